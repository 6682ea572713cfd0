#pragma once
#include "charge.hpp"
#include "floor.hpp"
#include "slot.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct ChargeConfig {
    std::string strategy = "fixed";
    double hourlyRate = 20;
    std::map<SlotType, double> rates = {{SlotType::SMALL, 20}, {SlotType::MEDIUM, 30}, {SlotType::LARGE, 40}};
};

struct LotConfig {
    std::string logFile = "parking.log";
    bool logToConsole = true;
    ChargeConfig charge;
    // 每层各类型车位数量
    std::vector<std::map<SlotType, int>> floors;
};

bool loadConfig(const std::string& filename, LotConfig& config, std::string& msg);
bool parseConfig(const json& j, LotConfig& config, std::string& msg);

std::shared_ptr<ChargeStrategy> makeChargeStrategy(const ChargeConfig& config);
std::unique_ptr<Floor> makeFloor(const std::map<SlotType, int>& slotCounts);
