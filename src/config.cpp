#include "../include/config.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

namespace {

bool parseRates(const json& j, std::map<SlotType, double>& rates, std::string& msg) {
    if (!j.is_object()) {
        msg = "rates 必须是对象";
        return false;
    }
    rates.clear();
    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        const json& value = item.value();
        SlotType type;
        if (!slotTypeFromString(key, type)) {
            msg = "未知车位类型: " + key;
            return false;
        }
        if (!value.is_number() || value.get<double>() < 0) {
            msg = "费率必须是非负数: " + key;
            return false;
        }
        rates[type] = value.get<double>();
    }
    // 动态计费必须给出所有车位类型的费率
    for (SlotType type : {SlotType::SMALL, SlotType::MEDIUM, SlotType::LARGE}) {
        if (rates.count(type) == 0) {
            msg = "rates 缺少车位类型: " + slotTypeToString(type);
            return false;
        }
    }
    return true;
}

bool parseCharge(const json& j, ChargeConfig& charge, std::string& msg) {
    if (!j.is_object()) {
        msg = "charge 必须是对象";
        return false;
    }
    charge.strategy = j.value("strategy", charge.strategy);
    if (charge.strategy != "fixed" && charge.strategy != "dynamic") {
        msg = "未知计费策略: " + charge.strategy;
        return false;
    }
    if (j.contains("hourly_rate")) {
        if (!j["hourly_rate"].is_number() || j["hourly_rate"].get<double>() < 0) {
            msg = "hourly_rate 必须是非负数";
            return false;
        }
        charge.hourlyRate = j["hourly_rate"].get<double>();
    }
    if (j.contains("rates")) {
        return parseRates(j["rates"], charge.rates, msg);
    }
    return true;
}

// 车位数量必须是 int 范围内的非负整数
bool readSlotCount(const json& value, int& count) {
    const auto max = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > max) {
            return false;
        }
    } else if (!value.is_number_integer()) {
        return false;
    } else {
        std::int64_t n = value.get<std::int64_t>();
        if (n < 0 || static_cast<std::uint64_t>(n) > max) {
            return false;
        }
    }
    count = value.get<int>();
    return true;
}

bool parseFloor(const json& j, std::map<SlotType, int>& counts, std::string& msg) {
    if (!j.is_object()) {
        msg = "楼层配置必须是对象";
        return false;
    }
    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        const json& value = item.value();
        SlotType type;
        if (!slotTypeFromString(key, type)) {
            msg = "未知车位类型: " + key;
            return false;
        }
        int count = 0;
        if (!readSlotCount(value, count)) {
            msg = "车位数量必须是 int 范围内的非负整数: " + key;
            return false;
        }
        counts[type] = count;
    }
    return true;
}

}

// 加载配置文件
bool loadConfig(const std::string& filename, LotConfig& config, std::string& msg) {
    std::ifstream config_file(filename);
    if (!config_file.is_open()) {
        msg = "无法打开配置文件: " + filename;
        return false;
    }
    json j;
    try {
        config_file >> j;
    } catch (const json::parse_error& e) {
        msg = std::string("配置文件错误: ") + e.what();
        return false;
    }
    return parseConfig(j, config, msg);
}

bool parseConfig(const json& j, LotConfig& config, std::string& msg) {
    if (!j.is_object()) {
        msg = "配置文件必须是对象";
        return false;
    }
    try {
        config.logFile = j.value("log_file", config.logFile);
        config.logToConsole = j.value("log_to_console", config.logToConsole);
        if (j.contains("charge") && !parseCharge(j["charge"], config.charge, msg)) {
            return false;
        }
    } catch (const json::type_error& e) {
        msg = std::string("配置文件错误: ") + e.what();
        return false;
    }

    if (!j.contains("floors") || !j["floors"].is_array()) {
        msg = "缺少 floors 数组";
        return false;
    }
    config.floors.clear();
    for (const auto& f : j["floors"]) {
        std::map<SlotType, int> counts;
        if (!parseFloor(f, counts, msg)) {
            return false;
        }
        config.floors.push_back(counts);
    }
    msg = "配置加载成功";
    return true;
}

std::shared_ptr<ChargeStrategy> makeChargeStrategy(const ChargeConfig& config) {
    if (config.strategy == "dynamic") {
        return std::make_shared<DynamicChargeStrategy>(config.rates);
    }
    return std::make_shared<FixedChargeStrategy>(config.hourlyRate);
}

// 按 SMALL, MEDIUM, LARGE 的顺序创建车位
std::unique_ptr<Floor> makeFloor(const std::map<SlotType, int>& slotCounts) {
    auto floor = std::make_unique<Floor>();
    for (const auto& [type, count] : slotCounts) {
        for (int i = 0; i < count; ++i) {
            floor->addSlot(Slot(type));
        }
    }
    return floor;
}
