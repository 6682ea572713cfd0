#pragma once
#include "charge.hpp"
#include "config.hpp"
#include "floor.hpp"
#include "ticket.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <ctime>

class ParkingSystem {
public:
    static ParkingSystem& getInstance();

    void addFloor(std::unique_ptr<Floor> floor);
    void setChargeStrategy(std::shared_ptr<ChargeStrategy> strategy);
    std::shared_ptr<ChargeStrategy> getChargeStrategy();

    bool parkVehicle(SlotType type, const std::string& vehicleId, time_t timestamp, Ticket& ticket, std::string& msg);
    bool unparkVehicle(const Ticket& ticket, time_t now, double& fee, std::string& msg);

    // 返回的指针只在下一次 clear() 或 configure() 之前有效
    Floor* findFloor(const std::string& floorId);
    size_t availableSlots(SlotType type);
    size_t floorCount();

    void configure(const LotConfig& config);
    void clear();

    ParkingSystem(const ParkingSystem&) = delete;
    ParkingSystem& operator=(const ParkingSystem&) = delete;

private:
    ParkingSystem();

    std::string id;
    // 整个查找并占用车位的过程在此锁内完成
    std::mutex bookingMutex;
    std::shared_mutex floorsMutex;
    std::vector<std::unique_ptr<Floor>> floors;
    std::mutex strategyMutex;
    std::shared_ptr<ChargeStrategy> strategy;
};
