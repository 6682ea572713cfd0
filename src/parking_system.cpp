#include "../include/parking_system.hpp"
#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

ParkingSystem& ParkingSystem::getInstance() {
    static ParkingSystem instance;
    return instance;
}

ParkingSystem::ParkingSystem()
    : id(utils::generateId()), strategy(std::make_shared<FixedChargeStrategy>()) {}

void ParkingSystem::addFloor(std::unique_ptr<Floor> floor) {
    if (!floor) {
        throw std::invalid_argument("cannot register a null floor");
    }
    std::unique_lock<std::shared_mutex> lock(floorsMutex);
    for (const auto& f : floors) {
        if (f->getId() == floor->getId()) {
            throw std::logic_error("duplicate floor id " + floor->getId());
        }
    }
    floors.push_back(std::move(floor));
}

void ParkingSystem::setChargeStrategy(std::shared_ptr<ChargeStrategy> newStrategy) {
    if (!newStrategy) {
        throw std::invalid_argument("charge strategy must not be null");
    }
    Logger::getInstance().log("Charge strategy set to " + newStrategy->describe().dump());
    std::lock_guard<std::mutex> lock(strategyMutex);
    strategy = std::move(newStrategy);
}

std::shared_ptr<ChargeStrategy> ParkingSystem::getChargeStrategy() {
    std::lock_guard<std::mutex> lock(strategyMutex);
    return strategy;
}

// 按楼层注册顺序查找, 第一个能占到车位的楼层出票
bool ParkingSystem::parkVehicle(SlotType type, const std::string& vehicleId, time_t timestamp, Ticket& ticket, std::string& msg) {
    std::lock_guard<std::mutex> booking(bookingMutex);
    std::shared_lock<std::shared_mutex> lock(floorsMutex);
    for (const auto& floor : floors) {
        if (floor->bookSlot(type, vehicleId, timestamp, ticket, msg)) {
            Logger::getInstance().logTicket(ticket, "park", "Ticket issued");
            return true;
        }
    }
    msg = "no slot available";
    Logger::getInstance().log("No " + slotTypeToString(type) + " slot available on any floor for " + vehicleId);
    return false;
}

// 先按登记处保存的票面计费, 计费策略配置错误时直接抛出, 不改变任何状态.
// 随后在登记处注销停车票, 重复出场和过期票在这里被拒绝, 不会误释放他人的车位
bool ParkingSystem::unparkVehicle(const Ticket& ticket, time_t now, double& fee, std::string& msg) {
    auto& registry = TicketRegistry::getInstance();
    Ticket stored;
    if (!registry.findTicket(ticket.id, stored)) {
        msg = "invalid ticket";
        Logger::getInstance().logTicket(ticket, "unpark", "Invalid ticket got");
        return false;
    }

    double charge = getChargeStrategy()->calculateCharge(stored, now);

    if (!registry.invalidateTicket(ticket, stored)) {
        msg = "invalid ticket";
        Logger::getInstance().logTicket(ticket, "unpark", "Invalid ticket got");
        return false;
    }

    bool released = false;
    {
        std::shared_lock<std::shared_mutex> lock(floorsMutex);
        for (const auto& floor : floors) {
            if (floor->releaseSlot(stored.slotId)) {
                released = true;
                break;
            }
        }
    }
    if (!released) {
        msg = "invalid ticket";
        Logger::getInstance().logTicket(stored, "unpark", "Invalid ticket got, slot unknown to every floor");
        return false;
    }

    fee = charge;
    std::ostringstream ss;
    ss << "Successfully released slot " << stored.slotId << ", fee " << fee;
    Logger::getInstance().logTicket(stored, "unpark", ss.str());
    msg = "unpark success";
    return true;
}

Floor* ParkingSystem::findFloor(const std::string& floorId) {
    std::shared_lock<std::shared_mutex> lock(floorsMutex);
    for (const auto& floor : floors) {
        if (floor->getId() == floorId) {
            return floor.get();
        }
    }
    return nullptr;
}

size_t ParkingSystem::availableSlots(SlotType type) {
    std::shared_lock<std::shared_mutex> lock(floorsMutex);
    size_t count = 0;
    for (const auto& floor : floors) {
        count += floor->countAvailable(type);
    }
    return count;
}

size_t ParkingSystem::floorCount() {
    std::shared_lock<std::shared_mutex> lock(floorsMutex);
    return floors.size();
}

// 按配置重建停车场: 清空现有楼层, 重新创建楼层与计费策略
void ParkingSystem::configure(const LotConfig& config) {
    Logger::getInstance().setOutput(config.logFile, config.logToConsole);
    clear();
    for (const auto& counts : config.floors) {
        addFloor(makeFloor(counts));
    }
    setChargeStrategy(makeChargeStrategy(config.charge));
    Logger::getInstance().log("Parking system " + id + " configured with " + std::to_string(config.floors.size()) + " floors");
}

void ParkingSystem::clear() {
    std::lock_guard<std::mutex> booking(bookingMutex);
    {
        std::unique_lock<std::shared_mutex> lock(floorsMutex);
        floors.clear();
    }
    std::lock_guard<std::mutex> lock(strategyMutex);
    strategy = std::make_shared<FixedChargeStrategy>();
}
