#include "../include/config.hpp"
#include "../include/logger.hpp"
#include "../include/parking_system.hpp"
#include "../include/utils.hpp"

#include <iostream>

// 演示程序: 读取配置, 建立停车场, 演示入场, 出场计费, 再次入场复用车位
int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    LotConfig config;
    std::string msg;
    if (!loadConfig(configPath, config, msg)) {
        std::cerr << msg << std::endl;
        return 1;
    }

    auto& system = ParkingSystem::getInstance();
    system.configure(config);
    Logger::getInstance().log("Loaded " + configPath + ", strategy " + system.getChargeStrategy()->describe().dump());

    time_t entry = utils::isoStringToTime("2026-02-02T10:00:00");
    Ticket ticket;
    if (!system.parkVehicle(SlotType::MEDIUM, "AP27PEK9409", entry, ticket, msg)) {
        std::cerr << "park failed: " << msg << std::endl;
        return 1;
    }
    std::cout << "Ticket: " << ticket.toString() << std::endl;

    double fee = 0;
    if (!system.unparkVehicle(ticket, entry + 2 * 3600, fee, msg)) {
        std::cerr << "unpark failed: " << msg << std::endl;
        return 1;
    }
    std::cout << "Fee: " << fee << std::endl;

    if (!system.unparkVehicle(ticket, entry + 3 * 3600, fee, msg)) {
        std::cout << "Second unpark rejected: " << msg << std::endl;
    }

    if (!system.parkVehicle(SlotType::MEDIUM, "TS27PEK9409", entry, ticket, msg)) {
        std::cerr << "park failed: " << msg << std::endl;
        return 1;
    }
    std::cout << ticket.toJson().dump(4) << std::endl;
    std::cout << "Available MEDIUM slots: " << system.availableSlots(SlotType::MEDIUM) << std::endl;
    return 0;
}
