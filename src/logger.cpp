#include "../include/logger.hpp"
#include "../include/ticket.hpp"
#include "../include/utils.hpp"
#include <fstream>
#include <iostream>

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// 空字符串表示不写日志文件
void Logger::setOutput(const std::string& file, bool console) {
    std::lock_guard<std::mutex> lock(logMutex);
    logFile = file;
    toConsole = console;
}

// 日志写入失败不能影响调用方
void Logger::writeLog(const nlohmann::json& log) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::string pretty;
    std::string line;
    try {
        pretty = log.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
        line = log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "logger: " << e.what() << std::endl;
        return;
    }

    if (toConsole) {
        std::cout << pretty << std::endl;
    }
    if (logFile.empty()) {
        return;
    }
    std::ofstream file(logFile, std::ios::app);
    if (file) {
        file << line << "\n";
    } else if (toConsole) {
        std::cerr << "logger: cannot open " << logFile << std::endl;
    }
}

void Logger::log(const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"message", message}
    };
    writeLog(log);
}

void Logger::logSlot(const std::string& floorId, const std::string& slotId, const std::string& action, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"floor", floorId},
        {"slot", slotId},
        {"action", action},
        {"message", message}
    };
    writeLog(log);
}

void Logger::logTicket(const Ticket& ticket, const std::string& action, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"ticket", ticket.id},
        {"license_plate", ticket.vehicleId},
        {"slot", ticket.slotId},
        {"action", action},
        {"message", message}
    };
    writeLog(log);
}
