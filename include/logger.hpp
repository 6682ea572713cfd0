#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

struct Ticket;

class Logger {
public:
    static Logger& getInstance();

    void setOutput(const std::string& logFile, bool toConsole);

    void log(const std::string& message);
    void logSlot(const std::string& floorId, const std::string& slotId, const std::string& action, const std::string& message);
    void logTicket(const Ticket& ticket, const std::string& action, const std::string& message);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    std::mutex logMutex;
    std::string logFile = "parking.log";
    bool toConsole = true;

    void writeLog(const nlohmann::json& log);
};
