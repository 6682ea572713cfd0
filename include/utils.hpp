#pragma once
#include <string>
#include <ctime>

namespace utils {
    std::string sha256(const std::string& input);
    std::string generateId(int bytes = 16);
    std::string getCurrentTimeISO();
    std::string timeToISO(time_t t);
    time_t isoStringToTime(const std::string& iso);
    double calculateHours(time_t start, time_t end);
    double roundTo2(double value);
}
