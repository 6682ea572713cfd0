#include "../include/utils.hpp"
#include <openssl/evp.h>
#include <cmath>
#include <sstream>
#include <iomanip>
#include <random>
#include <stdexcept>

// 计算SHA256哈希值
std::string utils::sha256(const std::string& input) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// 生成随机十六进制标识符, 车位/楼层/停车票共用
std::string utils::generateId(int bytes) {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 255);
    std::stringstream ss;
    for (int i = 0; i < bytes; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << dis(gen);
    }
    return ss.str();
}

// 获取当前时间的ISO格式字符串
std::string utils::getCurrentTimeISO() {
    return timeToISO(std::time(nullptr));
}

std::string utils::timeToISO(time_t t) {
    std::tm tm = {};
    localtime_r(&t, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

// 将ISO格式字符串转换为时间戳, 解析失败返回 -1
time_t utils::isoStringToTime(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return static_cast<time_t>(-1);
    }
    tm.tm_isdst = -1;
    return mktime(&tm);
}

// 计算两个时间戳之间的小时差
double utils::calculateHours(time_t start, time_t end) {
    return difftime(end, start) / 3600.0;
}

double utils::roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}
