#pragma once
#include "slot.hpp"
#include "ticket.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <ctime>
#include <nlohmann/json.hpp>

// 费率表缺少某种车位类型, 属于配置错误
class UnmappedSlotType : public std::logic_error {
public:
    explicit UnmappedSlotType(SlotType type);
};

// 计费策略: 费用 = 停车小时数 * 每小时费率, 最后一步保留两位小数
class ChargeStrategy {
public:
    virtual ~ChargeStrategy() = default;
    virtual double calculateCharge(const Ticket& ticket, time_t now) const = 0;
    virtual std::string name() const = 0;
    virtual nlohmann::json describe() const = 0;

protected:
    static double charge(const Ticket& ticket, time_t now, double hourlyRate);
};

class FixedChargeStrategy : public ChargeStrategy {
public:
    explicit FixedChargeStrategy(double hourlyRate = 20);
    double calculateCharge(const Ticket& ticket, time_t now) const override;
    std::string name() const override { return "fixed"; }
    nlohmann::json describe() const override;

private:
    double hourlyRate;
};

class DynamicChargeStrategy : public ChargeStrategy {
public:
    DynamicChargeStrategy();
    explicit DynamicChargeStrategy(std::map<SlotType, double> hourlyRates);
    double calculateCharge(const Ticket& ticket, time_t now) const override;
    std::string name() const override { return "dynamic"; }
    nlohmann::json describe() const override;

private:
    std::map<SlotType, double> hourlyRates;
};
