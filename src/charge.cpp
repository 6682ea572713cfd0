#include "../include/charge.hpp"
#include "../include/utils.hpp"
#include <utility>

UnmappedSlotType::UnmappedSlotType(SlotType type)
    : std::logic_error("no hourly rate for slot type " + slotTypeToString(type)) {}

double ChargeStrategy::charge(const Ticket& ticket, time_t now, double hourlyRate) {
    double hours = utils::calculateHours(ticket.issuedAt, now);
    if (hours < 0) {
        hours = 0;
    }
    return utils::roundTo2(hours * hourlyRate);
}

FixedChargeStrategy::FixedChargeStrategy(double hourlyRate) : hourlyRate(hourlyRate) {}

double FixedChargeStrategy::calculateCharge(const Ticket& ticket, time_t now) const {
    return charge(ticket, now, hourlyRate);
}

nlohmann::json FixedChargeStrategy::describe() const {
    return {{"strategy", name()}, {"hourly_rate", hourlyRate}};
}

DynamicChargeStrategy::DynamicChargeStrategy()
    : hourlyRates{{SlotType::SMALL, 20}, {SlotType::MEDIUM, 30}, {SlotType::LARGE, 40}} {}

DynamicChargeStrategy::DynamicChargeStrategy(std::map<SlotType, double> hourlyRates)
    : hourlyRates(std::move(hourlyRates)) {}

double DynamicChargeStrategy::calculateCharge(const Ticket& ticket, time_t now) const {
    auto it = hourlyRates.find(ticket.slotType);
    if (it == hourlyRates.end()) {
        throw UnmappedSlotType(ticket.slotType);
    }
    return charge(ticket, now, it->second);
}

nlohmann::json DynamicChargeStrategy::describe() const {
    nlohmann::json rates = nlohmann::json::object();
    for (const auto& [type, rate] : hourlyRates) {
        rates[slotTypeToString(type)] = rate;
    }
    return {{"strategy", name()}, {"rates", rates}};
}
