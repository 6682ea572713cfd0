#pragma once
#include "slot.hpp"
#include <string>
#include <map>
#include <mutex>
#include <ctime>
#include <nlohmann/json.hpp>

struct Ticket {
    std::string id;
    std::string vehicleId;
    std::string slotId;
    SlotType slotType = SlotType::SMALL;
    time_t issuedAt = 0;
    std::string code;

    std::string toString() const;
    nlohmann::json toJson() const;
};

class TicketRegistry {
public:
    static TicketRegistry& getInstance();
    Ticket createTicket(const std::string& vehicleId, const std::string& slotId, SlotType slotType, time_t issuedAt);
    bool invalidateTicket(const Ticket& ticket, Ticket& stored);
    bool invalidateTicket(const Ticket& ticket);
    bool findTicket(const std::string& id, Ticket& ticket);
    size_t activeCount();

    TicketRegistry(const TicketRegistry&) = delete;
    TicketRegistry& operator=(const TicketRegistry&) = delete;

private:
    TicketRegistry() = default;
    std::mutex ticketsMutex;
    std::map<std::string, Ticket> tickets;
};
