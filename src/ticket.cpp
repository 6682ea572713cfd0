#include "../include/ticket.hpp"
#include "../include/utils.hpp"
#include <sstream>

namespace {

// 停车票校验码: 对票面字段做 SHA256, 用于识别被篡改的票
std::string ticketCode(const Ticket& t) {
    std::ostringstream ss;
    ss << t.id << '|' << t.vehicleId << '|' << t.slotId << '|'
       << slotTypeToString(t.slotType) << '|' << static_cast<long long>(t.issuedAt);
    return utils::sha256(ss.str());
}

}

std::string Ticket::toString() const {
    std::ostringstream ss;
    ss << "id: " << id << ", vehicle_number: " << vehicleId
       << ", slot: " << slotId << " (" << slotTypeToString(slotType) << ")"
       << " and issued at: " << utils::timeToISO(issuedAt);
    return ss.str();
}

nlohmann::json Ticket::toJson() const {
    return {
        {"id", id},
        {"license_plate", vehicleId},
        {"slot", slotId},
        {"slot_type", slotTypeToString(slotType)},
        {"issued_at", utils::timeToISO(issuedAt)},
        {"code", code}
    };
}

// 该函数使用单例模式确保全局只有一个 TicketRegistry 实例
TicketRegistry& TicketRegistry::getInstance() {
    static TicketRegistry instance;
    return instance;
}

Ticket TicketRegistry::createTicket(const std::string& vehicleId, const std::string& slotId, SlotType slotType, time_t issuedAt) {
    Ticket ticket;
    ticket.vehicleId = vehicleId;
    ticket.slotId = slotId;
    ticket.slotType = slotType;
    ticket.issuedAt = issuedAt;

    std::lock_guard<std::mutex> lock(ticketsMutex);
    do {
        ticket.id = utils::generateId();
    } while (tickets.count(ticket.id) != 0);
    ticket.code = ticketCode(ticket);
    tickets[ticket.id] = ticket;
    return ticket;
}

// 注销停车票, 票不存在或票面与登记不符时返回 false
bool TicketRegistry::invalidateTicket(const Ticket& ticket, Ticket& stored) {
    std::lock_guard<std::mutex> lock(ticketsMutex);
    auto it = tickets.find(ticket.id);
    if (it == tickets.end()) {
        return false;
    }
    if (ticket.code != it->second.code || ticketCode(ticket) != it->second.code) {
        return false;
    }
    stored = it->second;
    tickets.erase(it);
    return true;
}

bool TicketRegistry::invalidateTicket(const Ticket& ticket) {
    Ticket stored;
    return invalidateTicket(ticket, stored);
}

bool TicketRegistry::findTicket(const std::string& id, Ticket& ticket) {
    std::lock_guard<std::mutex> lock(ticketsMutex);
    auto it = tickets.find(id);
    if (it != tickets.end()) {
        ticket = it->second;
        return true;
    }
    return false;
}

size_t TicketRegistry::activeCount() {
    std::lock_guard<std::mutex> lock(ticketsMutex);
    return tickets.size();
}
