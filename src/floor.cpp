#include "../include/floor.hpp"
#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <stdexcept>
#include <utility>

Floor::Floor() : id(utils::generateId()) {}

Floor::Floor(std::string id) : id(std::move(id)) {}

void Floor::addSlot(const Slot& slot) {
    std::lock_guard<std::mutex> lock(slotsMutex);
    if (slotIndex.count(slot.getId()) != 0) {
        throw std::logic_error("duplicate slot id " + slot.getId() + " on floor " + id);
    }
    slotIndex[slot.getId()] = slots.size();
    slots.push_back(slot);
}

// 首次适配: 取第一个类型匹配的空车位
bool Floor::bookSlot(SlotType type, const std::string& vehicleId, time_t timestamp, Ticket& ticket, std::string& msg) {
    std::string slotId;
    {
        std::lock_guard<std::mutex> lock(slotsMutex);
        for (auto& slot : slots) {
            if (slot.getType() == type && slot.getState() == SlotState::EMPTY) {
                slot.setState(SlotState::FILLED);
                slotId = slot.getId();
                break;
            }
        }
    }

    if (slotId.empty()) {
        msg = "no slot available";
        Logger::getInstance().logSlot(id, "", "book", "No " + slotTypeToString(type) + " slot available for " + vehicleId);
        return false;
    }

    ticket = TicketRegistry::getInstance().createTicket(vehicleId, slotId, type, timestamp);
    Logger::getInstance().logSlot(id, slotId, "book", "Booked for " + vehicleId);
    msg = "slot booked";
    return true;
}

// 未知车位或车位已空都返回 false, 并发释放同一车位只有一个调用成功
bool Floor::releaseSlot(const std::string& slotId) {
    {
        std::lock_guard<std::mutex> lock(slotsMutex);
        auto it = slotIndex.find(slotId);
        if (it == slotIndex.end()) {
            return false;
        }
        Slot& slot = slots[it->second];
        if (slot.getState() != SlotState::FILLED) {
            return false;
        }
        slot.setState(SlotState::EMPTY);
    }
    Logger::getInstance().logSlot(id, slotId, "release", "Slot released");
    return true;
}

bool Floor::getSlotState(const std::string& slotId, SlotState& state) {
    std::lock_guard<std::mutex> lock(slotsMutex);
    auto it = slotIndex.find(slotId);
    if (it == slotIndex.end()) {
        return false;
    }
    state = slots[it->second].getState();
    return true;
}

size_t Floor::countAvailable(SlotType type) {
    std::lock_guard<std::mutex> lock(slotsMutex);
    size_t count = 0;
    for (const auto& slot : slots) {
        if (slot.getType() == type && slot.getState() == SlotState::EMPTY) {
            ++count;
        }
    }
    return count;
}

size_t Floor::slotCount() {
    std::lock_guard<std::mutex> lock(slotsMutex);
    return slots.size();
}
