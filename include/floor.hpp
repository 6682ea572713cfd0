#pragma once
#include "slot.hpp"
#include "ticket.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <ctime>

class Floor {
public:
    Floor();
    explicit Floor(std::string id);

    const std::string& getId() const { return id; }

    void addSlot(const Slot& slot);
    bool bookSlot(SlotType type, const std::string& vehicleId, time_t timestamp, Ticket& ticket, std::string& msg);
    bool releaseSlot(const std::string& slotId);

    bool getSlotState(const std::string& slotId, SlotState& state);
    size_t countAvailable(SlotType type);
    size_t slotCount();

    Floor(const Floor&) = delete;
    Floor& operator=(const Floor&) = delete;

private:
    std::string id;
    std::mutex slotsMutex;
    // 按加入顺序保存, 决定首次适配时选中哪个车位
    std::vector<Slot> slots;
    std::map<std::string, size_t> slotIndex;
};
