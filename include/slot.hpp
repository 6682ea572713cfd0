#pragma once
#include <string>

enum class SlotType { SMALL, MEDIUM, LARGE };
enum class SlotState { EMPTY, FILLED };

std::string slotTypeToString(SlotType type);
bool slotTypeFromString(const std::string& name, SlotType& type);

// 单个车位, 状态修改由所属楼层加锁后进行
class Slot {
public:
    explicit Slot(SlotType type);
    Slot(std::string id, SlotType type);

    const std::string& getId() const { return id; }
    SlotType getType() const { return type; }
    SlotState getState() const { return state; }
    void setState(SlotState newState) { state = newState; }

private:
    std::string id;
    SlotType type;
    SlotState state = SlotState::EMPTY;
};
