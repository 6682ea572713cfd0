#include "../include/slot.hpp"
#include "../include/utils.hpp"
#include <utility>

Slot::Slot(SlotType type) : id(utils::generateId()), type(type) {}

Slot::Slot(std::string id, SlotType type) : id(std::move(id)), type(type) {}

std::string slotTypeToString(SlotType type) {
    switch (type) {
        case SlotType::SMALL: return "SMALL";
        case SlotType::MEDIUM: return "MEDIUM";
        case SlotType::LARGE: return "LARGE";
    }
    return "UNKNOWN";
}

bool slotTypeFromString(const std::string& name, SlotType& type) {
    if (name == "SMALL") {
        type = SlotType::SMALL;
    } else if (name == "MEDIUM") {
        type = SlotType::MEDIUM;
    } else if (name == "LARGE") {
        type = SlotType::LARGE;
    } else {
        return false;
    }
    return true;
}

