#include "../include/Utils.h"

namespace AnimaEngine {

const char* EventTypeName(EventType type) {
    switch (type) {
        case EventType::APPLY_ANIMATION: return "APPLY_ANIMATION";
        case EventType::SET_OPACITY:     return "SET_OPACITY";
        case EventType::ADD_PET:         return "ADD_PET";
        case EventType::REMOVE_PET:      return "REMOVE_PET";
        case EventType::TOGGLE_LOCK:     return "TOGGLE_LOCK";
        case EventType::OPEN_SELECTOR:   return "OPEN_SELECTOR";
        case EventType::SHOW_SELECTOR:   return "SHOW_SELECTOR";
        case EventType::HIDE_SELECTOR:   return "HIDE_SELECTOR";
        case EventType::SHUTDOWN:        return "SHUTDOWN";
    }
    return "UNKNOWN";
}

} // namespace AnimaEngine
