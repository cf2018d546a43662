#pragma once

#include <deque>
#include <string>
#include <optional>

namespace AnimaEngine {

// FIFO queue used as the application's event bus. Every producer (SDL
// input, GTK callbacks, Lua bindings) and the consumer run on the UI
// thread, so no locking is done here.
template<typename T>
class EventQueue {
public:
    EventQueue() = default;
    ~EventQueue() = default;

    // Disable copy
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @brief Push an item to the back of the queue
     */
    void push(const T& item) {
        queue_.push_back(item);
    }

    void push(T&& item) {
        queue_.push_back(std::move(item));
    }

    /**
     * @brief Pop the front item, or std::nullopt when empty
     */
    std::optional<T> tryPop() {
        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    bool empty() const {
        return queue_.empty();
    }

    size_t size() const {
        return queue_.size();
    }

    void clear() {
        queue_.clear();
    }

private:
    std::deque<T> queue_;
};

// Event types dispatched by App::ProcessAppEvents
enum class EventType {
    APPLY_ANIMATION,  // Set a pet's active animation (petId, payload = path)
    SET_OPACITY,      // Opacity for every pet (value = percent)
    ADD_PET,          // Spawn another pet
    REMOVE_PET,       // Close pet petId
    TOGGLE_LOCK,      // Flip lock flag of pet petId
    OPEN_SELECTOR,    // Show selector targeting petId
    SHOW_SELECTOR,    // Show and raise selector
    HIDE_SELECTOR,    // Hide selector
    SHUTDOWN          // Quit application
};

// Application event structure
struct AppEvent {
    EventType type;
    int petId = -1;
    int value = 0;
    std::string payload;

    AppEvent() : type(EventType::SHOW_SELECTOR) {}
    explicit AppEvent(EventType t) : type(t) {}
    AppEvent(EventType t, int id) : type(t), petId(id) {}
    AppEvent(EventType t, int id, const std::string& p) : type(t), petId(id), payload(p) {}

    static AppEvent Opacity(int percent) {
        AppEvent event(EventType::SET_OPACITY);
        event.value = percent;
        return event;
    }
};

const char* EventTypeName(EventType type);

} // namespace AnimaEngine
