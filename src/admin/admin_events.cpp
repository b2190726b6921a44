#include "admin_events.hpp"
#include <chrono>
#include <iostream>

std::function<void()> InstrumentationEmitter::addListener(const std::string& event_name, Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t listener_id = next_listener_id_++;
    listeners_[event_name][listener_id] = std::move(listener);

    return [this, event_name, listener_id]() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(event_name);
        if (it != listeners_.end()) {
            it->second.erase(listener_id);
        }
    };
}

void InstrumentationEmitter::emit(const std::string& event_name) {
    InstrumentationEvent event;
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.id = next_event_id_++;
        auto it = listeners_.find(event_name);
        if (it != listeners_.end()) {
            for (const auto& entry : it->second) {
                targets.push_back(entry.second);
            }
        }
    }

    event.type = event_name;
    event.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    for (const auto& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "Admin: Failed to execute listener: " << e.what()
                      << " (eventName=" << event_name << ")" << std::endl;
        }
    }
}
