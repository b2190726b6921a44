#ifndef ADMIN_EVENTS_HPP
#define ADMIN_EVENTS_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

struct AdminEvents {
    static constexpr const char* CONNECT = "admin.connect";
    static constexpr const char* DISCONNECT = "admin.disconnect";
};

struct InstrumentationEvent {
    int64_t id = 0;
    std::string type;
    // Milliseconds since the epoch
    int64_t timestamp = 0;
};

// Typed listener registry for admin lifecycle events
class InstrumentationEmitter {
public:
    using Listener = std::function<void(const InstrumentationEvent&)>;

    // Returns a function that removes the listener again
    std::function<void()> addListener(const std::string& event_name, Listener listener);

    // Deliver to every listener of the event. Listener failures are logged.
    void emit(const std::string& event_name);

private:
    std::mutex mutex_;
    int64_t next_listener_id_ = 0;
    int64_t next_event_id_ = 0;
    std::map<std::string, std::map<int64_t, Listener>> listeners_;
};

#endif // ADMIN_EVENTS_HPP
