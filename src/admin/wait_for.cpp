#include "wait_for.hpp"
#include "kafka_errors.hpp"
#include <thread>

void waitFor(const std::function<bool()>& condition, const WaitForOptions& options) {
    const auto deadline = std::chrono::steady_clock::now() + options.max_wait;

    while (true) {
        if (condition()) {
            return;
        }
        if (std::chrono::steady_clock::now() + options.delay > deadline) {
            throw TimeoutError(options.timeout_message);
        }
        std::this_thread::sleep_for(options.delay);
    }
}
