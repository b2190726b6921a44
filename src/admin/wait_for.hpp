#ifndef WAIT_FOR_HPP
#define WAIT_FOR_HPP

#include <chrono>
#include <functional>
#include <string>

struct WaitForOptions {
    std::chrono::milliseconds delay{100};
    std::chrono::milliseconds max_wait{10000};
    std::string timeout_message = "Timeout";
};

// Poll condition every options.delay until it holds.
// Throws TimeoutError(options.timeout_message) once max_wait has elapsed.
void waitFor(const std::function<bool()>& condition, const WaitForOptions& options);

#endif // WAIT_FOR_HPP
