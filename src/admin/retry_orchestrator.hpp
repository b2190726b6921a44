#ifndef RETRY_ORCHESTRATOR_HPP
#define RETRY_ORCHESTRATOR_HPP

#include "kafka_errors.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <utility>

struct RetryPolicy {
    int retries = 5;
    int initial_retry_time_ms = 300;
    int max_retry_time_ms = 30000;
    double factor = 0.2;
    double multiplier = 2.0;
};

// Thrown by RetryContext::bail to abort the loop with the wrapped error.
// Not derived from std::exception.
class RetryBail {
public:
    explicit RetryBail(std::exception_ptr cause) : cause_(std::move(cause)) {}
    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

// Per-call state handed to every attempt
struct RetryContext {
    // Number of retries already performed (0 on the first attempt)
    int attempt = 0;
    std::chrono::milliseconds elapsed{0};
    std::exception_ptr last_error;

    // Stop retrying and surface the error unchanged
    [[noreturn]] void bail(std::exception_ptr error) const { throw RetryBail(std::move(error)); }
};

enum class RetryDecision {
    Retry,
    Tolerate,
    Fail
};

// How one call site classifies failures
struct RetryStrategy {
    // Used in log lines: "Could not <description>"
    std::string description;
    std::set<ErrorType> retriable;
    std::set<ErrorType> tolerated;
    // Logged at error level before the error is escalated as fatal
    std::map<ErrorType, std::string> hints;
    // DeleteGroupsError failures are retried with the shrunken remainder
    bool retry_partial_failures = false;
    // Runs after a retriable failure, before the backoff
    std::function<void(const KafkaProtocolError&)> before_retry;

    RetryDecision classify(const KafkaProtocolError& error) const;
};

// Bounded retry executor shared by all admin components
class RetryOrchestrator {
public:
    explicit RetryOrchestrator(RetryPolicy policy = RetryPolicy());

    // Run operation until it returns, fails fatally or the policy is exhausted.
    // On exhaustion the last error is rethrown unchanged.
    template <typename T>
    T execute(const RetryStrategy& strategy,
              const std::function<T(RetryContext&)>& operation,
              T tolerated_value = T()) const;

    // Randomized exponential delay before retry number (attempt + 1)
    std::chrono::milliseconds calculateBackoff(int attempt) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;

    bool shouldRetry(const RetryContext& context) const;
    void logRetry(const RetryStrategy& strategy, const std::exception& error,
                  const RetryContext& context) const;
    void logFatal(const RetryStrategy& strategy, const KafkaProtocolError& error) const;
};

template <typename T>
T RetryOrchestrator::execute(const RetryStrategy& strategy,
                             const std::function<T(RetryContext&)>& operation,
                             T tolerated_value) const {
    const auto start = std::chrono::steady_clock::now();
    RetryContext context;

    while (true) {
        context.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        try {
            return operation(context);
        } catch (const RetryBail& bail) {
            std::rethrow_exception(bail.cause());
        } catch (const KafkaProtocolError& e) {
            switch (strategy.classify(e)) {
                case RetryDecision::Tolerate:
                    return tolerated_value;
                case RetryDecision::Fail:
                    logFatal(strategy, e);
                    throw;
                case RetryDecision::Retry:
                    break;
            }
            context.last_error = std::current_exception();
            context.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            logRetry(strategy, e, context);
            if (!shouldRetry(context)) {
                throw;
            }
            if (strategy.before_retry) {
                strategy.before_retry(e);
            }
        } catch (const DeleteGroupsError& e) {
            if (!strategy.retry_partial_failures) {
                throw;
            }
            context.last_error = std::current_exception();
            context.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            logRetry(strategy, e, context);
            if (!shouldRetry(context)) {
                throw;
            }
        }

        std::this_thread::sleep_for(calculateBackoff(context.attempt));
        context.attempt++;
    }
}

#endif // RETRY_ORCHESTRATOR_HPP
