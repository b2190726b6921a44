#include "retry_orchestrator.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>

RetryDecision RetryStrategy::classify(const KafkaProtocolError& error) const {
    if (tolerated.count(error.type())) {
        return RetryDecision::Tolerate;
    }
    if (retriable.count(error.type())) {
        return RetryDecision::Retry;
    }
    return RetryDecision::Fail;
}

RetryOrchestrator::RetryOrchestrator(RetryPolicy policy)
    : policy_(policy) {
}

std::chrono::milliseconds RetryOrchestrator::calculateBackoff(int attempt) const {
    // Exponential backoff: initial * multiplier^attempt
    double delay = policy_.initial_retry_time_ms * std::pow(policy_.multiplier, attempt);
    delay = std::min(delay, static_cast<double>(policy_.max_retry_time_ms));

    // Jitter of +/- factor around the exponential value
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dist(delay * (1.0 - policy_.factor),
                                          delay * (1.0 + policy_.factor));
    double jittered = std::min(dist(gen), static_cast<double>(policy_.max_retry_time_ms));

    return std::chrono::milliseconds(static_cast<int64_t>(std::max(jittered, 0.0)));
}

bool RetryOrchestrator::shouldRetry(const RetryContext& context) const {
    return context.attempt < policy_.retries &&
           context.elapsed.count() < policy_.max_retry_time_ms;
}

void RetryOrchestrator::logRetry(const RetryStrategy& strategy, const std::exception& error,
                                 const RetryContext& context) const {
    std::cerr << "Admin: Could not " << strategy.description << ": " << error.what()
              << " (retryCount=" << context.attempt
              << ", retryTime=" << context.elapsed.count() << "ms)" << std::endl;
}

void RetryOrchestrator::logFatal(const RetryStrategy& strategy,
                                 const KafkaProtocolError& error) const {
    auto hint = strategy.hints.find(error.type());
    if (hint != strategy.hints.end()) {
        std::cerr << "Admin: " << hint->second << std::endl;
    }
}
