#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

struct AdminConfig {
    std::string brokers;
    std::string client_id = "kafka-admin-gateway";
    int request_timeout_ms = 30000;

    // Retry policy shared by every admin operation
    int retries = 5;
    int initial_retry_time_ms = 300;
    int max_retry_time_ms = 30000;
    double retry_factor = 0.2;
    double retry_multiplier = 2.0;

    // Leader readiness polling after topic creation
    int leader_wait_delay_ms = 100;
    int leader_wait_timeout_ms = 10000;

    // How long setOffsets waits for the consumer to adopt the new positions
    int offset_commit_timeout_ms = 30000;

    std::string http_host = "0.0.0.0";
    int http_port = 8080;

    static AdminConfig fromEnv() {
        AdminConfig config;

        const char* brokers = std::getenv("KAFKA_BROKERS");
        if (!brokers || strlen(brokers) == 0) {
            throw std::runtime_error("KAFKA_BROKERS environment variable is required");
        }
        config.brokers = brokers;

        const char* client_id = std::getenv("ADMIN_CLIENT_ID");
        if (client_id && strlen(client_id) > 0) {
            config.client_id = client_id;
        }

        const char* request_timeout_str = std::getenv("ADMIN_REQUEST_TIMEOUT_MS");
        if (request_timeout_str) {
            config.request_timeout_ms = std::atoi(request_timeout_str);
        }

        const char* retries_str = std::getenv("ADMIN_RETRIES");
        if (retries_str) {
            config.retries = std::atoi(retries_str);
        }

        const char* initial_retry_str = std::getenv("ADMIN_INITIAL_RETRY_TIME_MS");
        if (initial_retry_str) {
            config.initial_retry_time_ms = std::atoi(initial_retry_str);
        }

        const char* max_retry_str = std::getenv("ADMIN_MAX_RETRY_TIME_MS");
        if (max_retry_str) {
            config.max_retry_time_ms = std::atoi(max_retry_str);
        }

        const char* leader_wait_str = std::getenv("LEADER_WAIT_TIMEOUT_MS");
        if (leader_wait_str) {
            config.leader_wait_timeout_ms = std::atoi(leader_wait_str);
        }

        const char* commit_timeout_str = std::getenv("OFFSET_COMMIT_TIMEOUT_MS");
        if (commit_timeout_str) {
            config.offset_commit_timeout_ms = std::atoi(commit_timeout_str);
        }

        const char* port_str = std::getenv("GATEWAY_PORT");
        if (port_str) {
            config.http_port = std::atoi(port_str);
        }

        if (config.retries < 0) {
            throw std::runtime_error("ADMIN_RETRIES must not be negative");
        }
        if (config.initial_retry_time_ms <= 0 || config.max_retry_time_ms <= 0) {
            throw std::runtime_error("Retry times must be positive");
        }

        return config;
    }
};

#endif // CONFIG_HPP
