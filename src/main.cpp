#include "gateway/http_server.hpp"
#include "admin/admin_client.hpp"
#include "transport/rdkafka_cluster.hpp"
#include "config.hpp"
#include <iostream>
#include <memory>

int main() {
    try {
        // Load configuration from environment
        AdminConfig config = AdminConfig::fromEnv();

        auto cluster = std::make_shared<RdKafkaCluster>(config);
        auto admin = std::make_shared<AdminClient>(cluster, config);

        admin->on(AdminEvents::CONNECT, [](const InstrumentationEvent& event) {
            std::cout << "Admin client connected (event " << event.id << ")" << std::endl;
        });

        // Serve /health even when the cluster is down; /ready reports the state
        try {
            admin->connect();
        } catch (const std::exception& e) {
            std::cerr << "Warning: Failed to connect to Kafka at " << config.brokers
                      << ": " << e.what() << std::endl;
        }

        HttpServer server(admin);
        server.start(config.http_host, config.http_port);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        std::cerr << "Please set required environment variables:" << std::endl;
        std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses" << std::endl;
        std::cerr << "  GATEWAY_PORT - HTTP port (optional, defaults to 8080)" << std::endl;
        return 1;
    }
    return 0;
}
