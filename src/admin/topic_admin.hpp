#ifndef TOPIC_ADMIN_HPP
#define TOPIC_ADMIN_HPP

#include "cluster.hpp"
#include "retry_orchestrator.hpp"
#include "wait_for.hpp"
#include <optional>
#include <string>
#include <vector>

struct CreateTopicsRequest {
    std::vector<TopicSpec> topics;
    bool validate_only = false;
    int timeout_ms = 5000;
    bool wait_for_leaders = true;
};

struct DeleteTopicsRequest {
    std::vector<std::string> topics;
    int timeout_ms = 5000;
};

struct CreatePartitionsRequest {
    std::vector<TopicPartitionsSpec> topic_partitions;
    bool validate_only = false;
    int timeout_ms = 5000;
};

struct TopicPartitionsMetadata {
    std::string name;
    std::vector<PartitionMetadata> partitions;
};

// Topic lifecycle operations, all routed to the controller
class TopicAdmin {
public:
    TopicAdmin(Cluster& cluster, const RetryOrchestrator& retry, WaitForOptions leader_wait);

    // Returns false when a topic already exists
    bool createTopics(const CreateTopicsRequest& request);

    void deleteTopics(const DeleteTopicsRequest& request);

    bool createPartitions(const CreatePartitionsRequest& request);

    std::vector<std::string> listTopics();

    // Deprecated: limited to the target topics when no topics are given
    std::vector<TopicPartitionsMetadata> getTopicMetadata(
        const std::optional<std::vector<std::string>>& topics = std::nullopt);

    // Metadata for the given topics, every topic of the cluster when empty
    std::vector<TopicPartitionsMetadata> fetchTopicMetadata(const std::vector<std::string>& topics = {});

private:
    Cluster& cluster_;
    const RetryOrchestrator& retry_;
    WaitForOptions leader_wait_;

    // Block until every partition of the topics has a leader
    void waitForLeaders(Broker& broker, const std::vector<std::string>& topics);
};

#endif // TOPIC_ADMIN_HPP
