#ifndef OFFSET_COORDINATOR_HPP
#define OFFSET_COORDINATOR_HPP

#include "cluster.hpp"
#include "retry_orchestrator.hpp"
#include <chrono>
#include <string>
#include <vector>

// Watermark queries and consumer group offset management
class OffsetCoordinator {
public:
    OffsetCoordinator(Cluster& cluster, const RetryOrchestrator& retry,
                      std::chrono::milliseconds commit_timeout);

    // Earliest and latest offsets of every partition of the topic
    std::vector<TopicWatermarks> fetchTopicOffsets(const std::string& topic);

    // Committed offsets of the group for the topic (single attempt)
    std::vector<GroupPartitionOffset> fetchOffsets(const std::string& group_id, const std::string& topic);

    // Commit new positions for the group. The group must have no running members.
    void setOffsets(const std::string& group_id, const std::string& topic,
                    const std::vector<PartitionOffsetRequest>& partitions);

    // Move every partition of the topic to the earliest or latest offset
    void resetOffsets(const std::string& group_id, const std::string& topic, bool earliest = false);

private:
    Cluster& cluster_;
    const RetryOrchestrator& retry_;
    std::chrono::milliseconds commit_timeout_;

    // Sorted partition ids of a topic, registering it as a target topic
    std::vector<int32_t> findTopicPartitions(const std::string& topic);
};

#endif // OFFSET_COORDINATOR_HPP
