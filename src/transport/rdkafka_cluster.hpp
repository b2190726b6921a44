#ifndef RDKAFKA_CLUSTER_HPP
#define RDKAFKA_CLUSTER_HPP

#include "../config.hpp"
#include "../admin/cluster.hpp"
#include "rdkafka_broker.hpp"
#include <cppkafka/cppkafka.h>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Cluster backed by a single cppkafka client handle
class RdKafkaCluster : public Cluster {
public:
    explicit RdKafkaCluster(const AdminConfig& config);
    ~RdKafkaCluster() override;

    void connect() override;
    void disconnect() override;
    bool isConnected() const override;

    ClusterMetadata metadata(const std::vector<std::string>& topics = {}) override;

    void refreshMetadata() override;
    void refreshMetadataIfNecessary() override;

    void addTargetTopic(const std::string& topic) override;
    void removeTargetTopic(const std::string& topic) override;
    std::set<std::string> targetTopics() const override;

    std::vector<PartitionMetadata> findTopicPartitionMetadata(const std::string& topic) override;

    std::shared_ptr<Broker> findControllerBroker() override;
    std::shared_ptr<Broker> findGroupCoordinator(const std::string& group_id) override;
    std::shared_ptr<Broker> findBroker(int32_t node_id) override;

    std::vector<int32_t> brokerNodeIds() const override;

    int64_t defaultOffset(bool from_beginning) const override;

    std::vector<TopicOffsets> fetchTopicsOffset(const std::vector<TopicOffsetQuery>& queries) override;

    std::unique_ptr<GroupConsumer> createConsumer(const std::string& group_id) override;

private:
    AdminConfig config_;
    std::shared_ptr<cppkafka::Producer> handle_;

    mutable std::mutex mutex_;
    ClusterMetadata cached_;
    bool metadata_stale_;
    std::set<std::string> target_topics_;
    std::map<int32_t, std::shared_ptr<RdKafkaBroker>> brokers_;

    // Throws when connect() has not been called
    std::shared_ptr<cppkafka::Producer> handle() const;

    // Fetch brokers, controller and cluster id, plus either every topic or
    // only the given ones
    ClusterMetadata loadMetadata(const std::vector<std::string>& topics, bool all_topics);

    // Node id of the coordinator of a consumer group
    int32_t findCoordinatorId(const std::string& group_id);
};

#endif // RDKAFKA_CLUSTER_HPP
