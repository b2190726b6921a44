#ifndef CLUSTER_HPP
#define CLUSTER_HPP

#include "protocol_types.hpp"
#include "kafka_errors.hpp"
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct BrokerAddress {
    int32_t node_id = -1;
    std::string host;
    int32_t port = 0;
};

struct PartitionMetadata {
    int16_t partition_error_code = 0;
    int32_t partition_id = 0;
    // -1 when the partition has no leader
    int32_t leader = -1;
    std::vector<int32_t> replicas;
    std::vector<int32_t> isr;
    std::vector<int32_t> offline_replicas;
};

struct TopicMetadata {
    int16_t topic_error_code = 0;
    std::string topic;
    std::vector<PartitionMetadata> partition_metadata;
};

struct ClusterMetadata {
    static constexpr int32_t NO_CONTROLLER_ID = -1;

    std::vector<BrokerAddress> brokers;
    std::string cluster_id;
    int32_t controller_id = NO_CONTROLLER_ID;
    std::vector<TopicMetadata> topic_metadata;
};

struct TopicOffsetQuery {
    std::string topic;
    bool from_beginning = false;
    std::vector<int32_t> partitions;
};

struct PartitionOffset {
    int32_t partition = 0;
    int64_t offset = 0;
};

struct TopicOffsets {
    std::string topic;
    std::vector<PartitionOffset> partitions;
};

struct OffsetFetchPartition {
    int32_t partition = 0;
    int64_t offset = -1;
    std::optional<std::string> metadata;
    int16_t error_code = 0;
};

struct OffsetFetchTopic {
    std::string topic;
    std::vector<OffsetFetchPartition> partitions;
};

struct TopicPartitions {
    std::string topic;
    std::vector<int32_t> partitions;
};

struct GroupMember {
    std::string member_id;
    std::string client_id;
    std::string client_host;
};

struct GroupDescription {
    std::string group_id;
    // Stable, PreparingRebalance, CompletingRebalance, Empty, Dead
    std::string state;
    std::string protocol_type;
    std::string protocol;
    std::vector<GroupMember> members;
};

struct ConsumerBatch {
    std::string topic;
    int32_t partition = 0;
    int64_t high_watermark = 0;
    size_t message_count = 0;
};

// A single node of the cluster. Every request either returns the decoded
// response or throws KafkaProtocolError.
class Broker {
public:
    virtual ~Broker() = default;

    virtual int32_t nodeId() const = 0;

    virtual void createTopics(const std::vector<TopicSpec>& topics, bool validate_only,
                              int timeout_ms) = 0;
    virtual void deleteTopics(const std::vector<std::string>& topics, int timeout_ms) = 0;
    virtual void createPartitions(const std::vector<TopicPartitionsSpec>& topic_partitions,
                                  bool validate_only, int timeout_ms) = 0;

    virtual DescribeConfigsResponse describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                                    bool include_synonyms) = 0;
    virtual AlterConfigsResponse alterConfigs(const std::vector<ResourceConfig>& resources,
                                              bool validate_only) = 0;

    virtual void createAcls(const std::vector<AclEntry>& acl) = 0;
    virtual DescribeAclsResponse describeAcls(const AclFilter& filter) = 0;
    virtual DeleteAclsResponse deleteAcls(const std::vector<AclFilter>& filters) = 0;

    virtual std::vector<GroupOverview> listGroups() = 0;
    // Per-group outcomes; the call itself throws only for request-level failures
    virtual std::vector<GroupDeletionResult> deleteGroups(const std::vector<std::string>& group_ids) = 0;

    virtual std::vector<TopicMetadata> metadata(const std::vector<std::string>& topics) = 0;

    virtual std::vector<OffsetFetchTopic> offsetFetch(const std::string& group_id,
                                                      const std::vector<TopicPartitions>& topics) = 0;
};

// Ephemeral member of a consumer group used to move committed offsets
class GroupConsumer {
public:
    using BatchHandler = std::function<void(const ConsumerBatch&)>;

    virtual ~GroupConsumer() = default;

    virtual void subscribe(const std::string& topic, bool from_beginning) = 0;

    virtual GroupDescription describeGroup() = 0;

    virtual void pause(const std::vector<std::string>& topics) = 0;

    virtual void seek(const SeekTarget& target) = 0;

    // Start the fetch loop. Returns once the loop is running.
    virtual void run(BatchHandler each_batch) = 0;

    // Resolves after the first fetch cycle has completed with the seek targets
    // applied, or carries the error that stopped the loop.
    virtual std::shared_future<void> fetchCompleted() = 0;

    virtual void stop() = 0;
};

// Connection-level view of the cluster: metadata cache, node routing and the
// set of topics metadata is kept for.
class Cluster {
public:
    virtual ~Cluster() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Metadata for the given topics, all topics when empty
    virtual ClusterMetadata metadata(const std::vector<std::string>& topics = {}) = 0;

    virtual void refreshMetadata() = 0;
    virtual void refreshMetadataIfNecessary() = 0;

    virtual void addTargetTopic(const std::string& topic) = 0;
    virtual void removeTargetTopic(const std::string& topic) = 0;
    virtual std::set<std::string> targetTopics() const = 0;

    virtual std::vector<PartitionMetadata> findTopicPartitionMetadata(const std::string& topic) = 0;

    virtual std::shared_ptr<Broker> findControllerBroker() = 0;
    virtual std::shared_ptr<Broker> findGroupCoordinator(const std::string& group_id) = 0;
    virtual std::shared_ptr<Broker> findBroker(int32_t node_id) = 0;

    // Node ids of every broker in the pool
    virtual std::vector<int32_t> brokerNodeIds() const = 0;

    // SeekTarget::EARLIEST or SeekTarget::LATEST
    virtual int64_t defaultOffset(bool from_beginning) const = 0;

    virtual std::vector<TopicOffsets> fetchTopicsOffset(const std::vector<TopicOffsetQuery>& queries) = 0;

    virtual std::unique_ptr<GroupConsumer> createConsumer(const std::string& group_id) = 0;
};

#endif // CLUSTER_HPP
