#include "rdkafka_cluster.hpp"
#include "rdkafka_admin.hpp"
#include "group_consumer.hpp"
#include <algorithm>
#include <iostream>
#include <tuple>

RdKafkaCluster::RdKafkaCluster(const AdminConfig& config)
    : config_(config), metadata_stale_(true) {
}

RdKafkaCluster::~RdKafkaCluster() {
    disconnect();
}

void RdKafkaCluster::connect() {
    try {
        cppkafka::Configuration configuration = {
            {"metadata.broker.list", config_.brokers},
            {"client.id", config_.client_id},
            {"socket.timeout.ms", std::to_string(config_.request_timeout_ms)},
        };

        auto handle = std::make_shared<cppkafka::Producer>(configuration);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handle_ = handle;
            metadata_stale_ = true;
        }
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(), "Failed to connect to " + config_.brokers);
    } catch (const cppkafka::Exception& e) {
        throw AdminError("Failed to connect to " + config_.brokers + ": " + e.what());
    }

    refreshMetadata();
    std::cout << "RdKafkaCluster connected to " << config_.brokers
              << " (" << brokerNodeIds().size() << " brokers)" << std::endl;
}

void RdKafkaCluster::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return;
    }
    brokers_.clear();
    handle_.reset();
    cached_ = ClusterMetadata();
    metadata_stale_ = true;
    std::cout << "RdKafkaCluster disconnected" << std::endl;
}

bool RdKafkaCluster::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

std::shared_ptr<cppkafka::Producer> RdKafkaCluster::handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        throw AdminError("Cluster is not connected");
    }
    return handle_;
}

ClusterMetadata RdKafkaCluster::loadMetadata(const std::vector<std::string>& topics, bool all_topics) {
    auto client = handle();
    ClusterMetadata result;

    try {
        cppkafka::Metadata metadata = client->get_metadata(all_topics);
        for (const auto& broker : metadata.get_brokers()) {
            result.brokers.push_back({broker.get_id(), broker.get_host(), static_cast<int32_t>(broker.get_port())});
        }
        if (all_topics) {
            for (const auto& topic : metadata.get_topics()) {
                result.topic_metadata.push_back(topicMetadataFrom(topic));
            }
        }
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(), "Failed to fetch cluster metadata");
    }

    if (!all_topics) {
        for (const auto& topic : topics) {
            result.topic_metadata.push_back(fetchTopicMetadata(*client, topic));
        }
    }

    rd_kafka_t* rk = client->get_handle();
    result.controller_id = rd_kafka_controllerid(rk, config_.request_timeout_ms);

    char* cluster_id = rd_kafka_clusterid(rk, config_.request_timeout_ms);
    if (cluster_id) {
        result.cluster_id = cluster_id;
        rd_kafka_mem_free(rk, cluster_id);
    }
    return result;
}

ClusterMetadata RdKafkaCluster::metadata(const std::vector<std::string>& topics) {
    return loadMetadata(topics, topics.empty());
}

void RdKafkaCluster::refreshMetadata() {
    auto targets = targetTopics();
    ClusterMetadata fresh = loadMetadata(std::vector<std::string>(targets.begin(), targets.end()), false);
    auto client = handle();

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<int32_t, std::shared_ptr<RdKafkaBroker>> brokers;
    for (const auto& address : fresh.brokers) {
        auto existing = brokers_.find(address.node_id);
        if (existing != brokers_.end()) {
            brokers[address.node_id] = existing->second;
        } else {
            brokers[address.node_id] = std::make_shared<RdKafkaBroker>(
                address.node_id, client, config_.request_timeout_ms);
        }
    }
    brokers_ = std::move(brokers);
    cached_ = std::move(fresh);
    metadata_stale_ = false;
}

void RdKafkaCluster::refreshMetadataIfNecessary() {
    bool necessary = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        necessary = metadata_stale_;
        for (const auto& topic : target_topics_) {
            bool cached = std::any_of(cached_.topic_metadata.begin(), cached_.topic_metadata.end(),
                                      [&topic](const TopicMetadata& m) { return m.topic == topic; });
            if (!cached) {
                necessary = true;
            }
        }
    }
    if (necessary) {
        refreshMetadata();
    }
}

void RdKafkaCluster::addTargetTopic(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (target_topics_.insert(topic).second) {
        metadata_stale_ = true;
    }
}

void RdKafkaCluster::removeTargetTopic(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    target_topics_.erase(topic);
    auto& topics = cached_.topic_metadata;
    topics.erase(std::remove_if(topics.begin(), topics.end(),
                                [&topic](const TopicMetadata& m) { return m.topic == topic; }),
                 topics.end());
}

std::set<std::string> RdKafkaCluster::targetTopics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_topics_;
}

std::vector<PartitionMetadata> RdKafkaCluster::findTopicPartitionMetadata(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& metadata : cached_.topic_metadata) {
        if (metadata.topic != topic) {
            continue;
        }
        if (metadata.topic_error_code != 0) {
            throw KafkaProtocolError(metadata.topic_error_code, "Failed to load metadata for topic " + topic);
        }
        return metadata.partition_metadata;
    }
    return {};
}

std::shared_ptr<Broker> RdKafkaCluster::findControllerBroker() {
    int32_t controller_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        controller_id = cached_.controller_id;
    }
    if (controller_id == ClusterMetadata::NO_CONTROLLER_ID) {
        throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "Controller broker is not known yet");
    }
    return findBroker(controller_id);
}

int32_t RdKafkaCluster::findCoordinatorId(const std::string& group_id) {
    auto client = handle();
    rd_kafka_t* rk = client->get_handle();

    AdminRequest request(rk, RD_KAFKA_ADMIN_OP_DESCRIBECONSUMERGROUPS, config_.request_timeout_ms);
    const char* groups[] = {group_id.c_str()};
    rd_kafka_DescribeConsumerGroups(rk, groups, 1, request.options(), request.queue());
    auto event = request.awaitResult("DescribeConsumerGroups");

    size_t count = 0;
    const rd_kafka_ConsumerGroupDescription_t** descriptions = rd_kafka_DescribeConsumerGroups_result_groups(
        rd_kafka_event_DescribeConsumerGroups_result(event.get()), &count);
    if (count == 0) {
        throw KafkaProtocolError(ErrorType::COORDINATOR_NOT_AVAILABLE,
                                 "No coordinator found for group " + group_id);
    }

    throwIfError(rd_kafka_ConsumerGroupDescription_error(descriptions[0]),
                 "Failed to find coordinator of group " + group_id);

    const rd_kafka_Node_t* coordinator = rd_kafka_ConsumerGroupDescription_coordinator(descriptions[0]);
    if (!coordinator) {
        throw KafkaProtocolError(ErrorType::COORDINATOR_NOT_AVAILABLE,
                                 "No coordinator found for group " + group_id);
    }
    return rd_kafka_Node_id(coordinator);
}

std::shared_ptr<Broker> RdKafkaCluster::findGroupCoordinator(const std::string& group_id) {
    return findBroker(findCoordinatorId(group_id));
}

std::shared_ptr<Broker> RdKafkaCluster::findBroker(int32_t node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = brokers_.find(node_id);
    if (it == brokers_.end()) {
        throw KafkaProtocolError(ErrorType::BROKER_NOT_AVAILABLE,
                                 "Broker " + std::to_string(node_id) + " is not in the cached metadata");
    }
    return it->second;
}

std::vector<int32_t> RdKafkaCluster::brokerNodeIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int32_t> ids;
    for (const auto& entry : brokers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

int64_t RdKafkaCluster::defaultOffset(bool from_beginning) const {
    return from_beginning ? SeekTarget::EARLIEST : SeekTarget::LATEST;
}

std::vector<TopicOffsets> RdKafkaCluster::fetchTopicsOffset(const std::vector<TopicOffsetQuery>& queries) {
    auto client = handle();
    std::vector<TopicOffsets> result;

    for (const auto& query : queries) {
        TopicOffsets offsets;
        offsets.topic = query.topic;
        for (int32_t partition : query.partitions) {
            try {
                auto watermarks = client->query_offsets(cppkafka::TopicPartition(query.topic, partition));
                int64_t offset = query.from_beginning ? std::get<0>(watermarks) : std::get<1>(watermarks);
                offsets.partitions.push_back({partition, offset});
            } catch (const cppkafka::HandleException& e) {
                throw protocolError(e.get_error().get_error(),
                                    "Failed to query offsets of " + query.topic + "/" + std::to_string(partition));
            }
        }
        result.push_back(offsets);
    }
    return result;
}

std::unique_ptr<GroupConsumer> RdKafkaCluster::createConsumer(const std::string& group_id) {
    return std::make_unique<KafkaGroupConsumer>(config_, group_id);
}
