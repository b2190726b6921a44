#include "offset_coordinator.hpp"
#include "request_validator.hpp"
#include <algorithm>
#include <iostream>

namespace {

// Only a group without live members may have its offsets moved
bool isGroupTerminal(const GroupDescription& description) {
    return description.state == "Empty" || description.state == "Dead";
}

std::vector<PartitionOffset> offsetsOf(const std::vector<TopicOffsets>& response, const std::string& topic) {
    for (const auto& entry : response) {
        if (entry.topic == topic) {
            return entry.partitions;
        }
    }
    return {};
}

} // namespace

OffsetCoordinator::OffsetCoordinator(Cluster& cluster, const RetryOrchestrator& retry,
                                     std::chrono::milliseconds commit_timeout)
    : cluster_(cluster), retry_(retry), commit_timeout_(commit_timeout) {
}

std::vector<int32_t> OffsetCoordinator::findTopicPartitions(const std::string& topic) {
    cluster_.addTargetTopic(topic);
    cluster_.refreshMetadataIfNecessary();

    std::vector<int32_t> partitions;
    for (const auto& partition : cluster_.findTopicPartitionMetadata(topic)) {
        partitions.push_back(partition.partition_id);
    }
    std::sort(partitions.begin(), partitions.end());
    return partitions;
}

std::vector<TopicWatermarks> OffsetCoordinator::fetchTopicOffsets(const std::string& topic) {
    RequestValidator::validateTopic(topic);

    RetryStrategy strategy;
    strategy.description = "fetch topic offsets";
    strategy.retriable = {ErrorType::UNKNOWN_TOPIC_OR_PARTITION};
    strategy.before_retry = [this](const KafkaProtocolError&) {
        cluster_.refreshMetadata();
    };

    return retry_.execute<std::vector<TopicWatermarks>>(strategy, [&](RetryContext&) {
        auto partitions = findTopicPartitions(topic);

        auto high = offsetsOf(cluster_.fetchTopicsOffset({{topic, false, partitions}}), topic);
        auto low = offsetsOf(cluster_.fetchTopicsOffset({{topic, true, partitions}}), topic);

        std::vector<TopicWatermarks> watermarks;
        for (const auto& latest : high) {
            auto earliest = std::find_if(low.begin(), low.end(), [&latest](const PartitionOffset& p) {
                return p.partition == latest.partition;
            });
            if (earliest == low.end()) {
                throw NonRetriableError("Missing earliest offset for partition " +
                                        std::to_string(latest.partition) + " of topic " + topic);
            }

            TopicWatermarks entry;
            entry.partition = latest.partition;
            entry.offset = latest.offset;
            entry.high = latest.offset;
            entry.low = earliest->offset;
            watermarks.push_back(entry);
        }
        return watermarks;
    });
}

std::vector<GroupPartitionOffset> OffsetCoordinator::fetchOffsets(const std::string& group_id,
                                                                  const std::string& topic) {
    RequestValidator::validateGroupId(group_id);
    RequestValidator::validateTopic(topic);

    auto partitions = findTopicPartitions(topic);
    auto coordinator = cluster_.findGroupCoordinator(group_id);
    auto response = coordinator->offsetFetch(group_id, {{topic, partitions}});

    std::vector<GroupPartitionOffset> offsets;
    for (const auto& entry : response) {
        if (entry.topic != topic) {
            continue;
        }
        for (const auto& partition : entry.partitions) {
            GroupPartitionOffset offset;
            offset.partition = partition.partition;
            offset.offset = partition.offset;
            // Brokers return "" when nothing was committed with the offset
            if (partition.metadata && !partition.metadata->empty()) {
                offset.metadata = partition.metadata;
            }
            offsets.push_back(offset);
        }
    }
    return offsets;
}

void OffsetCoordinator::setOffsets(const std::string& group_id, const std::string& topic,
                                   const std::vector<PartitionOffsetRequest>& partitions) {
    RequestValidator::validateSetOffsets(group_id, topic, partitions);

    auto consumer = cluster_.createConsumer(group_id);
    consumer->subscribe(topic, true);

    GroupDescription description = consumer->describeGroup();
    if (!isGroupTerminal(description)) {
        throw NonRetriableError("The consumer group must have no running instances, current state: " +
                                description.state);
    }

    consumer->pause({topic});
    for (const auto& p : partitions) {
        consumer->seek({topic, p.partition, p.offset});
    }

    std::shared_future<void> fetched = consumer->fetchCompleted();
    try {
        // Nothing is consumed; the fetch cycle only makes the seeks durable
        consumer->run([](const ConsumerBatch&) {});

        if (fetched.wait_for(commit_timeout_) != std::future_status::ready) {
            throw TimeoutError("Timed out while waiting for group " + group_id +
                               " to adopt the new offsets");
        }
        fetched.get();
    } catch (...) {
        consumer->stop();
        throw;
    }

    consumer->stop();
    std::cout << "Admin: Set offsets of group " << group_id << " on topic " << topic
              << " for " << partitions.size() << " partitions" << std::endl;
}

void OffsetCoordinator::resetOffsets(const std::string& group_id, const std::string& topic, bool earliest) {
    RequestValidator::validateGroupId(group_id);
    RequestValidator::validateTopic(topic);

    int64_t offset = cluster_.defaultOffset(earliest);

    std::vector<PartitionOffsetRequest> seeks;
    for (int32_t partition : findTopicPartitions(topic)) {
        seeks.push_back({partition, offset});
    }

    setOffsets(group_id, topic, seeks);
}
