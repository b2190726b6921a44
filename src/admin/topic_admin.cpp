#include "topic_admin.hpp"
#include "request_validator.hpp"
#include <algorithm>

namespace {

bool hasLeaders(const std::vector<TopicMetadata>& metadata, const std::vector<std::string>& topics) {
    for (const auto& topic : topics) {
        auto it = std::find_if(metadata.begin(), metadata.end(),
                               [&topic](const TopicMetadata& m) { return m.topic == topic; });
        if (it == metadata.end()) {
            return false;
        }
        if (it->topic_error_code == static_cast<int16_t>(ErrorType::LEADER_NOT_AVAILABLE) ||
            it->partition_metadata.empty()) {
            return false;
        }
        for (const auto& partition : it->partition_metadata) {
            if (partition.leader < 0 ||
                partition.partition_error_code == static_cast<int16_t>(ErrorType::LEADER_NOT_AVAILABLE)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

TopicAdmin::TopicAdmin(Cluster& cluster, const RetryOrchestrator& retry, WaitForOptions leader_wait)
    : cluster_(cluster), retry_(retry), leader_wait_(std::move(leader_wait)) {
}

bool TopicAdmin::createTopics(const CreateTopicsRequest& request) {
    RequestValidator::validateCreateTopics(request.topics);

    std::vector<std::string> names;
    for (const auto& spec : request.topics) {
        names.push_back(spec.topic);
    }

    RetryStrategy strategy;
    strategy.description = "create topics";
    strategy.retriable = {ErrorType::NOT_CONTROLLER};
    strategy.tolerated = {ErrorType::TOPIC_ALREADY_EXISTS};

    return retry_.execute<bool>(strategy, [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        broker->createTopics(request.topics, request.validate_only, request.timeout_ms);

        if (request.validate_only) {
            return true;
        }

        if (request.wait_for_leaders) {
            waitForLeaders(*broker, names);
        }

        for (const auto& name : names) {
            cluster_.addTargetTopic(name);
        }
        return true;
    }, false);
}

void TopicAdmin::waitForLeaders(Broker& broker, const std::vector<std::string>& topics) {
    waitFor([&]() {
        try {
            return hasLeaders(broker.metadata(topics), topics);
        } catch (const KafkaProtocolError& e) {
            if (e.type() == ErrorType::LEADER_NOT_AVAILABLE) {
                return false;
            }
            throw;
        }
    }, leader_wait_);
}

void TopicAdmin::deleteTopics(const DeleteTopicsRequest& request) {
    RequestValidator::validateDeleteTopics(request.topics);

    RetryStrategy strategy;
    strategy.description = "delete topics";
    strategy.retriable = {ErrorType::NOT_CONTROLLER, ErrorType::UNKNOWN_TOPIC_OR_PARTITION};
    strategy.hints[ErrorType::REQUEST_TIMED_OUT] =
        "Could not delete topics, check if \"delete.topic.enable\" is set to \"true\" "
        "(the default value is \"false\") or increase the timeout";

    retry_.execute<bool>(strategy, [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        broker->deleteTopics(request.topics, request.timeout_ms);

        for (const auto& topic : request.topics) {
            cluster_.removeTargetTopic(topic);
        }
        cluster_.refreshMetadata();
        return true;
    });
}

bool TopicAdmin::createPartitions(const CreatePartitionsRequest& request) {
    RequestValidator::validateCreatePartitions(request.topic_partitions);

    RetryStrategy strategy;
    strategy.description = "create partitions";
    strategy.retriable = {ErrorType::NOT_CONTROLLER};

    return retry_.execute<bool>(strategy, [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        broker->createPartitions(request.topic_partitions, request.validate_only, request.timeout_ms);
        return true;
    });
}

std::vector<std::string> TopicAdmin::listTopics() {
    ClusterMetadata metadata = cluster_.metadata();
    std::vector<std::string> topics;
    topics.reserve(metadata.topic_metadata.size());
    for (const auto& topic : metadata.topic_metadata) {
        topics.push_back(topic.topic);
    }
    return topics;
}

std::vector<TopicPartitionsMetadata> TopicAdmin::getTopicMetadata(
    const std::optional<std::vector<std::string>>& topics) {
    if (topics) {
        for (const auto& topic : *topics) {
            RequestValidator::validateTopic(topic);
            try {
                cluster_.addTargetTopic(topic);
            } catch (const KafkaProtocolError& e) {
                throw KafkaProtocolError(e.code(), "Failed to add target topic " + topic + ": " + e.what());
            }
        }
    }

    cluster_.refreshMetadataIfNecessary();

    std::vector<std::string> target_topics;
    if (topics) {
        target_topics = *topics;
    } else {
        auto targets = cluster_.targetTopics();
        target_topics.assign(targets.begin(), targets.end());
    }

    std::vector<TopicPartitionsMetadata> result;
    for (const auto& topic : target_topics) {
        result.push_back({topic, cluster_.findTopicPartitionMetadata(topic)});
    }
    return result;
}

std::vector<TopicPartitionsMetadata> TopicAdmin::fetchTopicMetadata(const std::vector<std::string>& topics) {
    RequestValidator::validateTopicNames(topics);

    ClusterMetadata metadata = cluster_.metadata(topics);

    std::vector<TopicPartitionsMetadata> result;
    for (const auto& topic : metadata.topic_metadata) {
        result.push_back({topic.topic, topic.partition_metadata});
    }
    return result;
}
