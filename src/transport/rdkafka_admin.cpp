#include "rdkafka_admin.hpp"

int16_t protocolCode(rd_kafka_resp_err_t err) {
    switch (err) {
        case RD_KAFKA_RESP_ERR__TIMED_OUT:
        case RD_KAFKA_RESP_ERR__TIMED_OUT_QUEUE:
            return static_cast<int16_t>(ErrorType::REQUEST_TIMED_OUT);
        case RD_KAFKA_RESP_ERR__TRANSPORT:
        case RD_KAFKA_RESP_ERR__ALL_BROKERS_DOWN:
            return static_cast<int16_t>(ErrorType::NETWORK_EXCEPTION);
        case RD_KAFKA_RESP_ERR__UNKNOWN_TOPIC:
        case RD_KAFKA_RESP_ERR__UNKNOWN_PARTITION:
            return static_cast<int16_t>(ErrorType::UNKNOWN_TOPIC_OR_PARTITION);
        case RD_KAFKA_RESP_ERR__WAIT_COORD:
            return static_cast<int16_t>(ErrorType::COORDINATOR_NOT_AVAILABLE);
        default:
            break;
    }
    if (err < 0) {
        return static_cast<int16_t>(ErrorType::UNKNOWN);
    }
    // Broker errors share the protocol numbering
    return static_cast<int16_t>(err);
}

KafkaProtocolError protocolError(rd_kafka_resp_err_t err, const std::string& context) {
    return KafkaProtocolError(protocolCode(err), context + ": " + rd_kafka_err2str(err));
}

void throwIfError(const rd_kafka_error_t* err, const std::string& context) {
    if (!err || rd_kafka_error_code(err) == RD_KAFKA_RESP_ERR_NO_ERROR) {
        return;
    }
    throw KafkaProtocolError(protocolCode(rd_kafka_error_code(err)),
                             context + ": " + rd_kafka_error_string(err));
}

AdminRequest::AdminRequest(rd_kafka_t* handle, rd_kafka_admin_op_t op, int timeout_ms)
    : options_(rd_kafka_AdminOptions_new(handle, op)),
      queue_(rd_kafka_queue_new(handle)),
      timeout_ms_(timeout_ms) {
    char errstr[512];
    if (rd_kafka_AdminOptions_set_request_timeout(options_, timeout_ms, errstr, sizeof(errstr)) !=
        RD_KAFKA_RESP_ERR_NO_ERROR) {
        rd_kafka_AdminOptions_destroy(options_);
        rd_kafka_queue_destroy(queue_);
        throw KafkaProtocolError(ErrorType::INVALID_REQUEST,
                                 std::string("Failed to set request timeout: ") + errstr);
    }
}

AdminRequest::~AdminRequest() {
    rd_kafka_AdminOptions_destroy(options_);
    rd_kafka_queue_destroy(queue_);
}

void AdminRequest::setOperationTimeout(int timeout_ms) {
    char errstr[512];
    if (rd_kafka_AdminOptions_set_operation_timeout(options_, timeout_ms, errstr, sizeof(errstr)) !=
        RD_KAFKA_RESP_ERR_NO_ERROR) {
        throw KafkaProtocolError(ErrorType::INVALID_REQUEST,
                                 std::string("Failed to set operation timeout: ") + errstr);
    }
}

void AdminRequest::setValidateOnly(bool validate_only) {
    char errstr[512];
    if (rd_kafka_AdminOptions_set_validate_only(options_, validate_only ? 1 : 0, errstr, sizeof(errstr)) !=
        RD_KAFKA_RESP_ERR_NO_ERROR) {
        throw KafkaProtocolError(ErrorType::INVALID_REQUEST,
                                 std::string("Failed to set validate_only: ") + errstr);
    }
}

std::unique_ptr<rd_kafka_event_t, void (*)(rd_kafka_event_t*)> AdminRequest::awaitResult(
    const std::string& context) {
    // Leave the client-side request timeout room to report first
    rd_kafka_event_t* event = rd_kafka_queue_poll(queue_, timeout_ms_ + 1000);
    if (!event) {
        throw KafkaProtocolError(ErrorType::REQUEST_TIMED_OUT, context + ": no result received");
    }

    std::unique_ptr<rd_kafka_event_t, void (*)(rd_kafka_event_t*)> result(event, rd_kafka_event_destroy);
    rd_kafka_resp_err_t err = rd_kafka_event_error(event);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        const char* message = rd_kafka_event_error_string(event);
        throw KafkaProtocolError(protocolCode(err), context + ": " + (message ? message : rd_kafka_err2str(err)));
    }
    return result;
}

TopicMetadata topicMetadataFrom(const cppkafka::TopicMetadata& metadata) {
    TopicMetadata result;
    result.topic = metadata.get_name();
    result.topic_error_code = protocolCode(metadata.get_error().get_error());
    for (const auto& partition : metadata.get_partitions()) {
        PartitionMetadata entry;
        entry.partition_id = static_cast<int32_t>(partition.get_id());
        entry.partition_error_code = protocolCode(partition.get_error().get_error());
        entry.leader = partition.get_leader();
        entry.replicas = partition.get_replicas();
        entry.isr = partition.get_in_sync_replicas();
        result.partition_metadata.push_back(entry);
    }
    return result;
}

TopicMetadata fetchTopicMetadata(cppkafka::Producer& handle, const std::string& topic) {
    try {
        return topicMetadataFrom(handle.get_metadata(handle.get_topic(topic)));
    } catch (const cppkafka::ElementNotFound&) {
        TopicMetadata missing;
        missing.topic = topic;
        missing.topic_error_code = static_cast<int16_t>(ErrorType::UNKNOWN_TOPIC_OR_PARTITION);
        return missing;
    } catch (const cppkafka::HandleException& e) {
        throw protocolError(e.get_error().get_error(), "Failed to fetch metadata for topic " + topic);
    }
}
