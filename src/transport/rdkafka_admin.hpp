#ifndef RDKAFKA_ADMIN_HPP
#define RDKAFKA_ADMIN_HPP

#include "../admin/kafka_errors.hpp"
#include "../admin/cluster.hpp"
#include <cppkafka/cppkafka.h>
#include <librdkafka/rdkafka.h>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Kafka protocol code for a librdkafka error (local errors are folded into
// the closest protocol code)
int16_t protocolCode(rd_kafka_resp_err_t err);

KafkaProtocolError protocolError(rd_kafka_resp_err_t err, const std::string& context);

// Throw when err is set. err may be null.
void throwIfError(const rd_kafka_error_t* err, const std::string& context);

// Convert cppkafka topic metadata into the admin layer's representation
TopicMetadata topicMetadataFrom(const cppkafka::TopicMetadata& metadata);

// Metadata of a single topic. A topic unknown to the cluster is reported
// through topic_error_code rather than thrown.
TopicMetadata fetchTopicMetadata(cppkafka::Producer& handle, const std::string& topic);

// Owns an array of librdkafka admin objects and frees them with the
// matching *_destroy_array function
template <typename T, void (*Destroy)(T**, size_t)>
class AdminObjects {
public:
    AdminObjects() = default;
    AdminObjects(const AdminObjects&) = delete;
    AdminObjects& operator=(const AdminObjects&) = delete;
    ~AdminObjects() {
        if (!items_.empty()) {
            Destroy(items_.data(), items_.size());
        }
    }

    void add(T* item) { items_.push_back(item); }
    T** data() { return items_.data(); }
    size_t size() const { return items_.size(); }

private:
    std::vector<T*> items_;
};

// Temporary result queue plus options for one admin request
class AdminRequest {
public:
    AdminRequest(rd_kafka_t* handle, rd_kafka_admin_op_t op, int timeout_ms);
    ~AdminRequest();

    AdminRequest(const AdminRequest&) = delete;
    AdminRequest& operator=(const AdminRequest&) = delete;

    // Broker-side operation timeout (topic and partition operations)
    void setOperationTimeout(int timeout_ms);

    void setValidateOnly(bool validate_only);

    rd_kafka_AdminOptions_t* options() { return options_; }
    rd_kafka_queue_t* queue() { return queue_; }

    // Wait for the result event. Throws on timeout or request-level error.
    std::unique_ptr<rd_kafka_event_t, void (*)(rd_kafka_event_t*)> awaitResult(const std::string& context);

private:
    rd_kafka_AdminOptions_t* options_;
    rd_kafka_queue_t* queue_;
    int timeout_ms_;
};

#endif // RDKAFKA_ADMIN_HPP
