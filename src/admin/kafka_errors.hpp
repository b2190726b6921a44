#ifndef KAFKA_ERRORS_HPP
#define KAFKA_ERRORS_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <utility>

// Protocol error kinds the admin layer classifies on. Values are Kafka error codes.
enum class ErrorType : int16_t {
    UNKNOWN_SERVER_ERROR = -1,
    NONE = 0,
    OFFSET_OUT_OF_RANGE = 1,
    UNKNOWN_TOPIC_OR_PARTITION = 3,
    LEADER_NOT_AVAILABLE = 5,
    NOT_LEADER_FOR_PARTITION = 6,
    REQUEST_TIMED_OUT = 7,
    BROKER_NOT_AVAILABLE = 8,
    NETWORK_EXCEPTION = 13,
    COORDINATOR_LOAD_IN_PROGRESS = 14,
    COORDINATOR_NOT_AVAILABLE = 15,
    NOT_COORDINATOR = 16,
    INVALID_TOPIC_EXCEPTION = 17,
    NOT_ENOUGH_REPLICAS = 19,
    INVALID_GROUP_ID = 24,
    TOPIC_AUTHORIZATION_FAILED = 29,
    GROUP_AUTHORIZATION_FAILED = 30,
    CLUSTER_AUTHORIZATION_FAILED = 31,
    UNSUPPORTED_VERSION = 35,
    TOPIC_ALREADY_EXISTS = 36,
    INVALID_PARTITIONS = 37,
    INVALID_REPLICATION_FACTOR = 38,
    INVALID_REPLICA_ASSIGNMENT = 39,
    INVALID_CONFIG = 40,
    NOT_CONTROLLER = 41,
    INVALID_REQUEST = 42,
    POLICY_VIOLATION = 44,
    SECURITY_DISABLED = 54,
    NON_EMPTY_GROUP = 68,
    GROUP_ID_NOT_FOUND = 69,
    TOPIC_DELETION_DISABLED = 73,
    // Any code not listed above
    UNKNOWN = 32767
};

// Map a raw protocol error code to its ErrorType (UNKNOWN when unmapped)
ErrorType errorTypeFromCode(int16_t code);

// Protocol name of an error type, e.g. "NOT_CONTROLLER"
std::string errorTypeName(ErrorType type);

// Base class of every error raised by the admin layer
class AdminError : public std::runtime_error {
public:
    explicit AdminError(const std::string& message) : std::runtime_error(message) {}
};

// Errors that must never be retried
class NonRetriableError : public AdminError {
public:
    explicit NonRetriableError(const std::string& message) : AdminError(message) {}
};

// Request payload rejected before any network call
class ValidationError : public NonRetriableError {
public:
    explicit ValidationError(const std::string& message) : NonRetriableError(message) {}
};

// A typed failure returned by a broker
class KafkaProtocolError : public AdminError {
public:
    KafkaProtocolError(int16_t code, const std::string& message);
    KafkaProtocolError(ErrorType type, const std::string& message);

    ErrorType type() const { return type_; }
    int16_t code() const { return code_; }

private:
    int16_t code_;
    ErrorType type_;
};

// Local deadline expired (leader wait, offset adoption)
class TimeoutError : public AdminError {
public:
    explicit TimeoutError(const std::string& message) : AdminError(message) {}
};

// Outcome of deleting a single consumer group
struct GroupDeletionResult {
    std::string group_id;
    int16_t error_code = 0;
    // Error type name, empty on success
    std::string error;
};

// Some groups of a delete-groups pass could not be deleted
class DeleteGroupsError : public AdminError {
public:
    DeleteGroupsError(const std::string& message, std::vector<GroupDeletionResult> failures)
        : AdminError(message), failures_(std::move(failures)) {}

    const std::vector<GroupDeletionResult>& failures() const { return failures_; }

private:
    std::vector<GroupDeletionResult> failures_;
};

#endif // KAFKA_ERRORS_HPP
