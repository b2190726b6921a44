#include "kafka_errors.hpp"
#include <map>

namespace {

const std::map<ErrorType, std::string>& errorTypeNames() {
    static const std::map<ErrorType, std::string> names = {
        {ErrorType::UNKNOWN_SERVER_ERROR, "UNKNOWN_SERVER_ERROR"},
        {ErrorType::NONE, "NONE"},
        {ErrorType::OFFSET_OUT_OF_RANGE, "OFFSET_OUT_OF_RANGE"},
        {ErrorType::UNKNOWN_TOPIC_OR_PARTITION, "UNKNOWN_TOPIC_OR_PARTITION"},
        {ErrorType::LEADER_NOT_AVAILABLE, "LEADER_NOT_AVAILABLE"},
        {ErrorType::NOT_LEADER_FOR_PARTITION, "NOT_LEADER_FOR_PARTITION"},
        {ErrorType::REQUEST_TIMED_OUT, "REQUEST_TIMED_OUT"},
        {ErrorType::BROKER_NOT_AVAILABLE, "BROKER_NOT_AVAILABLE"},
        {ErrorType::NETWORK_EXCEPTION, "NETWORK_EXCEPTION"},
        {ErrorType::COORDINATOR_LOAD_IN_PROGRESS, "COORDINATOR_LOAD_IN_PROGRESS"},
        {ErrorType::COORDINATOR_NOT_AVAILABLE, "COORDINATOR_NOT_AVAILABLE"},
        {ErrorType::NOT_COORDINATOR, "NOT_COORDINATOR"},
        {ErrorType::INVALID_TOPIC_EXCEPTION, "INVALID_TOPIC_EXCEPTION"},
        {ErrorType::NOT_ENOUGH_REPLICAS, "NOT_ENOUGH_REPLICAS"},
        {ErrorType::INVALID_GROUP_ID, "INVALID_GROUP_ID"},
        {ErrorType::TOPIC_AUTHORIZATION_FAILED, "TOPIC_AUTHORIZATION_FAILED"},
        {ErrorType::GROUP_AUTHORIZATION_FAILED, "GROUP_AUTHORIZATION_FAILED"},
        {ErrorType::CLUSTER_AUTHORIZATION_FAILED, "CLUSTER_AUTHORIZATION_FAILED"},
        {ErrorType::UNSUPPORTED_VERSION, "UNSUPPORTED_VERSION"},
        {ErrorType::TOPIC_ALREADY_EXISTS, "TOPIC_ALREADY_EXISTS"},
        {ErrorType::INVALID_PARTITIONS, "INVALID_PARTITIONS"},
        {ErrorType::INVALID_REPLICATION_FACTOR, "INVALID_REPLICATION_FACTOR"},
        {ErrorType::INVALID_REPLICA_ASSIGNMENT, "INVALID_REPLICA_ASSIGNMENT"},
        {ErrorType::INVALID_CONFIG, "INVALID_CONFIG"},
        {ErrorType::NOT_CONTROLLER, "NOT_CONTROLLER"},
        {ErrorType::INVALID_REQUEST, "INVALID_REQUEST"},
        {ErrorType::POLICY_VIOLATION, "POLICY_VIOLATION"},
        {ErrorType::SECURITY_DISABLED, "SECURITY_DISABLED"},
        {ErrorType::NON_EMPTY_GROUP, "NON_EMPTY_GROUP"},
        {ErrorType::GROUP_ID_NOT_FOUND, "GROUP_ID_NOT_FOUND"},
        {ErrorType::TOPIC_DELETION_DISABLED, "TOPIC_DELETION_DISABLED"},
        {ErrorType::UNKNOWN, "UNKNOWN"},
    };
    return names;
}

} // namespace

ErrorType errorTypeFromCode(int16_t code) {
    auto type = static_cast<ErrorType>(code);
    const auto& names = errorTypeNames();
    if (names.find(type) == names.end()) {
        return ErrorType::UNKNOWN;
    }
    return type;
}

std::string errorTypeName(ErrorType type) {
    const auto& names = errorTypeNames();
    auto it = names.find(type);
    if (it == names.end()) {
        return "UNKNOWN";
    }
    return it->second;
}

KafkaProtocolError::KafkaProtocolError(int16_t code, const std::string& message)
    : AdminError(message), code_(code), type_(errorTypeFromCode(code)) {
}

KafkaProtocolError::KafkaProtocolError(ErrorType type, const std::string& message)
    : AdminError(message), code_(static_cast<int16_t>(type)), type_(type) {
}
