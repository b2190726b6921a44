#include "request_validator.hpp"
#include "kafka_errors.hpp"
#include <set>
#include <sstream>
#include <algorithm>

namespace {

template <typename T, typename Name>
bool hasDuplicates(const std::vector<T>& items, Name name_of) {
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (!seen.insert(name_of(item)).second) {
            return true;
        }
    }
    return false;
}

bool isPresent(const std::optional<std::string>& value) {
    return !value || !value->empty();
}

// Shared rule order for ACL entries and filters
template <typename Acl>
void validateAclEnums(const std::vector<Acl>& acls) {
    for (const auto& acl : acls) {
        if (!isValidAclOperation(acl.operation)) {
            throw ValidationError("Invalid operation type " + enumValueName(acl.operation) +
                                  ": " + toJson(acl));
        }
    }
    for (const auto& acl : acls) {
        if (!isValidResourcePatternType(acl.resource_pattern_type)) {
            throw ValidationError("Invalid resource pattern type " +
                                  enumValueName(acl.resource_pattern_type) + ": " + toJson(acl));
        }
    }
    for (const auto& acl : acls) {
        if (!isValidAclPermissionType(acl.permission_type)) {
            throw ValidationError("Invalid permission type " + enumValueName(acl.permission_type) +
                                  ": " + toJson(acl));
        }
    }
    for (const auto& acl : acls) {
        if (!isValidResourceType(acl.resource_type)) {
            throw ValidationError("Invalid resource type " + enumValueName(acl.resource_type) +
                                  ": " + toJson(acl));
        }
    }
}

template <typename Resource>
void validateResourceIdentity(const std::vector<Resource>& resources) {
    if (resources.empty()) {
        throw ValidationError("Resources array cannot be empty");
    }
    for (const auto& resource : resources) {
        if (!isValidResourceType(resource.type)) {
            throw ValidationError("Invalid resource type " + std::to_string(resource.type) +
                                  ": " + toJson(resource));
        }
    }
    for (const auto& resource : resources) {
        if (resource.name.empty()) {
            throw ValidationError("Invalid resource name " + resource.name + ": " +
                                  toJson(resource));
        }
    }
}

} // namespace

void RequestValidator::validateCreateTopics(const std::vector<TopicSpec>& topics) {
    if (topics.empty()) {
        throw ValidationError("Empty topics array");
    }
    if (std::any_of(topics.begin(), topics.end(),
                    [](const TopicSpec& t) { return t.topic.empty(); })) {
        throw ValidationError("Invalid topics array, the topic names have to be a valid string");
    }
    if (hasDuplicates(topics, [](const TopicSpec& t) { return t.topic; })) {
        throw ValidationError(
            "Invalid topics array, it cannot have multiple entries for the same topic");
    }
}

void RequestValidator::validateDeleteTopics(const std::vector<std::string>& topics) {
    if (std::any_of(topics.begin(), topics.end(),
                    [](const std::string& t) { return t.empty(); })) {
        throw ValidationError("Invalid topics array, the names must be a valid string");
    }
}

void RequestValidator::validateCreatePartitions(
    const std::vector<TopicPartitionsSpec>& topic_partitions) {
    if (topic_partitions.empty()) {
        throw ValidationError("Empty topic partitions array");
    }
    if (std::any_of(topic_partitions.begin(), topic_partitions.end(),
                    [](const TopicPartitionsSpec& t) { return t.topic.empty(); })) {
        throw ValidationError(
            "Invalid topic partitions array, the topic names have to be a valid string");
    }
    if (hasDuplicates(topic_partitions, [](const TopicPartitionsSpec& t) { return t.topic; })) {
        throw ValidationError(
            "Invalid topic partitions array, it cannot have multiple entries for the same topic");
    }
}

void RequestValidator::validateTopicNames(const std::vector<std::string>& topics) {
    for (const auto& topic : topics) {
        validateTopic(topic);
    }
}

void RequestValidator::validateTopic(const std::string& topic) {
    if (topic.empty()) {
        throw ValidationError("Invalid topic " + topic);
    }
}

void RequestValidator::validateDescribeConfigs(const std::vector<ResourceConfigQuery>& resources) {
    validateResourceIdentity(resources);

    for (const auto& resource : resources) {
        bool invalid = std::any_of(resource.config_names.begin(), resource.config_names.end(),
                                   [](const std::string& n) { return n.empty(); });
        if (invalid) {
            std::ostringstream names;
            for (size_t i = 0; i < resource.config_names.size(); ++i) {
                if (i > 0) names << ",";
                names << resource.config_names[i];
            }
            throw ValidationError("Invalid resource configNames " + names.str() + ": " +
                                  toJson(resource));
        }
    }
}

void RequestValidator::validateAlterConfigs(const std::vector<ResourceConfig>& resources) {
    validateResourceIdentity(resources);

    for (const auto& resource : resources) {
        bool invalid = std::any_of(resource.config_entries.begin(), resource.config_entries.end(),
                                   [](const ConfigEntry& e) { return e.name.empty() || !e.value; });
        if (invalid) {
            throw ValidationError("Invalid resource config value: " + toJson(resource));
        }
    }
}

void RequestValidator::validateCreateAcls(const std::vector<AclEntry>& acl) {
    if (acl.empty()) {
        throw ValidationError("Empty ACL array");
    }
    if (std::any_of(acl.begin(), acl.end(), [](const AclEntry& a) { return a.principal.empty(); })) {
        throw ValidationError("Invalid ACL array, the principals have to be a valid string");
    }
    if (std::any_of(acl.begin(), acl.end(), [](const AclEntry& a) { return a.host.empty(); })) {
        throw ValidationError("Invalid ACL array, the hosts have to be a valid string");
    }
    if (std::any_of(acl.begin(), acl.end(),
                    [](const AclEntry& a) { return a.resource_name.empty(); })) {
        throw ValidationError("Invalid ACL array, the resourceNames have to be a valid string");
    }
    validateAclEnums(acl);
}

void RequestValidator::validateDeleteAcls(const std::vector<AclFilter>& filters) {
    if (filters.empty()) {
        throw ValidationError("Empty ACL Filter array");
    }
    if (std::any_of(filters.begin(), filters.end(),
                    [](const AclFilter& f) { return !isPresent(f.principal); })) {
        throw ValidationError("Invalid ACL Filter array, the principals have to be a valid string");
    }
    if (std::any_of(filters.begin(), filters.end(),
                    [](const AclFilter& f) { return !isPresent(f.host); })) {
        throw ValidationError("Invalid ACL Filter array, the hosts have to be a valid string");
    }
    if (std::any_of(filters.begin(), filters.end(),
                    [](const AclFilter& f) { return !isPresent(f.resource_name); })) {
        throw ValidationError(
            "Invalid ACL Filter array, the resourceNames have to be a valid string");
    }
    validateAclEnums(filters);
}

void RequestValidator::validateDescribeAcls(const AclFilter& filter) {
    if (!isPresent(filter.principal)) {
        throw ValidationError("Invalid principal, the principal have to be a valid string");
    }
    if (!isPresent(filter.host)) {
        throw ValidationError("Invalid host, the host have to be a valid string");
    }
    if (!isPresent(filter.resource_name)) {
        throw ValidationError("Invalid resourceName, the resourceName have to be a valid string");
    }
    if (!isValidAclOperation(filter.operation)) {
        throw ValidationError("Invalid operation type " + enumValueName(filter.operation));
    }
    if (!isValidResourcePatternType(filter.resource_pattern_type)) {
        throw ValidationError("Invalid resource pattern filter type " +
                              enumValueName(filter.resource_pattern_type));
    }
    if (!isValidAclPermissionType(filter.permission_type)) {
        throw ValidationError("Invalid permission type " + enumValueName(filter.permission_type));
    }
    if (!isValidResourceType(filter.resource_type)) {
        throw ValidationError("Invalid resource type " + enumValueName(filter.resource_type));
    }
}

void RequestValidator::validateGroupIds(const std::vector<std::string>& group_ids) {
    if (group_ids.empty()) {
        throw ValidationError("Empty groupIds array");
    }
    for (const auto& group_id : group_ids) {
        if (group_id.empty()) {
            throw ValidationError("Invalid groupId name: \"" + group_id + "\"");
        }
    }
}

void RequestValidator::validateGroupId(const std::string& group_id) {
    if (group_id.empty()) {
        throw ValidationError("Invalid groupId " + group_id);
    }
}

void RequestValidator::validateSetOffsets(const std::string& group_id, const std::string& topic,
                                          const std::vector<PartitionOffsetRequest>& partitions) {
    validateGroupId(group_id);
    validateTopic(topic);

    if (partitions.empty()) {
        throw ValidationError("Invalid partitions");
    }
    for (const auto& p : partitions) {
        if (p.partition < 0) {
            throw ValidationError("Invalid partition " + std::to_string(p.partition));
        }
        if (p.offset < SeekTarget::EARLIEST) {
            throw ValidationError("Invalid offset " + std::to_string(p.offset) +
                                  " for partition " + std::to_string(p.partition));
        }
    }
}
