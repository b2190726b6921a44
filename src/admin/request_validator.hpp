#ifndef REQUEST_VALIDATOR_HPP
#define REQUEST_VALIDATOR_HPP

#include "protocol_types.hpp"
#include <string>
#include <vector>

// Pre-flight checks for admin requests. Every method throws ValidationError
// for the first violated rule and performs no I/O.
class RequestValidator {
public:
    // Non-empty list of distinct, non-empty topic names
    static void validateCreateTopics(const std::vector<TopicSpec>& topics);

    // Non-empty topic names
    static void validateDeleteTopics(const std::vector<std::string>& topics);

    // Non-empty list of distinct, non-empty topic names
    static void validateCreatePartitions(const std::vector<TopicPartitionsSpec>& topic_partitions);

    // Each topic name non-empty ("Invalid topic <name>")
    static void validateTopicNames(const std::vector<std::string>& topics);

    static void validateTopic(const std::string& topic);

    static void validateDescribeConfigs(const std::vector<ResourceConfigQuery>& resources);

    static void validateAlterConfigs(const std::vector<ResourceConfig>& resources);

    // ACL entries, rule by rule: principal, host, resourceName, operation,
    // resourcePatternType, permissionType, resourceType
    static void validateCreateAcls(const std::vector<AclEntry>& acl);

    // Same precedence as validateCreateAcls; absent strings are allowed
    static void validateDeleteAcls(const std::vector<AclFilter>& filters);

    static void validateDescribeAcls(const AclFilter& filter);

    static void validateGroupIds(const std::vector<std::string>& group_ids);

    static void validateGroupId(const std::string& group_id);

    static void validateSetOffsets(const std::string& group_id, const std::string& topic,
                                   const std::vector<PartitionOffsetRequest>& partitions);
};

#endif // REQUEST_VALIDATOR_HPP
