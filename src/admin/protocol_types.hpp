#ifndef PROTOCOL_TYPES_HPP
#define PROTOCOL_TYPES_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <limits>

// Resource kinds addressed by ACLs and configs
enum class ResourceType : int32_t {
    UNKNOWN = 0,
    ANY = 1,
    TOPIC = 2,
    GROUP = 3,
    CLUSTER = 4,
    TRANSACTIONAL_ID = 5,
    DELEGATION_TOKEN = 6
};

enum class ResourcePatternType : int32_t {
    UNKNOWN = 0,
    ANY = 1,
    MATCH = 2,
    LITERAL = 3,
    PREFIXED = 4
};

enum class AclOperation : int32_t {
    UNKNOWN = 0,
    ANY = 1,
    ALL = 2,
    READ = 3,
    WRITE = 4,
    CREATE = 5,
    DELETE = 6,
    ALTER = 7,
    DESCRIBE = 8,
    CLUSTER_ACTION = 9,
    DESCRIBE_CONFIGS = 10,
    ALTER_CONFIGS = 11,
    IDEMPOTENT_WRITE = 12
};

enum class AclPermissionType : int32_t {
    UNKNOWN = 0,
    ANY = 1,
    DENY = 2,
    ALLOW = 3
};

// Membership checks against the protocol enumeration sets
bool isValidResourceType(int32_t value);
bool isValidResourcePatternType(int32_t value);
bool isValidAclOperation(int32_t value);
bool isValidAclPermissionType(int32_t value);

// Marks an enumerated field the request left out; no membership check accepts it
constexpr int32_t UNDEFINED_ENUM_VALUE = std::numeric_limits<int32_t>::min();

// Decimal value, or "undefined" for UNDEFINED_ENUM_VALUE
std::string enumValueName(int32_t value);

// Enumerated fields are kept as raw protocol integers so that out-of-range
// values survive decoding and can be rejected by the validator.
struct AclEntry {
    int32_t resource_type = UNDEFINED_ENUM_VALUE;
    std::string resource_name;
    int32_t resource_pattern_type = UNDEFINED_ENUM_VALUE;
    std::string principal;
    std::string host;
    int32_t operation = UNDEFINED_ENUM_VALUE;
    int32_t permission_type = UNDEFINED_ENUM_VALUE;
};

// Absent string fields match everything; the enums must always be given
// (ANY matches every value)
struct AclFilter {
    int32_t resource_type = UNDEFINED_ENUM_VALUE;
    std::optional<std::string> resource_name;
    int32_t resource_pattern_type = UNDEFINED_ENUM_VALUE;
    std::optional<std::string> principal;
    std::optional<std::string> host;
    int32_t operation = UNDEFINED_ENUM_VALUE;
    int32_t permission_type = UNDEFINED_ENUM_VALUE;
};

struct AclDescription {
    std::string principal;
    std::string host;
    int32_t operation = 0;
    int32_t permission_type = 0;
};

struct AclResource {
    int32_t resource_type = 0;
    std::string resource_name;
    int32_t resource_pattern_type = 0;
    std::vector<AclDescription> acls;
};

struct DescribeAclsResponse {
    int32_t throttle_time_ms = 0;
    int16_t error_code = 0;
    std::optional<std::string> error_message;
    std::vector<AclResource> resources;
};

struct MatchingAcl {
    int16_t error_code = 0;
    std::optional<std::string> error_message;
    AclEntry acl;
};

struct FilterResponse {
    int16_t error_code = 0;
    std::optional<std::string> error_message;
    std::vector<MatchingAcl> matching_acls;
};

struct DeleteAclsResponse {
    int32_t throttle_time_ms = 0;
    std::vector<FilterResponse> filter_responses;
};

// Config name/value pair; a missing value is a validation failure on alter
struct ConfigEntry {
    std::string name;
    std::optional<std::string> value;
};

struct ReplicaAssignment {
    int32_t partition = 0;
    std::vector<int32_t> replicas;
};

// -1 lets the broker apply its defaults
struct TopicSpec {
    std::string topic;
    int32_t num_partitions = -1;
    int16_t replication_factor = -1;
    std::vector<ReplicaAssignment> replica_assignment;
    std::vector<ConfigEntry> config_entries;
};

struct TopicPartitionsSpec {
    std::string topic;
    // New total partition count
    int32_t count = 0;
    // Replica lists for each new partition, in order
    std::vector<std::vector<int32_t>> assignments;
};

struct ResourceConfigQuery {
    int32_t type = static_cast<int32_t>(ResourceType::TOPIC);
    std::string name;
    // Empty means all configs
    std::vector<std::string> config_names;
};

struct ResourceConfig {
    int32_t type = static_cast<int32_t>(ResourceType::TOPIC);
    std::string name;
    std::vector<ConfigEntry> config_entries;
};

struct ConfigSynonym {
    std::string config_name;
    std::optional<std::string> config_value;
    int32_t config_source = 0;
};

struct DescribedConfigEntry {
    std::string config_name;
    std::optional<std::string> config_value;
    bool read_only = false;
    bool is_default = false;
    bool is_sensitive = false;
    std::vector<ConfigSynonym> config_synonyms;
};

struct DescribedResource {
    int16_t error_code = 0;
    std::optional<std::string> error_message;
    int32_t resource_type = 0;
    std::string resource_name;
    std::vector<DescribedConfigEntry> config_entries;
};

struct DescribeConfigsResponse {
    int32_t throttle_time_ms = 0;
    std::vector<DescribedResource> resources;
};

struct AlteredResource {
    int16_t error_code = 0;
    std::optional<std::string> error_message;
    int32_t resource_type = 0;
    std::string resource_name;
};

struct AlterConfigsResponse {
    int32_t throttle_time_ms = 0;
    std::vector<AlteredResource> resources;
};

struct GroupOverview {
    std::string group_id;
    std::string protocol_type;
};

// Offset positions to seek a group to
struct SeekTarget {
    static constexpr int64_t EARLIEST = -2;
    static constexpr int64_t LATEST = -1;

    std::string topic;
    int32_t partition = 0;
    int64_t offset = 0;
};

struct PartitionOffsetRequest {
    int32_t partition = 0;
    int64_t offset = 0;
};

struct GroupPartitionOffset {
    int32_t partition = 0;
    int64_t offset = -1;
    std::optional<std::string> metadata;
};

struct TopicWatermarks {
    int32_t partition = 0;
    int64_t offset = 0;
    int64_t high = 0;
    int64_t low = 0;
};

// JSON renderings used to echo offending records in validation messages
std::string toJson(const AclEntry& entry);
std::string toJson(const AclFilter& filter);
std::string toJson(const ResourceConfigQuery& resource);
std::string toJson(const ResourceConfig& resource);
std::string toJson(const ConfigEntry& entry);

#endif // PROTOCOL_TYPES_HPP
