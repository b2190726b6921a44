#include "request_codec.hpp"
#include <cstdlib>
#include <limits>
#include <utility>

namespace {

using crow::json::rvalue;
using crow::json::wvalue;

std::string dump(const rvalue& value) {
    return wvalue(value).dump();
}

bool isString(const rvalue& value) {
    return value.t() == crow::json::type::String;
}

bool isNumber(const rvalue& value) {
    return value.t() == crow::json::type::Number;
}

bool isObject(const rvalue& value) {
    return value.t() == crow::json::type::Object;
}

// Range is checked on the double reading so wide values cannot wrap
template <typename T>
T intValue(const rvalue& value) {
    if (!isNumber(value)) {
        return -1;
    }
    double number = value.d();
    if (number < static_cast<double>(std::numeric_limits<T>::min()) ||
        number > static_cast<double>(std::numeric_limits<T>::max())) {
        return -1;
    }
    return static_cast<T>(value.i());
}

// The list under key, or ValidationError("Invalid <label> <value>")
const rvalue& requireList(const rvalue& body, const std::string& key, const std::string& label) {
    if (!isObject(body) || !body.has(key)) {
        throw ValidationError("Invalid " + label + " undefined");
    }
    const rvalue& value = body[key];
    if (value.t() != crow::json::type::List) {
        throw ValidationError("Invalid " + label + " " + dump(value));
    }
    return value;
}

// Non-string values decode to "" so the validator rejects them
std::string stringValue(const rvalue& value) {
    return isString(value) ? std::string(value.s()) : std::string();
}

std::string stringField(const rvalue& object, const std::string& key) {
    if (!isObject(object) || !object.has(key)) {
        return std::string();
    }
    return stringValue(object[key]);
}

// Absent or null leaves the filter unset; any other non-string is invalid
std::optional<std::string> optionalStringField(const rvalue& object, const std::string& key) {
    if (!isObject(object) || !object.has(key) || object[key].t() == crow::json::type::Null) {
        return std::nullopt;
    }
    return stringValue(object[key]);
}

// Absent keeps the default; a non-number, or a number outside the range of T,
// becomes -1, which no enum, partition or count accepts
template <typename T>
T intField(const rvalue& object, const std::string& key, T default_value) {
    if (!isObject(object) || !object.has(key)) {
        return default_value;
    }
    return intValue<T>(object[key]);
}

bool boolField(const rvalue& object, const std::string& key, bool default_value) {
    if (!isObject(object) || !object.has(key)) {
        return default_value;
    }
    const rvalue& value = object[key];
    if (value.t() == crow::json::type::True) {
        return true;
    }
    if (value.t() == crow::json::type::False) {
        return false;
    }
    return default_value;
}

std::vector<ConfigEntry> configEntries(const rvalue& object) {
    std::vector<ConfigEntry> entries;
    if (!isObject(object) || !object.has("configEntries") ||
        object["configEntries"].t() != crow::json::type::List) {
        return entries;
    }
    for (const auto& item : object["configEntries"]) {
        ConfigEntry entry;
        entry.name = stringField(item, "name");
        if (isObject(item) && item.has("value") && isString(item["value"])) {
            entry.value = std::string(item["value"].s());
        }
        entries.push_back(entry);
    }
    return entries;
}

std::vector<int32_t> intList(const rvalue& value) {
    std::vector<int32_t> result;
    if (value.t() != crow::json::type::List) {
        return result;
    }
    for (const auto& item : value) {
        result.push_back(intValue<int32_t>(item));
    }
    return result;
}

AclEntry aclEntry(const rvalue& item) {
    AclEntry acl;
    acl.resource_type = intField<int32_t>(item, "resourceType", acl.resource_type);
    acl.resource_name = stringField(item, "resourceName");
    acl.resource_pattern_type = intField<int32_t>(item, "resourcePatternType", acl.resource_pattern_type);
    acl.principal = stringField(item, "principal");
    acl.host = stringField(item, "host");
    acl.operation = intField<int32_t>(item, "operation", acl.operation);
    acl.permission_type = intField<int32_t>(item, "permissionType", acl.permission_type);
    return acl;
}

wvalue optionalString(const std::optional<std::string>& value) {
    return value ? wvalue(*value) : wvalue(nullptr);
}

wvalue encodeAcl(const AclEntry& acl) {
    wvalue json;
    json["resourceType"] = acl.resource_type;
    json["resourceName"] = acl.resource_name;
    json["resourcePatternType"] = acl.resource_pattern_type;
    json["principal"] = acl.principal;
    json["host"] = acl.host;
    json["operation"] = acl.operation;
    json["permissionType"] = acl.permission_type;
    return json;
}

wvalue encodeInts(const std::vector<int32_t>& values) {
    wvalue::list list;
    for (int32_t value : values) {
        list.push_back(wvalue(value));
    }
    return wvalue(std::move(list));
}

} // namespace

crow::json::rvalue RequestCodec::parseBody(const std::string& body) {
    crow::json::rvalue json = crow::json::load(body);
    if (!json) {
        throw ValidationError("Invalid JSON body");
    }
    return json;
}

CreateTopicsRequest RequestCodec::decodeCreateTopics(const crow::json::rvalue& body) {
    CreateTopicsRequest request;
    for (const auto& item : requireList(body, "topics", "topics array")) {
        TopicSpec spec;
        spec.topic = stringField(item, "topic");
        spec.num_partitions = intField<int32_t>(item, "numPartitions", spec.num_partitions);
        spec.replication_factor = intField<int16_t>(item, "replicationFactor", spec.replication_factor);
        if (isObject(item) && item.has("replicaAssignment") &&
            item["replicaAssignment"].t() == crow::json::type::List) {
            for (const auto& assignment : item["replicaAssignment"]) {
                ReplicaAssignment replica;
                replica.partition = intField<int32_t>(assignment, "partition", 0);
                if (isObject(assignment) && assignment.has("replicas")) {
                    replica.replicas = intList(assignment["replicas"]);
                }
                spec.replica_assignment.push_back(replica);
            }
        }
        spec.config_entries = configEntries(item);
        request.topics.push_back(spec);
    }
    request.validate_only = boolField(body, "validateOnly", request.validate_only);
    request.wait_for_leaders = boolField(body, "waitForLeaders", request.wait_for_leaders);
    request.timeout_ms = intField<int>(body, "timeout", request.timeout_ms);
    return request;
}

DeleteTopicsRequest RequestCodec::decodeDeleteTopics(const crow::json::rvalue& body) {
    DeleteTopicsRequest request;
    for (const auto& item : requireList(body, "topics", "topics array")) {
        request.topics.push_back(stringValue(item));
    }
    request.timeout_ms = intField<int>(body, "timeout", request.timeout_ms);
    return request;
}

CreatePartitionsRequest RequestCodec::decodeCreatePartitions(const crow::json::rvalue& body) {
    CreatePartitionsRequest request;
    for (const auto& item : requireList(body, "topicPartitions", "topic partitions array")) {
        TopicPartitionsSpec spec;
        spec.topic = stringField(item, "topic");
        spec.count = intField<int32_t>(item, "count", 0);
        if (isObject(item) && item.has("assignments") && item["assignments"].t() == crow::json::type::List) {
            for (const auto& assignment : item["assignments"]) {
                spec.assignments.push_back(intList(assignment));
            }
        }
        request.topic_partitions.push_back(spec);
    }
    request.validate_only = boolField(body, "validateOnly", request.validate_only);
    request.timeout_ms = intField<int>(body, "timeout", request.timeout_ms);
    return request;
}

std::vector<std::string> RequestCodec::decodeTopicNames(const crow::json::rvalue& body) {
    std::vector<std::string> topics;
    if (!isObject(body) || !body.has("topics")) {
        return topics;
    }
    for (const auto& item : requireList(body, "topics", "topics array")) {
        topics.push_back(stringValue(item));
    }
    return topics;
}

std::vector<ResourceConfigQuery> RequestCodec::decodeDescribeConfigs(const crow::json::rvalue& body) {
    std::vector<ResourceConfigQuery> resources;
    for (const auto& item : requireList(body, "resources", "resources array")) {
        ResourceConfigQuery query;
        query.type = intField<int32_t>(item, "type", -1);
        query.name = stringField(item, "name");
        if (isObject(item) && item.has("configNames")) {
            if (item["configNames"].t() != crow::json::type::List) {
                throw ValidationError("Invalid resource configNames " + dump(item["configNames"]));
            }
            for (const auto& name : item["configNames"]) {
                query.config_names.push_back(stringValue(name));
            }
        }
        resources.push_back(query);
    }
    return resources;
}

std::vector<ResourceConfig> RequestCodec::decodeAlterConfigs(const crow::json::rvalue& body) {
    std::vector<ResourceConfig> resources;
    for (const auto& item : requireList(body, "resources", "resources array")) {
        ResourceConfig resource;
        resource.type = intField<int32_t>(item, "type", -1);
        resource.name = stringField(item, "name");
        resource.config_entries = configEntries(item);
        resources.push_back(resource);
    }
    return resources;
}

std::vector<AclEntry> RequestCodec::decodeCreateAcls(const crow::json::rvalue& body) {
    std::vector<AclEntry> acl;
    for (const auto& item : requireList(body, "acl", "ACL array")) {
        acl.push_back(aclEntry(item));
    }
    return acl;
}

AclFilter RequestCodec::decodeAclFilter(const crow::json::rvalue& item) {
    AclFilter filter;
    filter.resource_type = intField<int32_t>(item, "resourceType", filter.resource_type);
    filter.resource_name = optionalStringField(item, "resourceName");
    filter.resource_pattern_type = intField<int32_t>(item, "resourcePatternType", filter.resource_pattern_type);
    filter.principal = optionalStringField(item, "principal");
    filter.host = optionalStringField(item, "host");
    filter.operation = intField<int32_t>(item, "operation", filter.operation);
    filter.permission_type = intField<int32_t>(item, "permissionType", filter.permission_type);
    return filter;
}

std::vector<AclFilter> RequestCodec::decodeDeleteAcls(const crow::json::rvalue& body) {
    std::vector<AclFilter> filters;
    for (const auto& item : requireList(body, "filters", "ACL Filter array")) {
        filters.push_back(decodeAclFilter(item));
    }
    return filters;
}

std::vector<std::string> RequestCodec::decodeGroupIds(const crow::json::rvalue& body) {
    std::vector<std::string> group_ids;
    for (const auto& item : requireList(body, "groupIds", "groupIds array")) {
        group_ids.push_back(stringValue(item));
    }
    return group_ids;
}

std::vector<PartitionOffsetRequest> RequestCodec::decodeSetOffsets(const crow::json::rvalue& body) {
    std::vector<PartitionOffsetRequest> partitions;
    for (const auto& item : requireList(body, "partitions", "partitions")) {
        PartitionOffsetRequest request;
        request.partition = intField<int32_t>(item, "partition", -1);
        if (!isObject(item) || !item.has("offset")) {
            throw ValidationError("Invalid offset for partition " + std::to_string(request.partition));
        }
        const rvalue& offset = item["offset"];
        if (isNumber(offset)) {
            request.offset = offset.i();
        } else if (isString(offset)) {
            std::string text = offset.s();
            char* end = nullptr;
            request.offset = std::strtoll(text.c_str(), &end, 10);
            if (text.empty() || *end != '\0') {
                throw ValidationError("Invalid offset " + text + " for partition " +
                                      std::to_string(request.partition));
            }
        } else {
            throw ValidationError("Invalid offset " + dump(offset) + " for partition " +
                                  std::to_string(request.partition));
        }
        partitions.push_back(request);
    }
    return partitions;
}

crow::json::wvalue RequestCodec::encode(const ClusterDescription& cluster) {
    wvalue json;
    wvalue::list brokers;
    for (const auto& broker : cluster.brokers) {
        wvalue entry;
        entry["nodeId"] = broker.node_id;
        entry["host"] = broker.host;
        entry["port"] = broker.port;
        brokers.push_back(std::move(entry));
    }
    json["brokers"] = std::move(brokers);
    if (cluster.controller) {
        json["controller"] = *cluster.controller;
    } else {
        json["controller"] = nullptr;
    }
    json["clusterId"] = cluster.cluster_id;
    return json;
}

crow::json::wvalue RequestCodec::encode(const std::vector<TopicPartitionsMetadata>& topics) {
    wvalue::list list;
    for (const auto& topic : topics) {
        wvalue entry;
        entry["name"] = topic.name;
        wvalue::list partitions;
        for (const auto& partition : topic.partitions) {
            wvalue p;
            p["partitionErrorCode"] = partition.partition_error_code;
            p["partitionId"] = partition.partition_id;
            p["leader"] = partition.leader;
            p["replicas"] = encodeInts(partition.replicas);
            p["isr"] = encodeInts(partition.isr);
            p["offlineReplicas"] = encodeInts(partition.offline_replicas);
            partitions.push_back(std::move(p));
        }
        entry["partitions"] = std::move(partitions);
        list.push_back(std::move(entry));
    }
    wvalue json;
    json["topics"] = std::move(list);
    return json;
}

crow::json::wvalue RequestCodec::encode(const std::vector<TopicWatermarks>& offsets) {
    wvalue::list list;
    for (const auto& watermarks : offsets) {
        wvalue entry;
        entry["partition"] = watermarks.partition;
        entry["offset"] = std::to_string(watermarks.offset);
        entry["high"] = std::to_string(watermarks.high);
        entry["low"] = std::to_string(watermarks.low);
        list.push_back(std::move(entry));
    }
    return wvalue(std::move(list));
}

crow::json::wvalue RequestCodec::encode(const std::vector<GroupPartitionOffset>& offsets) {
    wvalue::list list;
    for (const auto& offset : offsets) {
        wvalue entry;
        entry["partition"] = offset.partition;
        entry["offset"] = std::to_string(offset.offset);
        entry["metadata"] = optionalString(offset.metadata);
        list.push_back(std::move(entry));
    }
    return wvalue(std::move(list));
}

crow::json::wvalue RequestCodec::encode(const std::vector<GroupOverview>& groups) {
    wvalue::list list;
    for (const auto& group : groups) {
        wvalue entry;
        entry["groupId"] = group.group_id;
        entry["protocolType"] = group.protocol_type;
        list.push_back(std::move(entry));
    }
    wvalue json;
    json["groups"] = std::move(list);
    return json;
}

crow::json::wvalue RequestCodec::encode(const std::vector<GroupDeletionResult>& results) {
    wvalue::list list;
    for (const auto& result : results) {
        wvalue entry;
        entry["groupId"] = result.group_id;
        entry["errorCode"] = result.error_code;
        if (!result.error.empty()) {
            entry["error"] = result.error;
        }
        list.push_back(std::move(entry));
    }
    return wvalue(std::move(list));
}

crow::json::wvalue RequestCodec::encode(const DescribeConfigsResponse& response) {
    wvalue::list resources;
    for (const auto& resource : response.resources) {
        wvalue entry;
        entry["errorCode"] = resource.error_code;
        entry["errorMessage"] = optionalString(resource.error_message);
        entry["resourceType"] = resource.resource_type;
        entry["resourceName"] = resource.resource_name;
        wvalue::list configs;
        for (const auto& config : resource.config_entries) {
            wvalue c;
            c["configName"] = config.config_name;
            c["configValue"] = optionalString(config.config_value);
            c["readOnly"] = config.read_only;
            c["isDefault"] = config.is_default;
            c["isSensitive"] = config.is_sensitive;
            wvalue::list synonyms;
            for (const auto& synonym : config.config_synonyms) {
                wvalue s;
                s["configName"] = synonym.config_name;
                s["configValue"] = optionalString(synonym.config_value);
                s["configSource"] = synonym.config_source;
                synonyms.push_back(std::move(s));
            }
            c["configSynonyms"] = std::move(synonyms);
            configs.push_back(std::move(c));
        }
        entry["configEntries"] = std::move(configs);
        resources.push_back(std::move(entry));
    }
    wvalue json;
    json["throttleTime"] = response.throttle_time_ms;
    json["resources"] = std::move(resources);
    return json;
}

crow::json::wvalue RequestCodec::encode(const AlterConfigsResponse& response) {
    wvalue::list resources;
    for (const auto& resource : response.resources) {
        wvalue entry;
        entry["errorCode"] = resource.error_code;
        entry["errorMessage"] = optionalString(resource.error_message);
        entry["resourceType"] = resource.resource_type;
        entry["resourceName"] = resource.resource_name;
        resources.push_back(std::move(entry));
    }
    wvalue json;
    json["throttleTime"] = response.throttle_time_ms;
    json["resources"] = std::move(resources);
    return json;
}

crow::json::wvalue RequestCodec::encode(const DescribeAclsResponse& response) {
    wvalue::list resources;
    for (const auto& resource : response.resources) {
        wvalue entry;
        entry["resourceType"] = resource.resource_type;
        entry["resourceName"] = resource.resource_name;
        entry["resourcePatternType"] = resource.resource_pattern_type;
        wvalue::list acls;
        for (const auto& acl : resource.acls) {
            wvalue a;
            a["principal"] = acl.principal;
            a["host"] = acl.host;
            a["operation"] = acl.operation;
            a["permissionType"] = acl.permission_type;
            acls.push_back(std::move(a));
        }
        entry["acls"] = std::move(acls);
        resources.push_back(std::move(entry));
    }
    wvalue json;
    json["throttleTime"] = response.throttle_time_ms;
    json["errorCode"] = response.error_code;
    json["errorMessage"] = optionalString(response.error_message);
    json["resources"] = std::move(resources);
    return json;
}

crow::json::wvalue RequestCodec::encode(const DeleteAclsResponse& response) {
    wvalue::list filters;
    for (const auto& filter : response.filter_responses) {
        wvalue entry;
        entry["errorCode"] = filter.error_code;
        entry["errorMessage"] = optionalString(filter.error_message);
        wvalue::list matching;
        for (const auto& match : filter.matching_acls) {
            wvalue m = encodeAcl(match.acl);
            m["errorCode"] = match.error_code;
            m["errorMessage"] = optionalString(match.error_message);
            matching.push_back(std::move(m));
        }
        entry["matchingAcls"] = std::move(matching);
        filters.push_back(std::move(entry));
    }
    wvalue json;
    json["throttleTime"] = response.throttle_time_ms;
    json["filterResponses"] = std::move(filters);
    return json;
}

crow::json::wvalue RequestCodec::encodeError(const std::string& message) {
    wvalue json;
    json["error"] = message;
    return json;
}
