#include "protocol_types.hpp"
#include "crow.h"

namespace {

using crow::json::wvalue;

// Undefined enum fields and absent optionals are left out of the object
void setEnum(wvalue& json, const char* key, int32_t value) {
    if (value != UNDEFINED_ENUM_VALUE) {
        json[key] = value;
    }
}

void setOptional(wvalue& json, const char* key, const std::optional<std::string>& value) {
    if (value) {
        json[key] = *value;
    }
}

wvalue configEntryJson(const ConfigEntry& entry) {
    wvalue json;
    json["name"] = entry.name;
    setOptional(json, "value", entry.value);
    return json;
}

} // namespace

bool isValidResourceType(int32_t value) {
    return value >= static_cast<int32_t>(ResourceType::UNKNOWN) &&
           value <= static_cast<int32_t>(ResourceType::DELEGATION_TOKEN);
}

bool isValidResourcePatternType(int32_t value) {
    return value >= static_cast<int32_t>(ResourcePatternType::UNKNOWN) &&
           value <= static_cast<int32_t>(ResourcePatternType::PREFIXED);
}

bool isValidAclOperation(int32_t value) {
    return value >= static_cast<int32_t>(AclOperation::UNKNOWN) &&
           value <= static_cast<int32_t>(AclOperation::IDEMPOTENT_WRITE);
}

bool isValidAclPermissionType(int32_t value) {
    return value >= static_cast<int32_t>(AclPermissionType::UNKNOWN) &&
           value <= static_cast<int32_t>(AclPermissionType::ALLOW);
}

std::string enumValueName(int32_t value) {
    return value == UNDEFINED_ENUM_VALUE ? "undefined" : std::to_string(value);
}

std::string toJson(const AclEntry& entry) {
    wvalue json;
    setEnum(json, "resourceType", entry.resource_type);
    json["resourceName"] = entry.resource_name;
    setEnum(json, "resourcePatternType", entry.resource_pattern_type);
    json["principal"] = entry.principal;
    json["host"] = entry.host;
    setEnum(json, "operation", entry.operation);
    setEnum(json, "permissionType", entry.permission_type);
    return json.dump();
}

std::string toJson(const AclFilter& filter) {
    wvalue json;
    setEnum(json, "resourceType", filter.resource_type);
    setOptional(json, "resourceName", filter.resource_name);
    setEnum(json, "resourcePatternType", filter.resource_pattern_type);
    setOptional(json, "principal", filter.principal);
    setOptional(json, "host", filter.host);
    setEnum(json, "operation", filter.operation);
    setEnum(json, "permissionType", filter.permission_type);
    return json.dump();
}

std::string toJson(const ResourceConfigQuery& resource) {
    wvalue json;
    json["type"] = resource.type;
    json["name"] = resource.name;
    if (!resource.config_names.empty()) {
        wvalue::list names;
        for (const auto& name : resource.config_names) {
            names.push_back(wvalue(name));
        }
        json["configNames"] = std::move(names);
    }
    return json.dump();
}

std::string toJson(const ConfigEntry& entry) {
    return configEntryJson(entry).dump();
}

std::string toJson(const ResourceConfig& resource) {
    wvalue json;
    json["type"] = resource.type;
    json["name"] = resource.name;
    wvalue::list entries;
    for (const auto& entry : resource.config_entries) {
        entries.push_back(configEntryJson(entry));
    }
    json["configEntries"] = std::move(entries);
    return json.dump();
}
