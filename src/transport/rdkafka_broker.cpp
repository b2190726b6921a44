#include "rdkafka_broker.hpp"
#include "rdkafka_admin.hpp"
#include <algorithm>

using NewTopics = AdminObjects<rd_kafka_NewTopic_t, rd_kafka_NewTopic_destroy_array>;
using DeleteTopics = AdminObjects<rd_kafka_DeleteTopic_t, rd_kafka_DeleteTopic_destroy_array>;
using NewPartitions = AdminObjects<rd_kafka_NewPartitions_t, rd_kafka_NewPartitions_destroy_array>;
using ConfigResources = AdminObjects<rd_kafka_ConfigResource_t, rd_kafka_ConfigResource_destroy_array>;
using AclBindings = AdminObjects<rd_kafka_AclBinding_t, rd_kafka_AclBinding_destroy_array>;
using DeleteGroups = AdminObjects<rd_kafka_DeleteGroup_t, rd_kafka_DeleteGroup_destroy_array>;
using GroupOffsetRequests = AdminObjects<rd_kafka_ListConsumerGroupOffsets_t,
                                         rd_kafka_ListConsumerGroupOffsets_destroy_array>;

namespace {

void throwOnTopicResults(const rd_kafka_topic_result_t** results, size_t count, const std::string& context) {
    for (size_t i = 0; i < count; i++) {
        rd_kafka_resp_err_t err = rd_kafka_topic_result_error(results[i]);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            const char* message = rd_kafka_topic_result_error_string(results[i]);
            throw KafkaProtocolError(protocolCode(err),
                                     context + " " + rd_kafka_topic_result_name(results[i]) + ": " +
                                     (message ? message : rd_kafka_err2str(err)));
        }
    }
}

std::optional<std::string> optionalString(const char* value) {
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

const char* optionalCString(const std::optional<std::string>& value) {
    return value ? value->c_str() : nullptr;
}

AclEntry aclEntryFrom(const rd_kafka_AclBinding_t* binding) {
    AclEntry entry;
    entry.resource_type = static_cast<int32_t>(rd_kafka_AclBinding_restype(binding));
    entry.resource_name = rd_kafka_AclBinding_name(binding);
    entry.resource_pattern_type = static_cast<int32_t>(rd_kafka_AclBinding_resource_pattern_type(binding));
    entry.principal = rd_kafka_AclBinding_principal(binding);
    entry.host = rd_kafka_AclBinding_host(binding);
    entry.operation = static_cast<int32_t>(rd_kafka_AclBinding_operation(binding));
    entry.permission_type = static_cast<int32_t>(rd_kafka_AclBinding_permission_type(binding));
    return entry;
}

rd_kafka_AclBinding_t* newAclFilter(const AclFilter& filter) {
    char errstr[512];
    rd_kafka_AclBindingFilter_t* binding = rd_kafka_AclBindingFilter_new(
        static_cast<rd_kafka_ResourceType_t>(filter.resource_type),
        optionalCString(filter.resource_name),
        static_cast<rd_kafka_ResourcePatternType_t>(filter.resource_pattern_type),
        optionalCString(filter.principal),
        optionalCString(filter.host),
        static_cast<rd_kafka_AclOperation_t>(filter.operation),
        static_cast<rd_kafka_AclPermissionType_t>(filter.permission_type),
        errstr, sizeof(errstr));
    if (!binding) {
        throw KafkaProtocolError(ErrorType::INVALID_REQUEST, std::string("Invalid ACL filter: ") + errstr);
    }
    return binding;
}

DescribedConfigEntry configEntryFrom(const rd_kafka_ConfigEntry_t* entry, bool include_synonyms) {
    DescribedConfigEntry result;
    result.config_name = rd_kafka_ConfigEntry_name(entry);
    result.config_value = optionalString(rd_kafka_ConfigEntry_value(entry));
    result.read_only = rd_kafka_ConfigEntry_is_read_only(entry) != 0;
    result.is_default = rd_kafka_ConfigEntry_is_default(entry) != 0;
    result.is_sensitive = rd_kafka_ConfigEntry_is_sensitive(entry) != 0;

    if (include_synonyms) {
        size_t synonym_count = 0;
        const rd_kafka_ConfigEntry_t** synonyms = rd_kafka_ConfigEntry_synonyms(entry, &synonym_count);
        for (size_t i = 0; i < synonym_count; i++) {
            ConfigSynonym synonym;
            synonym.config_name = rd_kafka_ConfigEntry_name(synonyms[i]);
            synonym.config_value = optionalString(rd_kafka_ConfigEntry_value(synonyms[i]));
            synonym.config_source = static_cast<int32_t>(rd_kafka_ConfigEntry_source(synonyms[i]));
            result.config_synonyms.push_back(synonym);
        }
    }
    return result;
}

} // namespace

RdKafkaBroker::RdKafkaBroker(int32_t node_id, std::shared_ptr<cppkafka::Producer> handle,
                             int request_timeout_ms)
    : node_id_(node_id), handle_(std::move(handle)), request_timeout_ms_(request_timeout_ms) {
}

void RdKafkaBroker::createTopics(const std::vector<TopicSpec>& topics, bool validate_only, int timeout_ms) {
    char errstr[512];
    NewTopics new_topics;

    for (const auto& spec : topics) {
        // Explicit assignments carry the replication factor themselves
        int replication_factor = spec.replica_assignment.empty() ? spec.replication_factor : -1;
        rd_kafka_NewTopic_t* new_topic = rd_kafka_NewTopic_new(
            spec.topic.c_str(), spec.num_partitions, replication_factor, errstr, sizeof(errstr));
        if (!new_topic) {
            throw KafkaProtocolError(ErrorType::INVALID_REQUEST,
                                     "Invalid topic " + spec.topic + ": " + errstr);
        }
        new_topics.add(new_topic);

        for (const auto& assignment : spec.replica_assignment) {
            std::vector<int32_t> replicas = assignment.replicas;
            if (rd_kafka_NewTopic_set_replica_assignment(new_topic, assignment.partition, replicas.data(),
                                                         replicas.size(), errstr, sizeof(errstr)) !=
                RD_KAFKA_RESP_ERR_NO_ERROR) {
                throw KafkaProtocolError(ErrorType::INVALID_REPLICA_ASSIGNMENT,
                                         "Invalid replica assignment for " + spec.topic + ": " + errstr);
            }
        }

        for (const auto& entry : spec.config_entries) {
            rd_kafka_resp_err_t err = rd_kafka_NewTopic_set_config(
                new_topic, entry.name.c_str(), entry.value ? entry.value->c_str() : nullptr);
            if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                throw protocolError(err, "Invalid config " + entry.name + " for topic " + spec.topic);
            }
        }
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_CREATETOPICS, request_timeout_ms_);
    request.setOperationTimeout(timeout_ms);
    request.setValidateOnly(validate_only);

    rd_kafka_CreateTopics(rawHandle(), new_topics.data(), new_topics.size(), request.options(), request.queue());
    auto event = request.awaitResult("CreateTopics");

    size_t count = 0;
    const rd_kafka_topic_result_t** results =
        rd_kafka_CreateTopics_result_topics(rd_kafka_event_CreateTopics_result(event.get()), &count);
    throwOnTopicResults(results, count, "Failed to create topic");
}

void RdKafkaBroker::deleteTopics(const std::vector<std::string>& topics, int timeout_ms) {
    DeleteTopics delete_topics;
    for (const auto& topic : topics) {
        delete_topics.add(rd_kafka_DeleteTopic_new(topic.c_str()));
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_DELETETOPICS, request_timeout_ms_);
    request.setOperationTimeout(timeout_ms);

    rd_kafka_DeleteTopics(rawHandle(), delete_topics.data(), delete_topics.size(),
                          request.options(), request.queue());
    auto event = request.awaitResult("DeleteTopics");

    size_t count = 0;
    const rd_kafka_topic_result_t** results =
        rd_kafka_DeleteTopics_result_topics(rd_kafka_event_DeleteTopics_result(event.get()), &count);
    throwOnTopicResults(results, count, "Failed to delete topic");
}

void RdKafkaBroker::createPartitions(const std::vector<TopicPartitionsSpec>& topic_partitions,
                                     bool validate_only, int timeout_ms) {
    char errstr[512];
    NewPartitions new_partitions;

    for (const auto& spec : topic_partitions) {
        rd_kafka_NewPartitions_t* partitions = rd_kafka_NewPartitions_new(
            spec.topic.c_str(), static_cast<size_t>(spec.count), errstr, sizeof(errstr));
        if (!partitions) {
            throw KafkaProtocolError(ErrorType::INVALID_PARTITIONS,
                                     "Invalid partitions for " + spec.topic + ": " + errstr);
        }
        new_partitions.add(partitions);

        for (size_t i = 0; i < spec.assignments.size(); i++) {
            std::vector<int32_t> replicas = spec.assignments[i];
            if (rd_kafka_NewPartitions_set_replica_assignment(partitions, static_cast<int32_t>(i),
                                                              replicas.data(), replicas.size(),
                                                              errstr, sizeof(errstr)) !=
                RD_KAFKA_RESP_ERR_NO_ERROR) {
                throw KafkaProtocolError(ErrorType::INVALID_REPLICA_ASSIGNMENT,
                                         "Invalid replica assignment for " + spec.topic + ": " + errstr);
            }
        }
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_CREATEPARTITIONS, request_timeout_ms_);
    request.setOperationTimeout(timeout_ms);
    request.setValidateOnly(validate_only);

    rd_kafka_CreatePartitions(rawHandle(), new_partitions.data(), new_partitions.size(),
                              request.options(), request.queue());
    auto event = request.awaitResult("CreatePartitions");

    size_t count = 0;
    const rd_kafka_topic_result_t** results =
        rd_kafka_CreatePartitions_result_topics(rd_kafka_event_CreatePartitions_result(event.get()), &count);
    throwOnTopicResults(results, count, "Failed to create partitions for");
}

DescribeConfigsResponse RdKafkaBroker::describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                                       bool include_synonyms) {
    ConfigResources configs;
    for (const auto& resource : resources) {
        configs.add(rd_kafka_ConfigResource_new(static_cast<rd_kafka_ResourceType_t>(resource.type),
                                                resource.name.c_str()));
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_DESCRIBECONFIGS, request_timeout_ms_);
    rd_kafka_DescribeConfigs(rawHandle(), configs.data(), configs.size(), request.options(), request.queue());
    auto event = request.awaitResult("DescribeConfigs");

    size_t count = 0;
    const rd_kafka_ConfigResource_t** described =
        rd_kafka_DescribeConfigs_result_resources(rd_kafka_event_DescribeConfigs_result(event.get()), &count);

    DescribeConfigsResponse response;
    for (size_t i = 0; i < count; i++) {
        DescribedResource resource;
        resource.error_code = protocolCode(rd_kafka_ConfigResource_error(described[i]));
        resource.error_message = optionalString(rd_kafka_ConfigResource_error_string(described[i]));
        resource.resource_type = static_cast<int32_t>(rd_kafka_ConfigResource_type(described[i]));
        resource.resource_name = rd_kafka_ConfigResource_name(described[i]);

        // Config names requested for this resource, empty for all
        std::vector<std::string> wanted;
        for (const auto& query : resources) {
            if (query.type == resource.resource_type && query.name == resource.resource_name) {
                wanted = query.config_names;
            }
        }

        size_t entry_count = 0;
        const rd_kafka_ConfigEntry_t** entries = rd_kafka_ConfigResource_configs(described[i], &entry_count);
        for (size_t j = 0; j < entry_count; j++) {
            std::string name = rd_kafka_ConfigEntry_name(entries[j]);
            if (!wanted.empty() && std::find(wanted.begin(), wanted.end(), name) == wanted.end()) {
                continue;
            }
            resource.config_entries.push_back(configEntryFrom(entries[j], include_synonyms));
        }
        response.resources.push_back(resource);
    }
    return response;
}

AlterConfigsResponse RdKafkaBroker::alterConfigs(const std::vector<ResourceConfig>& resources,
                                                 bool validate_only) {
    ConfigResources configs;
    for (const auto& resource : resources) {
        rd_kafka_ConfigResource_t* config = rd_kafka_ConfigResource_new(
            static_cast<rd_kafka_ResourceType_t>(resource.type), resource.name.c_str());
        configs.add(config);
        for (const auto& entry : resource.config_entries) {
            rd_kafka_resp_err_t err = rd_kafka_ConfigResource_set_config(
                config, entry.name.c_str(), entry.value ? entry.value->c_str() : nullptr);
            if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                throw protocolError(err, "Invalid config " + entry.name + " for " + resource.name);
            }
        }
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_ALTERCONFIGS, request_timeout_ms_);
    request.setValidateOnly(validate_only);
    rd_kafka_AlterConfigs(rawHandle(), configs.data(), configs.size(), request.options(), request.queue());
    auto event = request.awaitResult("AlterConfigs");

    size_t count = 0;
    const rd_kafka_ConfigResource_t** altered =
        rd_kafka_AlterConfigs_result_resources(rd_kafka_event_AlterConfigs_result(event.get()), &count);

    AlterConfigsResponse response;
    for (size_t i = 0; i < count; i++) {
        AlteredResource resource;
        resource.error_code = protocolCode(rd_kafka_ConfigResource_error(altered[i]));
        resource.error_message = optionalString(rd_kafka_ConfigResource_error_string(altered[i]));
        resource.resource_type = static_cast<int32_t>(rd_kafka_ConfigResource_type(altered[i]));
        resource.resource_name = rd_kafka_ConfigResource_name(altered[i]);
        response.resources.push_back(resource);
    }
    return response;
}

void RdKafkaBroker::createAcls(const std::vector<AclEntry>& acl) {
    char errstr[512];
    AclBindings bindings;
    for (const auto& entry : acl) {
        rd_kafka_AclBinding_t* binding = rd_kafka_AclBinding_new(
            static_cast<rd_kafka_ResourceType_t>(entry.resource_type),
            entry.resource_name.c_str(),
            static_cast<rd_kafka_ResourcePatternType_t>(entry.resource_pattern_type),
            entry.principal.c_str(),
            entry.host.c_str(),
            static_cast<rd_kafka_AclOperation_t>(entry.operation),
            static_cast<rd_kafka_AclPermissionType_t>(entry.permission_type),
            errstr, sizeof(errstr));
        if (!binding) {
            throw KafkaProtocolError(ErrorType::INVALID_REQUEST, std::string("Invalid ACL: ") + errstr);
        }
        bindings.add(binding);
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_CREATEACLS, request_timeout_ms_);
    rd_kafka_CreateAcls(rawHandle(), bindings.data(), bindings.size(), request.options(), request.queue());
    auto event = request.awaitResult("CreateAcls");

    size_t count = 0;
    const rd_kafka_acl_result_t** results =
        rd_kafka_CreateAcls_result_acls(rd_kafka_event_CreateAcls_result(event.get()), &count);
    for (size_t i = 0; i < count; i++) {
        throwIfError(rd_kafka_acl_result_error(results[i]), "Failed to create ACL");
    }
}

DescribeAclsResponse RdKafkaBroker::describeAcls(const AclFilter& filter) {
    AclBindings filters;
    filters.add(newAclFilter(filter));

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_DESCRIBEACLS, request_timeout_ms_);
    rd_kafka_DescribeAcls(rawHandle(), filters.data()[0], request.options(), request.queue());
    auto event = request.awaitResult("DescribeAcls");

    size_t count = 0;
    const rd_kafka_AclBinding_t** bindings =
        rd_kafka_DescribeAcls_result_acls(rd_kafka_event_DescribeAcls_result(event.get()), &count);

    // Group bindings by resource, keeping the broker's order
    DescribeAclsResponse response;
    for (size_t i = 0; i < count; i++) {
        AclEntry entry = aclEntryFrom(bindings[i]);
        auto it = std::find_if(response.resources.begin(), response.resources.end(),
                               [&entry](const AclResource& r) {
                                   return r.resource_type == entry.resource_type &&
                                          r.resource_name == entry.resource_name &&
                                          r.resource_pattern_type == entry.resource_pattern_type;
                               });
        if (it == response.resources.end()) {
            AclResource resource;
            resource.resource_type = entry.resource_type;
            resource.resource_name = entry.resource_name;
            resource.resource_pattern_type = entry.resource_pattern_type;
            response.resources.push_back(resource);
            it = response.resources.end() - 1;
        }
        it->acls.push_back({entry.principal, entry.host, entry.operation, entry.permission_type});
    }
    return response;
}

DeleteAclsResponse RdKafkaBroker::deleteAcls(const std::vector<AclFilter>& filters) {
    AclBindings bindings;
    for (const auto& filter : filters) {
        bindings.add(newAclFilter(filter));
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_DELETEACLS, request_timeout_ms_);
    rd_kafka_DeleteAcls(rawHandle(), bindings.data(), bindings.size(), request.options(), request.queue());
    auto event = request.awaitResult("DeleteAcls");

    size_t count = 0;
    const rd_kafka_DeleteAcls_result_response_t** responses =
        rd_kafka_DeleteAcls_result_responses(rd_kafka_event_DeleteAcls_result(event.get()), &count);

    DeleteAclsResponse response;
    for (size_t i = 0; i < count; i++) {
        FilterResponse filter_response;
        const rd_kafka_error_t* error = rd_kafka_DeleteAcls_result_response_error(responses[i]);
        if (error) {
            filter_response.error_code = protocolCode(rd_kafka_error_code(error));
            filter_response.error_message = std::string(rd_kafka_error_string(error));
        }

        size_t matching_count = 0;
        const rd_kafka_AclBinding_t** matching =
            rd_kafka_DeleteAcls_result_response_matching_acls(responses[i], &matching_count);
        for (size_t j = 0; j < matching_count; j++) {
            MatchingAcl acl;
            acl.acl = aclEntryFrom(matching[j]);
            const rd_kafka_error_t* acl_error = rd_kafka_AclBinding_error(matching[j]);
            if (acl_error) {
                acl.error_code = protocolCode(rd_kafka_error_code(acl_error));
                acl.error_message = std::string(rd_kafka_error_string(acl_error));
            }
            filter_response.matching_acls.push_back(acl);
        }
        response.filter_responses.push_back(filter_response);
    }
    return response;
}

// rd_kafka_list_groups cannot address a single node: with a null group it
// sends ListGroups to every known broker and merges the replies. Each call
// therefore costs a cluster-wide round trip bounded by request_timeout_ms_,
// and only the groups this node coordinates are kept.
std::vector<GroupOverview> RdKafkaBroker::listGroups() {
    const struct rd_kafka_group_list* list = nullptr;
    rd_kafka_resp_err_t err = rd_kafka_list_groups(rawHandle(), nullptr, &list, request_timeout_ms_);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        throw protocolError(err, "Failed to list groups on broker " + std::to_string(node_id_));
    }
    std::unique_ptr<const rd_kafka_group_list, void (*)(const rd_kafka_group_list*)> guard(
        list, rd_kafka_group_list_destroy);

    std::vector<GroupOverview> groups;
    for (int i = 0; i < list->group_cnt; i++) {
        const rd_kafka_group_info& info = list->groups[i];
        if (info.broker.id != node_id_) {
            continue;
        }
        GroupOverview group;
        group.group_id = info.group;
        group.protocol_type = info.protocol_type ? info.protocol_type : "";
        groups.push_back(group);
    }
    return groups;
}

std::vector<GroupDeletionResult> RdKafkaBroker::deleteGroups(const std::vector<std::string>& group_ids) {
    DeleteGroups delete_groups;
    for (const auto& group_id : group_ids) {
        delete_groups.add(rd_kafka_DeleteGroup_new(group_id.c_str()));
    }

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_DELETEGROUPS, request_timeout_ms_);
    rd_kafka_DeleteGroups(rawHandle(), delete_groups.data(), delete_groups.size(),
                          request.options(), request.queue());
    auto event = request.awaitResult("DeleteGroups");

    size_t count = 0;
    const rd_kafka_group_result_t** results =
        rd_kafka_DeleteGroups_result_groups(rd_kafka_event_DeleteGroups_result(event.get()), &count);

    std::vector<GroupDeletionResult> deletions;
    for (size_t i = 0; i < count; i++) {
        GroupDeletionResult result;
        result.group_id = rd_kafka_group_result_name(results[i]);
        const rd_kafka_error_t* error = rd_kafka_group_result_error(results[i]);
        if (error) {
            result.error_code = protocolCode(rd_kafka_error_code(error));
            result.error = errorTypeName(errorTypeFromCode(result.error_code));
        }
        deletions.push_back(result);
    }
    return deletions;
}

std::vector<TopicMetadata> RdKafkaBroker::metadata(const std::vector<std::string>& topics) {
    std::vector<TopicMetadata> result;
    for (const auto& topic : topics) {
        result.push_back(fetchTopicMetadata(*handle_, topic));
    }
    return result;
}

std::vector<OffsetFetchTopic> RdKafkaBroker::offsetFetch(const std::string& group_id,
                                                         const std::vector<TopicPartitions>& topics) {
    rd_kafka_topic_partition_list_t* partitions = rd_kafka_topic_partition_list_new(0);
    for (const auto& topic : topics) {
        for (int32_t partition : topic.partitions) {
            rd_kafka_topic_partition_list_add(partitions, topic.topic.c_str(), partition);
        }
    }

    GroupOffsetRequests requests;
    requests.add(rd_kafka_ListConsumerGroupOffsets_new(group_id.c_str(), partitions));
    rd_kafka_topic_partition_list_destroy(partitions);

    AdminRequest request(rawHandle(), RD_KAFKA_ADMIN_OP_LISTCONSUMERGROUPOFFSETS, request_timeout_ms_);
    rd_kafka_ListConsumerGroupOffsets(rawHandle(), requests.data(), requests.size(),
                                      request.options(), request.queue());
    auto event = request.awaitResult("OffsetFetch");

    size_t count = 0;
    const rd_kafka_group_result_t** groups = rd_kafka_ListConsumerGroupOffsets_result_groups(
        rd_kafka_event_ListConsumerGroupOffsets_result(event.get()), &count);

    std::vector<OffsetFetchTopic> response;
    for (size_t i = 0; i < count; i++) {
        throwIfError(rd_kafka_group_result_error(groups[i]), "Failed to fetch offsets of group " + group_id);

        const rd_kafka_topic_partition_list_t* committed = rd_kafka_group_result_partitions(groups[i]);
        if (!committed) {
            continue;
        }
        for (int j = 0; j < committed->cnt; j++) {
            const rd_kafka_topic_partition_t& elem = committed->elems[j];

            auto topic = std::find_if(response.begin(), response.end(),
                                      [&elem](const OffsetFetchTopic& t) { return t.topic == elem.topic; });
            if (topic == response.end()) {
                response.push_back({elem.topic, {}});
                topic = response.end() - 1;
            }

            OffsetFetchPartition partition;
            partition.partition = elem.partition;
            // No committed offset is reported as -1
            partition.offset = elem.offset == RD_KAFKA_OFFSET_INVALID ? -1 : elem.offset;
            if (elem.metadata && elem.metadata_size > 0) {
                partition.metadata = std::string(static_cast<const char*>(elem.metadata), elem.metadata_size);
            }
            partition.error_code = protocolCode(elem.err);
            topic->partitions.push_back(partition);
        }
    }
    return response;
}
