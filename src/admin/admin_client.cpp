#include "admin_client.hpp"

namespace {

RetryPolicy retryPolicyFrom(const AdminConfig& config) {
    RetryPolicy policy;
    policy.retries = config.retries;
    policy.initial_retry_time_ms = config.initial_retry_time_ms;
    policy.max_retry_time_ms = config.max_retry_time_ms;
    policy.factor = config.retry_factor;
    policy.multiplier = config.retry_multiplier;
    return policy;
}

WaitForOptions leaderWaitFrom(const AdminConfig& config) {
    WaitForOptions options;
    options.delay = std::chrono::milliseconds(config.leader_wait_delay_ms);
    options.max_wait = std::chrono::milliseconds(config.leader_wait_timeout_ms);
    options.timeout_message = "Timed out while waiting for topic leaders";
    return options;
}

} // namespace

AdminClient::AdminClient(std::shared_ptr<Cluster> cluster, const AdminConfig& config)
    : cluster_(std::move(cluster)),
      retry_(retryPolicyFrom(config)),
      topics_(*cluster_, retry_, leaderWaitFrom(config)),
      configs_(*cluster_, retry_),
      acls_(*cluster_, retry_),
      groups_(*cluster_, retry_),
      offsets_(*cluster_, retry_, std::chrono::milliseconds(config.offset_commit_timeout_ms)) {
}

void AdminClient::connect() {
    cluster_->connect();
    emitter_.emit(AdminEvents::CONNECT);
}

void AdminClient::disconnect() {
    cluster_->disconnect();
    emitter_.emit(AdminEvents::DISCONNECT);
}

bool AdminClient::isConnected() const {
    return cluster_->isConnected();
}

std::vector<std::string> AdminClient::listTopics() {
    return topics_.listTopics();
}

bool AdminClient::createTopics(const CreateTopicsRequest& request) {
    return topics_.createTopics(request);
}

void AdminClient::deleteTopics(const DeleteTopicsRequest& request) {
    topics_.deleteTopics(request);
}

bool AdminClient::createPartitions(const CreatePartitionsRequest& request) {
    return topics_.createPartitions(request);
}

std::vector<TopicPartitionsMetadata> AdminClient::getTopicMetadata(
    const std::optional<std::vector<std::string>>& topics) {
    return topics_.getTopicMetadata(topics);
}

std::vector<TopicPartitionsMetadata> AdminClient::fetchTopicMetadata(const std::vector<std::string>& topics) {
    return topics_.fetchTopicMetadata(topics);
}

ClusterDescription AdminClient::describeCluster() {
    ClusterMetadata metadata = cluster_->metadata({});

    ClusterDescription description;
    description.brokers = metadata.brokers;
    description.cluster_id = metadata.cluster_id;
    if (metadata.controller_id != ClusterMetadata::NO_CONTROLLER_ID) {
        description.controller = metadata.controller_id;
    }
    return description;
}

std::vector<GroupPartitionOffset> AdminClient::fetchOffsets(const std::string& group_id,
                                                            const std::string& topic) {
    return offsets_.fetchOffsets(group_id, topic);
}

std::vector<TopicWatermarks> AdminClient::fetchTopicOffsets(const std::string& topic) {
    return offsets_.fetchTopicOffsets(topic);
}

void AdminClient::setOffsets(const std::string& group_id, const std::string& topic,
                             const std::vector<PartitionOffsetRequest>& partitions) {
    offsets_.setOffsets(group_id, topic, partitions);
}

void AdminClient::resetOffsets(const std::string& group_id, const std::string& topic, bool earliest) {
    offsets_.resetOffsets(group_id, topic, earliest);
}

DescribeConfigsResponse AdminClient::describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                                     bool include_synonyms) {
    return configs_.describeConfigs(resources, include_synonyms);
}

AlterConfigsResponse AdminClient::alterConfigs(const std::vector<ResourceConfig>& resources,
                                               bool validate_only) {
    return configs_.alterConfigs(resources, validate_only);
}

std::vector<GroupOverview> AdminClient::listGroups() {
    return groups_.listGroups();
}

std::vector<GroupDeletionResult> AdminClient::deleteGroups(const std::vector<std::string>& group_ids) {
    return groups_.deleteGroups(group_ids);
}

DescribeAclsResponse AdminClient::describeAcls(const AclFilter& filter) {
    return acls_.describeAcls(filter);
}

DeleteAclsResponse AdminClient::deleteAcls(const std::vector<AclFilter>& filters) {
    return acls_.deleteAcls(filters);
}

bool AdminClient::createAcls(const std::vector<AclEntry>& acl) {
    return acls_.createAcls(acl);
}

std::function<void()> AdminClient::on(const std::string& event_name,
                                      InstrumentationEmitter::Listener listener) {
    if (event_name != AdminEvents::CONNECT && event_name != AdminEvents::DISCONNECT) {
        throw ValidationError(
            "Event name should be one of admin.events.CONNECT, admin.events.DISCONNECT");
    }
    return emitter_.addListener(event_name, std::move(listener));
}
