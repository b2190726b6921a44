#ifndef ADMIN_CLIENT_HPP
#define ADMIN_CLIENT_HPP

#include "../config.hpp"
#include "cluster.hpp"
#include "retry_orchestrator.hpp"
#include "admin_events.hpp"
#include "topic_admin.hpp"
#include "config_admin.hpp"
#include "acl_admin.hpp"
#include "group_admin.hpp"
#include "offset_coordinator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ClusterDescription {
    std::vector<BrokerAddress> brokers;
    // Unset while the cluster has no controller
    std::optional<int32_t> controller;
    std::string cluster_id;
};

// Public administrative surface over a connected cluster
class AdminClient {
public:
    AdminClient(std::shared_ptr<Cluster> cluster, const AdminConfig& config);

    void connect();
    void disconnect();
    bool isConnected() const;

    // Topics
    std::vector<std::string> listTopics();
    bool createTopics(const CreateTopicsRequest& request);
    void deleteTopics(const DeleteTopicsRequest& request);
    bool createPartitions(const CreatePartitionsRequest& request);
    std::vector<TopicPartitionsMetadata> getTopicMetadata(
        const std::optional<std::vector<std::string>>& topics = std::nullopt);
    std::vector<TopicPartitionsMetadata> fetchTopicMetadata(const std::vector<std::string>& topics = {});

    ClusterDescription describeCluster();

    // Offsets
    std::vector<GroupPartitionOffset> fetchOffsets(const std::string& group_id, const std::string& topic);
    std::vector<TopicWatermarks> fetchTopicOffsets(const std::string& topic);
    void setOffsets(const std::string& group_id, const std::string& topic,
                    const std::vector<PartitionOffsetRequest>& partitions);
    void resetOffsets(const std::string& group_id, const std::string& topic, bool earliest = false);

    // Configs
    DescribeConfigsResponse describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                            bool include_synonyms = false);
    AlterConfigsResponse alterConfigs(const std::vector<ResourceConfig>& resources,
                                      bool validate_only = false);

    // Groups
    std::vector<GroupOverview> listGroups();
    std::vector<GroupDeletionResult> deleteGroups(const std::vector<std::string>& group_ids);

    // ACLs
    DescribeAclsResponse describeAcls(const AclFilter& filter);
    DeleteAclsResponse deleteAcls(const std::vector<AclFilter>& filters);
    bool createAcls(const std::vector<AclEntry>& acl);

    // Subscribe to AdminEvents::CONNECT or AdminEvents::DISCONNECT.
    // Returns a function removing the listener.
    std::function<void()> on(const std::string& event_name, InstrumentationEmitter::Listener listener);

private:
    std::shared_ptr<Cluster> cluster_;
    RetryOrchestrator retry_;
    InstrumentationEmitter emitter_;

    TopicAdmin topics_;
    ConfigAdmin configs_;
    AclAdmin acls_;
    GroupAdmin groups_;
    OffsetCoordinator offsets_;
};

#endif // ADMIN_CLIENT_HPP
