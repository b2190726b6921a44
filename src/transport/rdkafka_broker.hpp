#ifndef RDKAFKA_BROKER_HPP
#define RDKAFKA_BROKER_HPP

#include "../admin/cluster.hpp"
#include <cppkafka/cppkafka.h>
#include <librdkafka/rdkafka.h>
#include <memory>
#include <string>
#include <vector>

// Broker handle backed by the librdkafka admin API. All brokers of a cluster
// share one client handle; librdkafka routes each request to the right node.
class RdKafkaBroker : public Broker {
public:
    RdKafkaBroker(int32_t node_id, std::shared_ptr<cppkafka::Producer> handle, int request_timeout_ms);

    int32_t nodeId() const override { return node_id_; }

    void createTopics(const std::vector<TopicSpec>& topics, bool validate_only, int timeout_ms) override;
    void deleteTopics(const std::vector<std::string>& topics, int timeout_ms) override;
    void createPartitions(const std::vector<TopicPartitionsSpec>& topic_partitions,
                          bool validate_only, int timeout_ms) override;

    DescribeConfigsResponse describeConfigs(const std::vector<ResourceConfigQuery>& resources,
                                            bool include_synonyms) override;
    AlterConfigsResponse alterConfigs(const std::vector<ResourceConfig>& resources,
                                      bool validate_only) override;

    void createAcls(const std::vector<AclEntry>& acl) override;
    DescribeAclsResponse describeAcls(const AclFilter& filter) override;
    DeleteAclsResponse deleteAcls(const std::vector<AclFilter>& filters) override;

    std::vector<GroupOverview> listGroups() override;
    std::vector<GroupDeletionResult> deleteGroups(const std::vector<std::string>& group_ids) override;

    std::vector<TopicMetadata> metadata(const std::vector<std::string>& topics) override;

    std::vector<OffsetFetchTopic> offsetFetch(const std::string& group_id,
                                              const std::vector<TopicPartitions>& topics) override;

private:
    int32_t node_id_;
    std::shared_ptr<cppkafka::Producer> handle_;
    int request_timeout_ms_;

    rd_kafka_t* rawHandle() const { return handle_->get_handle(); }
};

#endif // RDKAFKA_BROKER_HPP
