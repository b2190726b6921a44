#ifndef REQUEST_CODEC_HPP
#define REQUEST_CODEC_HPP

#include "../admin/admin_client.hpp"
#include "crow.h"
#include <string>
#include <vector>

// Translates gateway JSON bodies into admin requests and admin results back
// into JSON. Decoding throws ValidationError for malformed structure.
class RequestCodec {
public:
    // Parse a request body. Throws ValidationError on invalid JSON.
    static crow::json::rvalue parseBody(const std::string& body);

    static CreateTopicsRequest decodeCreateTopics(const crow::json::rvalue& body);
    static DeleteTopicsRequest decodeDeleteTopics(const crow::json::rvalue& body);
    static CreatePartitionsRequest decodeCreatePartitions(const crow::json::rvalue& body);
    static std::vector<std::string> decodeTopicNames(const crow::json::rvalue& body);

    static std::vector<ResourceConfigQuery> decodeDescribeConfigs(const crow::json::rvalue& body);
    static std::vector<ResourceConfig> decodeAlterConfigs(const crow::json::rvalue& body);

    static std::vector<AclEntry> decodeCreateAcls(const crow::json::rvalue& body);
    static AclFilter decodeAclFilter(const crow::json::rvalue& body);
    static std::vector<AclFilter> decodeDeleteAcls(const crow::json::rvalue& body);

    static std::vector<std::string> decodeGroupIds(const crow::json::rvalue& body);
    static std::vector<PartitionOffsetRequest> decodeSetOffsets(const crow::json::rvalue& body);

    static crow::json::wvalue encode(const ClusterDescription& cluster);
    static crow::json::wvalue encode(const std::vector<TopicPartitionsMetadata>& topics);
    static crow::json::wvalue encode(const std::vector<TopicWatermarks>& offsets);
    static crow::json::wvalue encode(const std::vector<GroupPartitionOffset>& offsets);
    static crow::json::wvalue encode(const std::vector<GroupOverview>& groups);
    static crow::json::wvalue encode(const std::vector<GroupDeletionResult>& results);
    static crow::json::wvalue encode(const DescribeConfigsResponse& response);
    static crow::json::wvalue encode(const AlterConfigsResponse& response);
    static crow::json::wvalue encode(const DescribeAclsResponse& response);
    static crow::json::wvalue encode(const DeleteAclsResponse& response);

    static crow::json::wvalue encodeError(const std::string& message);
};

#endif // REQUEST_CODEC_HPP
