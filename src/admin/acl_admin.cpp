#include "acl_admin.hpp"
#include "request_validator.hpp"

namespace {

RetryStrategy controllerStrategy(const std::string& description) {
    RetryStrategy strategy;
    strategy.description = description;
    strategy.retriable = {ErrorType::NOT_CONTROLLER};
    return strategy;
}

} // namespace

AclAdmin::AclAdmin(Cluster& cluster, const RetryOrchestrator& retry)
    : cluster_(cluster), retry_(retry) {
}

bool AclAdmin::createAcls(const std::vector<AclEntry>& acl) {
    RequestValidator::validateCreateAcls(acl);

    return retry_.execute<bool>(controllerStrategy("create ACL"), [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        broker->createAcls(acl);
        return true;
    });
}

DescribeAclsResponse AclAdmin::describeAcls(const AclFilter& filter) {
    RequestValidator::validateDescribeAcls(filter);

    return retry_.execute<DescribeAclsResponse>(controllerStrategy("describe ACL"), [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        return broker->describeAcls(filter);
    });
}

DeleteAclsResponse AclAdmin::deleteAcls(const std::vector<AclFilter>& filters) {
    RequestValidator::validateDeleteAcls(filters);

    return retry_.execute<DeleteAclsResponse>(controllerStrategy("delete ACL"), [&](RetryContext&) {
        cluster_.refreshMetadata();
        auto broker = cluster_.findControllerBroker();
        return broker->deleteAcls(filters);
    });
}
