#ifndef ACL_ADMIN_HPP
#define ACL_ADMIN_HPP

#include "cluster.hpp"
#include "retry_orchestrator.hpp"
#include <vector>

// ACL management through the controller
class AclAdmin {
public:
    AclAdmin(Cluster& cluster, const RetryOrchestrator& retry);

    bool createAcls(const std::vector<AclEntry>& acl);

    DescribeAclsResponse describeAcls(const AclFilter& filter);

    DeleteAclsResponse deleteAcls(const std::vector<AclFilter>& filters);

private:
    Cluster& cluster_;
    const RetryOrchestrator& retry_;
};

#endif // ACL_ADMIN_HPP
