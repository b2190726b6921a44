#ifndef GROUP_ADMIN_HPP
#define GROUP_ADMIN_HPP

#include "cluster.hpp"
#include "retry_orchestrator.hpp"
#include <string>
#include <vector>

// Cluster-wide consumer group listing and deletion
class GroupAdmin {
public:
    GroupAdmin(Cluster& cluster, const RetryOrchestrator& retry);

    // Groups known to every broker of the pool, concatenated in broker order.
    // Any broker failure fails the whole call.
    std::vector<GroupOverview> listGroups();

    // Delete groups through their coordinators. Groups that fail are retried
    // on the next pass; the result holds one entry per requested group.
    std::vector<GroupDeletionResult> deleteGroups(const std::vector<std::string>& group_ids);

private:
    Cluster& cluster_;
    const RetryOrchestrator& retry_;
};

#endif // GROUP_ADMIN_HPP
