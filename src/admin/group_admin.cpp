#include "group_admin.hpp"
#include "request_validator.hpp"
#include <future>
#include <iostream>
#include <map>

namespace {

// Wait for every call, then surface the first failure
template <typename T>
std::vector<T> gather(std::vector<std::future<std::vector<T>>>& calls) {
    std::vector<T> results;
    std::exception_ptr first_error;
    for (auto& call : calls) {
        try {
            auto partial = call.get();
            results.insert(results.end(), partial.begin(), partial.end());
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}

} // namespace

GroupAdmin::GroupAdmin(Cluster& cluster, const RetryOrchestrator& retry)
    : cluster_(cluster), retry_(retry) {
}

std::vector<GroupOverview> GroupAdmin::listGroups() {
    cluster_.refreshMetadata();

    std::vector<std::future<std::vector<GroupOverview>>> calls;
    for (int32_t node_id : cluster_.brokerNodeIds()) {
        auto broker = cluster_.findBroker(node_id);
        calls.push_back(std::async(std::launch::async, [broker]() {
            return broker->listGroups();
        }));
    }

    return gather(calls);
}

std::vector<GroupDeletionResult> GroupAdmin::deleteGroups(const std::vector<std::string>& group_ids) {
    RequestValidator::validateGroupIds(group_ids);

    RetryStrategy strategy;
    strategy.description = "delete groups";
    strategy.retriable = {ErrorType::NOT_CONTROLLER, ErrorType::COORDINATOR_NOT_AVAILABLE};
    strategy.retry_partial_failures = true;

    // Groups still to delete and the outcomes of groups already deleted
    std::vector<std::string> remaining = group_ids;
    std::vector<GroupDeletionResult> deleted;

    return retry_.execute<std::vector<GroupDeletionResult>>(strategy, [&](RetryContext&) {
        if (remaining.empty()) {
            return deleted;
        }

        cluster_.refreshMetadata();

        std::map<int32_t, std::shared_ptr<Broker>> coordinators;
        std::map<int32_t, std::vector<std::string>> groups_per_node;
        for (const auto& group_id : remaining) {
            auto broker = cluster_.findGroupCoordinator(group_id);
            coordinators[broker->nodeId()] = broker;
            groups_per_node[broker->nodeId()].push_back(group_id);
        }

        std::vector<std::future<std::vector<GroupDeletionResult>>> calls;
        for (const auto& entry : coordinators) {
            auto broker = entry.second;
            auto groups = groups_per_node[entry.first];
            calls.push_back(std::async(std::launch::async, [broker, groups]() {
                return broker->deleteGroups(groups);
            }));
        }

        auto results = gather(calls);

        std::vector<GroupDeletionResult> failures;
        for (const auto& result : results) {
            if (result.error_code != 0) {
                failures.push_back(result);
            } else {
                deleted.push_back(result);
            }
        }

        remaining.clear();
        for (const auto& failure : failures) {
            remaining.push_back(failure.group_id);
        }

        if (!failures.empty()) {
            std::cerr << "Admin: " << failures.size() << " of " << results.size()
                      << " groups could not be deleted" << std::endl;
            throw DeleteGroupsError("Error in DeleteGroups", failures);
        }

        return deleted;
    });
}
