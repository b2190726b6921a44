#include <gtest/gtest.h>
#include "../src/admin/group_admin.hpp"
#include "fake_cluster.hpp"
#include <algorithm>

class GroupAdminTest : public ::testing::Test {
protected:
    GroupAdminTest() : retry_(testRetryPolicy()), admin_(cluster_, retry_) {}

    void SetUp() override {
        cluster_.broker(1).groups = {{"billing", "consumer"}};
        cluster_.broker(2).groups = {{"audit", "consumer"}, {"connect-sink", "connect"}};

        for (const auto& group : {"billing", "audit", "reporting"}) {
            cluster_.state.group_states[group] = "Empty";
        }
        cluster_.state.coordinators["billing"] = 1;
        cluster_.state.coordinators["audit"] = 2;
        cluster_.state.coordinators["reporting"] = 2;
    }

    static std::vector<std::string> ids(const std::vector<GroupDeletionResult>& results) {
        std::vector<std::string> group_ids;
        for (const auto& result : results) {
            group_ids.push_back(result.group_id);
        }
        std::sort(group_ids.begin(), group_ids.end());
        return group_ids;
    }

    FakeCluster cluster_;
    RetryOrchestrator retry_;
    GroupAdmin admin_;
};

TEST_F(GroupAdminTest, ListsGroupsFromEveryBrokerInNodeOrder) {
    auto groups = admin_.listGroups();

    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].group_id, "billing");
    EXPECT_EQ(groups[1].group_id, "audit");
    EXPECT_EQ(groups[2].group_id, "connect-sink");
    EXPECT_EQ(groups[2].protocol_type, "connect");
    for (int32_t node_id : {1, 2, 3}) {
        EXPECT_EQ(cluster_.broker(node_id).script.calls("listGroups"), 1);
    }
}

TEST_F(GroupAdminTest, ListGroupsFailsWhenAnyBrokerFails) {
    cluster_.broker(3).script.failNext("listGroups", ErrorType::COORDINATOR_LOAD_IN_PROGRESS);

    try {
        admin_.listGroups();
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::COORDINATOR_LOAD_IN_PROGRESS);
    }
    // No retry for listing
    EXPECT_EQ(cluster_.broker(3).script.calls("listGroups"), 1);
}

TEST_F(GroupAdminTest, DeletesGroupsThroughTheirCoordinators) {
    auto results = admin_.deleteGroups({"billing", "audit", "reporting"});

    EXPECT_EQ(ids(results), (std::vector<std::string>{"audit", "billing", "reporting"}));
    for (const auto& result : results) {
        EXPECT_EQ(result.error_code, 0);
    }
    EXPECT_EQ(cluster_.broker(1).deleted_requests, (std::vector<std::string>{"billing"}));
    EXPECT_EQ(cluster_.broker(2).deleted_requests, (std::vector<std::string>{"audit", "reporting"}));
    // One request per coordinator
    EXPECT_EQ(cluster_.broker(2).script.calls("deleteGroups"), 1);
    EXPECT_TRUE(cluster_.state.group_states.empty());
}

TEST_F(GroupAdminTest, RetriesOnlyTheGroupsThatFailed) {
    cluster_.state.delete_group_errors["audit"] = {static_cast<int16_t>(ErrorType::COORDINATOR_LOAD_IN_PROGRESS)};

    auto results = admin_.deleteGroups({"billing", "audit"});

    // Successes of the first pass are kept
    EXPECT_EQ(ids(results), (std::vector<std::string>{"audit", "billing"}));
    EXPECT_EQ(cluster_.broker(1).deleted_requests, (std::vector<std::string>{"billing"}));
    EXPECT_EQ(cluster_.broker(2).deleted_requests, (std::vector<std::string>{"audit", "audit"}));
}

TEST_F(GroupAdminTest, PersistentFailuresSurfaceAsDeleteGroupsError) {
    std::deque<int16_t> errors(10, static_cast<int16_t>(ErrorType::NON_EMPTY_GROUP));
    cluster_.state.delete_group_errors["audit"] = errors;

    try {
        admin_.deleteGroups({"billing", "audit"});
        FAIL() << "Expected DeleteGroupsError";
    } catch (const DeleteGroupsError& e) {
        EXPECT_STREQ(e.what(), "Error in DeleteGroups");
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_EQ(e.failures()[0].group_id, "audit");
        EXPECT_EQ(e.failures()[0].error_code, static_cast<int16_t>(ErrorType::NON_EMPTY_GROUP));
        EXPECT_EQ(e.failures()[0].error, "NON_EMPTY_GROUP");
    }
    // billing is never sent again after it succeeded
    EXPECT_EQ(cluster_.broker(1).deleted_requests.size(), 1u);
    EXPECT_EQ(cluster_.broker(2).deleted_requests.size(), static_cast<size_t>(testRetryPolicy().retries + 1));
}

TEST_F(GroupAdminTest, RetriesWhenCoordinatorIsUnavailable) {
    cluster_.script.failNext("findGroupCoordinator", ErrorType::COORDINATOR_NOT_AVAILABLE);

    auto results = admin_.deleteGroups({"billing"});

    EXPECT_EQ(ids(results), (std::vector<std::string>{"billing"}));
    EXPECT_EQ(cluster_.script.calls("findGroupCoordinator"), 2);
}

TEST_F(GroupAdminTest, RequestLevelErrorsAreNotRetriedUnlessClassified) {
    cluster_.broker(1).script.failNext("deleteGroups", ErrorType::GROUP_AUTHORIZATION_FAILED);

    EXPECT_THROW(admin_.deleteGroups({"billing"}), KafkaProtocolError);
    EXPECT_EQ(cluster_.broker(1).script.calls("deleteGroups"), 1);
}

TEST_F(GroupAdminTest, DeleteGroupsValidatesIds) {
    EXPECT_THROW(admin_.deleteGroups({}), ValidationError);
    EXPECT_THROW(admin_.deleteGroups({"billing", ""}), ValidationError);
    EXPECT_EQ(cluster_.script.calls("refreshMetadata"), 0);
}
