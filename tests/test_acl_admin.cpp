#include <gtest/gtest.h>
#include "../src/admin/acl_admin.hpp"
#include "fake_cluster.hpp"

class AclAdminTest : public ::testing::Test {
protected:
    AclAdminTest() : retry_(testRetryPolicy()), admin_(cluster_, retry_) {}

    static AclEntry acl(const std::string& principal, const std::string& topic, AclOperation operation) {
        AclEntry entry;
        entry.resource_type = static_cast<int32_t>(ResourceType::TOPIC);
        entry.resource_name = topic;
        entry.resource_pattern_type = static_cast<int32_t>(ResourcePatternType::LITERAL);
        entry.principal = principal;
        entry.host = "*";
        entry.operation = static_cast<int32_t>(operation);
        entry.permission_type = static_cast<int32_t>(AclPermissionType::ALLOW);
        return entry;
    }

    static AclFilter anyFilter() {
        AclFilter filter;
        filter.resource_type = static_cast<int32_t>(ResourceType::ANY);
        filter.resource_pattern_type = static_cast<int32_t>(ResourcePatternType::ANY);
        filter.operation = static_cast<int32_t>(AclOperation::ANY);
        filter.permission_type = static_cast<int32_t>(AclPermissionType::ANY);
        return filter;
    }

    FakeCluster cluster_;
    RetryOrchestrator retry_;
    AclAdmin admin_;
};

TEST_F(AclAdminTest, CreatesAcls) {
    EXPECT_TRUE(admin_.createAcls({acl("User:bob", "orders", AclOperation::READ),
                                   acl("User:bob", "orders", AclOperation::WRITE)}));
    EXPECT_EQ(cluster_.state.acls.size(), 2u);
}

TEST_F(AclAdminTest, CreateRetriesWhenControllerMoves) {
    cluster_.broker(1).script.failNext("createAcls", ErrorType::NOT_CONTROLLER, 2);

    EXPECT_TRUE(admin_.createAcls({acl("User:bob", "orders", AclOperation::READ)}));
    EXPECT_EQ(cluster_.broker(1).script.calls("createAcls"), 3);
}

TEST_F(AclAdminTest, CreateFailsOnSecurityDisabled) {
    cluster_.broker(1).script.failNext("createAcls", ErrorType::SECURITY_DISABLED);

    try {
        admin_.createAcls({acl("User:bob", "orders", AclOperation::READ)});
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::SECURITY_DISABLED);
    }
    EXPECT_EQ(cluster_.broker(1).script.calls("createAcls"), 1);
}

TEST_F(AclAdminTest, CreateValidatesBeforeSending) {
    AclEntry bad = acl("User:bob", "orders", AclOperation::READ);
    bad.resource_type = 123;

    EXPECT_THROW(admin_.createAcls({bad}), ValidationError);
    EXPECT_EQ(cluster_.broker(1).script.calls("createAcls"), 0);
}

TEST_F(AclAdminTest, DescribesMatchingAclsGroupedByResource) {
    admin_.createAcls({acl("User:bob", "orders", AclOperation::READ),
                       acl("User:alice", "orders", AclOperation::WRITE),
                       acl("User:bob", "payments", AclOperation::READ)});

    AclFilter filter = anyFilter();
    filter.principal = "User:bob";
    auto response = admin_.describeAcls(filter);

    ASSERT_EQ(response.resources.size(), 2u);
    EXPECT_EQ(response.resources[0].resource_name, "orders");
    ASSERT_EQ(response.resources[0].acls.size(), 1u);
    EXPECT_EQ(response.resources[0].acls[0].principal, "User:bob");
    EXPECT_EQ(response.resources[1].resource_name, "payments");
}

TEST_F(AclAdminTest, DescribeRejectsEmptyPrincipal) {
    AclFilter filter = anyFilter();
    filter.principal = "";

    EXPECT_THROW(admin_.describeAcls(filter), ValidationError);
    EXPECT_EQ(cluster_.broker(1).script.calls("describeAcls"), 0);
}

TEST_F(AclAdminTest, DeletesMatchingAcls) {
    admin_.createAcls({acl("User:bob", "orders", AclOperation::READ),
                       acl("User:alice", "orders", AclOperation::WRITE)});

    AclFilter filter = anyFilter();
    filter.principal = "User:alice";
    auto response = admin_.deleteAcls({filter});

    ASSERT_EQ(response.filter_responses.size(), 1u);
    ASSERT_EQ(response.filter_responses[0].matching_acls.size(), 1u);
    EXPECT_EQ(response.filter_responses[0].matching_acls[0].acl.principal, "User:alice");
    ASSERT_EQ(cluster_.state.acls.size(), 1u);
    EXPECT_EQ(cluster_.state.acls[0].principal, "User:bob");
}

TEST_F(AclAdminTest, DeleteRejectsFilterWithoutOperation) {
    admin_.createAcls({acl("User:bob", "orders", AclOperation::READ)});

    AclFilter filter = anyFilter();
    filter.operation = UNDEFINED_ENUM_VALUE;

    EXPECT_THROW(admin_.deleteAcls({filter}), ValidationError);
    EXPECT_EQ(cluster_.broker(1).script.calls("deleteAcls"), 0);
    EXPECT_EQ(cluster_.state.acls.size(), 1u);
}

TEST_F(AclAdminTest, DeleteRejectsEmptyFilterArray) {
    EXPECT_THROW(admin_.deleteAcls({}), ValidationError);
}
