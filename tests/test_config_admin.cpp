#include <gtest/gtest.h>
#include "../src/admin/config_admin.hpp"
#include "fake_cluster.hpp"

class ConfigAdminTest : public ::testing::Test {
protected:
    ConfigAdminTest() : retry_(testRetryPolicy()), admin_(cluster_, retry_) {}

    void SetUp() override {
        cluster_.state.configs["orders"] = {
            {"cleanup.policy", "delete"},
            {"retention.ms", "604800000"},
        };
    }

    FakeCluster cluster_;
    RetryOrchestrator retry_;
    ConfigAdmin admin_;
};

TEST_F(ConfigAdminTest, DescribesRequestedConfigNames) {
    ResourceConfigQuery query;
    query.name = "orders";
    query.config_names = {"retention.ms"};

    auto response = admin_.describeConfigs({query});

    ASSERT_EQ(response.resources.size(), 1u);
    EXPECT_EQ(response.resources[0].resource_name, "orders");
    ASSERT_EQ(response.resources[0].config_entries.size(), 1u);
    EXPECT_EQ(response.resources[0].config_entries[0].config_name, "retention.ms");
    EXPECT_EQ(response.resources[0].config_entries[0].config_value, std::optional<std::string>("604800000"));
    EXPECT_FALSE(cluster_.broker(1).last_include_synonyms);
}

TEST_F(ConfigAdminTest, DescribesAllConfigsWithSynonyms) {
    ResourceConfigQuery query;
    query.name = "orders";

    auto response = admin_.describeConfigs({query}, true);

    ASSERT_EQ(response.resources.size(), 1u);
    EXPECT_EQ(response.resources[0].config_entries.size(), 2u);
    EXPECT_TRUE(cluster_.broker(1).last_include_synonyms);
}

TEST_F(ConfigAdminTest, DescribeRetriesWhenControllerMoves) {
    cluster_.controller_id = 2;
    cluster_.broker(2).script.failNext("describeConfigs", ErrorType::NOT_CONTROLLER);

    ResourceConfigQuery query;
    query.name = "orders";
    admin_.describeConfigs({query});

    EXPECT_EQ(cluster_.broker(2).script.calls("describeConfigs"), 2);
    EXPECT_EQ(cluster_.broker(1).script.calls("describeConfigs"), 0);
}

TEST_F(ConfigAdminTest, DescribeRejectsInvalidResourceType) {
    ResourceConfigQuery query;
    query.type = 9;
    query.name = "orders";

    EXPECT_THROW(admin_.describeConfigs({query}), ValidationError);
    EXPECT_EQ(cluster_.broker(1).script.calls("describeConfigs"), 0);
}

TEST_F(ConfigAdminTest, AltersConfigs) {
    ResourceConfig resource;
    resource.name = "orders";
    resource.config_entries = {{"cleanup.policy", std::string("compact")}};

    auto response = admin_.alterConfigs({resource});

    ASSERT_EQ(response.resources.size(), 1u);
    EXPECT_EQ(response.resources[0].resource_name, "orders");
    EXPECT_EQ(response.resources[0].error_code, 0);
    EXPECT_EQ(cluster_.state.configs["orders"]["cleanup.policy"], "compact");
}

TEST_F(ConfigAdminTest, AlterValidateOnlyLeavesConfigsUntouched) {
    ResourceConfig resource;
    resource.name = "orders";
    resource.config_entries = {{"cleanup.policy", std::string("compact")}};

    admin_.alterConfigs({resource}, true);

    EXPECT_EQ(cluster_.state.configs["orders"]["cleanup.policy"], "delete");
}

TEST_F(ConfigAdminTest, AlterRejectsMissingValue) {
    ResourceConfig resource;
    resource.name = "orders";
    resource.config_entries = {{"cleanup.policy", std::nullopt}};

    EXPECT_THROW(admin_.alterConfigs({resource}), ValidationError);
    EXPECT_EQ(cluster_.broker(1).script.calls("alterConfigs"), 0);
}

TEST_F(ConfigAdminTest, AlterSurfacesInvalidConfig) {
    cluster_.broker(1).script.failNext("alterConfigs", ErrorType::INVALID_CONFIG);

    ResourceConfig resource;
    resource.name = "orders";
    resource.config_entries = {{"cleanup.policy", std::string("bogus")}};

    EXPECT_THROW(admin_.alterConfigs({resource}), KafkaProtocolError);
    EXPECT_EQ(cluster_.broker(1).script.calls("alterConfigs"), 1);
}
