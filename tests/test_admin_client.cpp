#include <gtest/gtest.h>
#include "../src/admin/admin_client.hpp"
#include "fake_cluster.hpp"
#include <cstdlib>

class AdminClientTest : public ::testing::Test {
protected:
    AdminClientTest()
        : cluster_(std::make_shared<FakeCluster>()),
          admin_(cluster_, testConfig()) {}

    std::shared_ptr<FakeCluster> cluster_;
    AdminClient admin_;
};

TEST_F(AdminClientTest, ConnectAndDisconnectEmitEvents) {
    std::vector<InstrumentationEvent> events;
    admin_.on(AdminEvents::CONNECT, [&events](const InstrumentationEvent& e) { events.push_back(e); });
    admin_.on(AdminEvents::DISCONNECT, [&events](const InstrumentationEvent& e) { events.push_back(e); });

    admin_.connect();
    EXPECT_TRUE(admin_.isConnected());
    admin_.disconnect();
    EXPECT_FALSE(admin_.isConnected());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, AdminEvents::CONNECT);
    EXPECT_EQ(events[1].type, AdminEvents::DISCONNECT);
    EXPECT_LT(events[0].id, events[1].id);
    EXPECT_GT(events[0].timestamp, 0);
}

TEST_F(AdminClientTest, RemovedListenersAreNotCalled) {
    int calls = 0;
    auto remove = admin_.on(AdminEvents::CONNECT, [&calls](const InstrumentationEvent&) { calls++; });

    admin_.connect();
    remove();
    admin_.connect();

    EXPECT_EQ(calls, 1);
}

TEST_F(AdminClientTest, FailingListenerDoesNotStopOthers) {
    int calls = 0;
    admin_.on(AdminEvents::CONNECT, [](const InstrumentationEvent&) {
        throw std::runtime_error("listener broke");
    });
    admin_.on(AdminEvents::CONNECT, [&calls](const InstrumentationEvent&) { calls++; });

    EXPECT_NO_THROW(admin_.connect());
    EXPECT_EQ(calls, 1);
}

TEST_F(AdminClientTest, RejectsUnknownEventNames) {
    try {
        admin_.on("admin.request", [](const InstrumentationEvent&) {});
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Event name should be one of admin.events.CONNECT, admin.events.DISCONNECT");
    }
}

TEST_F(AdminClientTest, ConnectFailurePropagatesWithoutEvent) {
    int calls = 0;
    admin_.on(AdminEvents::CONNECT, [&calls](const InstrumentationEvent&) { calls++; });
    cluster_->script.failNext("connect", ErrorType::BROKER_NOT_AVAILABLE);

    EXPECT_THROW(admin_.connect(), KafkaProtocolError);
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(admin_.isConnected());
}

TEST_F(AdminClientTest, DescribeClusterReportsBrokersAndController) {
    auto description = admin_.describeCluster();

    ASSERT_EQ(description.brokers.size(), 3u);
    EXPECT_EQ(description.brokers[0].node_id, 1);
    EXPECT_EQ(description.brokers[0].host, "broker-1");
    EXPECT_EQ(description.brokers[0].port, 9092);
    EXPECT_EQ(description.controller, std::optional<int32_t>(1));
    EXPECT_EQ(description.cluster_id, "fake-cluster");
}

TEST_F(AdminClientTest, DescribeClusterWithoutController) {
    cluster_->controller_id = ClusterMetadata::NO_CONTROLLER_ID;

    EXPECT_FALSE(admin_.describeCluster().controller.has_value());
}

TEST_F(AdminClientTest, RoutesTopicAndOffsetOperations) {
    CreateTopicsRequest request;
    TopicSpec spec;
    spec.topic = "orders";
    spec.num_partitions = 2;
    request.topics = {spec};
    EXPECT_TRUE(admin_.createTopics(request));

    EXPECT_EQ(admin_.listTopics(), (std::vector<std::string>{"orders"}));

    cluster_->state.watermarks[{"orders", 0}] = {1, 4};
    cluster_->state.watermarks[{"orders", 1}] = {0, 9};
    cluster_->state.group_states["billing"] = "Empty";

    admin_.resetOffsets("billing", "orders");
    auto offsets = admin_.fetchOffsets("billing", "orders");
    ASSERT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets[0].offset, 4);
    EXPECT_EQ(offsets[1].offset, 9);
}

TEST_F(AdminClientTest, UsesConfiguredRetryCount) {
    AdminConfig config = testConfig();
    config.retries = 1;
    AdminClient admin(cluster_, config);
    cluster_->script.failNext("findControllerBroker", ErrorType::NOT_CONTROLLER, 5);

    CreateTopicsRequest request;
    TopicSpec spec;
    spec.topic = "orders";
    request.topics = {spec};

    EXPECT_THROW(admin.createTopics(request), KafkaProtocolError);
    EXPECT_EQ(cluster_->script.calls("findControllerBroker"), 2);
}

class AdminConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("KAFKA_BROKERS");
        unsetenv("ADMIN_RETRIES");
        unsetenv("GATEWAY_PORT");
    }
};

TEST_F(AdminConfigTest, RequiresBrokers) {
    unsetenv("KAFKA_BROKERS");
    EXPECT_THROW(AdminConfig::fromEnv(), std::runtime_error);
}

TEST_F(AdminConfigTest, ReadsOverridesFromEnvironment) {
    setenv("KAFKA_BROKERS", "kafka-1:9092,kafka-2:9092", 1);
    setenv("ADMIN_RETRIES", "2", 1);
    setenv("GATEWAY_PORT", "9090", 1);

    AdminConfig config = AdminConfig::fromEnv();

    EXPECT_EQ(config.brokers, "kafka-1:9092,kafka-2:9092");
    EXPECT_EQ(config.retries, 2);
    EXPECT_EQ(config.http_port, 9090);
    EXPECT_EQ(config.initial_retry_time_ms, 300);
}

TEST_F(AdminConfigTest, RejectsNegativeRetries) {
    setenv("KAFKA_BROKERS", "localhost:9092", 1);
    setenv("ADMIN_RETRIES", "-1", 1);

    EXPECT_THROW(AdminConfig::fromEnv(), std::runtime_error);
}
