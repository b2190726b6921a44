#include <gtest/gtest.h>
#include "../src/admin/topic_admin.hpp"
#include "fake_cluster.hpp"

class TopicAdminTest : public ::testing::Test {
protected:
    TopicAdminTest()
        : retry_(testRetryPolicy()),
          admin_(cluster_, retry_, leaderWait()) {}

    static WaitForOptions leaderWait() {
        WaitForOptions options;
        options.delay = std::chrono::milliseconds(1);
        options.max_wait = std::chrono::milliseconds(50);
        options.timeout_message = "Timed out while waiting for topic leaders";
        return options;
    }

    static CreateTopicsRequest createRequest(std::vector<std::string> names, int32_t partitions = 3) {
        CreateTopicsRequest request;
        for (const auto& name : names) {
            TopicSpec spec;
            spec.topic = name;
            spec.num_partitions = partitions;
            request.topics.push_back(spec);
        }
        return request;
    }

    FakeCluster cluster_;
    RetryOrchestrator retry_;
    TopicAdmin admin_;
};

TEST_F(TopicAdminTest, CreatesTopicsAndTracksThemAsTargets) {
    EXPECT_TRUE(admin_.createTopics(createRequest({"orders", "payments"})));

    EXPECT_EQ(cluster_.state.topics.count("orders"), 1u);
    EXPECT_EQ(cluster_.state.topics["orders"].partition_metadata.size(), 3u);
    EXPECT_EQ(cluster_.targetTopics(), (std::set<std::string>{"orders", "payments"}));
    // Leader readiness is polled on the controller
    EXPECT_GE(cluster_.broker(1).script.calls("metadata"), 1);
}

TEST_F(TopicAdminTest, PassesTimeoutToController) {
    auto request = createRequest({"orders"});
    request.timeout_ms = 1234;
    admin_.createTopics(request);

    EXPECT_EQ(cluster_.broker(1).last_timeout_ms, 1234);
}

TEST_F(TopicAdminTest, ReturnsFalseWhenTopicAlreadyExists) {
    cluster_.state.addTopic("orders", 1);

    EXPECT_FALSE(admin_.createTopics(createRequest({"orders"})));
    EXPECT_EQ(cluster_.broker(1).script.calls("createTopics"), 1);
    EXPECT_TRUE(cluster_.targetTopics().empty());
}

TEST_F(TopicAdminTest, ValidateOnlyNeitherWaitsNorTracks) {
    auto request = createRequest({"orders"});
    request.validate_only = true;

    EXPECT_TRUE(admin_.createTopics(request));
    EXPECT_EQ(cluster_.state.topics.count("orders"), 0u);
    EXPECT_EQ(cluster_.broker(1).script.calls("metadata"), 0);
    EXPECT_TRUE(cluster_.targetTopics().empty());
}

TEST_F(TopicAdminTest, RetriesWhenControllerMoves) {
    cluster_.script.failNext("findControllerBroker", ErrorType::NOT_CONTROLLER, 2);

    EXPECT_TRUE(admin_.createTopics(createRequest({"orders"})));
    EXPECT_EQ(cluster_.script.calls("findControllerBroker"), 3);
    // Metadata is refreshed before every attempt
    EXPECT_EQ(cluster_.script.calls("refreshMetadata"), 3);
}

TEST_F(TopicAdminTest, FailsOnNonRetriableCreateError) {
    cluster_.broker(1).script.failNext("createTopics", ErrorType::INVALID_REPLICATION_FACTOR);

    try {
        admin_.createTopics(createRequest({"orders"}));
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::INVALID_REPLICATION_FACTOR);
    }
    EXPECT_EQ(cluster_.broker(1).script.calls("createTopics"), 1);
}

TEST_F(TopicAdminTest, TimesOutWhenLeadersNeverAppear) {
    cluster_.state.new_topic_leader = -1;

    try {
        admin_.createTopics(createRequest({"orders"}));
        FAIL() << "Expected TimeoutError";
    } catch (const TimeoutError& e) {
        EXPECT_STREQ(e.what(), "Timed out while waiting for topic leaders");
    }
}

TEST_F(TopicAdminTest, SkipsLeaderWaitWhenDisabled) {
    cluster_.state.new_topic_leader = -1;
    auto request = createRequest({"orders"});
    request.wait_for_leaders = false;

    EXPECT_TRUE(admin_.createTopics(request));
    EXPECT_EQ(cluster_.broker(1).script.calls("metadata"), 0);
    EXPECT_EQ(cluster_.targetTopics().count("orders"), 1u);
}

TEST_F(TopicAdminTest, LeaderNotAvailableKeepsPolling) {
    cluster_.broker(1).script.failNext("metadata", ErrorType::LEADER_NOT_AVAILABLE, 2);

    EXPECT_TRUE(admin_.createTopics(createRequest({"orders"})));
    EXPECT_EQ(cluster_.broker(1).script.calls("metadata"), 3);
}

TEST_F(TopicAdminTest, ValidatesBeforeAnyNetworkCall) {
    EXPECT_THROW(admin_.createTopics(createRequest({})), ValidationError);
    EXPECT_THROW(admin_.createTopics(createRequest({"a", "a"})), ValidationError);
    EXPECT_EQ(cluster_.script.calls("refreshMetadata"), 0);
}

TEST_F(TopicAdminTest, DeleteTopicsDropsTargetsAndRefreshes) {
    admin_.createTopics(createRequest({"orders", "payments"}));
    int refreshes = cluster_.script.calls("refreshMetadata");

    DeleteTopicsRequest request;
    request.topics = {"orders"};
    admin_.deleteTopics(request);

    EXPECT_EQ(cluster_.state.topics.count("orders"), 0u);
    EXPECT_EQ(cluster_.targetTopics(), (std::set<std::string>{"payments"}));
    // One refresh before the attempt and one after removing the targets
    EXPECT_EQ(cluster_.script.calls("refreshMetadata"), refreshes + 2);
}

TEST_F(TopicAdminTest, DeleteTopicsRetriesUnknownTopic) {
    cluster_.state.addTopic("orders", 1);
    cluster_.broker(1).script.failNext("deleteTopics", ErrorType::UNKNOWN_TOPIC_OR_PARTITION);

    DeleteTopicsRequest request;
    request.topics = {"orders"};
    admin_.deleteTopics(request);

    EXPECT_EQ(cluster_.broker(1).script.calls("deleteTopics"), 2);
    EXPECT_EQ(cluster_.state.topics.count("orders"), 0u);
}

TEST_F(TopicAdminTest, DeleteTopicsTimeoutIsFatal) {
    cluster_.state.addTopic("orders", 1);
    cluster_.broker(1).script.failNext("deleteTopics", ErrorType::REQUEST_TIMED_OUT);

    DeleteTopicsRequest request;
    request.topics = {"orders"};
    EXPECT_THROW(admin_.deleteTopics(request), KafkaProtocolError);
    EXPECT_EQ(cluster_.broker(1).script.calls("deleteTopics"), 1);
}

TEST_F(TopicAdminTest, DeleteTopicsRejectsEmptyNames) {
    DeleteTopicsRequest request;
    request.topics = {""};
    EXPECT_THROW(admin_.deleteTopics(request), ValidationError);
}

TEST_F(TopicAdminTest, CreatePartitionsGrowsTopic) {
    cluster_.state.addTopic("orders", 2);

    CreatePartitionsRequest request;
    TopicPartitionsSpec spec;
    spec.topic = "orders";
    spec.count = 5;
    request.topic_partitions = {spec};

    EXPECT_TRUE(admin_.createPartitions(request));
    EXPECT_EQ(cluster_.state.topics["orders"].partition_metadata.size(), 5u);
}

TEST_F(TopicAdminTest, CreatePartitionsSurfacesInvalidPartitions) {
    cluster_.state.addTopic("orders", 4);

    CreatePartitionsRequest request;
    TopicPartitionsSpec spec;
    spec.topic = "orders";
    spec.count = 2;
    request.topic_partitions = {spec};

    try {
        admin_.createPartitions(request);
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::INVALID_PARTITIONS);
    }
    EXPECT_EQ(cluster_.broker(1).script.calls("createPartitions"), 1);
}

TEST_F(TopicAdminTest, ListTopicsReturnsEveryTopic) {
    cluster_.state.addTopic("a", 1);
    cluster_.state.addTopic("b", 1);

    EXPECT_EQ(admin_.listTopics(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(TopicAdminTest, GetTopicMetadataForGivenTopics) {
    cluster_.state.addTopic("a", 2);

    auto metadata = admin_.getTopicMetadata(std::vector<std::string>{"a"});

    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata[0].name, "a");
    EXPECT_EQ(metadata[0].partitions.size(), 2u);
    EXPECT_EQ(cluster_.targetTopics().count("a"), 1u);
}

TEST_F(TopicAdminTest, GetTopicMetadataDefaultsToTargetTopics) {
    cluster_.state.addTopic("a", 1);
    cluster_.state.addTopic("b", 1);
    cluster_.addTargetTopic("b");

    auto metadata = admin_.getTopicMetadata();

    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata[0].name, "b");
}

TEST_F(TopicAdminTest, GetTopicMetadataReportsUnknownTopic) {
    try {
        admin_.getTopicMetadata(std::vector<std::string>{"missing"});
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::UNKNOWN_TOPIC_OR_PARTITION);
    }
}

TEST_F(TopicAdminTest, GetTopicMetadataWrapsTargetFailures) {
    cluster_.script.failNext("addTargetTopic", ErrorType::TOPIC_AUTHORIZATION_FAILED);

    try {
        admin_.getTopicMetadata(std::vector<std::string>{"secret"});
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::TOPIC_AUTHORIZATION_FAILED);
        EXPECT_EQ(std::string(e.what()).rfind("Failed to add target topic secret: ", 0), 0u);
    }
}

TEST_F(TopicAdminTest, FetchTopicMetadataReturnsAllTopicsWhenEmpty) {
    cluster_.state.addTopic("a", 1);
    cluster_.state.addTopic("b", 3);

    auto all = admin_.fetchTopicMetadata();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].name, "b");
    EXPECT_EQ(all[1].partitions.size(), 3u);

    auto one = admin_.fetchTopicMetadata({"a"});
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].name, "a");

    EXPECT_THROW(admin_.fetchTopicMetadata({""}), ValidationError);
}
