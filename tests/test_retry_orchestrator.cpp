#include <gtest/gtest.h>
#include "../src/admin/retry_orchestrator.hpp"
#include <stdexcept>
#include <thread>

class RetryOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_.retries = 3;
        policy_.initial_retry_time_ms = 1;  // Short for testing
        policy_.max_retry_time_ms = 1000;

        strategy_.description = "run test operation";
        strategy_.retriable = {ErrorType::NOT_CONTROLLER};
        strategy_.tolerated = {ErrorType::TOPIC_ALREADY_EXISTS};
    }

    RetryPolicy policy_;
    RetryStrategy strategy_;
};

TEST_F(RetryOrchestratorTest, ReturnsResultOfFirstSuccessfulAttempt) {
    RetryOrchestrator retry(policy_);
    int calls = 0;

    int result = retry.execute<int>(strategy_, [&](RetryContext&) {
        calls++;
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryOrchestratorTest, RetriesRetriableErrorsUntilSuccess) {
    RetryOrchestrator retry(policy_);
    std::vector<int> attempts;

    bool result = retry.execute<bool>(strategy_, [&](RetryContext& context) {
        attempts.push_back(context.attempt);
        if (attempts.size() < 3) {
            throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "not the controller");
        }
        return true;
    });

    EXPECT_TRUE(result);
    EXPECT_EQ(attempts, (std::vector<int>{0, 1, 2}));
}

TEST_F(RetryOrchestratorTest, FailsImmediatelyOnUnclassifiedProtocolError) {
    RetryOrchestrator retry(policy_);
    int calls = 0;

    try {
        retry.execute<bool>(strategy_, [&](RetryContext&) -> bool {
            calls++;
            throw KafkaProtocolError(ErrorType::INVALID_PARTITIONS, "bad partitions");
        });
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::INVALID_PARTITIONS);
        EXPECT_STREQ(e.what(), "bad partitions");
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryOrchestratorTest, ToleratedErrorYieldsToleratedValue) {
    RetryOrchestrator retry(policy_);
    int calls = 0;

    bool result = retry.execute<bool>(strategy_, [&](RetryContext&) -> bool {
        calls++;
        throw KafkaProtocolError(ErrorType::TOPIC_ALREADY_EXISTS, "exists");
    }, false);

    EXPECT_FALSE(result);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryOrchestratorTest, RethrowsLastErrorWhenRetriesAreExhausted) {
    RetryOrchestrator retry(policy_);
    int calls = 0;

    try {
        retry.execute<bool>(strategy_, [&](RetryContext&) -> bool {
            calls++;
            throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "attempt " + std::to_string(calls));
        });
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::NOT_CONTROLLER);
        EXPECT_STREQ(e.what(), "attempt 4");
    }
    EXPECT_EQ(calls, policy_.retries + 1);
}

TEST_F(RetryOrchestratorTest, ZeroRetriesRunsOnce) {
    policy_.retries = 0;
    RetryOrchestrator retry(policy_);
    int calls = 0;

    EXPECT_THROW(retry.execute<bool>(strategy_, [&](RetryContext&) -> bool {
        calls++;
        throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "not the controller");
    }), KafkaProtocolError);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryOrchestratorTest, BailSurfacesErrorWithoutRetrying) {
    RetryOrchestrator retry(policy_);
    int calls = 0;

    try {
        retry.execute<bool>(strategy_, [&](RetryContext& context) -> bool {
            calls++;
            context.bail(std::make_exception_ptr(
                KafkaProtocolError(ErrorType::NOT_CONTROLLER, "bailed out")));
        });
        FAIL() << "Expected KafkaProtocolError";
    } catch (const KafkaProtocolError& e) {
        EXPECT_STREQ(e.what(), "bailed out");
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryOrchestratorTest, NonProtocolErrorsPropagateUnchanged) {
    RetryOrchestrator retry(policy_);
    int calls = 0;

    EXPECT_THROW(retry.execute<bool>(strategy_, [&](RetryContext&) -> bool {
        calls++;
        throw std::runtime_error("boom");
    }), std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryOrchestratorTest, BeforeRetryRunsOncePerRetry) {
    int hooks = 0;
    strategy_.before_retry = [&](const KafkaProtocolError& e) {
        EXPECT_EQ(e.type(), ErrorType::NOT_CONTROLLER);
        hooks++;
    };
    RetryOrchestrator retry(policy_);
    int calls = 0;

    retry.execute<bool>(strategy_, [&](RetryContext&) {
        if (++calls < 3) {
            throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "not the controller");
        }
        return true;
    });

    EXPECT_EQ(hooks, 2);
}

TEST_F(RetryOrchestratorTest, LastErrorIsVisibleToTheNextAttempt) {
    RetryOrchestrator retry(policy_);
    bool saw_last_error = false;

    retry.execute<bool>(strategy_, [&](RetryContext& context) {
        if (context.attempt == 0) {
            throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "first");
        }
        try {
            std::rethrow_exception(context.last_error);
        } catch (const KafkaProtocolError& e) {
            saw_last_error = std::string(e.what()) == "first";
        }
        return true;
    });

    EXPECT_TRUE(saw_last_error);
}

TEST_F(RetryOrchestratorTest, PartialFailuresAreRetriedOnlyWhenEnabled) {
    RetryOrchestrator retry(policy_);
    int calls = 0;
    auto operation = [&](RetryContext&) -> bool {
        calls++;
        throw DeleteGroupsError("Error in DeleteGroups", {{"group-a", 69, "GROUP_ID_NOT_FOUND"}});
    };

    EXPECT_THROW(retry.execute<bool>(strategy_, operation), DeleteGroupsError);
    EXPECT_EQ(calls, 1);

    calls = 0;
    strategy_.retry_partial_failures = true;
    EXPECT_THROW(retry.execute<bool>(strategy_, operation), DeleteGroupsError);
    EXPECT_EQ(calls, policy_.retries + 1);
}

TEST_F(RetryOrchestratorTest, StopsWhenTimeBudgetIsSpent) {
    policy_.retries = 100;
    policy_.max_retry_time_ms = 20;
    RetryOrchestrator retry(policy_);
    int calls = 0;

    EXPECT_THROW(retry.execute<bool>(strategy_, [&](RetryContext&) -> bool {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        throw KafkaProtocolError(ErrorType::NOT_CONTROLLER, "not the controller");
    }), KafkaProtocolError);

    EXPECT_LT(calls, 100);
}

TEST_F(RetryOrchestratorTest, BackoffStaysWithinJitterBounds) {
    policy_.initial_retry_time_ms = 100;
    policy_.max_retry_time_ms = 1000;
    RetryOrchestrator retry(policy_);

    for (int i = 0; i < 20; ++i) {
        auto first = retry.calculateBackoff(0).count();
        EXPECT_GE(first, 80);
        EXPECT_LE(first, 120);

        auto third = retry.calculateBackoff(2).count();
        EXPECT_GE(third, 320);
        EXPECT_LE(third, 480);
    }
}

TEST_F(RetryOrchestratorTest, BackoffIsCappedAtMaxRetryTime) {
    policy_.initial_retry_time_ms = 100;
    policy_.max_retry_time_ms = 1000;
    RetryOrchestrator retry(policy_);

    for (int i = 0; i < 20; ++i) {
        EXPECT_LE(retry.calculateBackoff(10).count(), 1000);
    }
}

TEST(RetryStrategyTest, ToleratedTakesPrecedenceOverRetriable) {
    RetryStrategy strategy;
    strategy.retriable = {ErrorType::NOT_CONTROLLER};
    strategy.tolerated = {ErrorType::NOT_CONTROLLER};

    KafkaProtocolError error(ErrorType::NOT_CONTROLLER, "x");
    EXPECT_EQ(strategy.classify(error), RetryDecision::Tolerate);
}

TEST(KafkaErrorsTest, MapsProtocolCodesToTypes) {
    EXPECT_EQ(errorTypeFromCode(41), ErrorType::NOT_CONTROLLER);
    EXPECT_EQ(errorTypeFromCode(36), ErrorType::TOPIC_ALREADY_EXISTS);
    EXPECT_EQ(errorTypeFromCode(12345), ErrorType::UNKNOWN);
    EXPECT_EQ(errorTypeName(ErrorType::COORDINATOR_NOT_AVAILABLE), "COORDINATOR_NOT_AVAILABLE");

    KafkaProtocolError error(static_cast<int16_t>(16), "not coordinator");
    EXPECT_EQ(error.type(), ErrorType::NOT_COORDINATOR);
    EXPECT_EQ(error.code(), 16);
}
