#include <gtest/gtest.h>
#include "../src/producer/producer_loop.hpp"
#include "fakes.hpp"
#include <chrono>
#include <thread>

class ProducerLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        stream_.addShard("shardId-000000000000");
        stream_.addShard("shardId-000000000001");
    }

    InMemoryStream stream_{"myFirstStream"};
    ShutdownSignal stop_;
    int64_t now_ = 1700000000000LL;
};

TEST_F(ProducerLoopTest, PayloadFormat) {
    EXPECT_EQ(ProducerLoop::payloadFor(1234), "testData-1234");
    EXPECT_EQ(ProducerLoop::partitionKeyFor(1234), "partitionKey-1234");
}

TEST_F(ProducerLoopTest, WritesSampleRecords) {
    ProducerLoop loop(stream_, stop_, std::chrono::milliseconds(1), [this]() { return now_++; });

    EXPECT_TRUE(loop.run(3));
    EXPECT_EQ(loop.getRecordsPut(), 3u);

    size_t total = stream_.recordsOf("shardId-000000000000").size() +
                   stream_.recordsOf("shardId-000000000001").size();
    EXPECT_EQ(total, 3u);

    for (const auto& shard : {"shardId-000000000000", "shardId-000000000001"}) {
        for (const auto& record : stream_.recordsOf(shard)) {
            EXPECT_EQ(record.data.rfind("testData-", 0), 0u);
            EXPECT_EQ(record.partition_key.rfind("partitionKey-", 0), 0u);
            EXPECT_EQ(record.data.substr(9), record.partition_key.substr(13));
        }
    }
}

TEST_F(ProducerLoopTest, RetryableFailureResendsSameRecord) {
    stream_.scriptPutStatuses({ProduceResult::RETRYABLE_ERROR, ProduceResult::RETRYABLE_ERROR});
    ProducerLoop loop(stream_, stop_, std::chrono::milliseconds(1), [this]() { return now_++; });

    EXPECT_TRUE(loop.run(1));
    EXPECT_EQ(loop.getRetries(), 2u);
    EXPECT_EQ(loop.getRecordsPut(), 1u);
    EXPECT_EQ(stream_.putCalls(), 3);
}

TEST_F(ProducerLoopTest, PersistentFailureStopsLoop) {
    stream_.scriptPutStatuses({ProduceResult::PERSISTENT_ERROR});
    ProducerLoop loop(stream_, stop_, std::chrono::milliseconds(1), [this]() { return now_++; });

    EXPECT_FALSE(loop.run(10));
    EXPECT_EQ(loop.getRecordsPut(), 0u);
    EXPECT_EQ(stream_.putCalls(), 1);
}

TEST_F(ProducerLoopTest, StopEndsUnboundedLoop) {
    ProducerLoop loop(stream_, stop_, std::chrono::milliseconds(1), [this]() { return now_++; });

    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop_.trigger();
    });

    EXPECT_TRUE(loop.run());
    stopper.join();
    EXPECT_GT(loop.getRecordsPut(), 0u);
}
