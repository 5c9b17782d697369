#include <gtest/gtest.h>
#include "../src/consumer/checkpoint_manager.hpp"
#include "../src/consumer/record_checkpointer.hpp"
#include "fakes.hpp"
#include <chrono>
#include <thread>

class CheckpointManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.createLeaseIfAbsent(shard_, {});
        LeaseResult lease = store_.acquireOrRenew(shard_, "worker-a", 0, 60000);
        ASSERT_EQ(lease.status, StoreStatus::OK);
        counter_ = lease.counter;
    }

    InMemoryLeaseStore store_;
    ShutdownSignal stop_;
    std::string shard_ = "shardId-000000000000";
    int64_t counter_ = 0;
};

TEST_F(CheckpointManagerTest, CommitsOnFirstAttempt) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    CheckpointManager manager(10, std::chrono::milliseconds(1), stop_);

    EXPECT_EQ(manager.checkpoint(checkpointer, 5), CheckpointResult::COMMITTED);
    EXPECT_EQ(store_.checkpointCalls(), 1);
    ASSERT_TRUE(checkpointer.getLastCheckpoint().has_value());
    EXPECT_EQ(*checkpointer.getLastCheckpoint(), 5);
    EXPECT_EQ(*store_.readLease(shard_)->checkpoint, 5);
}

TEST_F(CheckpointManagerTest, LeaseConflictIsNeverRetried) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    store_.steal(shard_, "worker-b");
    CheckpointManager manager(10, std::chrono::milliseconds(1), stop_);

    EXPECT_EQ(manager.checkpoint(checkpointer, 5), CheckpointResult::LEASE_LOST);
    EXPECT_EQ(store_.checkpointCalls(), 1);
    EXPECT_TRUE(checkpointer.leaseLost());
    EXPECT_FALSE(store_.readLease(shard_)->checkpoint.has_value());

    // Once lost, later writes do not reach the store
    EXPECT_EQ(manager.checkpoint(checkpointer, 6), CheckpointResult::LEASE_LOST);
    EXPECT_EQ(store_.checkpointCalls(), 1);
}

TEST_F(CheckpointManagerTest, ThrottlingRetriesUntilSuccess) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    store_.injectCheckpointFaults({StoreStatus::THROTTLED, StoreStatus::THROTTLED});
    CheckpointManager manager(10, std::chrono::milliseconds(1), stop_);

    EXPECT_EQ(manager.checkpoint(checkpointer, 7), CheckpointResult::COMMITTED);
    EXPECT_EQ(store_.checkpointCalls(), 3);
}

TEST_F(CheckpointManagerTest, ThrottlingGivesUpAfterRetryBound) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    store_.injectCheckpointFaults(std::vector<StoreStatus>(20, StoreStatus::THROTTLED));
    CheckpointManager manager(10, std::chrono::milliseconds(1), stop_);

    EXPECT_EQ(manager.checkpoint(checkpointer, 7), CheckpointResult::GAVE_UP);
    EXPECT_EQ(store_.checkpointCalls(), 10);
    EXPECT_FALSE(checkpointer.leaseLost());
    EXPECT_FALSE(checkpointer.failed());
}

TEST_F(CheckpointManagerTest, SchemaErrorIsFatal) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    store_.injectCheckpointFaults({StoreStatus::SCHEMA_ERROR});
    CheckpointManager manager(10, std::chrono::milliseconds(1), stop_);

    EXPECT_EQ(manager.checkpoint(checkpointer, 7), CheckpointResult::FATAL);
    EXPECT_EQ(store_.checkpointCalls(), 1);
    EXPECT_TRUE(checkpointer.failed());
}

TEST_F(CheckpointManagerTest, StopInterruptsBackoff) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    store_.injectCheckpointFaults(std::vector<StoreStatus>(20, StoreStatus::THROTTLED));
    CheckpointManager manager(10, std::chrono::seconds(30), stop_);

    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop_.trigger();
    });

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(manager.checkpoint(checkpointer, 7), CheckpointResult::GAVE_UP);
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(store_.checkpointCalls(), 1);
}

TEST_F(CheckpointManagerTest, StoredCheckpointNeverRegresses) {
    RecordCheckpointer checkpointer(store_, shard_);
    checkpointer.setLeaseCounter(counter_);
    CheckpointManager manager(3, std::chrono::milliseconds(1), stop_);

    EXPECT_EQ(manager.checkpoint(checkpointer, 10), CheckpointResult::COMMITTED);
    EXPECT_EQ(manager.checkpoint(checkpointer, 4), CheckpointResult::COMMITTED);

    EXPECT_EQ(*store_.readLease(shard_)->checkpoint, 10);
    EXPECT_EQ(*checkpointer.getLastCheckpoint(), 10);
}
