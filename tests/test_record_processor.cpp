#include <gtest/gtest.h>
#include "../src/consumer/record_processor.hpp"
#include "fakes.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

class RecordProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.createLeaseIfAbsent(shard_, {});
        LeaseResult lease = store_.acquireOrRenew(shard_, "worker-a", 0, 60000);
        ASSERT_EQ(lease.status, StoreStatus::OK);
        checkpointer_.setLeaseCounter(lease.counter);

        policy_.num_retries = 10;
        policy_.backoff = std::chrono::milliseconds(1);
        policy_.checkpoint_interval = std::chrono::milliseconds(0);
    }

    Record makeRecord(SequenceNumber sequence, const std::string& data) {
        Record record;
        record.shard_id = shard_;
        record.partition_key = "partitionKey-" + std::to_string(sequence);
        record.data = data;
        record.sequence_number = sequence;
        return record;
    }

    Record sampleRecord(SequenceNumber sequence) {
        return makeRecord(sequence, "testData-" + std::to_string(1700000000000LL + sequence));
    }

    InMemoryLeaseStore store_;
    std::string shard_ = "shardId-000000000000";
    RecordCheckpointer checkpointer_{store_, shard_};
    SampleRecordDecoder decoder_;
    ProcessorPolicy policy_;
    ShutdownSignal stop_;
};

TEST_F(RecordProcessorTest, ProcessBeforeInitializeThrows) {
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    EXPECT_THROW(processor.process({sampleRecord(1)}, checkpointer_), std::logic_error);
}

TEST_F(RecordProcessorTest, MalformedRecordIsRejectedAndBatchContinues) {
    std::vector<SequenceNumber> applied;
    RecordProcessor processor(decoder_, [&applied](const Record& record, const SampleEvent&) {
        applied.push_back(record.sequence_number);
    }, policy_);
    processor.initialize(shard_, stop_);

    std::vector<Record> batch = {
        sampleRecord(1),
        sampleRecord(2),
        makeRecord(3, std::string("\xff\xfe\xfd", 3)),
        sampleRecord(4),
        sampleRecord(5),
    };
    processor.process(batch, checkpointer_);

    EXPECT_EQ(applied, (std::vector<SequenceNumber>{1, 2, 4, 5}));
    ProcessorStats stats = processor.getStats();
    EXPECT_EQ(stats.applied, 4u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.failed_attempts, 0u);

    // Rejected records still count as handled for the cursor
    EXPECT_EQ(*processor.getLastHandled(), 5);
    EXPECT_EQ(*store_.readLease(shard_)->checkpoint, 5);
}

TEST_F(RecordProcessorTest, UnrecognizedTextIsNotRetried) {
    int calls = 0;
    RecordProcessor processor(decoder_, [&calls](const Record&, const SampleEvent&) { calls++; }, policy_);
    processor.initialize(shard_, stop_);

    processor.process({makeRecord(1, "hello")}, checkpointer_);

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(processor.getStats().rejected, 1u);
}

TEST_F(RecordProcessorTest, TransientHandlerFailureAppliesOnce) {
    int attempts = 0;
    int applied = 0;
    RecordProcessor processor(decoder_, [&](const Record&, const SampleEvent&) {
        attempts++;
        if (attempts <= 2) {
            throw std::runtime_error("downstream unavailable");
        }
        applied++;
    }, policy_);
    processor.initialize(shard_, stop_);

    processor.process({sampleRecord(1)}, checkpointer_);

    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(applied, 1);
    ProcessorStats stats = processor.getStats();
    EXPECT_EQ(stats.applied, 1u);
    EXPECT_EQ(stats.failed_attempts, 2u);
    EXPECT_EQ(stats.skipped, 0u);
}

TEST_F(RecordProcessorTest, PoisonRecordIsSkippedAfterRetryBound) {
    std::vector<SequenceNumber> applied;
    int poison_attempts = 0;
    RecordProcessor processor(decoder_, [&](const Record& record, const SampleEvent&) {
        if (record.sequence_number == 2) {
            poison_attempts++;
            throw std::runtime_error("always fails");
        }
        applied.push_back(record.sequence_number);
    }, policy_);
    processor.initialize(shard_, stop_);

    processor.process({sampleRecord(1), sampleRecord(2), sampleRecord(3)}, checkpointer_);

    EXPECT_EQ(poison_attempts, 10);
    EXPECT_EQ(applied, (std::vector<SequenceNumber>{1, 3}));
    EXPECT_EQ(processor.getStats().skipped, 1u);
    EXPECT_EQ(*processor.getLastHandled(), 3);
}

TEST_F(RecordProcessorTest, FirstBatchCheckpointsThenWaitsForInterval) {
    policy_.checkpoint_interval = std::chrono::hours(1);
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);

    processor.process({sampleRecord(1), sampleRecord(2)}, checkpointer_);
    EXPECT_EQ(store_.checkpointsOf(shard_), (std::vector<SequenceNumber>{2}));

    processor.process({sampleRecord(3)}, checkpointer_);
    EXPECT_EQ(store_.checkpointCalls(), 1);
    EXPECT_EQ(*store_.readLease(shard_)->checkpoint, 2);
}

TEST_F(RecordProcessorTest, EmptyBatchDoesNotCheckpoint) {
    policy_.checkpoint_interval = std::chrono::hours(1);
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);

    processor.process({}, checkpointer_);

    EXPECT_EQ(store_.checkpointCalls(), 0);
}

TEST_F(RecordProcessorTest, CheckpointsOncePerElapsedInterval) {
    policy_.checkpoint_interval = std::chrono::milliseconds(50);
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);

    processor.process({sampleRecord(1)}, checkpointer_);
    processor.process({sampleRecord(2)}, checkpointer_);
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    processor.process({sampleRecord(3)}, checkpointer_);

    EXPECT_EQ(store_.checkpointsOf(shard_), (std::vector<SequenceNumber>{1, 3}));
    EXPECT_EQ(processor.getStats().checkpoints, 2u);
}

TEST_F(RecordProcessorTest, TerminateCheckpointsShardEnd) {
    policy_.checkpoint_interval = std::chrono::hours(1);
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);

    // Nothing was processed, shard end is still recorded
    processor.shutdown(ShutdownReason::TERMINATE, checkpointer_);

    auto lease = store_.readLease(shard_);
    ASSERT_TRUE(lease->checkpoint.has_value());
    EXPECT_EQ(*lease->checkpoint, SHARD_END_SEQUENCE);
    EXPECT_TRUE(lease->isFinished());
}

TEST_F(RecordProcessorTest, ZombieNeverCheckpoints) {
    policy_.checkpoint_interval = std::chrono::hours(1);
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);
    processor.process({sampleRecord(1)}, checkpointer_);
    processor.process({sampleRecord(2)}, checkpointer_);
    int calls_before = store_.checkpointCalls();

    processor.shutdown(ShutdownReason::ZOMBIE, checkpointer_);

    EXPECT_EQ(store_.checkpointCalls(), calls_before);
    EXPECT_EQ(*store_.readLease(shard_)->checkpoint, 1);
}

TEST_F(RecordProcessorTest, RequestedShutdownFlushesPendingProgress) {
    policy_.checkpoint_interval = std::chrono::hours(1);
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);
    processor.process({sampleRecord(1)}, checkpointer_);
    processor.process({sampleRecord(2)}, checkpointer_);

    processor.shutdown(ShutdownReason::REQUESTED, checkpointer_);

    EXPECT_EQ(store_.checkpointsOf(shard_), (std::vector<SequenceNumber>{1, 2}));
}

TEST_F(RecordProcessorTest, StopDuringRetryLeavesRecordUnhandled) {
    policy_.backoff = std::chrono::seconds(30);
    policy_.checkpoint_interval = std::chrono::hours(1);
    RecordProcessor processor(decoder_, [this](const Record& record, const SampleEvent&) {
        if (record.sequence_number == 2) {
            stop_.trigger();
            throw std::runtime_error("fails while stopping");
        }
    }, policy_);
    processor.initialize(shard_, stop_);

    auto started = std::chrono::steady_clock::now();
    processor.process({sampleRecord(1), sampleRecord(2), sampleRecord(3)}, checkpointer_);

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(*processor.getLastHandled(), 1);
    EXPECT_EQ(processor.getStats().applied, 1u);
    EXPECT_EQ(processor.getStats().skipped, 0u);
}

TEST_F(RecordProcessorTest, LeaseLossDuringCheckpointIsReported) {
    RecordProcessor processor(decoder_, [](const Record&, const SampleEvent&) {}, policy_);
    processor.initialize(shard_, stop_);
    store_.steal(shard_, "worker-b");

    processor.process({sampleRecord(1)}, checkpointer_);

    EXPECT_TRUE(checkpointer_.leaseLost());
    EXPECT_EQ(store_.checkpointCalls(), 1);
    EXPECT_EQ(processor.getStats().checkpoints, 0u);
}
