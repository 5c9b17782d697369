#include <gtest/gtest.h>
#include "../src/consumer/duckdb_lease_store.hpp"
#include "../src/common/shutdown_signal.hpp"
#include <atomic>
#include <thread>
#include <vector>

class DuckDbLeaseStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<DuckDbLeaseStore>(":memory:", "SampleStreamApplication");
        ASSERT_TRUE(store_->initialize());
    }

    std::unique_ptr<DuckDbLeaseStore> store_;
    std::string shard_ = "shardId-000000000000";
};

TEST_F(DuckDbLeaseStoreTest, CreateLeaseIsIdempotent) {
    EXPECT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    ASSERT_EQ(store_->acquireOrRenew(shard_, "worker-a", 0, 60000).status, StoreStatus::OK);

    // A second create must not reset the owned row
    EXPECT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    auto lease = store_->readLease(shard_);
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->owner, "worker-a");
    EXPECT_EQ(lease->counter, 1);
    EXPECT_EQ(store_->listLeases().size(), 1u);
}

TEST_F(DuckDbLeaseStoreTest, NewLeaseIsUnassigned) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {"parent-a", "parent-b"}));

    auto lease = store_->readLease(shard_);
    ASSERT_TRUE(lease.has_value());
    EXPECT_TRUE(lease->owner.empty());
    EXPECT_FALSE(lease->checkpoint.has_value());
    EXPECT_EQ(lease->counter, 0);
    EXPECT_EQ(lease->parent_ids, (std::vector<std::string>{"parent-a", "parent-b"}));
    EXPECT_TRUE(lease->isExpired(currentTimeMillis()));
    EXPECT_FALSE(store_->readLease("missing").has_value());
}

TEST_F(DuckDbLeaseStoreTest, AcquireBumpsCounterAndRenewKeepsOwnership) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));

    LeaseResult first = store_->acquireOrRenew(shard_, "worker-a", 0, 60000);
    ASSERT_EQ(first.status, StoreStatus::OK);
    EXPECT_EQ(first.counter, 1);

    LeaseResult renew = store_->acquireOrRenew(shard_, "worker-a", 1, 60000);
    ASSERT_EQ(renew.status, StoreStatus::OK);
    EXPECT_EQ(renew.counter, 2);

    // Stale counter is rejected
    EXPECT_EQ(store_->acquireOrRenew(shard_, "worker-a", 1, 60000).status, StoreStatus::CONFLICT);
}

TEST_F(DuckDbLeaseStoreTest, LiveLeaseCannotBeTaken) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    ASSERT_EQ(store_->acquireOrRenew(shard_, "worker-a", 0, 60000).status, StoreStatus::OK);

    EXPECT_EQ(store_->acquireOrRenew(shard_, "worker-b", 1, 60000).status, StoreStatus::CONFLICT);
    EXPECT_EQ(store_->readLease(shard_)->owner, "worker-a");
}

TEST_F(DuckDbLeaseStoreTest, ExpiredLeaseCanBeTaken) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    ASSERT_EQ(store_->acquireOrRenew(shard_, "worker-a", 0, 0).status, StoreStatus::OK);

    LeaseResult taken = store_->acquireOrRenew(shard_, "worker-b", 1, 60000);
    ASSERT_EQ(taken.status, StoreStatus::OK);
    EXPECT_EQ(store_->readLease(shard_)->owner, "worker-b");

    // The previous owner's checkpoint is fenced off
    EXPECT_EQ(store_->writeCheckpoint(shard_, 1, 10), StoreStatus::CONFLICT);
    EXPECT_EQ(store_->writeCheckpoint(shard_, taken.counter, 10), StoreStatus::OK);
}

TEST_F(DuckDbLeaseStoreTest, ConcurrentAcquireHasOneWinner) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));

    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            LeaseResult result = store_->acquireOrRenew(shard_, "worker-" + std::to_string(i), 0, 60000);
            if (result.status == StoreStatus::OK) {
                winners++;
            } else if (result.status == StoreStatus::CONFLICT) {
                conflicts++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), 7);
    EXPECT_EQ(store_->readLease(shard_)->counter, 1);
}

TEST_F(DuckDbLeaseStoreTest, CheckpointNeverRegresses) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    LeaseResult lease = store_->acquireOrRenew(shard_, "worker-a", 0, 60000);
    ASSERT_EQ(lease.status, StoreStatus::OK);

    EXPECT_EQ(store_->writeCheckpoint(shard_, lease.counter, 100), StoreStatus::OK);
    EXPECT_EQ(store_->writeCheckpoint(shard_, lease.counter, 50), StoreStatus::OK);
    EXPECT_EQ(*store_->readLease(shard_)->checkpoint, 100);

    EXPECT_EQ(store_->writeCheckpoint(shard_, lease.counter, SHARD_END_SEQUENCE), StoreStatus::OK);
    EXPECT_TRUE(store_->readLease(shard_)->isFinished());
}

TEST_F(DuckDbLeaseStoreTest, ReleaseClearsOwnerAndFencesWriter) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    LeaseResult lease = store_->acquireOrRenew(shard_, "worker-a", 0, 60000);
    ASSERT_EQ(lease.status, StoreStatus::OK);

    EXPECT_EQ(store_->releaseLease(shard_, "worker-b", lease.counter), StoreStatus::CONFLICT);
    EXPECT_EQ(store_->releaseLease(shard_, "worker-a", lease.counter), StoreStatus::OK);

    auto released = store_->readLease(shard_);
    EXPECT_TRUE(released->owner.empty());
    EXPECT_EQ(released->counter, lease.counter + 1);
    EXPECT_EQ(store_->writeCheckpoint(shard_, lease.counter, 5), StoreStatus::CONFLICT);

    // Anyone can pick it up right away
    EXPECT_EQ(store_->acquireOrRenew(shard_, "worker-b", released->counter, 60000).status, StoreStatus::OK);
}

TEST_F(DuckDbLeaseStoreTest, MissingTableIsSchemaError) {
    ASSERT_TRUE(store_->createLeaseIfAbsent(shard_, {}));
    LeaseResult lease = store_->acquireOrRenew(shard_, "worker-a", 0, 60000);
    ASSERT_EQ(lease.status, StoreStatus::OK);

    ASSERT_TRUE(store_->destroy());

    EXPECT_EQ(store_->writeCheckpoint(shard_, lease.counter, 5), StoreStatus::SCHEMA_ERROR);
    EXPECT_EQ(store_->acquireOrRenew(shard_, "worker-a", lease.counter, 60000).status,
              StoreStatus::SCHEMA_ERROR);
    EXPECT_TRUE(store_->listLeases().empty());
}

TEST_F(DuckDbLeaseStoreTest, TableNameIsQuoted) {
    DuckDbLeaseStore odd(":memory:", "my-app \"v2\"");
    ASSERT_TRUE(odd.initialize());
    EXPECT_TRUE(odd.createLeaseIfAbsent("shard'1", {}));
    EXPECT_TRUE(odd.readLease("shard'1").has_value());
}

TEST(DuckDbLeaseStoreHelpersTest, EscapeSqlString) {
    EXPECT_EQ(DuckDbLeaseStore::escapeSqlString("plain"), "plain");
    EXPECT_EQ(DuckDbLeaseStore::escapeSqlString("it's"), "it''s");
    EXPECT_EQ(DuckDbLeaseStore::escapeSqlString(""), "");
}

TEST(DuckDbLeaseStoreHelpersTest, ClassifyError) {
    EXPECT_EQ(DuckDbLeaseStore::classifyError("Catalog Error: Table with name x does not exist!"),
              StoreStatus::SCHEMA_ERROR);
    EXPECT_EQ(DuckDbLeaseStore::classifyError("Binder Error: column y not found"),
              StoreStatus::SCHEMA_ERROR);
    EXPECT_EQ(DuckDbLeaseStore::classifyError("TransactionContext Error: Conflict on update"),
              StoreStatus::THROTTLED);
}

TEST(DuckDbLeaseStoreHelpersTest, ParentIdsRoundTripThroughColumn) {
    std::vector<std::string> ids = {"shardId-000000000001", "shardId-000000000002"};
    EXPECT_EQ(DuckDbLeaseStore::splitIds(DuckDbLeaseStore::joinIds(ids)), ids);
    EXPECT_TRUE(DuckDbLeaseStore::splitIds("").empty());
}
