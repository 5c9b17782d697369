#ifndef RECORD_CHECKPOINTER_HPP
#define RECORD_CHECKPOINTER_HPP

#include "../common/lease_store.hpp"
#include <string>
#include <mutex>
#include <optional>

// Write handle for one shard's checkpoint, bound to the lease counter the
// owning worker currently holds. Remembers whether a write revealed that the
// lease was lost or the store is unusable, so the worker can react after
// the processor returns.
class RecordCheckpointer {
public:
    RecordCheckpointer(LeaseStore& store, const std::string& shard_id);

    // Called by the shard worker after each successful acquire or renew
    void setLeaseCounter(int64_t counter) { lease_counter_ = counter; }
    int64_t getLeaseCounter() const { return lease_counter_; }

    // Single store write, no retries
    StoreStatus write(SequenceNumber sequence);

    bool leaseLost() const { return lease_lost_; }
    bool failed() const { return failed_; }

    const std::string& getShardId() const { return shard_id_; }
    std::optional<SequenceNumber> getLastCheckpoint() const;

private:
    LeaseStore& store_;
    std::string shard_id_;
    int64_t lease_counter_;
    bool lease_lost_;
    bool failed_;
    std::optional<SequenceNumber> last_checkpoint_;
    mutable std::mutex checkpoint_mutex_;  // last_checkpoint_ is read by stats callers
};

#endif // RECORD_CHECKPOINTER_HPP
