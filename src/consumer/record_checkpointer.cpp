#include "record_checkpointer.hpp"

RecordCheckpointer::RecordCheckpointer(LeaseStore& store, const std::string& shard_id)
    : store_(store)
    , shard_id_(shard_id)
    , lease_counter_(0)
    , lease_lost_(false)
    , failed_(false) {
}

StoreStatus RecordCheckpointer::write(SequenceNumber sequence) {
    // A superseded lease must never be written again
    if (lease_lost_) {
        return StoreStatus::CONFLICT;
    }
    if (failed_) {
        return StoreStatus::SCHEMA_ERROR;
    }

    StoreStatus status = store_.writeCheckpoint(shard_id_, lease_counter_, sequence);
    switch (status) {
        case StoreStatus::OK: {
            std::lock_guard<std::mutex> lock(checkpoint_mutex_);
            if (!last_checkpoint_ || sequence > *last_checkpoint_) {
                last_checkpoint_ = sequence;
            }
            break;
        }
        case StoreStatus::CONFLICT:
            lease_lost_ = true;
            break;
        case StoreStatus::SCHEMA_ERROR:
            failed_ = true;
            break;
        case StoreStatus::THROTTLED:
            break;
    }
    return status;
}

std::optional<SequenceNumber> RecordCheckpointer::getLastCheckpoint() const {
    std::lock_guard<std::mutex> lock(checkpoint_mutex_);
    return last_checkpoint_;
}
