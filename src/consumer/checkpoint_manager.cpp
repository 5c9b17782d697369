#include "checkpoint_manager.hpp"
#include <iostream>

const char* checkpointResultName(CheckpointResult result) {
    switch (result) {
        case CheckpointResult::COMMITTED: return "COMMITTED";
        case CheckpointResult::GAVE_UP: return "GAVE_UP";
        case CheckpointResult::LEASE_LOST: return "LEASE_LOST";
        case CheckpointResult::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

CheckpointManager::CheckpointManager(int num_retries,
                                     std::chrono::milliseconds backoff,
                                     const ShutdownSignal& stop_signal)
    : num_retries_(num_retries)
    , backoff_(backoff)
    , stop_signal_(stop_signal) {
}

CheckpointResult CheckpointManager::checkpoint(RecordCheckpointer& checkpointer, SequenceNumber sequence) {
    const std::string& shard_id = checkpointer.getShardId();
    std::cout << "Shard " << shard_id << ": Checkpointing at "
              << (sequence == SHARD_END_SEQUENCE ? std::string("SHARD_END") : std::to_string(sequence))
              << std::endl;

    for (int attempt = 0; attempt < num_retries_; ++attempt) {
        StoreStatus status = checkpointer.write(sequence);

        switch (status) {
            case StoreStatus::OK:
                return CheckpointResult::COMMITTED;

            case StoreStatus::CONFLICT:
                // Another worker owns the lease now (fail over)
                std::cout << "Shard " << shard_id
                          << ": Lease superseded, skipping checkpoint" << std::endl;
                return CheckpointResult::LEASE_LOST;

            case StoreStatus::SCHEMA_ERROR:
                std::cerr << "Shard " << shard_id
                          << ": Cannot save checkpoint to the lease table (check that the table exists)"
                          << std::endl;
                return CheckpointResult::FATAL;

            case StoreStatus::THROTTLED:
                break;
        }

        if (attempt >= num_retries_ - 1) {
            std::cerr << "Shard " << shard_id << ": Checkpoint failed after "
                      << (attempt + 1) << " attempts" << std::endl;
            break;
        }

        std::cout << "Shard " << shard_id << ": Transient issue when checkpointing - attempt "
                  << (attempt + 1) << " of " << num_retries_ << std::endl;

        if (stop_signal_.waitFor(backoff_)) {
            std::cout << "Shard " << shard_id
                      << ": Shutdown requested, abandoning checkpoint retries" << std::endl;
            break;
        }
    }

    return CheckpointResult::GAVE_UP;
}
