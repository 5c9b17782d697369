#ifndef CHECKPOINT_MANAGER_HPP
#define CHECKPOINT_MANAGER_HPP

#include "record_checkpointer.hpp"
#include "../common/shutdown_signal.hpp"
#include <chrono>

enum class CheckpointResult {
    COMMITTED,
    GAVE_UP,      // throttled on every attempt, or interrupted; the next interval retries
    LEASE_LOST,   // lease superseded, never retried
    FATAL         // store misconfigured, shard must stop
};

const char* checkpointResultName(CheckpointResult result);

// Persists a shard cursor with a fixed retry/backoff policy
class CheckpointManager {
public:
    CheckpointManager(int num_retries,
                      std::chrono::milliseconds backoff,
                      const ShutdownSignal& stop_signal);

    CheckpointResult checkpoint(RecordCheckpointer& checkpointer, SequenceNumber sequence);

private:
    int num_retries_;
    std::chrono::milliseconds backoff_;
    const ShutdownSignal& stop_signal_;
};

#endif // CHECKPOINT_MANAGER_HPP
