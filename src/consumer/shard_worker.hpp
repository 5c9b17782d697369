#ifndef SHARD_WORKER_HPP
#define SHARD_WORKER_HPP

#include "../config.hpp"
#include "../common/stream_source.hpp"
#include "../common/lease_store.hpp"
#include "../common/shutdown_signal.hpp"
#include "record_processor.hpp"
#include "record_checkpointer.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class ShardWorkerState {
    ACQUIRING,
    PROCESSING,
    DRAINING,
    LEASE_LOST,
    SHUTDOWN
};

// How a worker reached SHUTDOWN
enum class WorkerOutcome {
    NONE,             // still running
    NOT_ACQUIRED,     // lease held elsewhere
    SHARD_COMPLETED,  // drained and checkpointed at shard end
    LEASE_LOST,       // lease superseded while processing
    STOPPED,          // shutdown requested
    SHARD_FAILED,     // store or source reported a permanent error
    CRASHED           // unexpected exception in the worker loop
};

const char* shardWorkerStateName(ShardWorkerState state);
const char* workerOutcomeName(WorkerOutcome outcome);

// Owns one shard for its lifetime: takes the lease, pulls batches,
// drives a RecordProcessor and reacts to shard end or lease loss.
// Runs on its own thread; all store writes for the shard happen here.
class ShardWorker {
public:
    ShardWorker(const std::string& shard_id,
                const std::string& worker_id,
                const ConsumerConfig& config,
                StreamSource& source,
                LeaseStore& lease_store,
                RecordProcessorFactory processor_factory);
    ~ShardWorker();

    // Start the worker thread
    void start();

    // Run the state machine to SHUTDOWN on the calling thread
    void run();

    // Signal worker to stop (graceful)
    void signalStop();

    // Wait for worker to stop (with timeout)
    // Returns true if stopped cleanly, false if timeout
    bool waitForStop(int timeout_seconds);

    const std::string& getShardId() const { return shard_id_; }
    ShardWorkerState getState() const { return state_.load(); }
    WorkerOutcome getOutcome() const { return outcome_.load(); }
    bool isFinished() const { return state_.load() == ShardWorkerState::SHUTDOWN; }
    std::optional<SequenceNumber> getLastCheckpoint() const;
    ProcessorStats getStats() const;

private:
    std::string shard_id_;
    std::string worker_id_;
    const ConsumerConfig& config_;
    StreamSource& source_;
    LeaseStore& lease_store_;
    RecordProcessorFactory processor_factory_;

    ShutdownSignal stop_signal_;
    std::thread worker_thread_;
    std::atomic<ShardWorkerState> state_;
    std::atomic<WorkerOutcome> outcome_;

    RecordCheckpointer checkpointer_;
    std::unique_ptr<RecordProcessor> processor_;
    mutable std::mutex processor_mutex_;  // guards processor_ pointer for stats readers

    int64_t lease_counter_;
    int64_t lease_deadline_ms_;  // local view of when our lease runs out
    std::optional<SequenceNumber> cursor_;

    // ACQUIRING: returns false if another worker holds the lease
    bool acquireLease();

    // PROCESSING loop until a terminal condition
    void processShard();

    // Heartbeat. OK keeps the lease (a throttled heartbeat inside the TTL counts),
    // CONFLICT means it is gone, SCHEMA_ERROR means the table is unusable
    StoreStatus renewLease();

    // DRAINING: final shard-end checkpoint and release
    void drainShard();

    void finishWithoutCheckpoint(WorkerOutcome outcome);
    void releaseLease();
    void finish(WorkerOutcome outcome);
};

#endif // SHARD_WORKER_HPP
