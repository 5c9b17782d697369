#ifndef SHARD_COORDINATOR_HPP
#define SHARD_COORDINATOR_HPP

#include "../config.hpp"
#include "../common/stream_source.hpp"
#include "../common/lease_store.hpp"
#include "../common/shutdown_signal.hpp"
#include "shard_worker.hpp"
#include "record_processor.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct ShardStatus {
    std::string shard_id;
    ShardWorkerState state = ShardWorkerState::ACQUIRING;
    std::optional<SequenceNumber> last_checkpoint;
    ProcessorStats stats;
};

struct CoordinatorSnapshot {
    std::string worker_id;
    std::vector<ShardStatus> active;
    std::vector<std::string> completed;
    uint64_t crashed_workers = 0;
};

// Discovers shards, creates lease rows and spawns one ShardWorker per
// shard this process can take. Child shards wait until every parent
// lease is checkpointed at shard end.
class ShardCoordinator {
public:
    ShardCoordinator(const ConsumerConfig& config,
                     const std::string& worker_id,
                     StreamSource& source,
                     LeaseStore& lease_store,
                     RecordProcessorFactory processor_factory);
    ~ShardCoordinator();

    // Run the shard sync loop in the current thread until stop()
    void start();

    // Stop the sync loop and all workers gracefully
    void stop();

    // One discovery and acquisition pass
    void syncShards();

    bool isRunning() const { return running_; }

    // True if any worker ended on an unhandled exception
    bool hadUnhandledFailure() const { return crashed_workers_.load() > 0; }

    std::vector<std::string> getActiveShards() const;
    std::set<std::string> getCompletedShards() const;
    CoordinatorSnapshot snapshot() const;

    const std::string& getWorkerId() const { return worker_id_; }

private:
    ConsumerConfig config_;
    std::string worker_id_;
    StreamSource& source_;
    LeaseStore& lease_store_;
    RecordProcessorFactory processor_factory_;

    // Active workers by shard
    std::map<std::string, std::unique_ptr<ShardWorker>> workers_;
    mutable std::mutex workers_mutex_;

    std::set<std::string> completed_shards_;
    std::atomic<uint64_t> crashed_workers_;

    std::atomic<bool> running_;
    ShutdownSignal stop_signal_;

    // Join workers that reached SHUTDOWN and record their outcome
    void reapFinishedWorkers();

    void createWorker(const std::string& shard_id);

    static bool parentsFinished(const std::vector<std::string>& parent_ids,
                                const std::map<std::string, Lease>& leases,
                                const std::set<std::string>& listed_shards);
};

#endif // SHARD_COORDINATOR_HPP
