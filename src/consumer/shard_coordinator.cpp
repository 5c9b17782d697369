#include "shard_coordinator.hpp"
#include <iostream>
#include <algorithm>

ShardCoordinator::ShardCoordinator(const ConsumerConfig& config,
                                   const std::string& worker_id,
                                   StreamSource& source,
                                   LeaseStore& lease_store,
                                   RecordProcessorFactory processor_factory)
    : config_(config)
    , worker_id_(worker_id)
    , source_(source)
    , lease_store_(lease_store)
    , processor_factory_(std::move(processor_factory))
    , crashed_workers_(0)
    , running_(false) {
}

ShardCoordinator::~ShardCoordinator() {
    stop();
}

void ShardCoordinator::start() {
    if (running_) {
        std::cerr << "Coordinator is already running" << std::endl;
        return;
    }

    running_ = true;

    std::cout << "Starting shard coordinator for stream " << config_.stream_name
              << " as worker " << worker_id_ << std::endl;
    std::cout << "Lease TTL: " << config_.lease_ttl_ms << "ms, shard sync every "
              << config_.shard_sync_interval_ms << "ms, checkpoint every "
              << config_.checkpoint_interval_ms << "ms" << std::endl;

    const auto interval = std::chrono::milliseconds(config_.shard_sync_interval_ms);
    while (!stop_signal_.isTriggered()) {
        try {
            syncShards();
        } catch (const std::exception& e) {
            std::cerr << "Shard sync failed: " << e.what() << std::endl;
        }
        stop_signal_.waitFor(interval);
    }

    running_ = false;
    std::cout << "Shard coordinator loop exited" << std::endl;
}

void ShardCoordinator::stop() {
    stop_signal_.trigger();

    std::map<std::string, std::unique_ptr<ShardWorker>> to_stop;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (workers_.empty()) {
            return;
        }
        to_stop = std::move(workers_);
        workers_.clear();
    }

    std::cout << "Stopping " << to_stop.size() << " shard worker(s)..." << std::endl;

    for (auto& kv : to_stop) {
        kv.second->signalStop();
    }

    for (auto& kv : to_stop) {
        if (!kv.second->waitForStop(config_.worker_stop_timeout_seconds)) {
            std::cerr << "Shard " << kv.first << ": Worker did not stop cleanly" << std::endl;
        }
        if (kv.second->getOutcome() == WorkerOutcome::CRASHED) {
            crashed_workers_++;
        }
    }

    std::cout << "Shard coordinator stopped" << std::endl;
}

void ShardCoordinator::syncShards() {
    reapFinishedWorkers();

    if (stop_signal_.isTriggered()) {
        return;
    }

    ShardListing listing = source_.listShards(config_.stream_name);
    if (listing.status != SourceStatus::OK) {
        std::cerr << "Failed to list shards of " << config_.stream_name << " ("
                  << sourceStatusName(listing.status) << "): " << listing.error << std::endl;
        return;
    }

    std::set<std::string> listed;
    for (const auto& shard : listing.shards) {
        listed.insert(shard.shard_id);
        if (!lease_store_.createLeaseIfAbsent(shard.shard_id, shard.parent_ids)) {
            std::cerr << "Shard " << shard.shard_id << ": Failed to create lease row" << std::endl;
        }
    }

    std::map<std::string, Lease> leases;
    for (auto& lease : lease_store_.listLeases()) {
        leases.emplace(lease.shard_id, std::move(lease));
    }

    const int64_t now = currentTimeMillis();
    std::vector<std::string> to_create;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& shard : listing.shards) {
            if (workers_.count(shard.shard_id) > 0) {
                continue;  // at most one live worker per shard
            }

            auto it = leases.find(shard.shard_id);
            if (it == leases.end()) {
                continue;
            }
            const Lease& lease = it->second;

            if (lease.isFinished()) {
                continue;
            }

            std::vector<std::string> parents = shard.parent_ids;
            for (const auto& p : lease.parent_ids) {
                if (std::find(parents.begin(), parents.end(), p) == parents.end()) {
                    parents.push_back(p);
                }
            }
            if (!parentsFinished(parents, leases, listed)) {
                continue;
            }

            // Held by a live owner, possibly ourselves after a failure;
            // wait for the lease to expire
            if (!lease.isExpired(now)) {
                continue;
            }

            to_create.push_back(shard.shard_id);
        }
    }

    for (const auto& shard_id : to_create) {
        createWorker(shard_id);
    }
}

bool ShardCoordinator::parentsFinished(const std::vector<std::string>& parent_ids,
                                       const std::map<std::string, Lease>& leases,
                                       const std::set<std::string>& listed_shards) {
    for (const auto& parent : parent_ids) {
        auto it = leases.find(parent);
        if (it != leases.end()) {
            if (!it->second.isFinished()) {
                return false;
            }
        } else if (listed_shards.count(parent) > 0) {
            // Parent exists but has no lease row yet
            return false;
        }
        // Unlisted parent with no row has been trimmed from the stream
    }
    return true;
}

void ShardCoordinator::createWorker(const std::string& shard_id) {
    std::lock_guard<std::mutex> lock(workers_mutex_);

    if (stop_signal_.isTriggered()) {
        return;
    }
    if (workers_.find(shard_id) != workers_.end()) {
        return;
    }

    auto worker = std::make_unique<ShardWorker>(
        shard_id, worker_id_, config_, source_, lease_store_, processor_factory_);
    worker->start();
    workers_[shard_id] = std::move(worker);
}

void ShardCoordinator::reapFinishedWorkers() {
    std::vector<std::unique_ptr<ShardWorker>> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->second->isFinished()) {
                finished.push_back(std::move(it->second));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& worker : finished) {
        worker->waitForStop(config_.worker_stop_timeout_seconds);

        WorkerOutcome outcome = worker->getOutcome();
        if (outcome == WorkerOutcome::CRASHED) {
            crashed_workers_++;
        }
        if (outcome == WorkerOutcome::SHARD_COMPLETED) {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            completed_shards_.insert(worker->getShardId());
        }
        if (outcome != WorkerOutcome::NOT_ACQUIRED) {
            std::cout << "Shard " << worker->getShardId() << ": Removed worker ("
                      << workerOutcomeName(outcome) << ")" << std::endl;
        }
    }
}

std::vector<std::string> ShardCoordinator::getActiveShards() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    std::vector<std::string> shards;
    for (const auto& kv : workers_) {
        if (!kv.second->isFinished()) {
            shards.push_back(kv.first);
        }
    }
    return shards;
}

std::set<std::string> ShardCoordinator::getCompletedShards() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return completed_shards_;
}

CoordinatorSnapshot ShardCoordinator::snapshot() const {
    CoordinatorSnapshot snap;
    snap.worker_id = worker_id_;
    snap.crashed_workers = crashed_workers_.load();

    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const auto& kv : workers_) {
        ShardStatus status;
        status.shard_id = kv.first;
        status.state = kv.second->getState();
        status.last_checkpoint = kv.second->getLastCheckpoint();
        status.stats = kv.second->getStats();
        snap.active.push_back(std::move(status));
    }
    snap.completed.assign(completed_shards_.begin(), completed_shards_.end());
    return snap;
}
