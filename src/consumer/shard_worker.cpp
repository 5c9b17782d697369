#include "shard_worker.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

const char* shardWorkerStateName(ShardWorkerState state) {
    switch (state) {
        case ShardWorkerState::ACQUIRING: return "ACQUIRING";
        case ShardWorkerState::PROCESSING: return "PROCESSING";
        case ShardWorkerState::DRAINING: return "DRAINING";
        case ShardWorkerState::LEASE_LOST: return "LEASE_LOST";
        case ShardWorkerState::SHUTDOWN: return "SHUTDOWN";
    }
    return "UNKNOWN";
}

const char* workerOutcomeName(WorkerOutcome outcome) {
    switch (outcome) {
        case WorkerOutcome::NONE: return "NONE";
        case WorkerOutcome::NOT_ACQUIRED: return "NOT_ACQUIRED";
        case WorkerOutcome::SHARD_COMPLETED: return "SHARD_COMPLETED";
        case WorkerOutcome::LEASE_LOST: return "LEASE_LOST";
        case WorkerOutcome::STOPPED: return "STOPPED";
        case WorkerOutcome::SHARD_FAILED: return "SHARD_FAILED";
        case WorkerOutcome::CRASHED: return "CRASHED";
    }
    return "UNKNOWN";
}

ShardWorker::ShardWorker(const std::string& shard_id,
                         const std::string& worker_id,
                         const ConsumerConfig& config,
                         StreamSource& source,
                         LeaseStore& lease_store,
                         RecordProcessorFactory processor_factory)
    : shard_id_(shard_id)
    , worker_id_(worker_id)
    , config_(config)
    , source_(source)
    , lease_store_(lease_store)
    , processor_factory_(std::move(processor_factory))
    , state_(ShardWorkerState::ACQUIRING)
    , outcome_(WorkerOutcome::NONE)
    , checkpointer_(lease_store, shard_id)
    , lease_counter_(0)
    , lease_deadline_ms_(0) {
}

ShardWorker::~ShardWorker() {
    signalStop();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void ShardWorker::start() {
    if (worker_thread_.joinable()) {
        return;
    }
    worker_thread_ = std::thread(&ShardWorker::run, this);
    std::cout << "Shard " << shard_id_ << ": Worker started" << std::endl;
}

void ShardWorker::signalStop() {
    stop_signal_.trigger();
}

bool ShardWorker::waitForStop(int timeout_seconds) {
    if (!worker_thread_.joinable()) {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);

    signalStop();

    // std::thread has no timed join
    while (!isFinished() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (!isFinished()) {
        std::cerr << "Shard " << shard_id_ << ": Timeout waiting for worker to stop" << std::endl;
        return false;
    }

    worker_thread_.join();
    return true;
}

std::optional<SequenceNumber> ShardWorker::getLastCheckpoint() const {
    return checkpointer_.getLastCheckpoint();
}

ProcessorStats ShardWorker::getStats() const {
    std::lock_guard<std::mutex> lock(processor_mutex_);
    if (!processor_) {
        return ProcessorStats{};
    }
    return processor_->getStats();
}

void ShardWorker::run() {
    try {
        if (!acquireLease()) {
            finish(WorkerOutcome::NOT_ACQUIRED);
        } else {
            processShard();
        }
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id_ << ": Unhandled exception in worker ("
                  << shardWorkerStateName(state_.load()) << "): " << e.what() << std::endl;
        finish(WorkerOutcome::CRASHED);
    }

    source_.releaseShard(shard_id_);
    std::cout << "Shard " << shard_id_ << ": Worker stopped ("
              << workerOutcomeName(outcome_.load()) << ")" << std::endl;
}

bool ShardWorker::acquireLease() {
    state_ = ShardWorkerState::ACQUIRING;

    std::optional<Lease> lease = lease_store_.readLease(shard_id_);
    if (!lease) {
        std::cerr << "Shard " << shard_id_ << ": No lease row, cannot acquire" << std::endl;
        return false;
    }

    if (lease->owner != worker_id_ && !lease->isExpired(currentTimeMillis())) {
        std::cout << "Shard " << shard_id_ << ": Lease held by " << lease->owner << std::endl;
        return false;
    }

    LeaseResult result = lease_store_.acquireOrRenew(
        shard_id_, worker_id_, lease->counter, config_.lease_ttl_ms);
    if (result.status != StoreStatus::OK) {
        std::cout << "Shard " << shard_id_ << ": Lease not acquired ("
                  << storeStatusName(result.status) << ")" << std::endl;
        return false;
    }

    lease_counter_ = result.counter;
    lease_deadline_ms_ = currentTimeMillis() + config_.lease_ttl_ms;
    checkpointer_.setLeaseCounter(lease_counter_);
    cursor_ = lease->checkpoint;

    std::cout << "Shard " << shard_id_ << ": Acquired lease (counter " << lease_counter_
              << ", checkpoint "
              << (cursor_ ? std::to_string(*cursor_) : initialPositionName(config_.initial_position))
              << ")" << std::endl;
    return true;
}

StoreStatus ShardWorker::renewLease() {
    LeaseResult result = lease_store_.acquireOrRenew(
        shard_id_, worker_id_, lease_counter_, config_.lease_ttl_ms);

    switch (result.status) {
        case StoreStatus::OK:
            lease_counter_ = result.counter;
            lease_deadline_ms_ = currentTimeMillis() + config_.lease_ttl_ms;
            checkpointer_.setLeaseCounter(lease_counter_);
            return StoreStatus::OK;

        case StoreStatus::CONFLICT:
            std::cout << "Shard " << shard_id_ << ": Lease superseded during heartbeat" << std::endl;
            return StoreStatus::CONFLICT;

        case StoreStatus::SCHEMA_ERROR:
            std::cerr << "Shard " << shard_id_ << ": Lease table unusable during heartbeat" << std::endl;
            return StoreStatus::SCHEMA_ERROR;

        case StoreStatus::THROTTLED:
            if (currentTimeMillis() >= lease_deadline_ms_) {
                std::cerr << "Shard " << shard_id_
                          << ": Lease expired while heartbeats were throttled" << std::endl;
                return StoreStatus::CONFLICT;
            }
            std::cerr << "Shard " << shard_id_ << ": Heartbeat throttled, keeping lease" << std::endl;
            return StoreStatus::OK;
    }
    return StoreStatus::CONFLICT;
}

void ShardWorker::processShard() {
    if (cursor_ && *cursor_ == SHARD_END_SEQUENCE) {
        std::cout << "Shard " << shard_id_ << ": Already checkpointed at shard end" << std::endl;
        releaseLease();
        finish(WorkerOutcome::SHARD_COMPLETED);
        return;
    }

    {
        auto processor = processor_factory_(shard_id_);
        if (!processor) {
            throw std::runtime_error("record processor factory returned null");
        }
        std::lock_guard<std::mutex> lock(processor_mutex_);
        processor_ = std::move(processor);
    }
    processor_->initialize(shard_id_, stop_signal_);
    state_ = ShardWorkerState::PROCESSING;

    const auto backoff = std::chrono::milliseconds(config_.backoff_ms);
    const auto idle = std::chrono::milliseconds(config_.idle_time_between_reads_ms);

    while (true) {
        if (stop_signal_.isTriggered()) {
            processor_->shutdown(ShutdownReason::REQUESTED, checkpointer_);
            if (!checkpointer_.leaseLost()) {
                releaseLease();
            }
            finish(WorkerOutcome::STOPPED);
            return;
        }

        StoreStatus heartbeat = renewLease();
        if (heartbeat == StoreStatus::SCHEMA_ERROR) {
            finishWithoutCheckpoint(WorkerOutcome::SHARD_FAILED);
            return;
        }
        if (heartbeat != StoreStatus::OK) {
            finishWithoutCheckpoint(WorkerOutcome::LEASE_LOST);
            return;
        }

        RecordBatch batch = source_.getRecords(
            shard_id_, cursor_, config_.initial_position, config_.max_records);

        if (batch.status == SourceStatus::THROTTLED || batch.status == SourceStatus::TRANSIENT) {
            std::cerr << "Shard " << shard_id_ << ": getRecords " << sourceStatusName(batch.status)
                      << ": " << batch.error << std::endl;
            stop_signal_.waitFor(backoff);
            continue;
        }
        if (batch.status == SourceStatus::NOT_FOUND) {
            std::cerr << "Shard " << shard_id_ << ": Shard no longer exists: " << batch.error << std::endl;
            finishWithoutCheckpoint(WorkerOutcome::SHARD_FAILED);
            return;
        }

        if (!batch.records.empty()) {
            processor_->process(batch.records, checkpointer_);
            if (processor_->getLastHandled()) {
                cursor_ = processor_->getLastHandled();
            }

            if (checkpointer_.leaseLost()) {
                finishWithoutCheckpoint(WorkerOutcome::LEASE_LOST);
                return;
            }
            if (checkpointer_.failed()) {
                finishWithoutCheckpoint(WorkerOutcome::SHARD_FAILED);
                return;
            }
        }

        if (batch.shard_exhausted && !stop_signal_.isTriggered()) {
            drainShard();
            return;
        }

        if (batch.records.empty()) {
            stop_signal_.waitFor(idle);
        }
    }
}

void ShardWorker::drainShard() {
    state_ = ShardWorkerState::DRAINING;
    std::cout << "Shard " << shard_id_ << ": Reached end of shard" << std::endl;

    processor_->shutdown(ShutdownReason::TERMINATE, checkpointer_);

    std::optional<SequenceNumber> last = checkpointer_.getLastCheckpoint();
    if (last && *last == SHARD_END_SEQUENCE) {
        releaseLease();
        finish(WorkerOutcome::SHARD_COMPLETED);
        return;
    }

    if (checkpointer_.leaseLost()) {
        finish(WorkerOutcome::LEASE_LOST);
        return;
    }

    // Shard end not recorded; hand the lease back so the shard is drained again
    std::cerr << "Shard " << shard_id_ << ": Shard end checkpoint was not saved" << std::endl;
    if (!checkpointer_.failed()) {
        releaseLease();
    }
    finish(WorkerOutcome::SHARD_FAILED);
}

void ShardWorker::finishWithoutCheckpoint(WorkerOutcome outcome) {
    if (outcome == WorkerOutcome::LEASE_LOST) {
        state_ = ShardWorkerState::LEASE_LOST;
    }
    processor_->shutdown(ShutdownReason::ZOMBIE, checkpointer_);
    finish(outcome);
}

void ShardWorker::releaseLease() {
    StoreStatus status = lease_store_.releaseLease(shard_id_, worker_id_, lease_counter_);
    if (status != StoreStatus::OK) {
        std::cerr << "Shard " << shard_id_ << ": Failed to release lease ("
                  << storeStatusName(status) << ")" << std::endl;
    }
}

void ShardWorker::finish(WorkerOutcome outcome) {
    outcome_ = outcome;
    state_ = ShardWorkerState::SHUTDOWN;
}
