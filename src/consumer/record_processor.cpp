#include "record_processor.hpp"
#include <iostream>
#include <stdexcept>

const char* shutdownReasonName(ShutdownReason reason) {
    switch (reason) {
        case ShutdownReason::TERMINATE: return "TERMINATE";
        case ShutdownReason::ZOMBIE: return "ZOMBIE";
        case ShutdownReason::REQUESTED: return "REQUESTED";
    }
    return "UNKNOWN";
}

void logRecordAge(const Record& record, const SampleEvent& event) {
    int64_t age_ms = currentTimeMillis() - event.created_at_ms;
    std::cout << record.sequence_number << ", " << record.partition_key << ", " << event.text
              << ", Created " << age_ms << " milliseconds ago." << std::endl;
}

ProcessorPolicy ProcessorPolicy::fromConfig(const ConsumerConfig& config) {
    ProcessorPolicy policy;
    policy.num_retries = config.num_retries;
    policy.backoff = std::chrono::milliseconds(config.backoff_ms);
    policy.checkpoint_interval = std::chrono::milliseconds(config.checkpoint_interval_ms);
    return policy;
}

RecordProcessor::RecordProcessor(const RecordDecoder& decoder, RecordHandler handler, ProcessorPolicy policy)
    : decoder_(decoder)
    , handler_(std::move(handler))
    , policy_(policy)
    , stop_signal_(nullptr)
    , uncheckpointed_(false)
    , applied_(0)
    , rejected_(0)
    , skipped_(0)
    , failed_attempts_(0)
    , checkpoints_(0) {
}

void RecordProcessor::initialize(const std::string& shard_id, const ShutdownSignal& stop_signal) {
    std::cout << "Shard " << shard_id << ": Initializing record processor" << std::endl;
    shard_id_ = shard_id;
    stop_signal_ = &stop_signal;
    checkpoint_manager_ = std::make_unique<CheckpointManager>(
        policy_.num_retries, policy_.backoff, stop_signal);
    last_checkpoint_time_.reset();
}

void RecordProcessor::process(const std::vector<Record>& records, RecordCheckpointer& checkpointer) {
    if (!checkpoint_manager_) {
        throw std::logic_error("RecordProcessor::process called before initialize");
    }

    std::cout << "Shard " << shard_id_ << ": Processing " << records.size() << " records" << std::endl;

    for (const auto& record : records) {
        if (stop_signal_->isTriggered()) {
            break;
        }
        if (!processWithRetries(record)) {
            // Interrupted mid-retry: leave this record unhandled so it is redelivered
            break;
        }
        last_handled_ = record.sequence_number;
        uncheckpointed_ = true;
    }

    // The first batch with handled records is checkpointed right away
    auto now = std::chrono::steady_clock::now();
    if (uncheckpointed_ &&
        (!last_checkpoint_time_ || now - *last_checkpoint_time_ >= policy_.checkpoint_interval)) {
        checkpoint(checkpointer, *last_handled_);
        // The next attempt waits a full interval whatever this one returned
        last_checkpoint_time_ = std::chrono::steady_clock::now();
    }
}

bool RecordProcessor::processWithRetries(const Record& record) {
    DecodeResult decoded = decoder_.decode(record);
    if (!decoded.ok()) {
        // Retrying cannot fix a payload, skip it
        if (decoded.status == DecodeStatus::MALFORMED) {
            std::cerr << "Shard " << shard_id_ << ": Malformed data in record "
                      << record.sequence_number << ": " << decoded.error << std::endl;
        } else {
            std::cout << "Shard " << shard_id_ << ": Ignoring record "
                      << record.sequence_number << ": " << decoded.error << std::endl;
        }
        rejected_++;
        return true;
    }

    for (int attempt = 0; attempt < policy_.num_retries; ++attempt) {
        try {
            handler_(record, decoded.event);
            applied_++;
            return true;
        } catch (const std::exception& e) {
            failed_attempts_++;
            std::cerr << "Shard " << shard_id_ << ": Caught exception while processing record "
                      << record.sequence_number << " (attempt " << (attempt + 1) << " of "
                      << policy_.num_retries << "): " << e.what() << std::endl;
        }

        if (attempt < policy_.num_retries - 1 && stop_signal_->waitFor(policy_.backoff)) {
            return false;
        }
    }

    std::cerr << "Shard " << shard_id_ << ": Couldn't process record " << record.sequence_number
              << " (partition key " << record.partition_key << "). Skipping the record." << std::endl;
    skipped_++;
    return true;
}

void RecordProcessor::checkpoint(RecordCheckpointer& checkpointer, SequenceNumber sequence) {
    CheckpointResult result = checkpoint_manager_->checkpoint(checkpointer, sequence);
    if (result == CheckpointResult::COMMITTED) {
        checkpoints_++;
        uncheckpointed_ = false;
    } else {
        std::cerr << "Shard " << shard_id_ << ": Checkpoint not committed ("
                  << checkpointResultName(result) << ")" << std::endl;
    }
}

void RecordProcessor::shutdown(ShutdownReason reason, RecordCheckpointer& checkpointer) {
    std::cout << "Shard " << shard_id_ << ": Shutting down record processor ("
              << shutdownReasonName(reason) << ")" << std::endl;

    if (!checkpoint_manager_) {
        return;
    }

    switch (reason) {
        case ShutdownReason::TERMINATE:
            // Checkpoint at shard end so the child shards can be picked up
            checkpoint(checkpointer, SHARD_END_SEQUENCE);
            break;
        case ShutdownReason::ZOMBIE:
            // Another worker may own the lease, writing would race with it
            break;
        case ShutdownReason::REQUESTED:
            if (uncheckpointed_ && last_handled_) {
                checkpoint(checkpointer, *last_handled_);
            }
            break;
    }
}

ProcessorStats RecordProcessor::getStats() const {
    ProcessorStats stats;
    stats.applied = applied_.load();
    stats.rejected = rejected_.load();
    stats.skipped = skipped_.load();
    stats.failed_attempts = failed_attempts_.load();
    stats.checkpoints = checkpoints_.load();
    return stats;
}
