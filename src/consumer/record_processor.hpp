#ifndef RECORD_PROCESSOR_HPP
#define RECORD_PROCESSOR_HPP

#include "../config.hpp"
#include "../common/stream_types.hpp"
#include "../common/shutdown_signal.hpp"
#include "record_decoder.hpp"
#include "record_checkpointer.hpp"
#include "checkpoint_manager.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class ShutdownReason {
    TERMINATE,  // shard exhausted, no more records will arrive
    ZOMBIE,     // lease lost to another worker
    REQUESTED   // process is shutting down
};

const char* shutdownReasonName(ShutdownReason reason);

// Applies one decoded record. Throwing marks the attempt as failed and
// the record is retried.
using RecordHandler = std::function<void(const Record&, const SampleEvent&)>;

// Default handler: logs the record and how long ago it was created
void logRecordAge(const Record& record, const SampleEvent& event);

struct ProcessorPolicy {
    int num_retries = 10;
    std::chrono::milliseconds backoff{3000};
    std::chrono::milliseconds checkpoint_interval{60000};

    static ProcessorPolicy fromConfig(const ConsumerConfig& config);
};

struct ProcessorStats {
    uint64_t applied = 0;
    uint64_t rejected = 0;     // undecodable, never retried
    uint64_t skipped = 0;      // poison pills, failed every attempt
    uint64_t failed_attempts = 0;
    uint64_t checkpoints = 0;  // committed checkpoint writes
};

// Per-shard record processing state machine.
// One instance is created for each shard a worker takes.
class RecordProcessor {
public:
    RecordProcessor(const RecordDecoder& decoder, RecordHandler handler, ProcessorPolicy policy);

    void initialize(const std::string& shard_id, const ShutdownSignal& stop_signal);

    // Handle a batch in arrival order, then checkpoint if none was attempted
    // yet or the interval elapsed since the last attempt
    void process(const std::vector<Record>& records, RecordCheckpointer& checkpointer);

    void shutdown(ShutdownReason reason, RecordCheckpointer& checkpointer);

    ProcessorStats getStats() const;
    const std::string& getShardId() const { return shard_id_; }
    std::optional<SequenceNumber> getLastHandled() const { return last_handled_; }

private:
    const RecordDecoder& decoder_;
    RecordHandler handler_;
    ProcessorPolicy policy_;

    std::string shard_id_;
    const ShutdownSignal* stop_signal_;
    std::unique_ptr<CheckpointManager> checkpoint_manager_;

    std::optional<SequenceNumber> last_handled_;
    bool uncheckpointed_;
    std::optional<std::chrono::steady_clock::time_point> last_checkpoint_time_;  // last attempt

    std::atomic<uint64_t> applied_;
    std::atomic<uint64_t> rejected_;
    std::atomic<uint64_t> skipped_;
    std::atomic<uint64_t> failed_attempts_;
    std::atomic<uint64_t> checkpoints_;

    // Returns false if a stop request interrupted the retries
    bool processWithRetries(const Record& record);

    void checkpoint(RecordCheckpointer& checkpointer, SequenceNumber sequence);
};

using RecordProcessorFactory = std::function<std::unique_ptr<RecordProcessor>(const std::string& shard_id)>;

#endif // RECORD_PROCESSOR_HPP
