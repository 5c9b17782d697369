#ifndef STREAM_TYPES_HPP
#define STREAM_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <limits>
#include <optional>

using SequenceNumber = int64_t;

// Checkpoint value written once a shard has been fully drained.
// A lease holding this checkpoint is finished and unblocks its children.
constexpr SequenceNumber SHARD_END_SEQUENCE = std::numeric_limits<SequenceNumber>::max();

// A single record read from one shard
struct Record {
    std::string shard_id;
    std::string partition_key;
    std::string data;                 // opaque payload bytes
    SequenceNumber sequence_number = 0;
    int64_t append_time_ms = 0;       // backend append timestamp, 0 if unknown
};

struct ShardDescriptor {
    std::string shard_id;
    std::vector<std::string> parent_ids;  // set when the shard came from a split or merge
    bool closed = false;                  // closed shards accept no more records
};

// Status of a Stream Source call
enum class SourceStatus {
    OK,
    NOT_FOUND,   // stream or shard does not exist
    THROTTLED,   // read limit exceeded, retry later
    TRANSIENT    // brief unavailability, retry later
};

inline const char* sourceStatusName(SourceStatus status) {
    switch (status) {
        case SourceStatus::OK: return "OK";
        case SourceStatus::NOT_FOUND: return "NOT_FOUND";
        case SourceStatus::THROTTLED: return "THROTTLED";
        case SourceStatus::TRANSIENT: return "TRANSIENT";
    }
    return "UNKNOWN";
}

struct ShardListing {
    SourceStatus status = SourceStatus::OK;
    std::vector<ShardDescriptor> shards;
    std::string error;
};

struct RecordBatch {
    SourceStatus status = SourceStatus::OK;
    std::vector<Record> records;        // ordered by sequence number
    std::optional<SequenceNumber> next_cursor;  // last sequence returned, if any
    bool shard_exhausted = false;       // closed and no records remain after this batch
    std::string error;
};

// One row of the lease table
struct Lease {
    std::string shard_id;
    std::string owner;                     // empty when unassigned
    int64_t expiry_ms = 0;                 // wall-clock millis since epoch
    std::optional<SequenceNumber> checkpoint;  // empty means no progress yet
    int64_t counter = 0;                   // bumped on every acquisition or renewal
    std::vector<std::string> parent_ids;

    bool isFinished() const {
        return checkpoint && *checkpoint == SHARD_END_SEQUENCE;
    }

    bool isExpired(int64_t now_ms) const {
        return owner.empty() || expiry_ms <= now_ms;
    }
};

// Status of a Lease Store mutation
enum class StoreStatus {
    OK,
    CONFLICT,      // lease counter superseded, the caller no longer owns the lease
    THROTTLED,     // transient store pressure, retry with backoff
    SCHEMA_ERROR   // table missing or misconfigured, fatal for the shard
};

inline const char* storeStatusName(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK: return "OK";
        case StoreStatus::CONFLICT: return "CONFLICT";
        case StoreStatus::THROTTLED: return "THROTTLED";
        case StoreStatus::SCHEMA_ERROR: return "SCHEMA_ERROR";
    }
    return "UNKNOWN";
}

struct LeaseResult {
    StoreStatus status = StoreStatus::OK;
    int64_t counter = 0;  // new counter when status is OK
};

#endif // STREAM_TYPES_HPP
