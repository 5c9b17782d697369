#ifndef STREAM_SOURCE_HPP
#define STREAM_SOURCE_HPP

#include "../config.hpp"
#include "stream_types.hpp"
#include <string>
#include <optional>

// Read side of a sharded stream
class StreamSource {
public:
    virtual ~StreamSource() = default;

    virtual ShardListing listShards(const std::string& stream_name) = 0;

    // Read up to max_count records after from_exclusive, or from the
    // initial position when no cursor is given
    virtual RecordBatch getRecords(const std::string& shard_id,
                                   std::optional<SequenceNumber> from_exclusive,
                                   InitialPosition initial_position,
                                   int max_count) = 0;

    // Drop any per-shard read state once a worker is done with the shard
    virtual void releaseShard(const std::string& shard_id) { (void)shard_id; }
};

#endif // STREAM_SOURCE_HPP
