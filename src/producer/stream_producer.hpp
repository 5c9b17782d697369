#ifndef STREAM_PRODUCER_HPP
#define STREAM_PRODUCER_HPP

#include "../common/stream_types.hpp"
#include <string>

enum class ProduceResult {
    SUCCESS,
    RETRYABLE_ERROR,   // broker busy or unreachable, can retry
    PERSISTENT_ERROR   // stream missing or being deleted
};

struct PutResult {
    ProduceResult status = ProduceResult::SUCCESS;
    std::string shard_id;
    SequenceNumber sequence_number = 0;
    std::string error;
};

// Write side of a sharded stream
class StreamProducer {
public:
    virtual ~StreamProducer() = default;

    // Append one record; the partition key picks the shard
    virtual PutResult put(const std::string& partition_key, const std::string& payload) = 0;
};

#endif // STREAM_PRODUCER_HPP
