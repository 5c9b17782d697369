#ifndef KAFKA_STREAM_SOURCE_HPP
#define KAFKA_STREAM_SOURCE_HPP

#include "../config.hpp"
#include "../common/stream_source.hpp"
#include <cppkafka/cppkafka.h>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Stream Source backed by a Kafka topic.
// Each shard gets its own consumer assigned to exactly one partition, so
// shard workers never share a consumer handle. Kafka partitions never
// close, so shards are never reported exhausted.
class KafkaStreamSource : public StreamSource {
public:
    KafkaStreamSource(const ConsumerConfig& config);
    ~KafkaStreamSource() override;

    // Create the metadata consumer (must be called before use)
    bool initialize();

    ShardListing listShards(const std::string& stream_name) override;

    RecordBatch getRecords(const std::string& shard_id,
                           std::optional<SequenceNumber> from_exclusive,
                           InitialPosition initial_position,
                           int max_count) override;

    void releaseShard(const std::string& shard_id) override;

private:
    struct ShardReader {
        std::unique_ptr<cppkafka::Consumer> consumer;
        bool assigned = false;
        int64_t next_offset = -1;  // offset the consumer will return next, -1 if unknown
    };

    ConsumerConfig config_;
    std::chrono::milliseconds poll_timeout_;

    std::unique_ptr<cppkafka::Consumer> metadata_consumer_;
    std::mutex metadata_mutex_;

    std::map<std::string, std::unique_ptr<ShardReader>> readers_;
    std::mutex readers_mutex_;

    cppkafka::Configuration buildConfiguration() const;

    ShardReader& readerFor(const std::string& shard_id);

    static SourceStatus statusForError(const cppkafka::Error& error);
};

#endif // KAFKA_STREAM_SOURCE_HPP
