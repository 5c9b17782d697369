#include "kafka_stream_source.hpp"
#include "../common/kafka_naming.hpp"
#include <algorithm>
#include <iostream>

KafkaStreamSource::KafkaStreamSource(const ConsumerConfig& config)
    : config_(config)
    , poll_timeout_(std::min<int64_t>(config.idle_time_between_reads_ms, 1000)) {
}

KafkaStreamSource::~KafkaStreamSource() {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    readers_.clear();
}

cppkafka::Configuration KafkaStreamSource::buildConfiguration() const {
    // Positions live in the lease table, so nothing is committed to Kafka
    return cppkafka::Configuration{
        {"metadata.broker.list", config_.queue_brokers},
        {"group.id", config_.application_name},
        {"enable.auto.commit", "false"},
        {"enable.auto.offset.store", "false"},
        {"enable.partition.eof", "true"},
    };
}

bool KafkaStreamSource::initialize() {
    try {
        metadata_consumer_ = std::make_unique<cppkafka::Consumer>(buildConfiguration());

        std::cout << "KafkaStreamSource initialized with brokers: " << config_.queue_brokers
                  << ", stream: " << config_.stream_name << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize KafkaStreamSource: " << e.what() << std::endl;
        return false;
    }
}

ShardListing KafkaStreamSource::listShards(const std::string& stream_name) {
    ShardListing listing;
    std::lock_guard<std::mutex> lock(metadata_mutex_);

    if (!metadata_consumer_) {
        listing.status = SourceStatus::TRANSIENT;
        listing.error = "source not initialized";
        return listing;
    }

    try {
        cppkafka::Topic topic = metadata_consumer_->get_topic(stream_name);
        cppkafka::TopicMetadata metadata = metadata_consumer_->get_metadata(topic);

        if (metadata.get_error()) {
            listing.status = statusForError(metadata.get_error());
            listing.error = metadata.get_error().to_string();
            return listing;
        }

        std::vector<int32_t> partitions;
        for (const auto& partition : metadata.get_partitions()) {
            partitions.push_back(partition.get_id());
        }
        std::sort(partitions.begin(), partitions.end());

        for (int32_t partition : partitions) {
            ShardDescriptor shard;
            shard.shard_id = shardIdForPartition(partition);
            listing.shards.push_back(shard);
        }
    } catch (const cppkafka::HandleException& e) {
        listing.status = statusForError(e.get_error());
        listing.error = e.what();
    } catch (const cppkafka::ElementNotFound& e) {
        listing.status = SourceStatus::NOT_FOUND;
        listing.error = e.what();
    } catch (const std::exception& e) {
        listing.status = SourceStatus::TRANSIENT;
        listing.error = e.what();
    }
    return listing;
}

KafkaStreamSource::ShardReader& KafkaStreamSource::readerFor(const std::string& shard_id) {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    auto it = readers_.find(shard_id);
    if (it == readers_.end()) {
        auto reader = std::make_unique<ShardReader>();
        reader->consumer = std::make_unique<cppkafka::Consumer>(buildConfiguration());
        it = readers_.emplace(shard_id, std::move(reader)).first;
    }
    return *it->second;
}

RecordBatch KafkaStreamSource::getRecords(const std::string& shard_id,
                                          std::optional<SequenceNumber> from_exclusive,
                                          InitialPosition initial_position,
                                          int max_count) {
    RecordBatch batch;

    int32_t partition = 0;
    if (!partitionForShardId(shard_id, partition)) {
        batch.status = SourceStatus::NOT_FOUND;
        batch.error = "not a Kafka shard id: " + shard_id;
        return batch;
    }

    try {
        ShardReader& reader = readerFor(shard_id);

        // Reposition when the caller's cursor and ours disagree
        bool reposition = !reader.assigned ||
                          (from_exclusive && reader.next_offset != *from_exclusive + 1);
        if (reposition) {
            int64_t offset;
            if (from_exclusive) {
                offset = *from_exclusive + 1;
            } else if (initial_position == InitialPosition::TRIM_HORIZON) {
                offset = cppkafka::TopicPartition::OFFSET_BEGINNING;
            } else {
                offset = cppkafka::TopicPartition::OFFSET_END;
            }

            reader.consumer->assign({cppkafka::TopicPartition(config_.stream_name, partition, offset)});
            reader.assigned = true;
            reader.next_offset = from_exclusive ? offset : -1;
        }

        std::vector<cppkafka::Message> messages =
            reader.consumer->poll_batch(static_cast<size_t>(max_count), poll_timeout_);

        for (const auto& msg : messages) {
            if (msg.get_error()) {
                if (msg.is_eof()) {
                    continue;
                }
                if (batch.records.empty()) {
                    batch.status = statusForError(msg.get_error());
                    batch.error = msg.get_error().to_string();
                    return batch;
                }
                // Hand back what we have; the error shows up again on the next call
                break;
            }

            Record record;
            record.shard_id = shard_id;
            record.partition_key = static_cast<std::string>(msg.get_key());
            record.data = static_cast<std::string>(msg.get_payload());
            record.sequence_number = msg.get_offset();

            rd_kafka_timestamp_type_t ts_type;
            int64_t ts = rd_kafka_message_timestamp(msg.get_handle(), &ts_type);
            record.append_time_ms = ts_type == RD_KAFKA_TIMESTAMP_NOT_AVAILABLE ? 0 : ts;

            reader.next_offset = msg.get_offset() + 1;
            batch.records.push_back(std::move(record));
        }

        if (!batch.records.empty()) {
            batch.next_cursor = batch.records.back().sequence_number;
        }
    } catch (const cppkafka::HandleException& e) {
        batch.status = statusForError(e.get_error());
        batch.error = e.what();
    } catch (const std::exception& e) {
        batch.status = SourceStatus::TRANSIENT;
        batch.error = e.what();
    }
    return batch;
}

void KafkaStreamSource::releaseShard(const std::string& shard_id) {
    std::unique_ptr<ShardReader> reader;
    {
        std::lock_guard<std::mutex> lock(readers_mutex_);
        auto it = readers_.find(shard_id);
        if (it == readers_.end()) {
            return;
        }
        reader = std::move(it->second);
        readers_.erase(it);
    }

    try {
        reader->consumer->unassign();
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id << ": Error releasing consumer: " << e.what() << std::endl;
    }
}

SourceStatus KafkaStreamSource::statusForError(const cppkafka::Error& error) {
    rd_kafka_resp_err_t err = error.get_error();
    if (isNotFoundError(err)) {
        return SourceStatus::NOT_FOUND;
    }
    if (isThrottlingError(err)) {
        return SourceStatus::THROTTLED;
    }
    return SourceStatus::TRANSIENT;
}
