#ifndef KAFKA_NAMING_HPP
#define KAFKA_NAMING_HPP

#include <librdkafka/rdkafka.h>
#include <string>
#include <cstdint>

// A Kafka topic is a stream and each of its partitions is a shard.
// Shard ids look like "shardId-000000000003".
std::string shardIdForPartition(int32_t partition);

// Returns false if shard_id is not of the form above
bool partitionForShardId(const std::string& shard_id, int32_t& partition);

// Topic or partition does not exist
bool isNotFoundError(rd_kafka_resp_err_t err);

// Broker asked the client to slow down
bool isThrottlingError(rd_kafka_resp_err_t err);

#endif // KAFKA_NAMING_HPP
