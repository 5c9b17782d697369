#include "kafka_naming.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {
const char* SHARD_ID_PREFIX = "shardId-";
const size_t SHARD_ID_DIGITS = 12;
}

std::string shardIdForPartition(int32_t partition) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%012d", SHARD_ID_PREFIX, partition);
    return buf;
}

bool partitionForShardId(const std::string& shard_id, int32_t& partition) {
    const size_t prefix_len = std::strlen(SHARD_ID_PREFIX);
    if (shard_id.size() != prefix_len + SHARD_ID_DIGITS ||
        shard_id.compare(0, prefix_len, SHARD_ID_PREFIX) != 0) {
        return false;
    }
    for (size_t i = prefix_len; i < shard_id.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(shard_id[i]))) {
            return false;
        }
    }
    long long value = std::strtoll(shard_id.c_str() + prefix_len, nullptr, 10);
    if (value > INT32_MAX) {
        return false;
    }
    partition = static_cast<int32_t>(value);
    return true;
}

bool isNotFoundError(rd_kafka_resp_err_t err) {
    return err == RD_KAFKA_RESP_ERR_UNKNOWN_TOPIC_OR_PART ||
           err == RD_KAFKA_RESP_ERR__UNKNOWN_TOPIC ||
           err == RD_KAFKA_RESP_ERR__UNKNOWN_PARTITION;
}

bool isThrottlingError(rd_kafka_resp_err_t err) {
    return err == RD_KAFKA_RESP_ERR_THROTTLING_QUOTA_EXCEEDED;
}
