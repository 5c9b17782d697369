#include <gtest/gtest.h>
#include "../src/common/kafka_naming.hpp"

TEST(KafkaNamingTest, ShardIdForPartition) {
    EXPECT_EQ(shardIdForPartition(0), "shardId-000000000000");
    EXPECT_EQ(shardIdForPartition(17), "shardId-000000000017");
}

TEST(KafkaNamingTest, PartitionForShardId) {
    int32_t partition = -1;
    ASSERT_TRUE(partitionForShardId("shardId-000000000017", partition));
    EXPECT_EQ(partition, 17);

    EXPECT_FALSE(partitionForShardId("shard-17", partition));
    EXPECT_FALSE(partitionForShardId("shardId-", partition));
    EXPECT_FALSE(partitionForShardId("shardId-12x", partition));
}

TEST(KafkaNamingTest, ErrorClassification) {
    EXPECT_TRUE(isNotFoundError(RD_KAFKA_RESP_ERR_UNKNOWN_TOPIC_OR_PART));
    EXPECT_TRUE(isNotFoundError(RD_KAFKA_RESP_ERR__UNKNOWN_PARTITION));
    EXPECT_FALSE(isNotFoundError(RD_KAFKA_RESP_ERR__TRANSPORT));

    EXPECT_TRUE(isThrottlingError(RD_KAFKA_RESP_ERR_THROTTLING_QUOTA_EXCEEDED));
    EXPECT_FALSE(isThrottlingError(RD_KAFKA_RESP_ERR__TIMED_OUT));
}
