#ifndef KAFKA_STREAM_ADMIN_HPP
#define KAFKA_STREAM_ADMIN_HPP

#include "stream_admin.hpp"
#include <librdkafka/rdkafka.h>
#include <string>
#include <vector>

// Topic management through the librdkafka admin API
class KafkaStreamAdmin : public StreamAdmin {
public:
    KafkaStreamAdmin(const std::string& brokers, int replication_factor);
    ~KafkaStreamAdmin() override;

    bool initialize();

    StreamDescription describeStream(const std::string& name) override;
    bool createStream(const std::string& name, int shard_count) override;
    bool deleteStream(const std::string& name) override;
    std::vector<std::string> listStreams() override;

private:
    std::string brokers_;
    int replication_factor_;
    int request_timeout_ms_ = 10000;

    rd_kafka_t* client_;

    // Cluster-wide metadata; caller must rd_kafka_metadata_destroy the result
    const rd_kafka_metadata_t* fetchMetadata(std::string& error);
};

#endif // KAFKA_STREAM_ADMIN_HPP
