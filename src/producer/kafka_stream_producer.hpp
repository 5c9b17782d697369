#ifndef KAFKA_STREAM_PRODUCER_HPP
#define KAFKA_STREAM_PRODUCER_HPP

#include "../config.hpp"
#include "stream_producer.hpp"
#include <librdkafka/rdkafka.h>
#include <atomic>
#include <string>

// Outcome of one produced message, filled in by the delivery report
struct DeliveryState {
    std::atomic<bool> done{false};
    rd_kafka_resp_err_t err = RD_KAFKA_RESP_ERR_NO_ERROR;
    int32_t partition = -1;
    int64_t offset = -1;
};

class KafkaStreamProducer : public StreamProducer {
public:
    KafkaStreamProducer(const ProducerConfig& config);
    ~KafkaStreamProducer() override;

    // Initialize the producer (must be called before put)
    bool initialize();

    // Blocks until the broker acknowledges the record so that the
    // assigned shard and sequence number can be returned
    PutResult put(const std::string& partition_key, const std::string& payload) override;

    // Shutdown gracefully
    void shutdown();

private:
    ProducerConfig config_;

    rd_kafka_t* producer_;
    rd_kafka_topic_t* topic_;

    // Static callback function for librdkafka
    static void deliveryReportCallback(rd_kafka_t* rk, const rd_kafka_message_t* rkmessage, void* opaque);

    bool setConf(rd_kafka_conf_t* conf, const char* name, const std::string& value);

    static ProduceResult classify(rd_kafka_resp_err_t err);
};

#endif // KAFKA_STREAM_PRODUCER_HPP
