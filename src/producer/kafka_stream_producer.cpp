#include "kafka_stream_producer.hpp"
#include "../common/kafka_naming.hpp"
#include <chrono>
#include <iostream>

KafkaStreamProducer::KafkaStreamProducer(const ProducerConfig& config)
    : config_(config)
    , producer_(nullptr)
    , topic_(nullptr) {
}

KafkaStreamProducer::~KafkaStreamProducer() {
    shutdown();
}

bool KafkaStreamProducer::setConf(rd_kafka_conf_t* conf, const char* name, const std::string& value) {
    char errstr[512];
    if (rd_kafka_conf_set(conf, name, value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        std::cerr << "Failed to set " << name << ": " << errstr << std::endl;
        return false;
    }
    return true;
}

bool KafkaStreamProducer::initialize() {
    char errstr[512];

    rd_kafka_conf_t* conf = rd_kafka_conf_new();

    if (!setConf(conf, "bootstrap.servers", config_.queue_brokers) ||
        !setConf(conf, "acks", std::to_string(config_.acks)) ||
        !setConf(conf, "compression.type", config_.compression_type) ||
        !setConf(conf, "message.timeout.ms", std::to_string(config_.delivery_timeout_ms)) ||
        !setConf(conf, "enable.idempotence", "true") ||
        !setConf(conf, "linger.ms", "0")) {
        rd_kafka_conf_destroy(conf);
        return false;
    }

    rd_kafka_conf_set_dr_msg_cb(conf, KafkaStreamProducer::deliveryReportCallback);

    // Create producer; on success it takes ownership of conf
    producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!producer_) {
        std::cerr << "Failed to create producer: " << errstr << std::endl;
        rd_kafka_conf_destroy(conf);
        return false;
    }

    topic_ = rd_kafka_topic_new(producer_, config_.stream_name.c_str(), nullptr);
    if (!topic_) {
        std::cerr << "Failed to create topic object: " << rd_kafka_err2str(rd_kafka_last_error()) << std::endl;
        rd_kafka_destroy(producer_);
        producer_ = nullptr;
        return false;
    }

    std::cout << "KafkaStreamProducer initialized with brokers: " << config_.queue_brokers
              << ", stream: " << config_.stream_name << std::endl;
    return true;
}

void KafkaStreamProducer::deliveryReportCallback(rd_kafka_t* rk, const rd_kafka_message_t* rkmessage, void* opaque) {
    (void)rk;
    (void)opaque;
    DeliveryState* state = static_cast<DeliveryState*>(rkmessage->_private);
    if (!state) {
        return;
    }
    state->err = rkmessage->err;
    state->partition = rkmessage->partition;
    state->offset = rkmessage->offset;
    state->done = true;
}

PutResult KafkaStreamProducer::put(const std::string& partition_key, const std::string& payload) {
    PutResult result;

    if (!producer_ || !topic_) {
        result.status = ProduceResult::PERSISTENT_ERROR;
        result.error = "producer not initialized";
        return result;
    }

    DeliveryState state;
    int ret = rd_kafka_produce(
        topic_,
        RD_KAFKA_PARTITION_UA,  // partitioner hashes the key
        RD_KAFKA_MSG_F_COPY,
        const_cast<void*>(static_cast<const void*>(payload.data())),
        payload.size(),
        partition_key.data(),
        partition_key.size(),
        &state);

    if (ret == -1) {
        rd_kafka_resp_err_t err = rd_kafka_last_error();
        result.status = classify(err);
        result.error = rd_kafka_err2str(err);
        return result;
    }

    // message.timeout.ms guarantees a delivery report; the extra second
    // only guards against a stuck client
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.delivery_timeout_ms + 1000);
    while (!state.done) {
        rd_kafka_poll(producer_, 100);
        if (!state.done && std::chrono::steady_clock::now() > deadline) {
            // state must outlive the callback, so drain the queue before giving up
            rd_kafka_purge(producer_, RD_KAFKA_PURGE_F_QUEUE | RD_KAFKA_PURGE_F_INFLIGHT);
            rd_kafka_flush(producer_, 1000);
            if (!state.done) {
                state.err = RD_KAFKA_RESP_ERR__TIMED_OUT;
            }
            break;
        }
    }

    if (state.err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        result.status = classify(state.err);
        result.error = rd_kafka_err2str(state.err);
        return result;
    }

    result.shard_id = shardIdForPartition(state.partition);
    result.sequence_number = state.offset;
    return result;
}

ProduceResult KafkaStreamProducer::classify(rd_kafka_resp_err_t err) {
    if (isNotFoundError(err) ||
        err == RD_KAFKA_RESP_ERR_TOPIC_AUTHORIZATION_FAILED ||
        err == RD_KAFKA_RESP_ERR_MSG_SIZE_TOO_LARGE ||
        err == RD_KAFKA_RESP_ERR__MSG_SIZE_TOO_LARGE) {
        return ProduceResult::PERSISTENT_ERROR;
    }
    // Queue full, timeouts, leader changes and network errors clear up
    return ProduceResult::RETRYABLE_ERROR;
}

void KafkaStreamProducer::shutdown() {
    if (producer_) {
        // Flush any pending messages (wait up to 5 seconds)
        rd_kafka_resp_err_t err = rd_kafka_flush(producer_, 5000);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            std::cerr << "Warning: " << rd_kafka_outq_len(producer_)
                      << " messages were not delivered during shutdown" << std::endl;
        }

        if (topic_) {
            rd_kafka_topic_destroy(topic_);
            topic_ = nullptr;
        }

        rd_kafka_destroy(producer_);
        producer_ = nullptr;
    }
}
