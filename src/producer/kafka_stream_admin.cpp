#include "kafka_stream_admin.hpp"
#include "../common/kafka_naming.hpp"
#include <iostream>

KafkaStreamAdmin::KafkaStreamAdmin(const std::string& brokers, int replication_factor)
    : brokers_(brokers)
    , replication_factor_(replication_factor)
    , client_(nullptr) {
}

KafkaStreamAdmin::~KafkaStreamAdmin() {
    if (client_) {
        rd_kafka_destroy(client_);
        client_ = nullptr;
    }
}

bool KafkaStreamAdmin::initialize() {
    char errstr[512];
    rd_kafka_conf_t* conf = rd_kafka_conf_new();

    if (rd_kafka_conf_set(conf, "bootstrap.servers", brokers_.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        std::cerr << "Failed to set bootstrap.servers: " << errstr << std::endl;
        rd_kafka_conf_destroy(conf);
        return false;
    }

    client_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!client_) {
        std::cerr << "Failed to create admin client: " << errstr << std::endl;
        rd_kafka_conf_destroy(conf);
        return false;
    }
    return true;
}

const rd_kafka_metadata_t* KafkaStreamAdmin::fetchMetadata(std::string& error) {
    if (!client_) {
        error = "admin client not initialized";
        return nullptr;
    }
    const rd_kafka_metadata_t* metadata = nullptr;
    // all_topics=1 so that asking about a missing topic never auto-creates it
    rd_kafka_resp_err_t err = rd_kafka_metadata(client_, 1, nullptr, &metadata, request_timeout_ms_);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        error = rd_kafka_err2str(err);
        return nullptr;
    }
    return metadata;
}

StreamDescription KafkaStreamAdmin::describeStream(const std::string& name) {
    StreamDescription description;

    std::string error;
    const rd_kafka_metadata_t* metadata = fetchMetadata(error);
    if (!metadata) {
        description.status = StreamStatus::ERROR;
        description.error = error;
        return description;
    }

    description.status = StreamStatus::NOT_FOUND;
    for (int i = 0; i < metadata->topic_cnt; ++i) {
        const rd_kafka_metadata_topic_t& topic = metadata->topics[i];
        if (name != topic.topic) {
            continue;
        }

        description.shard_count = topic.partition_cnt;
        // Kafka drops a topic from metadata once deletion starts, so DELETING
        // is never reported here
        if (isNotFoundError(topic.err)) {
            description.status = StreamStatus::NOT_FOUND;
        } else if (topic.err != RD_KAFKA_RESP_ERR_NO_ERROR || topic.partition_cnt == 0) {
            // Leaders not elected yet
            description.status = StreamStatus::CREATING;
        } else {
            description.status = StreamStatus::ACTIVE;
            for (int p = 0; p < topic.partition_cnt; ++p) {
                if (topic.partitions[p].err != RD_KAFKA_RESP_ERR_NO_ERROR ||
                    topic.partitions[p].leader < 0) {
                    description.status = StreamStatus::UPDATING;
                    break;
                }
            }
        }
        break;
    }

    rd_kafka_metadata_destroy(metadata);
    return description;
}

bool KafkaStreamAdmin::createStream(const std::string& name, int shard_count) {
    if (!client_) {
        std::cerr << "Admin client not initialized" << std::endl;
        return false;
    }

    char errstr[512];
    rd_kafka_NewTopic_t* new_topic =
        rd_kafka_NewTopic_new(name.c_str(), shard_count, replication_factor_, errstr, sizeof(errstr));
    if (!new_topic) {
        std::cerr << "Invalid stream definition for " << name << ": " << errstr << std::endl;
        return false;
    }

    rd_kafka_AdminOptions_t* options = rd_kafka_AdminOptions_new(client_, RD_KAFKA_ADMIN_OP_CREATETOPICS);
    rd_kafka_queue_t* queue = rd_kafka_queue_new(client_);

    rd_kafka_CreateTopics(client_, &new_topic, 1, options, queue);
    rd_kafka_event_t* event = rd_kafka_queue_poll(queue, request_timeout_ms_);

    bool success = false;
    if (!event) {
        std::cerr << "Timed out creating stream " << name << std::endl;
    } else if (rd_kafka_event_error(event) != RD_KAFKA_RESP_ERR_NO_ERROR) {
        std::cerr << "Failed to create stream " << name << ": " << rd_kafka_event_error_string(event) << std::endl;
    } else {
        const rd_kafka_CreateTopics_result_t* result = rd_kafka_event_CreateTopics_result(event);
        size_t count = 0;
        const rd_kafka_topic_result_t** topics = rd_kafka_CreateTopics_result_topics(result, &count);
        success = true;
        for (size_t i = 0; i < count; ++i) {
            rd_kafka_resp_err_t err = rd_kafka_topic_result_error(topics[i]);
            if (err == RD_KAFKA_RESP_ERR_TOPIC_ALREADY_EXISTS) {
                std::cout << "Stream " << name << " already exists" << std::endl;
            } else if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                std::cerr << "Failed to create stream " << name << ": "
                          << rd_kafka_topic_result_error_string(topics[i]) << std::endl;
                success = false;
            }
        }
        if (success) {
            std::cout << "Stream " << name << " create request accepted" << std::endl;
        }
    }

    if (event) {
        rd_kafka_event_destroy(event);
    }
    rd_kafka_queue_destroy(queue);
    rd_kafka_AdminOptions_destroy(options);
    rd_kafka_NewTopic_destroy(new_topic);
    return success;
}

bool KafkaStreamAdmin::deleteStream(const std::string& name) {
    if (!client_) {
        std::cerr << "Admin client not initialized" << std::endl;
        return false;
    }

    rd_kafka_DeleteTopic_t* del_topic = rd_kafka_DeleteTopic_new(name.c_str());
    rd_kafka_AdminOptions_t* options = rd_kafka_AdminOptions_new(client_, RD_KAFKA_ADMIN_OP_DELETETOPICS);
    rd_kafka_queue_t* queue = rd_kafka_queue_new(client_);

    rd_kafka_DeleteTopics(client_, &del_topic, 1, options, queue);
    rd_kafka_event_t* event = rd_kafka_queue_poll(queue, request_timeout_ms_);

    bool success = false;
    if (!event) {
        std::cerr << "Timed out deleting stream " << name << std::endl;
    } else if (rd_kafka_event_error(event) != RD_KAFKA_RESP_ERR_NO_ERROR) {
        std::cerr << "Failed to delete stream " << name << ": " << rd_kafka_event_error_string(event) << std::endl;
    } else {
        const rd_kafka_DeleteTopics_result_t* result = rd_kafka_event_DeleteTopics_result(event);
        size_t count = 0;
        const rd_kafka_topic_result_t** topics = rd_kafka_DeleteTopics_result_topics(result, &count);
        success = true;
        for (size_t i = 0; i < count; ++i) {
            rd_kafka_resp_err_t err = rd_kafka_topic_result_error(topics[i]);
            if (isNotFoundError(err)) {
                std::cout << "Stream " << name << " does not exist" << std::endl;
            } else if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                std::cerr << "Failed to delete stream " << name << ": "
                          << rd_kafka_topic_result_error_string(topics[i]) << std::endl;
                success = false;
            }
        }
        if (success) {
            std::cout << "Stream " << name << " deleted" << std::endl;
        }
    }

    if (event) {
        rd_kafka_event_destroy(event);
    }
    rd_kafka_queue_destroy(queue);
    rd_kafka_AdminOptions_destroy(options);
    rd_kafka_DeleteTopic_destroy(del_topic);
    return success;
}

std::vector<std::string> KafkaStreamAdmin::listStreams() {
    std::vector<std::string> names;

    std::string error;
    const rd_kafka_metadata_t* metadata = fetchMetadata(error);
    if (!metadata) {
        std::cerr << "Failed to list streams: " << error << std::endl;
        return names;
    }

    for (int i = 0; i < metadata->topic_cnt; ++i) {
        std::string topic = metadata->topics[i].topic;
        // Internal topics such as __consumer_offsets are not streams
        if (topic.rfind("__", 0) == 0) {
            continue;
        }
        names.push_back(topic);
    }

    rd_kafka_metadata_destroy(metadata);
    return names;
}
