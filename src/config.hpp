#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <cerrno>
#include <climits>
#include <stdexcept>

// Where a shard with no checkpoint starts reading
enum class InitialPosition {
    LATEST,        // Only records appended after the worker starts
    TRIM_HORIZON   // Oldest record still retained
};

inline std::string initialPositionName(InitialPosition position) {
    return position == InitialPosition::TRIM_HORIZON ? "TRIM_HORIZON" : "LATEST";
}

inline InitialPosition parseInitialPosition(const std::string& value) {
    if (value == "LATEST") {
        return InitialPosition::LATEST;
    }
    if (value == "TRIM_HORIZON") {
        return InitialPosition::TRIM_HORIZON;
    }
    throw std::runtime_error("INITIAL_POSITION must be LATEST or TRIM_HORIZON, got: " + value);
}

namespace config_env {

inline const char* get(const char* name) {
    const char* value = std::getenv(name);
    if (!value || strlen(value) == 0) {
        return nullptr;
    }
    return value;
}

inline std::string required(const char* name) {
    const char* value = get(name);
    if (!value) {
        throw std::runtime_error(std::string(name) + " environment variable is required");
    }
    return value;
}

inline int64_t integer(const char* name, int64_t fallback, int64_t min_value,
                       int64_t max_value = INT64_MAX) {
    const char* value = get(name);
    if (!value) {
        return fallback;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value, &end, 10);
    if (*end != '\0') {
        throw std::runtime_error(std::string(name) + " must be an integer, got: " + value);
    }
    if (errno == ERANGE) {
        throw std::runtime_error(std::string(name) + " is out of range: " + value);
    }
    if (parsed < min_value) {
        throw std::runtime_error(std::string(name) + " must be >= " + std::to_string(min_value));
    }
    if (parsed > max_value) {
        throw std::runtime_error(std::string(name) + " must be <= " + std::to_string(max_value));
    }
    return parsed;
}

// For settings stored in an int
inline int smallInteger(const char* name, int fallback, int min_value, int max_value = INT_MAX) {
    return static_cast<int>(integer(name, fallback, min_value, max_value));
}

}  // namespace config_env

struct ConsumerConfig {
    std::string queue_brokers;
    std::string application_name = "SampleStreamApplication";
    std::string stream_name = "myFirstStream";
    InitialPosition initial_position = InitialPosition::LATEST;
    std::string lease_db_path;  // defaults to <application_name>.leases.db

    // Lease settings
    int64_t lease_ttl_ms = 10000;
    int64_t shard_sync_interval_ms = 10000;

    // Processing and checkpoint settings
    int64_t checkpoint_interval_ms = 60000;  // checkpoint about once a minute
    int num_retries = 10;
    int64_t backoff_ms = 3000;
    int max_records = 10000;
    int64_t idle_time_between_reads_ms = 1000;

    int worker_stop_timeout_seconds = 30;
    int health_port = 8080;  // 0 disables the health server

    static ConsumerConfig fromEnv() {
        ConsumerConfig config;

        config.queue_brokers = config_env::required("KAFKA_BROKERS");

        if (const char* app = config_env::get("APPLICATION_NAME")) {
            config.application_name = app;
        }
        if (const char* stream = config_env::get("STREAM_NAME")) {
            config.stream_name = stream;
        }
        if (const char* position = config_env::get("INITIAL_POSITION")) {
            config.initial_position = parseInitialPosition(position);
        }

        const char* lease_db = config_env::get("LEASE_DB_PATH");
        config.lease_db_path = lease_db ? lease_db : config.application_name + ".leases.db";

        config.lease_ttl_ms = config_env::integer("LEASE_TTL_MS", config.lease_ttl_ms, 1);
        config.shard_sync_interval_ms =
            config_env::integer("SHARD_SYNC_INTERVAL_MS", config.shard_sync_interval_ms, 1);
        config.checkpoint_interval_ms =
            config_env::integer("CHECKPOINT_INTERVAL_MS", config.checkpoint_interval_ms, 0);
        config.num_retries = config_env::smallInteger("NUM_RETRIES", config.num_retries, 1);
        config.backoff_ms = config_env::integer("BACKOFF_MS", config.backoff_ms, 0);
        config.max_records = config_env::smallInteger("MAX_RECORDS", config.max_records, 1);
        config.idle_time_between_reads_ms =
            config_env::integer("IDLE_TIME_BETWEEN_READS_MS", config.idle_time_between_reads_ms, 0);
        config.worker_stop_timeout_seconds = 
            config_env::smallInteger("WORKER_STOP_TIMEOUT_SECONDS", config.worker_stop_timeout_seconds, 1);
        config.health_port = config_env::smallInteger("HEALTH_PORT", config.health_port, 0, 65535);

        return config;
    }
};

struct ProducerConfig {
    std::string queue_brokers;
    std::string stream_name = "myFirstStream";
    int shard_count = 1;
    int replication_factor = 1;
    int64_t stream_poll_interval_ms = 20000;     // 20 seconds
    int64_t stream_active_timeout_ms = 600000;   // 10 minutes
    int acks = -1;  // -1 means all replicas must acknowledge
    std::string compression_type = "snappy";
    int delivery_timeout_ms = 30000;
    int64_t retry_backoff_ms = 100;

    static ProducerConfig fromEnv() {
        ProducerConfig config;

        config.queue_brokers = config_env::required("KAFKA_BROKERS");

        if (const char* stream = config_env::get("STREAM_NAME")) {
            config.stream_name = stream;
        }

        config.shard_count = config_env::smallInteger("SHARD_COUNT", config.shard_count, 1);
        config.replication_factor =
            config_env::smallInteger("REPLICATION_FACTOR", config.replication_factor, 1);
        config.stream_poll_interval_ms =
            config_env::integer("STREAM_POLL_INTERVAL_MS", config.stream_poll_interval_ms, 1);
        config.stream_active_timeout_ms =
            config_env::integer("STREAM_ACTIVE_TIMEOUT_MS", config.stream_active_timeout_ms, 1);
        config.acks = config_env::smallInteger("PRODUCER_ACKS", config.acks, -1);

        if (const char* compression = config_env::get("PRODUCER_COMPRESSION")) {
            config.compression_type = compression;
        }

        config.delivery_timeout_ms =
            config_env::smallInteger("DELIVERY_TIMEOUT_MS", config.delivery_timeout_ms, 1);
        config.retry_backoff_ms =
            config_env::integer("PRODUCER_RETRY_BACKOFF_MS", config.retry_backoff_ms, 0);

        return config;
    }
};

#endif // CONFIG_HPP
