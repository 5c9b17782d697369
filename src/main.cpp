#include "config.hpp"
#include "common/shutdown_signal.hpp"
#include "common/worker_id.hpp"
#include "consumer/duckdb_lease_store.hpp"
#include "consumer/health_server.hpp"
#include "consumer/kafka_stream_source.hpp"
#include "consumer/record_decoder.hpp"
#include "consumer/record_processor.hpp"
#include "consumer/shard_coordinator.hpp"
#include "producer/kafka_stream_admin.hpp"
#include "producer/kafka_stream_producer.hpp"
#include "producer/producer_loop.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

static void printUsage() {
    std::cerr << "Usage:" << std::endl;
    std::cerr << "  streamkeeper run                    Consume the stream" << std::endl;
    std::cerr << "  streamkeeper run delete-resources   Delete the stream and the lease table" << std::endl;
    std::cerr << "  streamkeeper produce                Write sample records to the stream" << std::endl;
}

// Blocks the main thread until SIGINT/SIGTERM or until done() returns true
template <typename Done>
static void waitForSignal(Done done) {
    while (g_running && !done()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

static int runConsumer() {
    ConsumerConfig config = ConsumerConfig::fromEnv();
    WorkerId worker_id = WorkerId::generate();

    KafkaStreamSource source(config);
    if (!source.initialize()) {
        std::cerr << "Failed to initialize stream source" << std::endl;
        return 1;
    }

    DuckDbLeaseStore lease_store(config.lease_db_path, config.application_name);
    if (!lease_store.initialize()) {
        std::cerr << "Failed to initialize lease store at " << config.lease_db_path << std::endl;
        return 1;
    }

    SampleRecordDecoder decoder;
    ProcessorPolicy policy = ProcessorPolicy::fromConfig(config);
    RecordProcessorFactory factory = [&decoder, policy](const std::string&) {
        return std::make_unique<RecordProcessor>(decoder, logRecordAge, policy);
    };

    ShardCoordinator coordinator(config, worker_id.str(), source, lease_store, factory);

    std::cout << "Running " << config.application_name << " to process stream " << config.stream_name
              << " as worker " << worker_id.str() << std::endl;
    std::cout << "Initial position: " << initialPositionName(config.initial_position)
              << ", checkpoint interval: " << config.checkpoint_interval_ms << " ms" << std::endl;

    std::unique_ptr<HealthServer> health_server;
    if (config.health_port > 0) {
        health_server = std::make_unique<HealthServer>([&coordinator]() { return coordinator.snapshot(); });
        health_server->start(config.health_port);
    }

    std::atomic<bool> coordinator_exited(false);
    std::thread coordinator_thread([&coordinator, &coordinator_exited]() {
        try {
            coordinator.start();
        } catch (const std::exception& e) {
            std::cerr << "Shard coordinator failed: " << e.what() << std::endl;
        }
        coordinator_exited = true;
    });

    waitForSignal([&coordinator_exited]() { return coordinator_exited.load(); });

    std::cout << "Shutting down gracefully..." << std::endl;
    coordinator.stop();
    coordinator_thread.join();

    if (health_server) {
        health_server->stop();
    }

    if (coordinator.hadUnhandledFailure()) {
        std::cerr << "One or more shard workers ended on an unhandled error" << std::endl;
        return 1;
    }
    std::cout << "Consumer stopped" << std::endl;
    return 0;
}

static int deleteResources() {
    ConsumerConfig config = ConsumerConfig::fromEnv();
    bool ok = true;

    KafkaStreamAdmin admin(config.queue_brokers, 1);
    if (!admin.initialize() || !admin.deleteStream(config.stream_name)) {
        std::cerr << "Failed to delete stream " << config.stream_name << std::endl;
        ok = false;
    }

    DuckDbLeaseStore lease_store(config.lease_db_path, config.application_name);
    if (!lease_store.initialize() || !lease_store.destroy()) {
        std::cerr << "Failed to delete lease table " << config.application_name << std::endl;
        ok = false;
    } else {
        std::cout << "Lease table " << config.application_name << " deleted" << std::endl;
    }

    return ok ? 0 : 1;
}

static int runProducer() {
    ProducerConfig config = ProducerConfig::fromEnv();
    ShutdownSignal stop;

    KafkaStreamAdmin admin(config.queue_brokers, config.replication_factor);
    if (!admin.initialize()) {
        std::cerr << "Failed to initialize stream admin" << std::endl;
        return 1;
    }

    KafkaStreamProducer producer(config);
    if (!producer.initialize()) {
        std::cerr << "Failed to initialize stream producer" << std::endl;
        return 1;
    }

    std::atomic<bool> producer_exited(false);
    std::atomic<int> exit_code(0);
    std::thread producer_thread([&]() {
        try {
            ensureStreamActive(admin,
                               config.stream_name,
                               config.shard_count,
                               std::chrono::milliseconds(config.stream_poll_interval_ms),
                               std::chrono::milliseconds(config.stream_active_timeout_ms),
                               stop);

            std::cout << "Streams:";
            for (const auto& name : admin.listStreams()) {
                std::cout << " " << name;
            }
            std::cout << std::endl;

            ProducerLoop loop(producer, stop, std::chrono::milliseconds(config.retry_backoff_ms));
            if (!loop.run()) {
                exit_code = 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Producer failed: " << e.what() << std::endl;
            exit_code = 1;
        }
        producer_exited = true;
    });

    waitForSignal([&producer_exited]() { return producer_exited.load(); });

    stop.trigger();
    producer_thread.join();
    producer.shutdown();
    return exit_code;
}

int main(int argc, char** argv) {
    try {
        // Set up signal handlers
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (argc >= 2 && std::strcmp(argv[1], "run") == 0) {
            if (argc == 2) {
                return runConsumer();
            }
            if (argc == 3 && std::strcmp(argv[2], "delete-resources") == 0) {
                return deleteResources();
            }
        } else if (argc == 2 && std::strcmp(argv[1], "produce") == 0) {
            return runProducer();
        }

        printUsage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        std::cerr << "Please set required environment variables:" << std::endl;
        std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses" << std::endl;
        std::cerr << "  STREAM_NAME - Stream name (optional, defaults to 'myFirstStream')" << std::endl;
        return 1;
    }
}
