#ifndef HEALTH_SERVER_HPP
#define HEALTH_SERVER_HPP

#include "shard_coordinator.hpp"
#include "crow.h"
#include <functional>
#include <future>
#include <mutex>

// HTTP liveness and stats endpoints for a running consumer
class HealthServer {
public:
    using SnapshotProvider = std::function<CoordinatorSnapshot()>;

    explicit HealthServer(SnapshotProvider snapshot_provider);
    ~HealthServer();

    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

    // Serves on port from a background thread until stop()
    void start(int port);

    // Blocks until the server has shut down. Safe to call before start()
    // or while the server is still binding.
    void stop();

    static crow::json::wvalue toJson(const CoordinatorSnapshot& snapshot);

private:
    SnapshotProvider snapshot_provider_;
    crow::SimpleApp app_;
    std::mutex app_mutex_;
    std::future<void> server_future_;
    bool stopped_;
};

#endif // HEALTH_SERVER_HPP
