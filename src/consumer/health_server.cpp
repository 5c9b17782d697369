#include "health_server.hpp"
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

HealthServer::HealthServer(SnapshotProvider snapshot_provider)
    : snapshot_provider_(std::move(snapshot_provider))
    , stopped_(false) {
}

HealthServer::~HealthServer() {
    stop();
}

crow::json::wvalue HealthServer::toJson(const CoordinatorSnapshot& snapshot) {
    crow::json::wvalue stats;
    stats["worker_id"] = snapshot.worker_id;
    stats["crashed_workers"] = snapshot.crashed_workers;

    std::vector<crow::json::wvalue> active;
    for (const auto& shard : snapshot.active) {
        crow::json::wvalue entry;
        entry["shard_id"] = shard.shard_id;
        entry["state"] = shardWorkerStateName(shard.state);
        if (shard.last_checkpoint) {
            entry["last_checkpoint"] = static_cast<int64_t>(*shard.last_checkpoint);
        } else {
            entry["last_checkpoint"] = nullptr;
        }
        entry["applied"] = shard.stats.applied;
        entry["rejected"] = shard.stats.rejected;
        entry["skipped"] = shard.stats.skipped;
        entry["failed_attempts"] = shard.stats.failed_attempts;
        entry["checkpoints"] = shard.stats.checkpoints;
        active.push_back(std::move(entry));
    }
    stats["active_shards"] = std::move(active);

    std::vector<crow::json::wvalue> completed;
    for (const auto& shard_id : snapshot.completed) {
        completed.push_back(crow::json::wvalue(shard_id));
    }
    stats["completed_shards"] = std::move(completed);

    return stats;
}

void HealthServer::setupRoutes(crow::SimpleApp& app) {
    CROW_ROUTE(app, "/health")
    ([]() {
        return crow::response(200, "OK");
    });

    CROW_ROUTE(app, "/stats")
    ([this]() {
        crow::json::wvalue stats = toJson(snapshot_provider_());
        return crow::response(200, stats);
    });
}

void HealthServer::start(int port) {
    std::lock_guard<std::mutex> lock(app_mutex_);
    if (stopped_ || server_future_.valid()) {
        return;
    }
    setupRoutes(app_);

    std::cout << "Consumer health server running on port " << port << std::endl;
    std::cout << "  GET /health - Health check" << std::endl;
    std::cout << "  GET /stats  - Shard and worker statistics" << std::endl;

    server_future_ = app_.port(port).multithreaded().run_async();
}

void HealthServer::stop() {
    std::lock_guard<std::mutex> lock(app_mutex_);
    stopped_ = true;
    if (!server_future_.valid()) {
        return;
    }

    // App::stop() is a no-op until the server object exists, so repeat it
    // until the serving thread returns
    do {
        app_.stop();
    } while (server_future_.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready);

    try {
        server_future_.get();
    } catch (const std::exception& e) {
        std::cerr << "Health server error: " << e.what() << std::endl;
    }
}
