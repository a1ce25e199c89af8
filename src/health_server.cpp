#include "health_server.hpp"
#include <iostream>
#include <chrono>

HealthServer::HealthServer(ShardStream& stream, CheckpointPipe* pipe)
    : stream_(stream)
    , pipe_(pipe)
    , finished_(false) {
}

void HealthServer::setupRoutes(crow::SimpleApp& app) {
    // Health check endpoint
    CROW_ROUTE(app, "/health")
    ([]() {
        return crow::response(200, "OK");
    });

    // Ready once the coordinator is running
    CROW_ROUTE(app, "/ready")
    ([this]() {
        StreamState state = stream_.getState();
        if (state != StreamState::Running) {
            return crow::response(503, std::string("Stream ") + toString(state));
        }
        return crow::response(200, "OK");
    });

    CROW_ROUTE(app, "/stats")
    ([this]() {
        crow::json::wvalue stats;
        stats["worker_id"] = stream_.getWorkerId();
        stats["state"] = toString(stream_.getState());
        stats["records_read"] = stream_.getRecordsRead();
        stats["buffered_chunks"] = stream_.getBufferedChunks();
        if (pipe_) {
            stats["records_emitted"] = pipe_->getRecordsEmitted();
            stats["checkpoints"] = pipe_->getCheckpointCount();
            stats["active_shards"] = pipe_->getActiveShardCount();
        }
        return crow::response(200, stats);
    });
}

void HealthServer::start(const std::string& host, int port) {
    setupRoutes(app_);

    std::cout << "Health server running on port " << port << std::endl;
    std::cout << "  GET /health - Health check" << std::endl;
    std::cout << "  GET /ready - 200 once the stream is running" << std::endl;
    std::cout << "  GET /stats - Stream and checkpoint statistics" << std::endl;

    try {
        app_.bindaddr(host).port(port).multithreaded().run();
    } catch (const std::exception& e) {
        std::cerr << "Health server failed: " << e.what() << std::endl;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

void HealthServer::stop() {
    std::unique_lock<std::mutex> lock(mutex_);

    // A stop issued while the server is still starting is lost, so repeat it
    while (!finished_) {
        lock.unlock();
        app_.stop();
        lock.lock();
        finished_cv_.wait_for(lock, std::chrono::milliseconds(100), [this] { return finished_; });
    }
}
