#ifndef HEALTH_SERVER_HPP
#define HEALTH_SERVER_HPP

#include "consumer/shard_stream.hpp"
#include "consumer/checkpoint_pipe.hpp"
#include <string>
#include <mutex>
#include <condition_variable>
#include "crow.h"

// Health, readiness and stats endpoints of the tail service.
// The pipe is optional; without it only stream counters are reported.
class HealthServer {
public:
    HealthServer(ShardStream& stream, CheckpointPipe* pipe);

    // Blocks serving requests until stop()
    void start(const std::string& host, int port);

    // Blocks until start() has returned
    void stop();

    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

private:
    ShardStream& stream_;
    CheckpointPipe* pipe_;
    crow::SimpleApp app_;

    bool finished_;
    std::mutex mutex_;
    std::condition_variable finished_cv_;
};

#endif // HEALTH_SERVER_HPP
