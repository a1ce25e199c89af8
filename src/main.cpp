#include "config.hpp"
#include "health_server.hpp"
#include "consumer/shard_stream.hpp"
#include "consumer/checkpoint_pipe.hpp"
#include "consumer/stream_errors.hpp"
#include "kafka/kafka_shard_coordinator.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <cstdlib>

std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down gracefully..." << std::endl;
    g_running = false;
}

int main() {
    try {
        // Set up signal handlers
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Load configuration from environment
        ConsumerSettings settings = ConsumerSettings::fromEnv();
        CheckpointSettings checkpoint_settings = CheckpointSettings::fromEnv();

        // Get health server port from environment (default: 8080)
        int health_port = 8080;
        const char* health_port_str = std::getenv("HEALTH_PORT");
        if (health_port_str) {
            health_port = std::atoi(health_port_str);
        }

        std::unique_ptr<RecordStream> records = readFromStream(settings, KafkaShardCoordinator::factory());
        std::unique_ptr<CheckpointPipe> pipe = checkpointRecords(*records, checkpoint_settings);

        // Start health server in a separate thread
        HealthServer health_server(records->chunks(), pipe.get());
        std::thread health_thread([&health_server, health_port]() {
            health_server.start("0.0.0.0", health_port);
        });

        // Cancel the pipe once a signal arrives; next() then returns false
        std::thread shutdown_watcher([&pipe]() {
            while (g_running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            pipe->cancel();
        });

        std::cout << "Shard stream tail started on stream " << settings.stream_name
                  << " for application " << settings.app_name << std::endl;
        std::cout << "Checkpoint settings: " << checkpoint_settings.max_batch_size << " records or "
                  << checkpoint_settings.max_batch_wait.count() << " ms per shard, "
                  << (checkpoint_settings.output == CheckpointOutput::PassThrough ? "pass_through" : "checkpointed_only")
                  << " output" << std::endl;

        int exit_code = 0;
        try {
            Record record;
            while (pipe->next(record)) {
                std::cout << "Record " << record.sequence_number
                          << " (key: " << record.partition_key
                          << ", " << record.data.size() << " bytes)" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Stream terminated: " << e.what() << std::endl;
            exit_code = 1;
        }

        g_running = false;
        shutdown_watcher.join();

        health_server.stop();
        health_thread.join();

        std::cout << "Shard stream tail stopped" << std::endl;
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        std::cerr << "Please set required environment variables:" << std::endl;
        std::cerr << "  STREAM_NAME - Stream (topic) to read" << std::endl;
        std::cerr << "  APPLICATION_NAME - Application (consumer group) name" << std::endl;
        std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses" << std::endl;
        std::cerr << "Optional:" << std::endl;
        std::cerr << "  BUFFER_SIZE - Chunks buffered between shards and the reader (default: 10)" << std::endl;
        std::cerr << "  RETRIEVAL_MODE - polling or fanout (default: fanout)" << std::endl;
        std::cerr << "  INITIAL_POSITION - trim_horizon, latest or at_timestamp (default: latest)" << std::endl;
        std::cerr << "  INITIAL_TIMESTAMP_MS - Start timestamp for at_timestamp" << std::endl;
        std::cerr << "  MAX_RECORDS - Records per fetch in polling mode (default: 10000)" << std::endl;
        std::cerr << "  IDLE_TIME_BETWEEN_READS_MS - Sleep after an empty fetch (default: 1000)" << std::endl;
        std::cerr << "  CHECKPOINT_BATCH_SIZE - Records per checkpoint window (default: 1000)" << std::endl;
        std::cerr << "  CHECKPOINT_BATCH_WAIT_MS - Checkpoint window duration (default: 10000)" << std::endl;
        std::cerr << "  CHECKPOINT_OUTPUT - pass_through or checkpointed_only (default: pass_through)" << std::endl;
        std::cerr << "  HEALTH_PORT - Health/stats endpoint port (default: 8080)" << std::endl;
        return 1;
    }
}
