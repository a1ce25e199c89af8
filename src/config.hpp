#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdint>
#include <chrono>
#include <stdexcept>

// How the coordinator retrieves records from the source stream
enum class RetrievalMode {
    Polling,  // fetch in batches, sleep between empty reads
    FanOut    // records are pushed as soon as they arrive
};

enum class InitialPositionType {
    TrimHorizon,  // oldest record still retained
    Latest,       // only records arriving after start
    AtTimestamp
};

// Where a shard starts when no checkpoint exists for it yet
struct InitialPosition {
    InitialPositionType type = InitialPositionType::Latest;
    std::chrono::system_clock::time_point timestamp;  // only for AtTimestamp

    static InitialPosition trimHorizon() {
        InitialPosition position;
        position.type = InitialPositionType::TrimHorizon;
        return position;
    }

    static InitialPosition latest() {
        return InitialPosition();
    }

    static InitialPosition atTimestamp(std::chrono::system_clock::time_point ts) {
        InitialPosition position;
        position.type = InitialPositionType::AtTimestamp;
        position.timestamp = ts;
        return position;
    }
};

struct ConsumerSettings {
    std::string stream_name;
    std::string app_name;
    size_t buffer_size = 10;  // max chunks held between shard callbacks and the consumer
    RetrievalMode retrieval_mode = RetrievalMode::FanOut;
    InitialPosition initial_position;

    // Kafka coordinator binding
    std::string brokers;
    int max_records = 10000;
    int idle_time_between_reads_ms = 1000;

    void validate() const {
        if (stream_name.empty()) {
            throw std::invalid_argument("stream name must not be empty");
        }
        if (app_name.empty()) {
            throw std::invalid_argument("application name must not be empty");
        }
        if (buffer_size == 0) {
            throw std::invalid_argument("buffer size must be greater than 0");
        }
        if (max_records <= 0) {
            throw std::invalid_argument("max records must be greater than 0");
        }
        if (idle_time_between_reads_ms < 0) {
            throw std::invalid_argument("idle time between reads must not be negative");
        }
    }

    static RetrievalMode parseRetrievalMode(const std::string& value) {
        if (value == "polling") {
            return RetrievalMode::Polling;
        }
        if (value == "fanout") {
            return RetrievalMode::FanOut;
        }
        throw std::invalid_argument("Unknown retrieval mode: " + value);
    }

    static InitialPosition parseInitialPosition(const std::string& value, int64_t timestamp_ms) {
        if (value == "trim_horizon") {
            return InitialPosition::trimHorizon();
        }
        if (value == "latest") {
            return InitialPosition::latest();
        }
        if (value == "at_timestamp") {
            if (timestamp_ms < 0) {
                throw std::invalid_argument("INITIAL_TIMESTAMP_MS is required for at_timestamp");
            }
            return InitialPosition::atTimestamp(
                std::chrono::system_clock::time_point(std::chrono::milliseconds(timestamp_ms)));
        }
        throw std::invalid_argument("Unknown initial position: " + value);
    }

    static ConsumerSettings fromEnv() {
        ConsumerSettings config;

        const char* stream = std::getenv("STREAM_NAME");
        if (!stream || strlen(stream) == 0) {
            throw std::runtime_error("STREAM_NAME environment variable is required");
        }
        config.stream_name = stream;

        const char* app = std::getenv("APPLICATION_NAME");
        if (!app || strlen(app) == 0) {
            throw std::runtime_error("APPLICATION_NAME environment variable is required");
        }
        config.app_name = app;

        const char* brokers = std::getenv("KAFKA_BROKERS");
        if (brokers) {
            config.brokers = brokers;
        }

        const char* buffer_size = std::getenv("BUFFER_SIZE");
        if (buffer_size) {
            long long value = std::atoll(buffer_size);
            config.buffer_size = value > 0 ? static_cast<size_t>(value) : 0;
        }

        const char* mode = std::getenv("RETRIEVAL_MODE");
        if (mode && strlen(mode) > 0) {
            config.retrieval_mode = parseRetrievalMode(mode);
        }

        const char* position = std::getenv("INITIAL_POSITION");
        if (position && strlen(position) > 0) {
            const char* timestamp = std::getenv("INITIAL_TIMESTAMP_MS");
            int64_t timestamp_ms = timestamp ? std::atoll(timestamp) : -1;
            config.initial_position = parseInitialPosition(position, timestamp_ms);
        }

        const char* max_records = std::getenv("MAX_RECORDS");
        if (max_records) {
            config.max_records = std::atoi(max_records);
        }

        const char* idle_time = std::getenv("IDLE_TIME_BETWEEN_READS_MS");
        if (idle_time) {
            config.idle_time_between_reads_ms = std::atoi(idle_time);
        }

        config.validate();
        return config;
    }
};

// What the checkpoint pipe emits
enum class CheckpointOutput {
    PassThrough,      // every record as soon as it is dispatched; checkpoints run beside it
    CheckpointedOnly  // only the checkpointed (latest) record of each window
};

struct CheckpointSettings {
    size_t max_batch_size = 1000;
    std::chrono::milliseconds max_batch_wait{10000};
    CheckpointOutput output = CheckpointOutput::PassThrough;

    void validate() const {
        if (max_batch_size == 0) {
            throw std::invalid_argument("checkpoint batch size must be greater than 0");
        }
        if (max_batch_wait.count() <= 0) {
            throw std::invalid_argument("checkpoint batch wait must be greater than 0");
        }
    }

    static CheckpointOutput parseOutput(const std::string& value) {
        if (value == "pass_through") {
            return CheckpointOutput::PassThrough;
        }
        if (value == "checkpointed_only") {
            return CheckpointOutput::CheckpointedOnly;
        }
        throw std::invalid_argument("Unknown checkpoint output: " + value);
    }

    static CheckpointSettings fromEnv() {
        CheckpointSettings config;

        const char* batch_size = std::getenv("CHECKPOINT_BATCH_SIZE");
        if (batch_size) {
            long long value = std::atoll(batch_size);
            config.max_batch_size = value > 0 ? static_cast<size_t>(value) : 0;
        }

        const char* batch_wait = std::getenv("CHECKPOINT_BATCH_WAIT_MS");
        if (batch_wait) {
            config.max_batch_wait = std::chrono::milliseconds(std::atoll(batch_wait));
        }

        const char* output = std::getenv("CHECKPOINT_OUTPUT");
        if (output && strlen(output) > 0) {
            config.output = parseOutput(output);
        }

        config.validate();
        return config;
    }
};

#endif // CONFIG_HPP
