#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "../src/config.hpp"
#include "../src/consumer/shard_processor.hpp"
#include "../src/consumer/shard_stream.hpp"
#include "../src/consumer/bounded_buffer.hpp"
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

// Records checkpoint calls, optionally failing them
class RecordingCheckpointer : public RecordCheckpointer {
public:
    void checkpoint(const std::string& sequence_number, int64_t sub_sequence_number) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            throw std::runtime_error("lease expired");
        }
        calls_.emplace_back(sequence_number, sub_sequence_number);
    }

    void checkpointShardEnd() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++shard_end_calls_;
    }

    std::vector<std::pair<std::string, int64_t>> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> sequenceNumbers() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& call : calls_) {
            result.push_back(call.first);
        }
        return result;
    }

    int shardEndCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shard_end_calls_;
    }

    void setFail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

private:
    std::mutex mutex_;
    std::vector<std::pair<std::string, int64_t>> calls_;
    int shard_end_calls_ = 0;
    bool fail_ = false;
};

// Observable state of the fake coordinators created by one factory
struct FakeCoordinatorState {
    std::mutex mutex;
    std::condition_variable cv;

    int created = 0;
    int run_calls = 0;
    int shutdown_calls = 0;
    bool running = false;
    bool shutdown = false;
    bool exit_run = false;       // make run() return on its own
    std::string fail_message;    // make run() throw
    std::vector<std::string> worker_ids;
    ShardRecordProcessorFactory processor_factory;

    bool waitUntilRunning(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return running; });
    }

    void exitRun() {
        std::lock_guard<std::mutex> lock(mutex);
        exit_run = true;
        cv.notify_all();
    }

    void failRun(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        fail_message = message;
        cv.notify_all();
    }

    int createdCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return created;
    }

    std::vector<std::string> workerIds() {
        std::lock_guard<std::mutex> lock(mutex);
        return worker_ids;
    }

    int shutdownCalls() {
        std::lock_guard<std::mutex> lock(mutex);
        return shutdown_calls;
    }

    ShardRecordProcessorFactory processorFactory() {
        std::lock_guard<std::mutex> lock(mutex);
        return processor_factory;
    }
};

// Coordinator whose run() blocks until shutdown(), exitRun() or failRun()
class FakeCoordinator : public ShardCoordinator {
public:
    explicit FakeCoordinator(std::shared_ptr<FakeCoordinatorState> state)
        : state_(std::move(state)) {
    }

    void run() override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        ++state_->run_calls;
        state_->running = true;
        state_->cv.notify_all();

        state_->cv.wait(lock, [this] {
            return state_->shutdown || state_->exit_run || !state_->fail_message.empty();
        });
        state_->running = false;

        if (!state_->shutdown && !state_->fail_message.empty()) {
            throw std::runtime_error(state_->fail_message);
        }
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->shutdown_calls;
        state_->shutdown = true;
        state_->cv.notify_all();
    }

private:
    std::shared_ptr<FakeCoordinatorState> state_;
};

inline CoordinatorFactory fakeCoordinatorFactory(std::shared_ptr<FakeCoordinatorState> state) {
    return [state](const ConsumerSettings&,
                   const std::string& worker_id,
                   ShardRecordProcessorFactory processor_factory) -> std::unique_ptr<ShardCoordinator> {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->created;
            state->worker_ids.push_back(worker_id);
            state->processor_factory = std::move(processor_factory);
        }
        return std::make_unique<FakeCoordinator>(state);
    };
}

// One leased shard driven the way a coordinator drives it
class FakeShard {
public:
    FakeShard(const ShardRecordProcessorFactory& factory, const std::string& shard_id)
        : processor_(factory())
        , checkpointer_(std::make_shared<RecordingCheckpointer>()) {
        InitializationInput init;
        init.shard_id = shard_id;
        processor_->initialize(init);
    }

    void deliver(const std::vector<std::string>& sequence_numbers) {
        ProcessRecordsInput input;
        input.checkpointer = checkpointer_;
        for (const auto& seq : sequence_numbers) {
            Record record;
            record.sequence_number = seq;
            record.data = seq;
            input.records.push_back(record);
        }
        processor_->processRecords(input);
    }

    ShardRecordProcessor& processor() { return *processor_; }
    const std::shared_ptr<RecordingCheckpointer>& checkpointer() const { return checkpointer_; }

private:
    std::unique_ptr<ShardRecordProcessor> processor_;
    std::shared_ptr<RecordingCheckpointer> checkpointer_;
};

// RecordSource fed directly by the test
class FakeRecordSource : public RecordSource {
public:
    explicit FakeRecordSource(size_t capacity = 1024)
        : buffer_(capacity), cancel_calls_(0) {
    }

    void push(const std::string& shard_id, const std::string& sequence_number,
              std::shared_ptr<RecordingCheckpointer> checkpointer) {
        CommittableRecord committable;
        committable.shard_id = shard_id;
        committable.record.sequence_number = sequence_number;
        committable.record.data = shard_id + ":" + sequence_number;
        committable.checkpoint_action = [checkpointer, sequence_number]() {
            checkpointer->checkpoint(sequence_number, 0);
        };
        buffer_.enqueue(std::move(committable));
    }

    void end() { buffer_.close(); }

    void fail(const std::string& message) {
        buffer_.fail(std::make_exception_ptr(std::runtime_error(message)));
    }

    bool next(CommittableRecord& out) override {
        return buffer_.dequeue(out);
    }

    void cancel() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancel_calls_;
        buffer_.close();
    }

    int cancelCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancel_calls_;
    }

private:
    BoundedBuffer<CommittableRecord> buffer_;
    std::mutex mutex_;
    int cancel_calls_;
};

inline ConsumerSettings testConsumerSettings(size_t buffer_size = 10) {
    ConsumerSettings settings;
    settings.stream_name = "test-stream";
    settings.app_name = "test-app";
    settings.buffer_size = buffer_size;
    return settings;
}

#endif // TEST_FAKES_HPP
