#include "checkpoint_pipe.hpp"
#include <iostream>
#include <vector>

static size_t validatedOutputCapacity(const CheckpointSettings& settings) {
    settings.validate();
    return settings.max_batch_size;
}

CheckpointPipe::CheckpointPipe(RecordSource& source, const CheckpointSettings& settings)
    : source_(source)
    , settings_(settings)
    , output_(validatedOutputCapacity(settings))
    , retired_checkpoints_(0)
    , started_(false)
    , stop_requested_(false)
    , stopped_(false)
    , records_emitted_(0) {
}

CheckpointPipe::~CheckpointPipe() {
    stop();
}

bool CheckpointPipe::next(Record& out) {
    if (!started_) {
        start();
    }

    bool received = false;
    try {
        received = output_.dequeue(out);
    } catch (const std::exception& e) {
        std::cerr << "CheckpointPipe: Terminating: " << e.what() << std::endl;
        stop();
        throw;
    }

    if (!received) {
        stop();
        return false;
    }

    ++records_emitted_;
    return true;
}

void CheckpointPipe::cancel() {
    std::cout << "CheckpointPipe: Cancel requested" << std::endl;
    stop();
}

size_t CheckpointPipe::getActiveShardCount() const {
    std::lock_guard<std::mutex> lock(batchers_mutex_);
    size_t active = 0;
    for (const auto& kv : batchers_) {
        if (kv.second->isRunning()) {
            ++active;
        }
    }
    return active;
}

uint64_t CheckpointPipe::getCheckpointCount() const {
    std::lock_guard<std::mutex> lock(batchers_mutex_);
    uint64_t total = retired_checkpoints_;
    for (const auto& kv : batchers_) {
        total += kv.second->getCheckpointCount();
    }
    return total;
}

void CheckpointPipe::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_ || stopped_) {
        return;
    }

    started_ = true;
    dispatcher_thread_ = std::thread(&CheckpointPipe::dispatch, this);

    std::cout << "CheckpointPipe: Started (per-shard batches of " << settings_.max_batch_size
              << " records or " << settings_.max_batch_wait.count() << " ms, "
              << (settings_.output == CheckpointOutput::PassThrough ? "pass-through" : "checkpointed only")
              << " output)" << std::endl;
}

void CheckpointPipe::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;

    stop_requested_ = true;
    output_.close();
    stopBatchers();

    if (!started_) {
        return;
    }

    // Terminating the output terminates the source
    source_.cancel();

    if (dispatcher_thread_.joinable()) {
        dispatcher_thread_.join();
    }
    joinBatchers();

    std::cout << "CheckpointPipe: Stopped after " << getCheckpointCount() << " checkpoints, "
              << records_emitted_.load() << " records emitted" << std::endl;
}

void CheckpointPipe::dispatch() {
    try {
        CommittableRecord record;
        while (!stop_requested_ && source_.next(record)) {
            if (settings_.output == CheckpointOutput::PassThrough && !output_.enqueue(record.record)) {
                return;
            }
            if (!route(record)) {
                // Stopping, or the shard's batcher failed
                return;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "CheckpointPipe: Source failed: " << e.what() << std::endl;
        stop_requested_ = true;
        stopBatchers();
        output_.fail(std::current_exception());
        joinBatchers();
        return;
    }

    if (stop_requested_) {
        return;
    }

    std::cout << "CheckpointPipe: Source ended, closing open windows" << std::endl;
    finishBatchers();
    joinBatchers();
    output_.close();
}

bool CheckpointPipe::route(CommittableRecord& record) {
    while (true) {
        ShardBatcher* batcher = batcherFor(record.shard_id);
        if (!batcher) {
            return false;
        }
        if (batcher->enqueue(record)) {
            return true;
        }

        // Refused: the batcher is exiting, wait for it to settle
        batcher->join();
        if (!batcher->isRetired() || stop_requested_) {
            return false;
        }
    }
}

ShardBatcher* CheckpointPipe::batcherFor(const std::string& shard_id) {
    std::lock_guard<std::mutex> lock(batchers_mutex_);

    if (stop_requested_) {
        return nullptr;
    }

    auto it = batchers_.find(shard_id);
    if (it != batchers_.end() && !it->second->isRetired()) {
        return it->second.get();
    }

    reapRetiredBatchers();

    auto batcher = std::make_unique<ShardBatcher>(
        shard_id,
        settings_,
        [this](Record record) { return output_.enqueue(std::move(record)); },
        [this](const std::string& id, std::exception_ptr error) { onCheckpointFailure(id, error); }
    );
    batcher->start();

    ShardBatcher* raw = batcher.get();
    batchers_.emplace(shard_id, std::move(batcher));

    std::cout << "Shard " << shard_id << ": Created batcher" << std::endl;
    return raw;
}

void CheckpointPipe::reapRetiredBatchers() {
    for (auto it = batchers_.begin(); it != batchers_.end();) {
        if (!it->second->isRetired()) {
            ++it;
            continue;
        }
        // A retired batcher's thread has already left its loop
        it->second->join();
        retired_checkpoints_ += it->second->getCheckpointCount();
        std::cout << "Shard " << it->first << ": Removed idle batcher" << std::endl;
        it = batchers_.erase(it);
    }
}

void CheckpointPipe::onCheckpointFailure(const std::string& shard_id, std::exception_ptr error) {
    std::cerr << "Shard " << shard_id << ": Failing checkpoint pipe" << std::endl;

    // Records already emitted are still delivered, then next() throws
    stop_requested_ = true;
    output_.fail(error);
    stopBatchers();
}

void CheckpointPipe::stopBatchers() {
    std::lock_guard<std::mutex> lock(batchers_mutex_);
    for (auto& kv : batchers_) {
        kv.second->signalStop();
    }
}

void CheckpointPipe::finishBatchers() {
    std::lock_guard<std::mutex> lock(batchers_mutex_);
    for (auto& kv : batchers_) {
        kv.second->finish();
    }
}

void CheckpointPipe::joinBatchers() {
    // Join without the lock: a failing batcher takes it in its callback
    std::vector<ShardBatcher*> batchers;
    {
        std::lock_guard<std::mutex> lock(batchers_mutex_);
        for (auto& kv : batchers_) {
            batchers.push_back(kv.second.get());
        }
    }

    for (ShardBatcher* batcher : batchers) {
        batcher->join();
    }
}

BypassPipe::BypassPipe(RecordSource& source)
    : source_(source) {
}

bool BypassPipe::next(Record& out) {
    CommittableRecord committable;
    if (!source_.next(committable)) {
        return false;
    }
    out = std::move(committable.record);
    return true;
}

void BypassPipe::cancel() {
    source_.cancel();
}

std::unique_ptr<CheckpointPipe> checkpointRecords(RecordSource& source,
                                                  const CheckpointSettings& settings) {
    return std::make_unique<CheckpointPipe>(source, settings);
}

std::unique_ptr<CheckpointPipe> checkpointRecords(RecordSource& source,
                                                  size_t max_batch_size,
                                                  std::chrono::milliseconds max_batch_wait) {
    CheckpointSettings settings;
    settings.max_batch_size = max_batch_size;
    settings.max_batch_wait = max_batch_wait;
    return std::make_unique<CheckpointPipe>(source, settings);
}

std::unique_ptr<BypassPipe> bypassCheckpoint(RecordSource& source) {
    return std::make_unique<BypassPipe>(source);
}
