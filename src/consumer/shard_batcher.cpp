#include "shard_batcher.hpp"
#include <iostream>
#include <algorithm>

ShardBatcher::ShardBatcher(const std::string& shard_id,
                           const CheckpointSettings& settings,
                           RecordEmitCallback emit_callback,
                           CheckpointFailureCallback failure_callback)
    : shard_id_(shard_id)
    , settings_(settings)
    , emit_callback_(std::move(emit_callback))
    , failure_callback_(std::move(failure_callback))
    , inbox_(settings.max_batch_size)
    , running_(false)
    , stop_requested_(false)
    , retired_(false)
    , checkpoints_(0) {
}

ShardBatcher::~ShardBatcher() {
    signalStop();
    join();
}

void ShardBatcher::start() {
    if (running_) {
        return;
    }

    running_ = true;
    worker_thread_ = std::thread(&ShardBatcher::run, this);
}

bool ShardBatcher::enqueue(CommittableRecord& record) {
    if (stop_requested_) {
        return false;
    }
    return inbox_.enqueue(std::move(record));
}

void ShardBatcher::finish() {
    inbox_.close();
}

void ShardBatcher::signalStop() {
    stop_requested_ = true;
    inbox_.close();
}

void ShardBatcher::join() {
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void ShardBatcher::run() {
    std::cout << "Shard " << shard_id_ << ": Batcher started ("
              << settings_.max_batch_size << " records or "
              << settings_.max_batch_wait.count() << " ms)" << std::endl;

    std::vector<CommittableRecord> window;
    window.reserve(settings_.max_batch_size);
    std::chrono::steady_clock::time_point deadline;

    while (!stop_requested_) {
        // Time trigger
        if (!window.empty() && std::chrono::steady_clock::now() >= deadline) {
            if (!closeWindow(window)) {
                break;
            }
            continue;
        }

        CommittableRecord record;
        DequeueResult result;
        if (window.empty()) {
            result = inbox_.dequeueUntil(record, std::chrono::steady_clock::now() + settings_.max_batch_wait);
            if (result == DequeueResult::Timeout) {
                // Idle: retire unless a record raced in
                if (inbox_.closeIfEmpty()) {
                    retired_ = true;
                    std::cout << "Shard " << shard_id_ << ": Batcher idle, retiring" << std::endl;
                    break;
                }
                continue;
            }
        } else {
            result = inbox_.dequeueUntil(record, deadline);
        }

        if (stop_requested_) {
            break;
        }

        if (result == DequeueResult::Item) {
            if (window.empty()) {
                deadline = std::chrono::steady_clock::now() + settings_.max_batch_wait;
            }
            window.push_back(std::move(record));

            // Count trigger
            if (window.size() >= settings_.max_batch_size && !closeWindow(window)) {
                break;
            }
        } else if (result == DequeueResult::Timeout) {
            if (!closeWindow(window)) {
                break;
            }
        } else {
            // Upstream finished, close the final partial window
            if (!window.empty()) {
                closeWindow(window);
            }
            break;
        }
    }

    running_ = false;
    std::cout << "Shard " << shard_id_ << ": Batcher stopped after "
              << checkpoints_.load() << " checkpoints" << std::endl;
}

bool ShardBatcher::closeWindow(std::vector<CommittableRecord>& window) {
    if (window.empty()) {
        return true;
    }
    if (stop_requested_) {
        return false;
    }

    auto latest = std::max_element(window.begin(), window.end(), SequenceNumberOrder());

    try {
        latest->checkpoint();
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id_ << ": Checkpoint failed: " << e.what() << std::endl;
        window.clear();
        stop_requested_ = true;
        inbox_.close();
        if (failure_callback_) {
            failure_callback_(shard_id_, std::current_exception());
        }
        return false;
    }
    ++checkpoints_;

    // Pass-through output already carries every record
    bool emitted = true;
    if (settings_.output == CheckpointOutput::CheckpointedOnly) {
        emitted = emit_callback_(std::move(latest->record));
    }

    window.clear();
    return emitted;
}
