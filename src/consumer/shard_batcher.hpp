#ifndef SHARD_BATCHER_HPP
#define SHARD_BATCHER_HPP

#include "../config.hpp"
#include "bounded_buffer.hpp"
#include "committable_record.hpp"
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <exception>

// Passes a checkpointed record downstream (CheckpointedOnly output); false
// once the output is closed
using RecordEmitCallback = std::function<bool(Record)>;

// Notified when a checkpoint action fails for the shard
using CheckpointFailureCallback = std::function<void(const std::string& shard_id, std::exception_ptr error)>;

// Worker thread batching the records of a single shard.
// A window closes when max_batch_size records have accumulated or
// max_batch_wait has elapsed since its first record; the latest record of
// the window is then checkpointed. A batcher that stays idle for
// max_batch_wait with an empty window retires: its thread exits and it
// refuses further records.
class ShardBatcher {
public:
    ShardBatcher(const std::string& shard_id,
                 const CheckpointSettings& settings,
                 RecordEmitCallback emit_callback,
                 CheckpointFailureCallback failure_callback);
    ~ShardBatcher();

    // Start the worker thread
    void start();

    // Blocks while the inbox is full. Returns false once the batcher stopped
    // or retired; the record is only moved from on success.
    bool enqueue(CommittableRecord& record);

    // Upstream is done: close the open window, then exit
    void finish();

    // Exit without closing any further window; a checkpoint already in
    // progress completes
    void signalStop();

    void join();

    const std::string& getShardId() const { return shard_id_; }
    uint64_t getCheckpointCount() const { return checkpoints_.load(); }
    bool isRunning() const { return running_.load(); }
    bool isRetired() const { return retired_.load(); }

private:
    std::string shard_id_;
    CheckpointSettings settings_;
    RecordEmitCallback emit_callback_;
    CheckpointFailureCallback failure_callback_;

    BoundedBuffer<CommittableRecord> inbox_;

    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> retired_;
    std::atomic<uint64_t> checkpoints_;

    // Main worker loop
    void run();

    // Checkpoint the latest record of the window, emitting it in
    // CheckpointedOnly mode. Returns false when the batcher must stop.
    bool closeWindow(std::vector<CommittableRecord>& window);
};

#endif // SHARD_BATCHER_HPP
