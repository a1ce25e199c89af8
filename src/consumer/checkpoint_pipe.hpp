#ifndef CHECKPOINT_PIPE_HPP
#define CHECKPOINT_PIPE_HPP

#include "../config.hpp"
#include "bounded_buffer.hpp"
#include "committable_record.hpp"
#include "shard_batcher.hpp"
#include "shard_stream.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <string>
#include <chrono>
#include <exception>

// Checkpoints records of a RecordSource in per-shard batches.
// Records are routed by shard id to a ShardBatcher created on the first
// record of each shard and torn down once idle; batchers run concurrently.
// With PassThrough output every record is emitted as soon as it is
// dispatched and checkpointing runs beside it. With CheckpointedOnly output
// only the checkpointed record of each window is emitted, merged in
// completion order. The source must outlive the pipe.
class CheckpointPipe {
public:
    CheckpointPipe(RecordSource& source, const CheckpointSettings& settings);
    ~CheckpointPipe();

    CheckpointPipe(const CheckpointPipe&) = delete;
    CheckpointPipe& operator=(const CheckpointPipe&) = delete;

    // Blocks until a record is available. Returns false when the source
    // ended (after every open window was checkpointed) or after cancel().
    // Throws CheckpointError, or the source's terminal error.
    bool next(Record& out);

    // Cancels the source as well
    void cancel();

    size_t getActiveShardCount() const;
    uint64_t getCheckpointCount() const;
    uint64_t getRecordsEmitted() const { return records_emitted_.load(); }

private:
    RecordSource& source_;
    CheckpointSettings settings_;

    BoundedBuffer<Record> output_;

    std::map<std::string, std::unique_ptr<ShardBatcher>> batchers_;
    uint64_t retired_checkpoints_;  // guarded by batchers_mutex_
    mutable std::mutex batchers_mutex_;

    std::thread dispatcher_thread_;
    std::atomic<bool> started_;
    std::atomic<bool> stop_requested_;
    bool stopped_;  // guarded by lifecycle_mutex_
    std::atomic<uint64_t> records_emitted_;
    std::mutex lifecycle_mutex_;

    void start();
    void stop();

    // Dispatcher thread body: pulls from the source and routes by shard
    void dispatch();

    // Hands the record to its shard's batcher, replacing a retired one.
    // Returns false once the pipe is stopping or the batcher failed.
    bool route(CommittableRecord& record);

    // Returns nullptr once the pipe is stopping
    ShardBatcher* batcherFor(const std::string& shard_id);

    // Joins and drops retired batchers; requires batchers_mutex_
    void reapRetiredBatchers();

    void onCheckpointFailure(const std::string& shard_id, std::exception_ptr error);

    void stopBatchers();
    void finishBatchers();
    void joinBatchers();
};

// Maps records to their payloads without checkpointing
class BypassPipe {
public:
    explicit BypassPipe(RecordSource& source);

    bool next(Record& out);
    void cancel();

private:
    RecordSource& source_;
};

std::unique_ptr<CheckpointPipe> checkpointRecords(RecordSource& source,
                                                  const CheckpointSettings& settings);

std::unique_ptr<CheckpointPipe> checkpointRecords(RecordSource& source,
                                                  size_t max_batch_size,
                                                  std::chrono::milliseconds max_batch_wait);

std::unique_ptr<BypassPipe> bypassCheckpoint(RecordSource& source);

#endif // CHECKPOINT_PIPE_HPP
