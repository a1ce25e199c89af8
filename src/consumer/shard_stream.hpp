#ifndef SHARD_STREAM_HPP
#define SHARD_STREAM_HPP

#include "../config.hpp"
#include "bounded_buffer.hpp"
#include "committable_record.hpp"
#include "shard_processor.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <cstdint>

enum class StreamState {
    Created,
    Running,
    Stopping,
    Stopped
};

const char* toString(StreamState state);

// Pull interface over committable records, consumed by the checkpoint pipes
class RecordSource {
public:
    virtual ~RecordSource() = default;

    // Blocks until a record is available. Returns false when the source
    // ended normally or was cancelled; throws on a terminal error.
    virtual bool next(CommittableRecord& out) = 0;

    // Stop producing; a blocked next() returns false. Safe from any thread.
    virtual void cancel() = 0;
};

// Chunked record stream over one coordinator run.
// The coordinator is created and started on the first next() call, on a
// dedicated thread, with a fresh worker id. Every exit path (cancel(),
// terminal error, coordinator exit, destruction) shuts the coordinator down
// exactly once and releases any shard thread blocked on the buffer.
class ShardStream {
public:
    ShardStream(const ConsumerSettings& settings, CoordinatorFactory coordinator_factory);
    ~ShardStream();

    ShardStream(const ShardStream&) = delete;
    ShardStream& operator=(const ShardStream&) = delete;

    // Blocks until a chunk arrives. Returns false after cancel().
    // Throws CoordinatorError if the coordinator stops on its own, and
    // BufferClosedError when pulled again after such a failure.
    bool next(Chunk& out);

    void cancel();

    StreamState getState() const { return state_.load(); }
    const std::string& getWorkerId() const { return worker_id_; }
    size_t getBufferedChunks() const { return buffer_.size(); }
    uint64_t getRecordsRead() const { return records_read_.load(); }

    // Random UUID (v4) text, used as the coordinator's worker identity
    static std::string generateWorkerId();

private:
    ConsumerSettings settings_;
    CoordinatorFactory coordinator_factory_;
    std::string worker_id_;

    BoundedBuffer<Chunk> buffer_;

    std::unique_ptr<ShardCoordinator> coordinator_;
    std::thread coordinator_thread_;

    std::atomic<StreamState> state_;
    std::atomic<bool> failed_;
    std::mutex lifecycle_mutex_;
    std::atomic<uint64_t> records_read_;

    void start();

    // Coordinator thread body
    void runCoordinator();

    // Shutdown path shared by every termination cause
    void stop();

    std::unique_ptr<ShardRecordProcessor> createProcessor();
};

// Flattens a ShardStream into single records
class RecordStream : public RecordSource {
public:
    RecordStream(const ConsumerSettings& settings, CoordinatorFactory coordinator_factory);
    explicit RecordStream(std::unique_ptr<ShardStream> chunks);

    // Returns false after cancel(), even with records of the current chunk left
    bool next(CommittableRecord& out) override;
    void cancel() override;

    ShardStream& chunks() { return *chunks_; }

private:
    std::unique_ptr<ShardStream> chunks_;
    Chunk current_;
    size_t position_;
    std::atomic<bool> cancelled_;
};

// Start reading a stream as chunks, one chunk per shard callback
std::unique_ptr<ShardStream> readChunkedFromStream(const ConsumerSettings& settings,
                                                   CoordinatorFactory coordinator_factory);

// Start reading a stream record by record
std::unique_ptr<RecordStream> readFromStream(const ConsumerSettings& settings,
                                             CoordinatorFactory coordinator_factory);

#endif // SHARD_STREAM_HPP
