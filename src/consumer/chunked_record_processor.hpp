#ifndef CHUNKED_RECORD_PROCESSOR_HPP
#define CHUNKED_RECORD_PROCESSOR_HPP

#include "shard_processor.hpp"
#include "committable_record.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <functional>

// Hands a chunk to the consumer side, blocking while it is full.
// Returns false once the consumer side has gone away.
using ChunkSink = std::function<bool(Chunk)>;

// Per-shard processor that wraps each delivered record into a
// CommittableRecord and pushes the batch into the stream buffer
class ChunkedRecordProcessor : public ShardRecordProcessor {
public:
    explicit ChunkedRecordProcessor(ChunkSink sink);

    void initialize(const InitializationInput& input) override;
    void processRecords(const ProcessRecordsInput& input) override;
    void leaseLost() override;
    void shardEnded(const std::shared_ptr<RecordCheckpointer>& checkpointer) override;
    void shutdownRequested(const std::shared_ptr<RecordCheckpointer>& checkpointer) override;

    const std::string& getShardId() const { return shard_id_; }

    // True once the lease was lost or shutdown was requested; checkpoint
    // actions created by this processor become no-ops from then on
    bool isShutdown() const { return shutdown_->load(); }

private:
    ChunkSink sink_;
    std::string shard_id_;
    std::string starting_sequence_number_;

    // Shared with the checkpoint actions, which may outlive the processor
    std::shared_ptr<std::atomic<bool>> shutdown_;

    CheckpointAction bindCheckpoint(const std::shared_ptr<RecordCheckpointer>& checkpointer,
                                    const Record& record) const;
};

#endif // CHUNKED_RECORD_PROCESSOR_HPP
