#ifndef SHARD_PROCESSOR_HPP
#define SHARD_PROCESSOR_HPP

#include "../config.hpp"
#include "committable_record.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

// Interfaces of the external coordinator that leases shards to this worker
// and calls back into one processor per leased shard.

// Commits a shard position on behalf of one shard processor
class RecordCheckpointer {
public:
    virtual ~RecordCheckpointer() = default;

    // Commit up to and including (sequence_number, sub_sequence_number)
    virtual void checkpoint(const std::string& sequence_number, int64_t sub_sequence_number) = 0;

    // Mark the shard as fully consumed (called once the shard has ended)
    virtual void checkpointShardEnd() = 0;
};

struct InitializationInput {
    std::string shard_id;
    std::string starting_sequence_number;
};

struct ProcessRecordsInput {
    std::vector<Record> records;
    int64_t millis_behind_latest = 0;
    std::shared_ptr<RecordCheckpointer> checkpointer;
};

// Callback target for a single shard. The coordinator calls one instance
// from one thread at a time, but different instances run concurrently.
class ShardRecordProcessor {
public:
    virtual ~ShardRecordProcessor() = default;

    virtual void initialize(const InitializationInput& input) = 0;
    virtual void processRecords(const ProcessRecordsInput& input) = 0;

    // Lease taken by another worker; checkpointing is no longer possible
    virtual void leaseLost() = 0;

    // Every record of the shard has been delivered
    virtual void shardEnded(const std::shared_ptr<RecordCheckpointer>& checkpointer) = 0;

    // The coordinator is shutting down this worker
    virtual void shutdownRequested(const std::shared_ptr<RecordCheckpointer>& checkpointer) = 0;
};

using ShardRecordProcessorFactory = std::function<std::unique_ptr<ShardRecordProcessor>()>;

// The coordinator itself: run() blocks for its whole lifetime,
// shutdown() is idempotent and may be called before or after run() returns.
class ShardCoordinator {
public:
    virtual ~ShardCoordinator() = default;

    virtual void run() = 0;
    virtual void shutdown() = 0;
};

using CoordinatorFactory = std::function<std::unique_ptr<ShardCoordinator>(
    const ConsumerSettings& settings,
    const std::string& worker_id,
    ShardRecordProcessorFactory processor_factory)>;

#endif // SHARD_PROCESSOR_HPP
