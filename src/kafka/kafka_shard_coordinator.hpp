#ifndef KAFKA_SHARD_COORDINATOR_HPP
#define KAFKA_SHARD_COORDINATOR_HPP

#include "../config.hpp"
#include "../consumer/shard_processor.hpp"
#include <cppkafka/cppkafka.h>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <string>
#include <cstdint>
#include <chrono>

// Commits offsets for one partition of the consumer group.
// A Kafka offset is the record's sequence number; committing record R
// stores R + 1, the next offset to read.
class KafkaRecordCheckpointer : public RecordCheckpointer {
public:
    KafkaRecordCheckpointer(cppkafka::Consumer& consumer, const std::string& topic, int32_t partition);

    void checkpoint(const std::string& sequence_number, int64_t sub_sequence_number) override;

    // Kafka partitions never end
    void checkpointShardEnd() override;

    // Called when the partition is revoked or the consumer goes away;
    // later checkpoints are logged and skipped
    void invalidate();

    int64_t getLastCheckpointedOffset() const { return last_checkpointed_offset_.load(); }

private:
    cppkafka::Consumer& consumer_;
    std::string topic_;
    int32_t partition_;
    bool valid_;
    std::mutex mutex_;
    std::atomic<int64_t> last_checkpointed_offset_;
};

// Coordinator over a Kafka consumer group: the topic is the stream, the
// group id is the application and every assigned partition is a shard
// served by its own thread. Partition assignment, lease balancing and
// failover are left to the group protocol.
class KafkaShardCoordinator : public ShardCoordinator {
public:
    KafkaShardCoordinator(const ConsumerSettings& settings,
                          const std::string& worker_id,
                          ShardRecordProcessorFactory processor_factory);
    ~KafkaShardCoordinator() override;

    // Create the consumer and subscribe (must be called before run)
    bool initialize();

    // Serve rebalance events until shutdown() is called
    void run() override;

    void shutdown() override;

    size_t getShardCount() const;

    // Factory for ShardStream
    static CoordinatorFactory factory();

    static std::string shardIdFor(const std::string& topic, int32_t partition);

private:
    struct ShardWorker {
        explicit ShardWorker(cppkafka::Queue partition_queue) : queue(std::move(partition_queue)) {}

        int32_t partition = 0;
        std::string shard_id;
        std::unique_ptr<ShardRecordProcessor> processor;
        std::shared_ptr<KafkaRecordCheckpointer> checkpointer;
        cppkafka::Queue queue;
        std::string starting_sequence_number;
        std::thread thread;
        std::atomic<bool> stop_requested{false};
    };

    ConsumerSettings settings_;
    std::string worker_id_;
    ShardRecordProcessorFactory processor_factory_;

    std::unique_ptr<cppkafka::Configuration> kafka_config_;
    std::unique_ptr<cppkafka::Consumer> consumer_;

    // Active shards by partition
    std::map<int32_t, std::unique_ptr<ShardWorker>> shards_;
    mutable std::mutex shards_mutex_;

    std::atomic<bool> running_;
    std::atomic<bool> shutdown_requested_;
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    void onPartitionsAssigned(cppkafka::TopicPartitionList& partitions);
    void onPartitionsRevoked(const cppkafka::TopicPartitionList& partitions);

    // Move partitions without a committed offset to the configured timestamp
    void applyTimestampPosition(cppkafka::TopicPartitionList& partitions);

    void startShard(const cppkafka::TopicPartition& partition);
    void stopShard(int32_t partition);
    void shutdownShards();

    // Shard thread body
    void runShard(ShardWorker& shard);

    void idleWait(const ShardWorker& shard, std::chrono::milliseconds duration);
};

#endif // KAFKA_SHARD_COORDINATOR_HPP
