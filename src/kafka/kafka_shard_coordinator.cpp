#include "kafka_shard_coordinator.hpp"
#include <iostream>
#include <vector>
#include <stdexcept>
#include <algorithm>

KafkaRecordCheckpointer::KafkaRecordCheckpointer(cppkafka::Consumer& consumer,
                                                 const std::string& topic,
                                                 int32_t partition)
    : consumer_(consumer)
    , topic_(topic)
    , partition_(partition)
    , valid_(true)
    , last_checkpointed_offset_(-1) {
}

void KafkaRecordCheckpointer::checkpoint(const std::string& sequence_number, int64_t sub_sequence_number) {
    (void)sub_sequence_number;  // Kafka offsets have no sub-sequence

    int64_t offset = std::stoll(sequence_number);
    if (offset < 0) {
        throw std::invalid_argument("Invalid offset for partition " + std::to_string(partition_) +
                                    ": " + sequence_number);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!valid_) {
        // Lost in a rebalance; the new owner resumes from its last commit
        std::cerr << "Partition " << partition_ << ": Skipping checkpoint at " << sequence_number
                  << ", partition is no longer owned by this worker" << std::endl;
        return;
    }

    // Synchronous commit of the next offset to read
    consumer_.commit(cppkafka::TopicPartitionList{
        cppkafka::TopicPartition(topic_, partition_, offset + 1)
    });
    last_checkpointed_offset_ = offset;

    std::cout << "Partition " << partition_ << ": Committed offset " << (offset + 1) << std::endl;
}

void KafkaRecordCheckpointer::checkpointShardEnd() {
    std::cout << "Partition " << partition_ << ": Shard end checkpoint ignored" << std::endl;
}

void KafkaRecordCheckpointer::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    valid_ = false;
}

KafkaShardCoordinator::KafkaShardCoordinator(const ConsumerSettings& settings,
                                             const std::string& worker_id,
                                             ShardRecordProcessorFactory processor_factory)
    : settings_(settings)
    , worker_id_(worker_id)
    , processor_factory_(std::move(processor_factory))
    , running_(false)
    , shutdown_requested_(false) {
}

KafkaShardCoordinator::~KafkaShardCoordinator() {
    shutdown();
    shutdownShards();

    // Partition queues and rebalance callbacks reference this object,
    // destroy the consumer while the shard map is still alive
    consumer_.reset();
}

bool KafkaShardCoordinator::initialize() {
    try {
        std::string offset_reset =
            settings_.initial_position.type == InitialPositionType::Latest ? "latest" : "earliest";

        kafka_config_ = std::make_unique<cppkafka::Configuration>(cppkafka::Configuration{
            {"metadata.broker.list", settings_.brokers},
            {"group.id", settings_.app_name},
            {"client.id", worker_id_},
            {"enable.auto.commit", "false"},  // Offsets are committed by checkpoint actions
            {"auto.offset.reset", offset_reset},
            {"enable.partition.eof", "false"},
        });

        consumer_ = std::make_unique<cppkafka::Consumer>(*kafka_config_);

        consumer_->set_assignment_callback([this](cppkafka::TopicPartitionList& partitions) {
            onPartitionsAssigned(partitions);
        });

        consumer_->set_revocation_callback([this](const cppkafka::TopicPartitionList& partitions) {
            onPartitionsRevoked(partitions);
        });

        consumer_->subscribe({settings_.stream_name});

        std::cout << "KafkaShardCoordinator initialized with brokers: " << settings_.brokers
                  << ", stream: " << settings_.stream_name
                  << ", application: " << settings_.app_name
                  << ", worker: " << worker_id_ << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize KafkaShardCoordinator: " << e.what() << std::endl;
        return false;
    }
}

void KafkaShardCoordinator::run() {
    if (!consumer_) {
        throw std::runtime_error("Coordinator not initialized. Call initialize() first.");
    }

    running_ = true;
    std::cout << "Starting shard coordinator..." << std::endl;

    try {
        // Serves rebalance callbacks; records arrive on the partition queues
        while (!shutdown_requested_) {
            cppkafka::Message msg = consumer_->poll(std::chrono::milliseconds(100));
            if (!msg) {
                continue;
            }

            if (msg.get_error()) {
                if (!msg.is_eof()) {
                    std::cerr << "Consumer error: " << msg.get_error() << std::endl;
                }
                continue;
            }

            std::cerr << "Partition " << msg.get_partition() << ": Unexpected record at offset "
                      << msg.get_offset() << " on the group queue" << std::endl;
        }
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Kafka error in coordinator: " << e.what() << std::endl;
        shutdownShards();
        running_ = false;
        throw;
    }

    shutdownShards();

    try {
        consumer_->unsubscribe();
    } catch (const std::exception& e) {
        std::cerr << "Error during consumer shutdown: " << e.what() << std::endl;
    }

    running_ = false;
    std::cout << "Shard coordinator stopped" << std::endl;
}

void KafkaShardCoordinator::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }

    std::cout << "Shard coordinator shutdown requested" << std::endl;
    std::lock_guard<std::mutex> lock(idle_mutex_);
    idle_cv_.notify_all();
}

size_t KafkaShardCoordinator::getShardCount() const {
    std::lock_guard<std::mutex> lock(shards_mutex_);
    return shards_.size();
}

CoordinatorFactory KafkaShardCoordinator::factory() {
    return [](const ConsumerSettings& settings,
              const std::string& worker_id,
              ShardRecordProcessorFactory processor_factory) -> std::unique_ptr<ShardCoordinator> {
        if (settings.brokers.empty()) {
            throw std::invalid_argument("KAFKA_BROKERS is required for the Kafka coordinator");
        }

        auto coordinator = std::make_unique<KafkaShardCoordinator>(
            settings, worker_id, std::move(processor_factory));
        if (!coordinator->initialize()) {
            throw std::runtime_error("Failed to initialize Kafka coordinator");
        }
        return coordinator;
    };
}

std::string KafkaShardCoordinator::shardIdFor(const std::string& topic, int32_t partition) {
    return topic + "-" + std::to_string(partition);
}

void KafkaShardCoordinator::onPartitionsAssigned(cppkafka::TopicPartitionList& partitions) {
    std::cout << "Partitions assigned: ";
    for (const auto& tp : partitions) {
        std::cout << tp.get_partition() << " ";
    }
    std::cout << std::endl;

    if (settings_.initial_position.type == InitialPositionType::AtTimestamp) {
        applyTimestampPosition(partitions);
    }

    for (const auto& tp : partitions) {
        startShard(tp);
    }
}

void KafkaShardCoordinator::onPartitionsRevoked(const cppkafka::TopicPartitionList& partitions) {
    std::cout << "Partitions revoked: ";
    for (const auto& tp : partitions) {
        std::cout << tp.get_partition() << " ";
    }
    std::cout << std::endl;

    for (const auto& tp : partitions) {
        stopShard(tp.get_partition());
    }
}

void KafkaShardCoordinator::applyTimestampPosition(cppkafka::TopicPartitionList& partitions) {
    try {
        cppkafka::TopicPartitionList committed = consumer_->get_offsets_committed(partitions);

        auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            settings_.initial_position.timestamp.time_since_epoch());

        std::map<cppkafka::TopicPartition, std::chrono::milliseconds> queries;
        for (const auto& tp : committed) {
            // A committed offset wins over the initial position
            if (tp.get_offset() < 0) {
                queries[cppkafka::TopicPartition(tp.get_topic(), tp.get_partition())] = timestamp;
            }
        }

        if (queries.empty()) {
            return;
        }

        cppkafka::TopicPartitionList resolved = consumer_->get_offsets_for_times(queries);
        for (auto& tp : partitions) {
            for (const auto& position : resolved) {
                if (position.get_partition() == tp.get_partition() && position.get_offset() >= 0) {
                    tp.set_offset(position.get_offset());
                    std::cout << "Partition " << tp.get_partition() << ": Starting at offset "
                              << position.get_offset() << " for timestamp "
                              << timestamp.count() << std::endl;
                }
            }
        }
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Failed to resolve initial timestamp position: " << e.what() << std::endl;
    }
}

void KafkaShardCoordinator::startShard(const cppkafka::TopicPartition& partition) {
    int32_t id = partition.get_partition();

    {
        std::lock_guard<std::mutex> lock(shards_mutex_);
        if (shards_.find(id) != shards_.end()) {
            return;
        }
    }

    // Detach the partition queue from the group queue before the assignment
    // starts fetching
    cppkafka::Queue queue = consumer_->get_partition_queue(partition);
    queue.disable_queue_forwarding();

    auto shard = std::make_unique<ShardWorker>(std::move(queue));
    shard->partition = id;
    shard->shard_id = shardIdFor(settings_.stream_name, id);
    shard->processor = processor_factory_();
    shard->checkpointer = std::make_shared<KafkaRecordCheckpointer>(*consumer_, settings_.stream_name, id);
    if (partition.get_offset() >= 0) {
        shard->starting_sequence_number = std::to_string(partition.get_offset());
    }

    ShardWorker* raw = shard.get();
    {
        std::lock_guard<std::mutex> lock(shards_mutex_);
        shards_[id] = std::move(shard);
    }
    raw->thread = std::thread(&KafkaShardCoordinator::runShard, this, std::ref(*raw));

    std::cout << "Partition " << id << ": Started shard " << raw->shard_id << std::endl;
}

void KafkaShardCoordinator::stopShard(int32_t partition) {
    std::unique_ptr<ShardWorker> shard;
    {
        std::lock_guard<std::mutex> lock(shards_mutex_);
        auto it = shards_.find(partition);
        if (it == shards_.end()) {
            return;
        }
        shard = std::move(it->second);
        shards_.erase(it);
    }

    shard->stop_requested = true;
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_cv_.notify_all();
    }
    if (shard->thread.joinable()) {
        shard->thread.join();
    }

    try {
        shard->processor->leaseLost();
    } catch (const std::exception& e) {
        std::cerr << "Partition " << partition << ": Error in lease lost handler: " << e.what() << std::endl;
    }
    shard->checkpointer->invalidate();

    std::cout << "Partition " << partition << ": Stopped shard " << shard->shard_id << std::endl;
}

void KafkaShardCoordinator::shutdownShards() {
    std::map<int32_t, std::unique_ptr<ShardWorker>> shards;
    {
        std::lock_guard<std::mutex> lock(shards_mutex_);
        shards.swap(shards_);
    }

    if (shards.empty()) {
        return;
    }

    for (auto& kv : shards) {
        kv.second->stop_requested = true;
    }
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_cv_.notify_all();
    }

    for (auto& kv : shards) {
        ShardWorker& shard = *kv.second;
        if (shard.thread.joinable()) {
            shard.thread.join();
        }

        try {
            shard.processor->shutdownRequested(shard.checkpointer);
        } catch (const std::exception& e) {
            std::cerr << "Partition " << shard.partition << ": Error in shutdown handler: "
                      << e.what() << std::endl;
        }
        shard.checkpointer->invalidate();
    }

    std::cout << "Stopped " << shards.size() << " shards" << std::endl;
}

void KafkaShardCoordinator::runShard(ShardWorker& shard) {
    const bool polling = settings_.retrieval_mode == RetrievalMode::Polling;

    // Fan-out keeps a fetch outstanding; polling drains and then idles
    const std::chrono::milliseconds fetch_timeout = polling
        ? std::chrono::milliseconds(0)
        : std::chrono::milliseconds(200);

    try {
        InitializationInput init;
        init.shard_id = shard.shard_id;
        init.starting_sequence_number = shard.starting_sequence_number;
        shard.processor->initialize(init);

        while (!shard.stop_requested && !shutdown_requested_) {
            std::vector<cppkafka::Message> messages =
                shard.queue.consume_batch(static_cast<size_t>(settings_.max_records), fetch_timeout);

            ProcessRecordsInput input;
            input.checkpointer = shard.checkpointer;
            int64_t newest_timestamp_ms = -1;

            for (const auto& msg : messages) {
                if (msg.get_error()) {
                    if (!msg.is_eof()) {
                        std::cerr << "Partition " << shard.partition << ": Consumer error: "
                                  << msg.get_error() << std::endl;
                    }
                    continue;
                }

                Record record;
                record.sequence_number = std::to_string(msg.get_offset());
                record.sub_sequence_number = 0;
                record.partition_key = msg.get_key();
                record.data = msg.get_payload();

                auto timestamp = msg.get_timestamp();
                if (timestamp) {
                    std::chrono::milliseconds ms = timestamp->get_timestamp();
                    record.approximate_arrival_timestamp = std::chrono::system_clock::time_point(ms);
                    newest_timestamp_ms = ms.count();
                }

                input.records.push_back(std::move(record));
            }

            if (input.records.empty()) {
                if (polling) {
                    idleWait(shard, std::chrono::milliseconds(settings_.idle_time_between_reads_ms));
                }
                continue;
            }

            if (newest_timestamp_ms >= 0) {
                int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
                input.millis_behind_latest = std::max<int64_t>(0, now_ms - newest_timestamp_ms);
            }

            // Blocks while the stream buffer is full
            shard.processor->processRecords(input);
        }
    } catch (const std::exception& e) {
        std::cerr << "Partition " << shard.partition << ": Shard thread failed: " << e.what() << std::endl;
    }
}

void KafkaShardCoordinator::idleWait(const ShardWorker& shard, std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait_for(lock, duration, [this, &shard]() {
        return shard.stop_requested.load() || shutdown_requested_.load();
    });
}
