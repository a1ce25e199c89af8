#include "chunked_record_processor.hpp"
#include <iostream>
#include <stdexcept>

ChunkedRecordProcessor::ChunkedRecordProcessor(ChunkSink sink)
    : sink_(std::move(sink))
    , shutdown_(std::make_shared<std::atomic<bool>>(false)) {
}

void ChunkedRecordProcessor::initialize(const InitializationInput& input) {
    shard_id_ = input.shard_id;
    starting_sequence_number_ = input.starting_sequence_number;

    std::cout << "Shard " << shard_id_ << ": Processor initialized at sequence "
              << (starting_sequence_number_.empty() ? "<none>" : starting_sequence_number_)
              << std::endl;
}

void ChunkedRecordProcessor::processRecords(const ProcessRecordsInput& input) {
    if (input.records.empty()) {
        return;
    }

    Chunk chunk;
    chunk.reserve(input.records.size());
    for (const auto& record : input.records) {
        CommittableRecord committable;
        committable.shard_id = shard_id_;
        committable.starting_sequence_number = starting_sequence_number_;
        committable.millis_behind_latest = input.millis_behind_latest;
        committable.record = record;
        committable.checkpoint_action = bindCheckpoint(input.checkpointer, record);
        chunk.push_back(std::move(committable));
    }

    size_t count = chunk.size();

    // Never let a failure escape into the coordinator's thread: the records
    // stay uncheckpointed and will be delivered again
    try {
        if (!sink_(std::move(chunk))) {
            std::cerr << "Shard " << shard_id_ << ": Dropping " << count
                      << " records, consumer stream is closed" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id_ << ": Failed to enqueue " << count
                  << " records: " << e.what() << std::endl;
    }
}

void ChunkedRecordProcessor::leaseLost() {
    shutdown_->store(true);
    std::cout << "Shard " << shard_id_ << ": Lease lost" << std::endl;
}

void ChunkedRecordProcessor::shardEnded(const std::shared_ptr<RecordCheckpointer>& checkpointer) {
    std::cout << "Shard " << shard_id_ << ": Reached shard end" << std::endl;

    if (!checkpointer) {
        return;
    }

    try {
        checkpointer->checkpointShardEnd();
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id_ << ": Failed to checkpoint shard end: "
                  << e.what() << std::endl;
    }
}

void ChunkedRecordProcessor::shutdownRequested(const std::shared_ptr<RecordCheckpointer>&) {
    shutdown_->store(true);
    std::cout << "Shard " << shard_id_ << ": Shutdown requested" << std::endl;
}

CheckpointAction ChunkedRecordProcessor::bindCheckpoint(
    const std::shared_ptr<RecordCheckpointer>& checkpointer,
    const Record& record) const {

    auto shutdown = shutdown_;
    std::string shard_id = shard_id_;
    std::string sequence_number = record.sequence_number;
    int64_t sub_sequence_number = record.sub_sequence_number;

    return [checkpointer, shutdown, shard_id, sequence_number, sub_sequence_number]() {
        if (shutdown->load()) {
            std::cerr << "Shard " << shard_id << ": Skipping checkpoint at " << sequence_number
                      << ", processor is no longer active" << std::endl;
            return;
        }
        if (!checkpointer) {
            throw std::runtime_error("no checkpointer bound to shard " + shard_id);
        }
        checkpointer->checkpoint(sequence_number, sub_sequence_number);
    };
}
