#ifndef COMMITTABLE_RECORD_HPP
#define COMMITTABLE_RECORD_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

// A record as delivered by the coordinator for one shard
struct Record {
    std::string sequence_number;
    int64_t sub_sequence_number = 0;
    std::string partition_key;
    std::string data;
    std::chrono::system_clock::time_point approximate_arrival_timestamp;
};

// Commits progress up to and including the bound record on its shard
using CheckpointAction = std::function<void()>;

// Record envelope: one delivered record plus the shard it came from and
// the capability to checkpoint it
struct CommittableRecord {
    std::string shard_id;
    std::string starting_sequence_number;  // shard position at lease start
    int64_t millis_behind_latest = 0;
    Record record;
    CheckpointAction checkpoint_action;

    const std::string& sequenceNumber() const { return record.sequence_number; }
    int64_t subSequenceNumber() const { return record.sub_sequence_number; }

    // Checkpointing this record implicitly checkpoints every earlier record
    // of the same shard. Throws CheckpointError on failure.
    void checkpoint() const;
};

// Records delivered together by one shard callback, in delivery order
using Chunk = std::vector<CommittableRecord>;

// Shard-local total order: sequence number, then sub-sequence number.
// Sequence numbers are decimal integers of arbitrary length, so "9" < "10".
// Non-decimal values sort after every decimal, among themselves as text.
struct SequenceNumberOrder {
    // Returns <0, 0 or >0
    static int compare(const std::string& a, const std::string& b);
    static int compare(const Record& a, const Record& b);

    bool operator()(const Record& a, const Record& b) const {
        return compare(a, b) < 0;
    }

    bool operator()(const CommittableRecord& a, const CommittableRecord& b) const {
        return compare(a.record, b.record) < 0;
    }
};

#endif // COMMITTABLE_RECORD_HPP
