#include <gtest/gtest.h>
#include "../src/kafka/kafka_shard_coordinator.hpp"
#include "../src/consumer/committable_record.hpp"
#include <cppkafka/cppkafka.h>
#include <memory>
#include <stdexcept>

// The consumer is never subscribed, so nothing here needs a reachable broker
class KafkaCheckpointerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cppkafka::Configuration config = {
            {"metadata.broker.list", "127.0.0.1:1"},
            {"group.id", "shard-stream-test"},
            {"enable.auto.commit", "false"}
        };
        consumer_ = std::make_unique<cppkafka::Consumer>(config);
        checkpointer_ = std::make_shared<KafkaRecordCheckpointer>(*consumer_, "events", 3);
    }

    void TearDown() override {
        checkpointer_.reset();
        consumer_.reset();
    }

    std::unique_ptr<cppkafka::Consumer> consumer_;
    std::shared_ptr<KafkaRecordCheckpointer> checkpointer_;
};

TEST_F(KafkaCheckpointerTest, CheckpointAfterRevocationIsSkipped) {
    checkpointer_->invalidate();

    EXPECT_NO_THROW(checkpointer_->checkpoint("42", 0));
    EXPECT_EQ(checkpointer_->getLastCheckpointedOffset(), -1);
}

TEST_F(KafkaCheckpointerTest, RevokedPartitionDoesNotFailRecordCheckpoint) {
    CommittableRecord committable;
    committable.shard_id = "3";
    committable.record.sequence_number = "42";
    std::shared_ptr<KafkaRecordCheckpointer> checkpointer = checkpointer_;
    committable.checkpoint_action = [checkpointer]() {
        checkpointer->checkpoint("42", 0);
    };

    // Revoked between the record being handed out and its window closing
    checkpointer_->invalidate();
    EXPECT_NO_THROW(committable.checkpoint());
    EXPECT_EQ(checkpointer_->getLastCheckpointedOffset(), -1);
}

TEST_F(KafkaCheckpointerTest, RejectsInvalidOffsets) {
    EXPECT_THROW(checkpointer_->checkpoint("-5", 0), std::invalid_argument);
    EXPECT_THROW(checkpointer_->checkpoint("not-an-offset", 0), std::invalid_argument);
}
