#include <gtest/gtest.h>
#include "../src/config.hpp"
#include <cstdlib>
#include <stdexcept>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearEnv();
    }

    void TearDown() override {
        clearEnv();
    }

    static void clearEnv() {
        for (const char* name : {"STREAM_NAME", "APPLICATION_NAME", "KAFKA_BROKERS", "BUFFER_SIZE",
                                 "RETRIEVAL_MODE", "INITIAL_POSITION", "INITIAL_TIMESTAMP_MS",
                                 "MAX_RECORDS", "IDLE_TIME_BETWEEN_READS_MS",
                                 "CHECKPOINT_BATCH_SIZE", "CHECKPOINT_BATCH_WAIT_MS",
                                 "CHECKPOINT_OUTPUT"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, ConsumerDefaults) {
    ConsumerSettings settings;
    EXPECT_EQ(settings.buffer_size, 10u);
    EXPECT_EQ(settings.retrieval_mode, RetrievalMode::FanOut);
    EXPECT_EQ(settings.initial_position.type, InitialPositionType::Latest);

    CheckpointSettings checkpoint;
    EXPECT_EQ(checkpoint.max_batch_size, 1000u);
    EXPECT_EQ(checkpoint.max_batch_wait, std::chrono::milliseconds(10000));
    EXPECT_EQ(checkpoint.output, CheckpointOutput::PassThrough);
    EXPECT_NO_THROW(checkpoint.validate());
}

TEST_F(ConfigTest, RequiresStreamAndApplication) {
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::runtime_error);

    setenv("STREAM_NAME", "orders", 1);
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::runtime_error);

    setenv("APPLICATION_NAME", "billing", 1);
    ConsumerSettings settings = ConsumerSettings::fromEnv();
    EXPECT_EQ(settings.stream_name, "orders");
    EXPECT_EQ(settings.app_name, "billing");
    EXPECT_EQ(settings.buffer_size, 10u);
}

TEST_F(ConfigTest, ReadsOptionalVariables) {
    setenv("STREAM_NAME", "orders", 1);
    setenv("APPLICATION_NAME", "billing", 1);
    setenv("KAFKA_BROKERS", "localhost:9092", 1);
    setenv("BUFFER_SIZE", "25", 1);
    setenv("RETRIEVAL_MODE", "polling", 1);
    setenv("INITIAL_POSITION", "at_timestamp", 1);
    setenv("INITIAL_TIMESTAMP_MS", "1700000000000", 1);
    setenv("MAX_RECORDS", "500", 1);
    setenv("IDLE_TIME_BETWEEN_READS_MS", "250", 1);

    ConsumerSettings settings = ConsumerSettings::fromEnv();
    EXPECT_EQ(settings.brokers, "localhost:9092");
    EXPECT_EQ(settings.buffer_size, 25u);
    EXPECT_EQ(settings.retrieval_mode, RetrievalMode::Polling);
    EXPECT_EQ(settings.initial_position.type, InitialPositionType::AtTimestamp);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(
                  settings.initial_position.timestamp.time_since_epoch()).count(),
              1700000000000LL);
    EXPECT_EQ(settings.max_records, 500);
    EXPECT_EQ(settings.idle_time_between_reads_ms, 250);
}

TEST_F(ConfigTest, RejectsInvalidConsumerValues) {
    setenv("STREAM_NAME", "orders", 1);
    setenv("APPLICATION_NAME", "billing", 1);

    setenv("BUFFER_SIZE", "0", 1);
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::invalid_argument);
    setenv("BUFFER_SIZE", "-3", 1);
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::invalid_argument);
    unsetenv("BUFFER_SIZE");

    setenv("RETRIEVAL_MODE", "push", 1);
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::invalid_argument);
    unsetenv("RETRIEVAL_MODE");

    setenv("INITIAL_POSITION", "at_timestamp", 1);
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::invalid_argument);
    setenv("INITIAL_POSITION", "oldest", 1);
    EXPECT_THROW(ConsumerSettings::fromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, ParsesInitialPositions) {
    EXPECT_EQ(ConsumerSettings::parseInitialPosition("trim_horizon", -1).type, InitialPositionType::TrimHorizon);
    EXPECT_EQ(ConsumerSettings::parseInitialPosition("latest", -1).type, InitialPositionType::Latest);
    EXPECT_EQ(ConsumerSettings::parseInitialPosition("at_timestamp", 0).type, InitialPositionType::AtTimestamp);
    EXPECT_EQ(ConsumerSettings::parseRetrievalMode("fanout"), RetrievalMode::FanOut);
}

TEST_F(ConfigTest, CheckpointSettingsFromEnv) {
    CheckpointSettings defaults = CheckpointSettings::fromEnv();
    EXPECT_EQ(defaults.max_batch_size, 1000u);
    EXPECT_EQ(defaults.output, CheckpointOutput::PassThrough);

    setenv("CHECKPOINT_OUTPUT", "checkpointed_only", 1);
    EXPECT_EQ(CheckpointSettings::fromEnv().output, CheckpointOutput::CheckpointedOnly);
    setenv("CHECKPOINT_OUTPUT", "pass_through", 1);
    EXPECT_EQ(CheckpointSettings::fromEnv().output, CheckpointOutput::PassThrough);
    setenv("CHECKPOINT_OUTPUT", "window_max", 1);
    EXPECT_THROW(CheckpointSettings::fromEnv(), std::invalid_argument);
    unsetenv("CHECKPOINT_OUTPUT");

    setenv("CHECKPOINT_BATCH_SIZE", "50", 1);
    setenv("CHECKPOINT_BATCH_WAIT_MS", "2000", 1);
    CheckpointSettings settings = CheckpointSettings::fromEnv();
    EXPECT_EQ(settings.max_batch_size, 50u);
    EXPECT_EQ(settings.max_batch_wait, std::chrono::milliseconds(2000));

    setenv("CHECKPOINT_BATCH_SIZE", "0", 1);
    EXPECT_THROW(CheckpointSettings::fromEnv(), std::invalid_argument);

    setenv("CHECKPOINT_BATCH_SIZE", "50", 1);
    setenv("CHECKPOINT_BATCH_WAIT_MS", "0", 1);
    EXPECT_THROW(CheckpointSettings::fromEnv(), std::invalid_argument);
}
