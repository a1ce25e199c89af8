#include <gtest/gtest.h>
#include "../src/health_server.hpp"
#include "fakes.hpp"
#include "crow.h"
#include <thread>

class HealthServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeCoordinatorState>();
        stream_ = std::make_unique<ShardStream>(testConsumerSettings(), fakeCoordinatorFactory(state_));
        server_ = std::make_unique<HealthServer>(*stream_, nullptr);
        server_->setupRoutes(app);
        app.validate();  // Required to make sure all route handlers are in order
    }

    void TearDown() override {
        server_.reset();
        stream_.reset();
    }

    crow::response get(const std::string& url) {
        crow::request req;
        req.url = url;
        req.method = "GET"_method;

        crow::response res;
        app.handle_full(req, res);
        return res;
    }

    // Pull one chunk so the stream is running
    void startStream() {
        std::thread consumer([this]() {
            Chunk chunk;
            stream_->next(chunk);
        });
        ASSERT_TRUE(state_->waitUntilRunning());
        FakeShard shard(state_->processorFactory(), "shard-0");
        shard.deliver({"1", "2", "3"});
        consumer.join();
    }

    std::shared_ptr<FakeCoordinatorState> state_;
    std::unique_ptr<ShardStream> stream_;
    std::unique_ptr<HealthServer> server_;
    crow::SimpleApp app;
};

TEST_F(HealthServerTest, HealthIsAlwaysOk) {
    crow::response res = get("/health");
    EXPECT_EQ(res.code, 200);
    EXPECT_EQ(res.body, "OK");
}

TEST_F(HealthServerTest, NotReadyBeforeStreamRuns) {
    crow::response res = get("/ready");
    EXPECT_EQ(res.code, 503);
}

TEST_F(HealthServerTest, ReadyWhileRunning) {
    startStream();
    EXPECT_EQ(get("/ready").code, 200);

    stream_->cancel();
    EXPECT_EQ(get("/ready").code, 503);
}

TEST_F(HealthServerTest, StatsReportStreamCounters) {
    startStream();

    crow::response res = get("/stats");
    EXPECT_EQ(res.code, 200);

    auto stats = crow::json::load(res.body);
    ASSERT_TRUE(stats);
    EXPECT_EQ(std::string(stats["worker_id"].s()), stream_->getWorkerId());
    EXPECT_EQ(std::string(stats["state"].s()), "running");
    EXPECT_EQ(stats["records_read"].u(), 3u);
    EXPECT_FALSE(stats.has("checkpoints"));
}

TEST_F(HealthServerTest, UnknownRouteIsNotFound) {
    EXPECT_EQ(get("/flush").code, 404);
}
