#include <gtest/gtest.h>
#include <shard/Errors.hpp>
#include <shard/MultiPartitionReader.hpp>
#include "FakeStreamClient.hpp"

#include <map>

using namespace shard;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> range(int first, int last) {
    std::vector<std::string> result;
    for(int i = first; i <= last; ++i) result.push_back(std::to_string(i));
    return result;
}

Split split(const std::string& id) {
    return Split{id, Position::Earliest(), Position::None()};
}

}

class MultiPartitionReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<test::FakeStreamClient>();
        config_.stream_name = "orders";
        config_.backoff = 20ms;
    }

    // Drains the reader until every partition stopped, keyed by partition.
    std::map<std::string, std::vector<std::string>> drain(MultiPartitionReader& reader) {
        std::map<std::string, std::vector<std::string>> result;
        auto deadline = std::chrono::steady_clock::now() + 10s;
        while(!reader.finished() && std::chrono::steady_clock::now() < deadline) {
            auto batch = reader.next(100ms);
            if(!batch) continue;
            for(auto& record : batch->records)
                result[batch->partition_id].push_back(record.sequence_number);
        }
        return result;
    }

    std::shared_ptr<test::FakeStreamClient> client_;
    ShardConfig config_;
};

TEST_F(MultiPartitionReaderTest, RequiresAtLeastOneSplit) {
    EXPECT_THROW((MultiPartitionReader{client_, config_, {}}), ConfigurationError);
}

TEST_F(MultiPartitionReaderTest, RejectsDuplicatePartitions) {
    client_->addPartition("p0");
    EXPECT_THROW((MultiPartitionReader{client_, config_, {split("p0"), split("p0")}}),
                 ConfigurationError);
}

TEST_F(MultiPartitionReaderTest, MergesPartitionsPreservingOrder) {
    client_->addPartition("p0", range(1, 30));
    client_->addPartition("p1", range(500, 520));
    client_->addPartition("p2", range(7000, 7009));
    for(auto id : {"p0", "p1", "p2"}) client_->closePartition(id);
    client_->setMaxRecordsPerFetch(3);

    MultiPartitionReader reader{client_, config_, {split("p0"), split("p1"), split("p2")}};
    auto emitted = drain(reader);

    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(emitted["p0"], range(1, 30));
    EXPECT_EQ(emitted["p1"], range(500, 520));
    EXPECT_EQ(emitted["p2"], range(7000, 7009));

    auto checkpoints = reader.snapshot();
    ASSERT_EQ(checkpoints.size(), 3u);
    EXPECT_EQ(checkpoints[0], (CheckpointState{"orders", "p0", "30"}));
    EXPECT_EQ(checkpoints[1], (CheckpointState{"orders", "p1", "520"}));
    EXPECT_EQ(checkpoints[2], (CheckpointState{"orders", "p2", "7009"}));
    EXPECT_FALSE(reader.next(10ms));
}

TEST_F(MultiPartitionReaderTest, IdlePartitionDoesNotDelayOthers) {
    client_->addPartition("idle");
    client_->addPartition("busy", range(1, 20));
    client_->closePartition("busy");
    client_->setMaxRecordsPerFetch(1);
    config_.backoff = 2s;

    MultiPartitionReader reader{client_, config_, {split("idle"), split("busy")}};

    std::vector<std::string> busy;
    auto start = std::chrono::steady_clock::now();
    while(busy.size() < 20 && std::chrono::steady_clock::now() - start < 5s) {
        auto batch = reader.next(100ms);
        if(!batch) continue;
        EXPECT_EQ(batch->partition_id, "busy");
        for(auto& record : batch->records) busy.push_back(record.sequence_number);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(busy, range(1, 20));
    // the idle partition spent this whole time in one backoff period
    EXPECT_LT(elapsed, config_.backoff);
    EXPECT_EQ(client_->fetchTimes("idle").size(), 1u);
}

TEST_F(MultiPartitionReaderTest, SlowFetchDoesNotDelayOthers) {
    client_->addPartition("slow", range(1, 5));
    client_->addPartition("fast", range(100, 104));
    client_->closePartition("fast");
    client_->setFetchDelay("slow", 1s);

    MultiPartitionReader reader{client_, config_, {split("slow"), split("fast")}};
    auto batch = reader.next(500ms);

    ASSERT_TRUE(batch);
    EXPECT_EQ(batch->partition_id, "fast");
}

TEST_F(MultiPartitionReaderTest, PublishesCursorTokens) {
    client_->addPartition("p0", range(1, 3));
    client_->addPartition("p1");
    client_->closePartition("p0");

    MultiPartitionReader reader{client_, config_, {split("p0"), split("p1")}};
    auto batch = reader.next(2s);
    ASSERT_TRUE(batch);
    EXPECT_EQ(batch->partition_id, "p0");

    // p0 is closed and drained, p1 keeps a live cursor
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while(!reader.cursorToken("p1") && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(reader.cursorToken("p1"));
    EXPECT_FALSE(reader.cursorToken("p0"));
}

TEST_F(MultiPartitionReaderTest, SurfacesPartitionFailure) {
    client_->addPartition("p0", range(1, 3));
    client_->failNextFetch("connection reset");

    MultiPartitionReader reader{client_, config_, {split("p0")}};
    std::optional<Batch> batch;
    EXPECT_THROW(batch = reader.next(2s), TransportError);
    EXPECT_TRUE(reader.finished());
}

TEST_F(MultiPartitionReaderTest, RetriesAfterThrottling) {
    client_->addPartition("p0", range(1, 3));
    client_->closePartition("p0");
    client_->throttleNextFetches(2);
    config_.throttle_backoff = 10ms;

    MultiPartitionReader reader{client_, config_, {split("p0")}};
    auto emitted = drain(reader);

    EXPECT_EQ(emitted["p0"], range(1, 3));
}

TEST_F(MultiPartitionReaderTest, ResumesFromCheckpoints) {
    client_->addPartition("p0", range(1, 10));
    client_->addPartition("p1", range(20, 25));
    client_->closePartition("p0");
    client_->closePartition("p1");

    std::vector<CheckpointState> checkpoints{{"orders", "p0", "7"}};
    MultiPartitionReader reader{client_, config_, {split("p0"), split("p1")}, checkpoints};
    EXPECT_EQ(reader.snapshot(), checkpoints);

    auto emitted = drain(reader);
    EXPECT_EQ(emitted["p0"], range(8, 10));
    EXPECT_EQ(emitted["p1"], range(20, 25));
}

TEST_F(MultiPartitionReaderTest, StopEndsReading) {
    client_->addPartition("p0");
    config_.backoff = 10s;

    auto reader = std::make_unique<MultiPartitionReader>(
        client_, config_, std::vector<Split>{split("p0")});
    reader->stop();
    EXPECT_FALSE(reader->next(1s));

    auto start = std::chrono::steady_clock::now();
    reader.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(MultiPartitionReaderTest, FinishedOnceStopped) {
    client_->addPartition("p0", range(1, 3));
    client_->addPartition("p1");

    MultiPartitionReader reader{client_, config_, {split("p0"), split("p1")}};
    ASSERT_TRUE(reader.next(2s));
    EXPECT_FALSE(reader.finished());

    reader.stop();
    EXPECT_TRUE(reader.finished());
    EXPECT_FALSE(reader.next(1s));
}
