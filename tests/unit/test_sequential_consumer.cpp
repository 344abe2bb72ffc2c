/**
 * @file test_sequential_consumer.cpp
 * @brief Unit tests for in-order delivery per client
 */

#include <gtest/gtest.h>
#include <memqueue/core/client_cursor.hpp>
#include <memqueue/core/memory_store.hpp>
#include <memqueue/core/queue_reader.hpp>
#include <memqueue/core/queue_writer.hpp>
#include <memqueue/core/sequential_consumer.hpp>
#include <memqueue/core/time_bucket_index.hpp>

#include "support/manual_clock.hpp"

#include <string>
#include <vector>

using namespace memqueue::core;
using memqueue::testing::ManualClock;

class SequentialConsumerTest : public ::testing::Test {
protected:
    static constexpr int LAG_SECONDS = 120;

    SequentialConsumerTest()
        : index_(store_, clock_)
        , cursor_(store_, clock_)
        , writer_(store_, clock_, index_)
        , reader_(store_, index_, cursor_)
        , consumer_(cursor_, reader_, clock_, LAG_SECONDS, false)
    {}

    std::vector<std::string> putMany(int count, const std::string& prefix = "msg") {
        std::vector<std::string> keys;
        for (int i = 0; i < count; ++i) {
            keys.push_back(writer_.put("jobs", prefix + std::to_string(i), "producer"));
        }
        return keys;
    }

    MemoryStore store_;
    ManualClock clock_;
    TimeBucketIndex index_;
    ClientCursor cursor_;
    QueueWriter writer_;
    QueueReader reader_;
    SequentialConsumer consumer_;
};

TEST(SequentialConsumerWindowTest, WindowMinutesEqualLagValue) {
    EXPECT_EQ(SequentialConsumer::windowMinutesFor(0), 0);
    EXPECT_EQ(SequentialConsumer::windowMinutesFor(-5), 0);
    EXPECT_EQ(SequentialConsumer::windowMinutesFor(1), 1);
    EXPECT_EQ(SequentialConsumer::windowMinutesFor(61), 61);
    EXPECT_EQ(SequentialConsumer::windowMinutesFor(120), 120);
}

TEST_F(SequentialConsumerTest, EmptyQueueYieldsNothing) {
    EXPECT_FALSE(consumer_.next("jobs", "c1").has_value());
    EXPECT_FALSE(cursor_.get("jobs", "c1").lastKey.has_value());
}

TEST_F(SequentialConsumerTest, NewClientStartsAtOldestInWindow) {
    putMany(3);
    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("msg0"));
}

TEST_F(SequentialConsumerTest, NewClientFindsBacklogOlderThanLag) {
    putMany(10);
    clock_.advance(std::chrono::minutes(5));

    EXPECT_EQ(consumer_.next("jobs", "fresh"), std::optional<std::string>("msg0"));
    EXPECT_EQ(consumer_.next("jobs", "fresh"), std::optional<std::string>("msg1"));
}

TEST_F(SequentialConsumerTest, ResumesAfterReadingOldMessage) {
    auto keys = putMany(10);
    clock_.advance(std::chrono::minutes(4));
    reader_.fetch("jobs", keys[3], "c1", false);
    clock_.advance(std::chrono::seconds(5));

    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("msg4"));
}

TEST_F(SequentialConsumerTest, BacklogBeyondWindowIsNotScanned) {
    SequentialConsumer shortLag(cursor_, reader_, clock_, 2, false);
    putMany(1, "old");
    clock_.advance(std::chrono::minutes(3));
    putMany(1, "recent");

    EXPECT_EQ(shortLag.next("jobs", "fresh"), std::optional<std::string>("recent0"));
}

TEST_F(SequentialConsumerTest, DeliversEveryMessageOnceInOrder) {
    putMany(50);

    for (int i = 0; i < 50; ++i) {
        auto payload = consumer_.next("jobs", "c1");
        ASSERT_TRUE(payload.has_value()) << "at message " << i;
        EXPECT_EQ(*payload, "msg" + std::to_string(i));
    }
    EXPECT_FALSE(consumer_.next("jobs", "c1").has_value());
}

TEST_F(SequentialConsumerTest, CaughtUpIsStable) {
    putMany(2);
    consumer_.next("jobs", "c1");
    consumer_.next("jobs", "c1");

    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(consumer_.next("jobs", "c1").has_value());
    }
    EXPECT_EQ(cursor_.get("jobs", "c1").lastKey, reader_.lastMessageKey("jobs"));
}

TEST_F(SequentialConsumerTest, ClientsProgressIndependently) {
    putMany(3);

    EXPECT_EQ(consumer_.next("jobs", "a"), std::optional<std::string>("msg0"));
    EXPECT_EQ(consumer_.next("jobs", "a"), std::optional<std::string>("msg1"));
    EXPECT_EQ(consumer_.next("jobs", "b"), std::optional<std::string>("msg0"));
    EXPECT_EQ(consumer_.next("jobs", "a"), std::optional<std::string>("msg2"));
    EXPECT_EQ(consumer_.next("jobs", "b"), std::optional<std::string>("msg1"));
}

TEST_F(SequentialConsumerTest, PicksUpMessagesInLaterMinutes) {
    putMany(1, "early");
    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("early0"));

    clock_.advance(std::chrono::seconds(70));
    putMany(2, "late");

    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("late0"));
    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("late1"));
    EXPECT_FALSE(consumer_.next("jobs", "c1").has_value());
}

TEST_F(SequentialConsumerTest, SilentClientFastForwardsToNewest) {
    putMany(1, "first");
    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("first0"));

    clock_.advance(std::chrono::seconds(LAG_SECONDS + 80));
    auto keys = putMany(3, "fresh");

    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("fresh2"));
    EXPECT_EQ(cursor_.get("jobs", "c1").lastKey, std::optional<std::string>(keys.back()));
    EXPECT_FALSE(consumer_.next("jobs", "c1").has_value());
}

TEST_F(SequentialConsumerTest, SilenceAtExactlyLagDoesNotFastForward) {
    putMany(1, "first");
    consumer_.next("jobs", "c1");

    clock_.advance(std::chrono::seconds(LAG_SECONDS));
    putMany(2, "more");

    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("more0"));
}

TEST_F(SequentialConsumerTest, CursorOutsideWindowRestartsAtOldest) {
    putMany(2);
    cursor_.set("jobs", "c1", "jobs_expired_key");

    EXPECT_EQ(consumer_.next("jobs", "c1"), std::optional<std::string>("msg0"));
}

TEST_F(SequentialConsumerTest, CursorAtEndOfWindowYieldsNothing) {
    auto keys = putMany(2);
    cursor_.set("jobs", "c1", keys.back());

    // Newest pointer moved on but its bucket entry is not visible yet
    store_.set("jobs_LASTMSG", "jobs_not_yet_indexed");

    EXPECT_FALSE(consumer_.next("jobs", "c1").has_value());
}

TEST_F(SequentialConsumerTest, AutodeleteRemovesDeliveredMessages) {
    SequentialConsumer deleting(cursor_, reader_, clock_, LAG_SECONDS, true);
    auto keys = putMany(2);

    EXPECT_EQ(deleting.next("jobs", "c1"), std::optional<std::string>("msg0"));
    EXPECT_FALSE(store_.get(keys[0]).has_value());
    EXPECT_TRUE(store_.get(keys[1]).has_value());
}
