/**
 * @file test_memcache_store.cpp
 * @brief Unit tests for the memcached text-protocol store
 */

#include <gtest/gtest.h>
#include <memqueue/core/errors.hpp>
#include <memqueue/core/mem_queue.hpp>
#include <memqueue/net/memcache_store.hpp>

#include "support/fake_memcached.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace memqueue::net;
using memqueue::core::CacheError;
using memqueue::testing::FakeMemcached;

class MemcacheStoreTest : public ::testing::Test {
protected:
    MemcacheStoreTest() : store_({server_.endpoint()}, 1000) {}

    FakeMemcached server_;
    MemcacheStore store_;
};

// =============================================================================
// Key validation
// =============================================================================

TEST(MemcacheKeyTest, ValidKeys) {
    EXPECT_TRUE(MemcacheStore::isValidKey("jobs_LIST_202401151030"));
    EXPECT_TRUE(MemcacheStore::isValidKey(std::string(250, 'k')));
}

TEST(MemcacheKeyTest, InvalidKeys) {
    EXPECT_FALSE(MemcacheStore::isValidKey(""));
    EXPECT_FALSE(MemcacheStore::isValidKey(std::string(251, 'k')));
    EXPECT_FALSE(MemcacheStore::isValidKey("has space"));
    EXPECT_FALSE(MemcacheStore::isValidKey("line\nbreak"));
    EXPECT_FALSE(MemcacheStore::isValidKey(std::string("nul\0", 4)));
}

TEST(MemcacheStoreConfigTest, NeedsAServer) {
    EXPECT_THROW(MemcacheStore(std::vector<std::string>{}), std::invalid_argument);
}

TEST(MemcacheStoreConfigTest, DefaultPortApplied) {
    MemcacheStore store({"cache01"});
    EXPECT_EQ(store.serverFor("anything").port, MemcacheStore::DEFAULT_PORT);
}

// =============================================================================
// Operations
// =============================================================================

TEST_F(MemcacheStoreTest, GetMissing) {
    EXPECT_FALSE(store_.get("nothing").has_value());
}

TEST_F(MemcacheStoreTest, SetAndGet) {
    store_.set("k", "value");
    EXPECT_EQ(store_.get("k"), std::optional<std::string>("value"));
    EXPECT_EQ(server_.data().get("k"), std::optional<std::string>("value"));
}

TEST_F(MemcacheStoreTest, BinaryPayloadSurvives) {
    std::string payload("line1\r\nEND\r\n\0tail", 17);
    store_.set("bin", payload);
    EXPECT_EQ(store_.get("bin"), std::optional<std::string>(payload));
}

TEST_F(MemcacheStoreTest, EmptyValue) {
    store_.set("empty", "");
    EXPECT_EQ(store_.get("empty"), std::optional<std::string>(""));
}

TEST_F(MemcacheStoreTest, LargeValue) {
    std::string payload(200000, 'x');
    store_.set("big", payload);
    auto value = store_.get("big");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->size(), payload.size());
}

TEST_F(MemcacheStoreTest, AddAndAppendSemantics) {
    EXPECT_FALSE(store_.append("bucket", "a,"));
    EXPECT_TRUE(store_.add("bucket", "a,"));
    EXPECT_FALSE(store_.add("bucket", "b,"));
    EXPECT_TRUE(store_.append("bucket", "b,"));
    EXPECT_EQ(store_.get("bucket"), std::optional<std::string>("a,b,"));
}

TEST_F(MemcacheStoreTest, Remove) {
    store_.set("k", "v");
    EXPECT_TRUE(store_.remove("k"));
    EXPECT_FALSE(store_.remove("k"));
}

TEST_F(MemcacheStoreTest, FlushAll) {
    store_.set("a", "1");
    store_.set("b", "2");
    store_.flushAll();
    EXPECT_EQ(server_.data().size(), 0u);
}

TEST_F(MemcacheStoreTest, ReusesConnection) {
    for (int i = 0; i < 10; ++i) {
        store_.set("k" + std::to_string(i), "v");
    }
    EXPECT_EQ(server_.connectionCount(), 1u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(MemcacheStoreTest, InvalidKeyNeverReachesServer) {
    EXPECT_THROW(store_.set("bad key", "v"), CacheError);
    EXPECT_THROW(store_.get(std::string(300, 'k')), CacheError);
    EXPECT_EQ(server_.commandCount(), 0u);
}

TEST_F(MemcacheStoreTest, ServerErrorReply) {
    server_.failNextWith("SERVER_ERROR out of memory storing object");
    EXPECT_THROW(store_.set("k", "v"), CacheError);

    // Store recovers on a fresh connection
    store_.set("k", "v");
    EXPECT_EQ(store_.get("k"), std::optional<std::string>("v"));
}

TEST_F(MemcacheStoreTest, RefusedSetIsAnError) {
    server_.failNextWith("NOT_STORED");
    EXPECT_THROW(store_.set("k", "v"), CacheError);
}

TEST_F(MemcacheStoreTest, GarbledGetReply) {
    server_.failNextWith("WHAT");
    EXPECT_THROW(store_.get("k"), CacheError);
}

TEST_F(MemcacheStoreTest, DroppedConnectionReconnects) {
    store_.set("k", "v");
    server_.dropNextCommand();
    EXPECT_THROW(store_.get("k"), CacheError);

    EXPECT_EQ(store_.get("k"), std::optional<std::string>("v"));
    EXPECT_EQ(server_.connectionCount(), 2u);
}

TEST(MemcacheStoreDownTest, UnreachableServer) {
    std::string endpoint;
    {
        FakeMemcached server;
        endpoint = server.endpoint();
    }

    MemcacheStore store({endpoint}, 500);
    EXPECT_THROW(store.get("k"), CacheError);
    EXPECT_THROW(store.set("k", "v"), CacheError);
}

// =============================================================================
// Sharding
// =============================================================================

TEST(MemcacheStoreShardTest, KeysLandOnTheirServer) {
    FakeMemcached a;
    FakeMemcached b;
    MemcacheStore store({a.endpoint(), b.endpoint()}, 1000);
    ASSERT_EQ(store.serverCount(), 2u);

    int onA = 0;
    for (int i = 0; i < 40; ++i) {
        std::string key = "jobs_LIST_2024011510" + std::to_string(i);
        store.set(key, "v");

        bool expectA = store.serverFor(key).port == a.port();
        EXPECT_EQ(a.data().get(key).has_value(), expectA) << key;
        EXPECT_EQ(b.data().get(key).has_value(), !expectA) << key;
        onA += expectA ? 1 : 0;
    }
    EXPECT_GT(onA, 0);
    EXPECT_LT(onA, 40);
}

TEST(MemcacheStoreShardTest, MemQueueOverMemcached) {
    FakeMemcached server;
    auto store = std::make_shared<MemcacheStore>(std::vector<std::string>{server.endpoint()}, 1000);
    memqueue::core::MemQueue queue(store);

    queue.put("jobs", "first");
    queue.put("jobs", "second");

    std::string client = memqueue::core::MemQueue::createClientID();
    EXPECT_EQ(queue.nextmsg("jobs", client), std::optional<std::string>("first"));
    EXPECT_EQ(queue.nextmsg("jobs", client), std::optional<std::string>("second"));
    EXPECT_FALSE(queue.nextmsg("jobs", client).has_value());
    EXPECT_GT(queue.checkQueue("jobs"), 0.0);
}
