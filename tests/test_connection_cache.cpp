#include <gtest/gtest.h>
#include <managers/connection_cache.hpp>
#include "memory_session.hpp"

class ConnectionCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryRemote> remote = std::make_shared<MemoryRemote>();
    CredentialIdentity identity;

    void SetUp() override {
        identity.name = "prod";
        identity.host = "sftp.example.com";
        identity.username = "deploy";
        identity.password = "pw";
    }
};

TEST_F(ConnectionCacheTest, PersistedSessionIsReused) {
    ConnectionCache cache(memory_factory(remote));
    std::string key = identity.cache_key();

    auto first = cache.acquire(key, identity, true);
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value.connected_now);
    cache.release(first.value);

    auto second = cache.acquire(key, identity, true);
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value.cached_before);
    EXPECT_FALSE(second.value.connected_now);
    cache.release(second.value);

    EXPECT_EQ(remote->connects.load(), 1);
    EXPECT_EQ(remote->ends.load(), 0);
    EXPECT_TRUE(cache.is_cached(key));
}

TEST_F(ConnectionCacheTest, UncachedLeaseIsEndedOnRelease) {
    ConnectionCache cache(memory_factory(remote));
    std::string key = identity.cache_key();

    auto lease = cache.acquire(key, identity, false);
    ASSERT_TRUE(lease.is_ok());
    EXPECT_FALSE(cache.is_cached(key));

    cache.release(lease.value);
    EXPECT_EQ(remote->ends.load(), 1);
    EXPECT_FALSE(lease.value.session);
}

TEST_F(ConnectionCacheTest, ConnectCallbackOnlyForNewConnections) {
    ConnectionCache cache(memory_factory(remote));
    int connecting = 0;
    auto cb = [&connecting] { ++connecting; };

    auto a = cache.acquire("k", identity, true, cb);
    ASSERT_TRUE(a.is_ok());
    cache.release(a.value);
    auto b = cache.acquire("k", identity, true, cb);
    ASSERT_TRUE(b.is_ok());
    cache.release(b.value);

    EXPECT_EQ(connecting, 1);
}

TEST_F(ConnectionCacheTest, ConnectFailureIsNotCached) {
    remote->fail_connect = true;
    ConnectionCache cache(memory_factory(remote));

    auto r = cache.acquire("k", identity, true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connect);
    EXPECT_FALSE(cache.is_cached("k"));
    EXPECT_TRUE(cache.cached_keys().empty());
}

TEST_F(ConnectionCacheTest, CloseRemovesAndEnds) {
    ConnectionCache cache(memory_factory(remote));
    auto lease = cache.acquire("k", identity, true);
    ASSERT_TRUE(lease.is_ok());
    cache.release(lease.value);

    EXPECT_TRUE(cache.close("k"));
    EXPECT_FALSE(cache.is_cached("k"));
    EXPECT_EQ(remote->ends.load(), 1);

    // Nothing left to close
    EXPECT_FALSE(cache.close("k"));
}

TEST_F(ConnectionCacheTest, TeardownErrorsAreSwallowed) {
    remote->fail_end = true;
    ConnectionCache cache(memory_factory(remote));
    auto lease = cache.acquire("k", identity, true);
    ASSERT_TRUE(lease.is_ok());
    cache.release(lease.value);

    EXPECT_TRUE(cache.close("k"));
    EXPECT_FALSE(cache.is_cached("k"));
}

TEST_F(ConnectionCacheTest, DeadSessionIsReplaced) {
    ConnectionCache cache(memory_factory(remote));
    auto first = cache.acquire("k", identity, true);
    ASSERT_TRUE(first.is_ok());
    auto* mem = dynamic_cast<MemorySession*>(first.value.session.get());
    ASSERT_NE(mem, nullptr);
    mem->kill();
    cache.release(first.value);

    auto second = cache.acquire("k", identity, true);
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value.connected_now);
    cache.release(second.value);

    EXPECT_EQ(remote->connects.load(), 2);
    EXPECT_EQ(remote->ends.load(), 1);
}

TEST_F(ConnectionCacheTest, CloseAllEndsEverySession) {
    ConnectionCache cache(memory_factory(remote));
    for (const char* key : {"a", "b", "c"}) {
        auto lease = cache.acquire(key, identity, true);
        ASSERT_TRUE(lease.is_ok());
        cache.release(lease.value);
    }
    EXPECT_EQ(cache.cached_keys().size(), 3u);

    cache.close_all();
    EXPECT_TRUE(cache.cached_keys().empty());
    EXPECT_EQ(remote->ends.load(), 3);
}

TEST_F(ConnectionCacheTest, LeaseGuardReleases) {
    ConnectionCache cache(memory_factory(remote));
    {
        auto lease = cache.acquire("k", identity, false);
        ASSERT_TRUE(lease.is_ok());
        LeaseGuard guard(cache, lease.value);
    }
    EXPECT_EQ(remote->ends.load(), 1);
}
