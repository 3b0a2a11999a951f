// ============================================================================
// CONNECTION POOL UNIT TESTS
// ============================================================================
// Lazy creation, reuse, exhaustion and unhealthy connection disposal
// ============================================================================

#include <gtest/gtest.h>
#include <gelfbridge/core/storage/connection_pool.hpp>
#include <gelfbridge/core/errors.hpp>
#include "fake_connection.hpp"

#include <chrono>
#include <thread>

using namespace GelfBridge;
using namespace GelfBridge::Testing;
using namespace std::chrono_literals;

TEST(ConnectionPool, OpensLazilyAndReuses) {
    FakeDatabase db;
    ConnectionPool pool(fakeFactory(db), 2);
    EXPECT_EQ(pool.openCount(), 0u);

    {
        auto lease = pool.acquire(10ms);
        EXPECT_EQ(pool.openCount(), 1u);
    }
    EXPECT_EQ(pool.idleCount(), 1u);

    {
        auto lease = pool.acquire(10ms);
        EXPECT_STREQ(lease->backendName(), "fake");
    }
    EXPECT_EQ(db.opened.load(), 1);
}

TEST(ConnectionPool, ExhaustionIsTransientStorageError) {
    FakeDatabase db;
    ConnectionPool pool(fakeFactory(db), 1);
    auto held = pool.acquire(10ms);

    try {
        pool.acquire(20ms);
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_TRUE(e.transient());
    }
}

TEST(ConnectionPool, WaiterGetsReleasedConnection) {
    FakeDatabase db;
    ConnectionPool pool(fakeFactory(db), 1);
    auto held = std::make_unique<PooledConnection>(pool.acquire(10ms));

    std::thread releaser([&] {
        std::this_thread::sleep_for(50ms);
        held.reset();
    });

    EXPECT_NO_THROW(pool.acquire(2000ms));
    releaser.join();
    EXPECT_EQ(db.opened.load(), 1);
}

TEST(ConnectionPool, InvalidatedLeaseIsDiscarded) {
    FakeDatabase db;
    ConnectionPool pool(fakeFactory(db), 1);
    {
        auto lease = pool.acquire(10ms);
        lease.invalidate();
    }
    EXPECT_EQ(pool.openCount(), 0u);
    EXPECT_EQ(pool.idleCount(), 0u);

    auto lease = pool.acquire(10ms);
    EXPECT_EQ(db.opened.load(), 2);
}

TEST(ConnectionPool, BrokenConnectionIsNotReused) {
    FakeDatabase db;
    db.failNext(1, "connection reset by peer", true, true);
    ConnectionPool pool(fakeFactory(db), 1);
    {
        auto lease = pool.acquire(10ms);
        EXPECT_THROW(lease->execute("INSERT", {}), StorageError);
        EXPECT_FALSE(lease->isHealthy());
    }
    EXPECT_EQ(pool.openCount(), 0u);
}

TEST(ConnectionPool, FactoryFailureReleasesSlot) {
    int calls = 0;
    ConnectionPool pool([&calls]() -> ConnectionPtr {
        ++calls;
        throw StorageError("connection refused", true);
    }, 1);

    EXPECT_THROW(pool.acquire(10ms), StorageError);
    EXPECT_THROW(pool.acquire(10ms), StorageError);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(pool.openCount(), 0u);
}
