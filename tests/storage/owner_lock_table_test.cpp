// File: tests/storage/owner_lock_table_test.cpp
#include "storage/owner_lock_table.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <thread>

namespace careledger {
namespace {

OwnerLockTable::Config FastConfig() {
    OwnerLockTable::Config config;
    config.timeout = std::chrono::milliseconds(20);
    config.retries = 1;
    return config;
}

TEST(OwnerLockTableTest, RejectsInvalidConfig) {
    OwnerLockTable::Config zero_timeout;
    zero_timeout.timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(OwnerLockTable table(zero_timeout), std::invalid_argument);

    OwnerLockTable::Config negative_retries;
    negative_retries.retries = -1;
    EXPECT_THROW(OwnerLockTable table(negative_retries), std::invalid_argument);
}

TEST(OwnerLockTableTest, SharedLocksCoexist) {
    OwnerLockTable table(FastConfig());

    auto first = table.LockShared("patient-1");
    auto second = table.LockShared("patient-1");

    EXPECT_TRUE(first.owns_lock());
    EXPECT_TRUE(second.owns_lock());
    EXPECT_EQ(1u, table.Size());
}

TEST(OwnerLockTableTest, ExclusiveLockBlocksReadersOfSameOwner) {
    OwnerLockTable table(FastConfig());
    auto writer = table.LockExclusive("patient-1");

    auto reader = std::async(std::launch::async, [&table]() {
        return table.LockShared("patient-1").owns_lock();
    });
    EXPECT_THROW(reader.get(), ConcurrencyConflictError);
}

TEST(OwnerLockTableTest, ExclusiveLockBlocksOtherWriters) {
    OwnerLockTable table(FastConfig());
    auto reader = table.LockShared("patient-1");

    auto writer = std::async(std::launch::async, [&table]() {
        return table.LockExclusive("patient-1").owns_lock();
    });
    EXPECT_THROW(writer.get(), ConcurrencyConflictError);
}

TEST(OwnerLockTableTest, OwnersDoNotContend) {
    OwnerLockTable table(FastConfig());
    auto writer = table.LockExclusive("patient-1");

    auto other = std::async(std::launch::async, [&table]() {
        return table.LockExclusive("patient-2").owns_lock();
    });
    EXPECT_TRUE(other.get());
    EXPECT_EQ(2u, table.Size());
}

TEST(OwnerLockTableTest, RetrySucceedsOnceLockIsReleased) {
    OwnerLockTable::Config config;
    config.timeout = std::chrono::milliseconds(50);
    config.retries = 10;
    OwnerLockTable table(config);

    std::promise<void> locked;
    std::thread holder([&table, &locked]() {
        auto guard = table.LockExclusive("patient-1");
        locked.set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
    });
    locked.get_future().wait();

    auto guard = table.LockExclusive("patient-1");
    EXPECT_TRUE(guard.owns_lock());
    EXPECT_GE(table.GetContendedCount(), 1u);

    holder.join();
}

TEST(OwnerLockTableTest, ReleasedGuardFreesTheOwner) {
    OwnerLockTable table(FastConfig());
    {
        auto writer = table.LockExclusive("patient-1");
    }
    auto again = table.LockExclusive("patient-1");
    EXPECT_TRUE(again.owns_lock());
    EXPECT_EQ(0u, table.GetContendedCount());
}

} // namespace
} // namespace careledger
