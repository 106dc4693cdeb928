// GTest
#include <gtest/gtest.h>

// standard
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

// rebuf
#include <src/common/rw-lock.hpp>
#include <src/common/exceptions.hpp>

using namespace std::chrono;

TEST(RWLockTest, SharedHoldersCoexist) {
    rebuf::RWLock lock;

    auto first = lock.shared();
    auto second = lock.shared();

    EXPECT_TRUE(first.owns_lock());
    EXPECT_TRUE(second.owns_lock());
}

TEST(RWLockTest, ExclusiveWaitsForSharedHolders) {
    rebuf::RWLock lock;
    std::atomic<bool> acquired = false;

    auto shared = lock.shared();
    std::thread writer([&]() {
        auto exclusive = lock.exclusive();
        acquired = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired);

    shared.unlock();
    writer.join();
    EXPECT_TRUE(acquired);
}

TEST(ClosedFlagTest, CloseIsTerminalAndNotIdempotent) {
    rebuf::ClosedFlag flag("test resource");

    EXPECT_FALSE(flag.isClosed());
    EXPECT_NO_THROW(flag.ensureOpen());

    flag.close();

    EXPECT_TRUE(flag.isClosed());
    EXPECT_THROW(flag.ensureOpen(), rebuf::RebufClosed);
    EXPECT_THROW(flag.close(), rebuf::RebufClosed);
}

TEST(ClosedFlagTest, CloseWaitsForInFlightOperation) {
    rebuf::ClosedFlag flag("test resource");
    std::atomic<bool> closed = false;

    auto inFlight = flag.ensureOpen();
    std::thread closer([&]() {
        flag.close();
        closed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(closed);

    inFlight.unlock();
    closer.join();
    EXPECT_TRUE(closed);
    EXPECT_THROW(flag.ensureOpen(), rebuf::RebufClosed);
}
