#include <gtest/gtest.h>

#include "ui/drag/drag_lock.hpp"

using namespace kestrel;

TEST(DragLock, UnlockedByDefault)
{
    DragLock lock;
    EXPECT_FALSE(lock.is_locked());
    EXPECT_FALSE(lock.owner().has_value());
    EXPECT_EQ(lock.held_for().count(), 0);
}

TEST(DragLock, SecondOwnerDenied)
{
    DragLock lock;
    EXPECT_TRUE(lock.try_lock("a"));
    EXPECT_FALSE(lock.try_lock("b"));
    EXPECT_FALSE(lock.try_lock("a"));
    EXPECT_EQ(lock.owner(), std::optional<std::string>("a"));
}

TEST(DragLock, ReleaseOnlyByHolder)
{
    DragLock lock;
    lock.try_lock("a");
    EXPECT_FALSE(lock.release("b"));
    EXPECT_TRUE(lock.is_locked());
    EXPECT_TRUE(lock.release("a"));
    EXPECT_FALSE(lock.is_locked());
    EXPECT_FALSE(lock.release("a"));
}

TEST(DragLock, ForceRelease)
{
    DragLock lock;
    lock.try_lock("a");
    lock.force_release();
    EXPECT_FALSE(lock.is_locked());
    EXPECT_TRUE(lock.try_lock("b"));
}

// ─── Guard ───────────────────────────────────────────────────────────────────

TEST(DragLockGuard, ReleasesOnScopeExit)
{
    DragLock lock;
    {
        auto guard = lock.acquire("a");
        EXPECT_TRUE(static_cast<bool>(guard));
        EXPECT_TRUE(lock.is_locked());

        auto denied = lock.acquire("b");
        EXPECT_FALSE(static_cast<bool>(denied));
    }
    EXPECT_FALSE(lock.is_locked());
}

TEST(DragLockGuard, MoveTransfersOwnership)
{
    DragLock        lock;
    DragLock::Guard outer;
    {
        auto guard = lock.acquire("a");
        outer      = std::move(guard);
    }
    EXPECT_TRUE(lock.is_locked());
    outer.release();
    EXPECT_FALSE(lock.is_locked());
}

TEST(DragLockGuard, GuardAfterForceReleaseDoesNotFreeNewHolder)
{
    DragLock lock;
    {
        auto guard = lock.acquire("a");
        lock.force_release();
        EXPECT_TRUE(lock.try_lock("b"));
    }
    EXPECT_EQ(lock.owner(), std::optional<std::string>("b"));
}
