#include <gtest/gtest.h>

import Core;
import Graphics;

using Graphics::FrameState;

// -----------------------------------------------------------------------------
// MirrorSyncState
// -----------------------------------------------------------------------------

TEST(MirrorSyncState, FreshMirrorNeedsWriteInEverySlot)
{
    Graphics::MirrorSyncState sync;
    EXPECT_TRUE(sync.NeedsWrite(0));
    EXPECT_TRUE(sync.NeedsWrite(1));
}

TEST(MirrorSyncState, WriteSynchronizesOnlyThatSlot)
{
    Graphics::MirrorSyncState sync;
    sync.MarkWritten(0);
    EXPECT_TRUE(sync.IsSynchronized(0));
    EXPECT_FALSE(sync.IsSynchronized(1));
}

TEST(MirrorSyncState, DirtyAfterWriteMakesSlotsStale)
{
    Graphics::MirrorSyncState sync;
    sync.MarkWritten(0);
    sync.MarkWritten(1);
    EXPECT_TRUE(sync.IsSynchronized(0));
    EXPECT_TRUE(sync.IsSynchronized(1));

    const uint64_t before = sync.GetGeneration();
    sync.MarkDirty();
    EXPECT_EQ(sync.GetGeneration(), before + 1);
    EXPECT_TRUE(sync.NeedsWrite(0));
    EXPECT_TRUE(sync.NeedsWrite(1));
}

// -----------------------------------------------------------------------------
// Frame state transitions
// -----------------------------------------------------------------------------

TEST(FrameState, LegalSequence)
{
    EXPECT_TRUE(Graphics::IsValidTransition(FrameState::Idle, FrameState::FrameAcquired));
    EXPECT_TRUE(Graphics::IsValidTransition(FrameState::FrameAcquired, FrameState::CommandsRecorded));
    EXPECT_TRUE(Graphics::IsValidTransition(FrameState::CommandsRecorded, FrameState::Submitted));
    EXPECT_TRUE(Graphics::IsValidTransition(FrameState::Submitted, FrameState::Presented));
    EXPECT_TRUE(Graphics::IsValidTransition(FrameState::Presented, FrameState::Idle));
    EXPECT_TRUE(Graphics::IsValidTransition(FrameState::Idle, FrameState::Idle));
}

TEST(FrameState, SkippingAStepIsIllegal)
{
    EXPECT_FALSE(Graphics::IsValidTransition(FrameState::Idle, FrameState::CommandsRecorded));
    EXPECT_FALSE(Graphics::IsValidTransition(FrameState::FrameAcquired, FrameState::Submitted));
    EXPECT_FALSE(Graphics::IsValidTransition(FrameState::CommandsRecorded, FrameState::Presented));
    EXPECT_FALSE(Graphics::IsValidTransition(FrameState::Submitted, FrameState::Idle));
    EXPECT_FALSE(Graphics::IsValidTransition(FrameState::Presented, FrameState::FrameAcquired));
}

TEST(FrameState, Names)
{
    EXPECT_EQ(Graphics::FrameStateToString(FrameState::Submitted), "Submitted");
    EXPECT_EQ(Graphics::FrameStateToString(FrameState::Idle), "Idle");
}

// -----------------------------------------------------------------------------
// AcquireWithRetry
// -----------------------------------------------------------------------------

TEST(AcquireWithRetry, SuccessDoesNotReconfigure)
{
    int acquires = 0;
    int reconfigures = 0;

    auto result = Graphics::AcquireWithRetry(
        [&]() -> Core::Expected<int> { ++acquires; return 7; },
        [&]() -> Core::Result { ++reconfigures; return Core::Ok(); });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(acquires, 1);
    EXPECT_EQ(reconfigures, 0);
}

TEST(AcquireWithRetry, TransientErrorRetriesExactlyOnce)
{
    int acquires = 0;
    int reconfigures = 0;

    auto result = Graphics::AcquireWithRetry(
        [&]() -> Core::Expected<int>
        {
            ++acquires;
            if (acquires == 1) return std::unexpected(Core::ErrorCode::SwapchainOutOfDate);
            return 3;
        },
        [&]() -> Core::Result { ++reconfigures; return Core::Ok(); });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3);
    EXPECT_EQ(acquires, 2);
    EXPECT_EQ(reconfigures, 1);
}

TEST(AcquireWithRetry, SecondFailureIsFinal)
{
    int acquires = 0;
    int reconfigures = 0;

    auto result = Graphics::AcquireWithRetry(
        [&]() -> Core::Expected<int> { ++acquires; return std::unexpected(Core::ErrorCode::SurfaceLost); },
        [&]() -> Core::Result { ++reconfigures; return Core::Ok(); });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::SurfaceLost);
    EXPECT_EQ(acquires, 2);
    EXPECT_EQ(reconfigures, 1);
}

TEST(AcquireWithRetry, FatalErrorIsNotRetried)
{
    int acquires = 0;
    int reconfigures = 0;

    auto result = Graphics::AcquireWithRetry(
        [&]() -> Core::Expected<int> { ++acquires; return std::unexpected(Core::ErrorCode::DeviceLost); },
        [&]() -> Core::Result { ++reconfigures; return Core::Ok(); });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::DeviceLost);
    EXPECT_EQ(acquires, 1);
    EXPECT_EQ(reconfigures, 0);
}

TEST(AcquireWithRetry, FailedReconfigureStopsRetry)
{
    int acquires = 0;

    auto result = Graphics::AcquireWithRetry(
        [&]() -> Core::Expected<int> { ++acquires; return std::unexpected(Core::ErrorCode::SwapchainOutOfDate); },
        [&]() -> Core::Result { return Core::Err(Core::ErrorCode::SurfaceConfigFailed); });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::SurfaceConfigFailed);
    EXPECT_EQ(acquires, 1);
}
