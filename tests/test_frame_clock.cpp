#include "Animation.h"
#include <gtest/gtest.h>

namespace AnimaEngine {

    TEST(FrameClock, MissingDelaysUseDefault) {
        FrameClock clock({100, 50, 0});
        EXPECT_EQ(clock.FrameCount(), 3u);
        EXPECT_EQ(clock.TotalDurationMs(), 100 + 50 + DEFAULT_FRAME_DELAY_MS);
    }

    TEST(FrameClock, AdvancesThroughFrames) {
        FrameClock clock({100, 50, 0});
        EXPECT_EQ(clock.CurrentFrame(), 0u);

        EXPECT_FALSE(clock.Advance(99));
        EXPECT_EQ(clock.CurrentFrame(), 0u);

        EXPECT_TRUE(clock.Advance(1));
        EXPECT_EQ(clock.CurrentFrame(), 1u);

        EXPECT_TRUE(clock.Advance(50));
        EXPECT_EQ(clock.CurrentFrame(), 2u);
    }

    TEST(FrameClock, WrapsAfterLastFrame) {
        FrameClock clock({100, 50, 0});
        clock.Advance(240);
        EXPECT_EQ(clock.CurrentFrame(), 2u);

        EXPECT_TRUE(clock.Advance(10));
        EXPECT_EQ(clock.CurrentFrame(), 0u);
    }

    TEST(FrameClock, LongStallSkipsWholeLoops) {
        FrameClock clock({100, 50, 0});
        // 10 full loops plus 120ms lands inside the second frame
        clock.Advance(250 * 10 + 120);
        EXPECT_EQ(clock.CurrentFrame(), 1u);
    }

    TEST(FrameClock, SingleFrameNeverChanges) {
        FrameClock clock({80});
        EXPECT_FALSE(clock.Advance(1000));
        EXPECT_EQ(clock.CurrentFrame(), 0u);

        FrameClock empty;
        EXPECT_FALSE(empty.Advance(1000));
        EXPECT_EQ(empty.FrameCount(), 0u);
    }

    TEST(FrameClock, IgnoresNonPositiveDelta) {
        FrameClock clock({10, 10});
        EXPECT_FALSE(clock.Advance(0));
        EXPECT_FALSE(clock.Advance(-50));
        EXPECT_EQ(clock.CurrentFrame(), 0u);
    }

} // namespace AnimaEngine
