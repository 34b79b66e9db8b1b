#include <gtest/gtest.h>
#include <vector>
#include "scene/frame_cursor.h"

TEST(FrameCursorTest, StartsAtFirstFramePaused) {
    FrameCursor cursor;
    EXPECT_EQ(cursor.getCurrentFrame(), 0);
    EXPECT_EQ(cursor.getLoopCount(), 0);
    EXPECT_FALSE(cursor.isPlaying());
}

TEST(FrameCursorTest, AdvancesOnlyWhilePlaying) {
    FrameCursor cursor;
    cursor.advance();
    EXPECT_EQ(cursor.getCurrentFrame(), 0);

    cursor.setPlaying(true);
    cursor.advance();
    cursor.advance();
    EXPECT_EQ(cursor.getCurrentFrame(), 2);
}

TEST(FrameCursorTest, WrapsAndCountsLoops) {
    FrameCursor cursor;
    cursor.setPlaying(true);
    const int frameCount = 5;

    // One tick = wrap, draw, advance
    std::vector<int> drawn;
    for (int tick = 0; tick < 12; ++tick) {
        cursor.wrap(frameCount);
        drawn.push_back(cursor.getCurrentFrame());
        cursor.advance();
    }
    std::vector<int> expected = { 0, 1, 2, 3, 4, 0, 1, 2, 3, 4, 0, 1 };
    EXPECT_EQ(drawn, expected);
    EXPECT_EQ(cursor.getLoopCount(), 2);
}

TEST(FrameCursorTest, ScrubWhilePausedIsExact) {
    FrameCursor cursor;
    EXPECT_TRUE(cursor.scrubTo(3, 10, true));
    for (int tick = 0; tick < 5; ++tick) {
        cursor.wrap(10);
        EXPECT_EQ(cursor.getCurrentFrame(), 3);
        cursor.advance();
    }
}

TEST(FrameCursorTest, ScrubIsIgnoredBeforeLoading) {
    FrameCursor cursor;
    EXPECT_FALSE(cursor.scrubTo(3, 10, false));
    EXPECT_EQ(cursor.getCurrentFrame(), 0);
}

TEST(FrameCursorTest, ScrubClampsIntoRange) {
    FrameCursor cursor;
    cursor.scrubTo(42, 10, true);
    EXPECT_EQ(cursor.getCurrentFrame(), 9);
    cursor.scrubTo(-3, 10, true);
    EXPECT_EQ(cursor.getCurrentFrame(), 0);
    EXPECT_EQ(cursor.getLoopCount(), 0);
}

TEST(FrameCursorTest, StepMovesOneFrame) {
    FrameCursor cursor;
    cursor.step(1, 10, true);
    cursor.step(1, 10, true);
    cursor.step(-1, 10, true);
    EXPECT_EQ(cursor.getCurrentFrame(), 1);
    cursor.step(-5, 10, true);
    EXPECT_EQ(cursor.getCurrentFrame(), 0);
}

TEST(FrameCursorTest, TogglePlaying) {
    FrameCursor cursor;
    cursor.togglePlaying();
    EXPECT_TRUE(cursor.isPlaying());
    cursor.togglePlaying();
    EXPECT_FALSE(cursor.isPlaying());
}

TEST(FrameCursorTest, ShownFrameStaysInRangeBetweenTicks) {
    FrameCursor cursor;
    cursor.setPlaying(true);
    const int frameCount = 3;

    // The UI reads the cursor after the tick has advanced it
    for (int tick = 0; tick < 6; ++tick) {
        cursor.wrap(frameCount);
        int drawn = cursor.getCurrentFrame();
        cursor.advance();
        EXPECT_EQ(cursor.getShownFrame(), drawn);
        EXPECT_LT(cursor.getShownFrame(), frameCount);
    }
    EXPECT_EQ(cursor.getCurrentFrame(), frameCount);
}

TEST(FrameCursorTest, ScrubUpdatesShownFrameImmediately) {
    FrameCursor cursor;
    ASSERT_TRUE(cursor.scrubTo(4, 10, true));
    EXPECT_EQ(cursor.getShownFrame(), 4);
    cursor.reset();
    EXPECT_EQ(cursor.getShownFrame(), 0);
}
