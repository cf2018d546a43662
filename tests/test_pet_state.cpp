#include "PetState.h"
#include "Settings.h"
#include <gtest/gtest.h>

namespace AnimaEngine {

    // ---------------------------------------------------------------------------
    // Idle
    // ---------------------------------------------------------------------------

    TEST(PetState, IdleTimerArmedOnlyWithIdleAnimation) {
        PetState withIdle("walk.gif", "idle.gif", false);
        EXPECT_TRUE(withIdle.IdleTimerActive());
        EXPECT_EQ(withIdle.IdleRemainingMs(), IDLE_TIMEOUT_MS);

        PetState withoutIdle("walk.gif", "", false);
        EXPECT_FALSE(withoutIdle.IdleTimerActive());
        EXPECT_FALSE(withoutIdle.Update(IDLE_TIMEOUT_MS * 2));
        EXPECT_FALSE(withoutIdle.IsIdle());
        EXPECT_FALSE(withoutIdle.EnterIdle());
    }

    TEST(PetState, GoesIdleAfterQuietPeriod) {
        PetState state("walk.gif", "idle.gif", false);

        EXPECT_FALSE(state.Update(IDLE_TIMEOUT_MS - 1));
        EXPECT_FALSE(state.IsIdle());

        EXPECT_TRUE(state.Update(1));
        EXPECT_TRUE(state.IsIdle());
        EXPECT_EQ(state.CurrentAnimation(), "idle.gif");
        EXPECT_EQ(state.ActiveAnimation(), "walk.gif");

        // Single shot
        EXPECT_FALSE(state.IdleTimerActive());
        EXPECT_FALSE(state.Update(IDLE_TIMEOUT_MS));
    }

    TEST(PetState, EnterIdleTwiceChangesNothing) {
        PetState state("walk.gif", "idle.gif", false);
        EXPECT_TRUE(state.EnterIdle());
        EXPECT_FALSE(state.EnterIdle());
    }

    TEST(PetState, ExitIdleRestoresActiveAnimationAndRearms) {
        PetState state("walk.gif", "idle.gif", false);
        state.EnterIdle();

        EXPECT_TRUE(state.ExitIdle());
        EXPECT_FALSE(state.IsIdle());
        EXPECT_EQ(state.CurrentAnimation(), "walk.gif");
        EXPECT_TRUE(state.IdleTimerActive());
        EXPECT_EQ(state.IdleRemainingMs(), IDLE_TIMEOUT_MS);

        // Not idle: nothing to restore, timer still re-armed
        state.Update(1000);
        EXPECT_FALSE(state.ExitIdle());
        EXPECT_EQ(state.IdleRemainingMs(), IDLE_TIMEOUT_MS);
    }

    TEST(PetState, SetAnimationLeavesIdle) {
        PetState state("walk.gif", "idle.gif", false);
        state.EnterIdle();

        state.SetAnimation("run.gif");
        EXPECT_FALSE(state.IsIdle());
        EXPECT_EQ(state.ActiveAnimation(), "run.gif");
        EXPECT_EQ(state.CurrentAnimation(), "run.gif");
        EXPECT_EQ(state.IdleRemainingMs(), IDLE_TIMEOUT_MS);
    }

    // ---------------------------------------------------------------------------
    // Drag and lock
    // ---------------------------------------------------------------------------

    TEST(PetState, DragMovesByPointerMinusOffset) {
        PetState state("walk.gif", "", false);
        state.Press(40, 25);
        ASSERT_TRUE(state.IsDragging());

        auto pos = state.DragTo(500, 300);
        ASSERT_TRUE(pos.has_value());
        EXPECT_EQ(*pos, (Point{460, 275}));
    }

    TEST(PetState, NoDragWithoutPress) {
        PetState state("walk.gif", "", false);
        EXPECT_FALSE(state.DragTo(10, 10).has_value());
    }

    TEST(PetState, PressCancelsIdle) {
        PetState state("walk.gif", "idle.gif", false);
        state.EnterIdle();

        state.Press(0, 0);
        EXPECT_FALSE(state.IsIdle());
        EXPECT_EQ(state.CurrentAnimation(), "walk.gif");
    }

    TEST(PetState, LockedPetDoesNotDrag) {
        PetState state("walk.gif", "", false);
        state.ToggleLock();
        ASSERT_TRUE(state.IsLocked());

        state.Press(10, 10);
        EXPECT_FALSE(state.IsDragging());
        EXPECT_FALSE(state.DragTo(100, 100).has_value());
    }

    TEST(PetState, LockingMidDragStopsMovement) {
        PetState state("walk.gif", "", false);
        state.Press(10, 10);
        state.ToggleLock();
        EXPECT_FALSE(state.DragTo(100, 100).has_value());

        state.ToggleLock();
        EXPECT_FALSE(state.IsLocked());
        EXPECT_TRUE(state.DragTo(100, 100).has_value());
    }

    TEST(PetState, ReleaseEndsDragAndReportsPersistence) {
        PetState main("walk.gif", "", true);
        main.Press(1, 1);
        EXPECT_TRUE(main.Release());
        EXPECT_FALSE(main.IsDragging());

        PetState extra("walk.gif", "", false);
        extra.Press(1, 1);
        EXPECT_FALSE(extra.Release());
    }

    // ---------------------------------------------------------------------------
    // Fade-in
    // ---------------------------------------------------------------------------

    TEST(PetState, FadeStepsTowardsTarget) {
        PetState state("walk.gif", "", true);
        state.StartFadeIn(0.8);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.0);
        EXPECT_TRUE(state.IsFading());

        state.Update(FADE_STEP_MS - 1);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.0);

        state.Update(1);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.8 / FADE_STEPS);

        state.Update(FADE_STEP_MS * 9);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.8 * 10 / FADE_STEPS);
        EXPECT_TRUE(state.IsFading());
    }

    TEST(PetState, FadeFinishesAtTarget) {
        PetState state("walk.gif", "", true);
        state.StartFadeIn(0.6);

        state.Update(FADE_STEP_MS * FADE_STEPS + 500);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.6);
        EXPECT_FALSE(state.IsFading());

        state.Update(FADE_STEP_MS * 5);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.6);
    }

    TEST(PetState, SetOpacityCancelsFade) {
        PetState state("walk.gif", "", true);
        state.StartFadeIn(1.0);
        state.Update(FADE_STEP_MS * 3);

        state.SetOpacity(0.5);
        EXPECT_FALSE(state.IsFading());

        state.Update(FADE_STEP_MS * FADE_STEPS);
        EXPECT_DOUBLE_EQ(state.GetOpacity(), 0.5);
    }

} // namespace AnimaEngine
