#include <gtest/gtest.h>

#include "fake_collaborators.hpp"
#include "ui/drag/drag_session.hpp"
#include "ui/drag/drop_zone_layout.hpp"

using namespace kestrel;
using kestrel::test::FakeFeedback;

class DragSessionTest : public ::testing::Test
{
   protected:
    void SetUp() override { session.set_feedback(&feedback); }

    DragSession  session;
    FakeFeedback feedback;

    const Container pinned  = Container::space_pinned(1);
    const Container regular = Container::space_regular(1);
};

// ─── Start ───────────────────────────────────────────────────────────────────

TEST_F(DragSessionTest, IdleByDefault)
{
    EXPECT_EQ(session.state(), DragSession::State::Idle);
    EXPECT_FALSE(session.is_dragging());
    EXPECT_EQ(session.dragged_item(), INVALID_TAB_ID);
}

TEST_F(DragSessionTest, StartSnapshotsOrigin)
{
    EXPECT_TRUE(session.start_drag(7, regular, 2));
    EXPECT_TRUE(session.is_dragging());
    EXPECT_EQ(session.dragged_item(), 7u);
    EXPECT_EQ(session.origin_container(), regular);
    EXPECT_EQ(session.origin_index(), 2);
    EXPECT_EQ(session.target_container(), regular);
    EXPECT_EQ(session.target_index(), 2);
    EXPECT_EQ(session.target_group(), std::optional<SpaceId>(1));
    EXPECT_EQ(feedback.pulses, 0);
}

TEST_F(DragSessionTest, StartClampsNegativeOrigin)
{
    session.start_drag(7, regular, -3);
    EXPECT_EQ(session.origin_index(), 0);
}

TEST_F(DragSessionTest, StartWhileDraggingIsRejected)
{
    session.start_drag(7, regular, 2);
    EXPECT_FALSE(session.start_drag(8, pinned, 0));
    EXPECT_EQ(session.dragged_item(), 7u);
}

TEST_F(DragSessionTest, StartWithInvalidItemIsRejected)
{
    EXPECT_FALSE(session.start_drag(INVALID_TAB_ID, regular, 0));
    EXPECT_FALSE(session.is_dragging());
}

// ─── Update target ───────────────────────────────────────────────────────────

TEST_F(DragSessionTest, UpdateWhileIdleIsIgnored)
{
    EXPECT_FALSE(session.update_target(pinned, 1));
    EXPECT_EQ(session.target_container(), Container::none());
    EXPECT_EQ(feedback.pulses, 0);
}

TEST_F(DragSessionTest, NegativeIndexStoredAsZero)
{
    session.start_drag(7, regular, 2);
    session.update_target(pinned, -5);
    EXPECT_EQ(session.target_index(), 0);
}

TEST_F(DragSessionTest, RepeatedTargetPulsesOnce)
{
    session.start_drag(7, regular, 0);
    session.update_target(pinned, 3);
    session.update_target(pinned, 3);
    EXPECT_EQ(feedback.pulses, 1);
    EXPECT_EQ(session.last_pulse_index(), std::optional<int>(3));
}

TEST_F(DragSessionTest, EachNewPairPulses)
{
    session.start_drag(7, regular, 0);
    session.update_target(regular, 1);
    session.update_target(regular, 2);
    session.update_target(pinned, 2);
    session.update_target(pinned, 2);
    EXPECT_EQ(feedback.pulses, 3);
}

TEST_F(DragSessionTest, OriginPairDoesNotPulse)
{
    session.start_drag(7, regular, 2);
    session.update_target(regular, 2);
    EXPECT_EQ(feedback.pulses, 0);
}

TEST_F(DragSessionTest, HapticsDisabledStillCounts)
{
    session.set_haptics_enabled(false);
    session.start_drag(7, regular, 0);
    session.update_target(pinned, 1);
    EXPECT_EQ(feedback.pulses, 0);
    EXPECT_EQ(session.pulse_count(), 1u);
}

TEST_F(DragSessionTest, ExplicitGroupOverridesContainerSpace)
{
    session.start_drag(7, regular, 0);
    session.update_target(Container::folder(4), 0, SpaceId{9});
    EXPECT_EQ(session.target_group(), std::optional<SpaceId>(9));

    session.update_target(Container::essentials(), 0);
    EXPECT_FALSE(session.target_group().has_value());
}

// ─── End ─────────────────────────────────────────────────────────────────────

TEST_F(DragSessionTest, CancelReturnsNothingAndResets)
{
    session.start_drag(7, regular, 2);
    session.update_target(pinned, 4);

    EXPECT_FALSE(session.end_drag(false).has_value());
    EXPECT_EQ(session.state(), DragSession::State::Idle);
    EXPECT_EQ(session.dragged_item(), INVALID_TAB_ID);
    EXPECT_EQ(session.origin_container(), Container::none());
    EXPECT_EQ(session.origin_index(), 0);
    EXPECT_EQ(session.target_container(), Container::none());
    EXPECT_EQ(session.target_index(), 0);
    EXPECT_FALSE(session.target_group().has_value());
    EXPECT_FALSE(session.last_pulse_index().has_value());
}

TEST_F(DragSessionTest, CommitAtOriginReturnsNothing)
{
    session.start_drag(7, regular, 2);
    session.update_target(pinned, 0);
    session.update_target(regular, 2);

    EXPECT_FALSE(session.end_drag(true).has_value());
    EXPECT_FALSE(session.is_dragging());
}

TEST_F(DragSessionTest, CommitProducesOperation)
{
    session.start_drag(7, Container::essentials(), 2);
    session.update_target(pinned, 0);

    auto op = session.end_drag(true);
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op->item, 7u);
    EXPECT_EQ(op->from_container, Container::essentials());
    EXPECT_EQ(op->from_index, 2);
    EXPECT_EQ(op->to_container, pinned);
    EXPECT_EQ(op->to_index, 0);
    EXPECT_EQ(op->to_space, std::optional<SpaceId>(1));
    EXPECT_TRUE(op->moving_between_containers());
    EXPECT_FALSE(op->is_reordering());
    EXPECT_FALSE(session.is_dragging());
}

TEST_F(DragSessionTest, EndWhileIdleReturnsNothing)
{
    EXPECT_FALSE(session.end_drag(true).has_value());
    EXPECT_FALSE(session.is_dragging());
}

TEST_F(DragSessionTest, CancelShorthand)
{
    session.start_drag(7, regular, 0);
    session.cancel();
    EXPECT_FALSE(session.is_dragging());
}

TEST_F(DragSessionTest, SessionReusableAfterEnd)
{
    session.start_drag(7, regular, 0);
    session.cancel();
    EXPECT_TRUE(session.start_drag(8, pinned, 1));
    EXPECT_EQ(session.dragged_item(), 8u);
}

// ─── Outside window ──────────────────────────────────────────────────────────

TEST_F(DragSessionTest, LeavingWindowClearsTarget)
{
    session.start_drag(7, regular, 1);
    session.set_outside_window(true);
    EXPECT_TRUE(session.is_outside_window());
    EXPECT_TRUE(session.target_container().is_none());
    EXPECT_EQ(feedback.pulses, 1);

    session.set_outside_window(true);   // no transition
    EXPECT_EQ(feedback.pulses, 1);

    session.set_outside_window(false);
    EXPECT_EQ(feedback.pulses, 2);
}

TEST_F(DragSessionTest, DropOutsideReturnsNothing)
{
    session.start_drag(7, regular, 1);
    session.update_target(pinned, 0);
    session.set_outside_window(true);
    EXPECT_FALSE(session.end_drag(true).has_value());
}

// ─── Reorder queries ─────────────────────────────────────────────────────────

TEST_F(DragSessionTest, SidebarReorder)
{
    session.start_drag(7, regular, 1);
    EXPECT_TRUE(session.is_sidebar_reorder());
    session.update_target(pinned, 0);
    EXPECT_FALSE(session.is_sidebar_reorder());
    session.cancel();

    session.start_drag(7, Container::essentials(), 1);
    EXPECT_FALSE(session.is_sidebar_reorder());
}

TEST_F(DragSessionTest, ReorderOffsetDraggingDown)
{
    session.start_drag(7, regular, 1);
    session.update_target(regular, 3);

    EXPECT_EQ(session.reorder_offset(regular, 0, 38.0f), 0.0f);
    EXPECT_EQ(session.reorder_offset(regular, 1, 38.0f), 0.0f);
    EXPECT_EQ(session.reorder_offset(regular, 2, 38.0f), -38.0f);
    EXPECT_EQ(session.reorder_offset(regular, 3, 38.0f), -38.0f);
    EXPECT_EQ(session.reorder_offset(regular, 4, 38.0f), 0.0f);
}

TEST_F(DragSessionTest, ReorderOffsetDraggingUp)
{
    session.start_drag(7, regular, 3);
    session.update_target(regular, 1);

    EXPECT_EQ(session.reorder_offset(regular, 0, 38.0f), 0.0f);
    EXPECT_EQ(session.reorder_offset(regular, 1, 38.0f), 38.0f);
    EXPECT_EQ(session.reorder_offset(regular, 2, 38.0f), 38.0f);
    EXPECT_EQ(session.reorder_offset(regular, 3, 38.0f), 0.0f);
}

TEST_F(DragSessionTest, ReorderOffsetOtherContainerIsZero)
{
    session.start_drag(7, regular, 3);
    session.update_target(regular, 1);
    EXPECT_EQ(session.reorder_offset(pinned, 2, 38.0f), 0.0f);
}

// ─── Insertion indicator ─────────────────────────────────────────────────────

TEST_F(DragSessionTest, IndicatorShownForKnownLayout)
{
    DropZoneLayouts layouts;
    DropZoneLayout  layout;
    layout.frame      = {0.0f, 100.0f, 200.0f, 400.0f};
    layout.item_count = 5;
    layouts.set_layout(pinned, layout);
    session.set_layouts(&layouts);

    session.start_drag(7, regular, 0);
    session.update_target(pinned, 2);
    ASSERT_EQ(feedback.indicators.size(), 1u);
    EXPECT_EQ(feedback.indicators[0].w, 200.0f);

    session.cancel();
    EXPECT_EQ(feedback.clears, 1);
}

TEST_F(DragSessionTest, NoIndicatorWithoutLayout)
{
    DropZoneLayouts layouts;
    session.set_layouts(&layouts);
    session.start_drag(7, regular, 0);
    session.update_target(pinned, 2);
    EXPECT_TRUE(feedback.indicators.empty());
    session.cancel();
    EXPECT_EQ(feedback.clears, 0);
}
