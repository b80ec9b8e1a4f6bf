#include <gtest/gtest.h>

#include <chrono>
#include <kestrel/shell.hpp>
#include <memory>

#include "fake_collaborators.hpp"

using namespace kestrel;
using namespace kestrel::test;
using std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════════════════════════
// Shell integration: window lifecycle, surface cleanup, drag commit pipeline
// and selection reconciliation, all wired through one Shell with fakes.
// ═══════════════════════════════════════════════════════════════════════════════

class ShellTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        shell = std::make_unique<Shell>();
        shell->set_render_engine(&engine);
        shell->set_tab_list(&tabs);
        shell->set_feedback(&feedback);
        shell->set_persistence(&persistence);
    }

    void TearDown() override { shell.reset(); }

    // Collaborators are declared first so they outlive the shell.
    FakeEngine             engine;
    FakeTabList            tabs;
    FakeFeedback           feedback;
    FakePersistence        persistence;
    std::unique_ptr<Shell> shell;

    const Container essentials = Container::essentials();
    const Container pinned     = Container::space_pinned(1);
    const Container regular    = Container::space_regular(1);
};

// ─── Windows ─────────────────────────────────────────────────────────────────

TEST_F(ShellTest, OpenAssignsIdsAndActivatesFirst)
{
    WindowId a = shell->open_window();
    WindowId b = shell->open_window();
    EXPECT_NE(a, INVALID_WINDOW_ID);
    EXPECT_NE(a, b);
    EXPECT_EQ(shell->windows().active_id(), std::optional<WindowId>(a));
}

TEST_F(ShellTest, OpenWithTakenIdFails)
{
    WindowContext ctx;
    ctx.id = 4;
    EXPECT_EQ(shell->open_window(ctx), 4u);
    EXPECT_EQ(shell->open_window(ctx), INVALID_WINDOW_ID);
    EXPECT_EQ(shell->open_window(), 5u);
}

TEST_F(ShellTest, CloseWindowPurgesItsSurfaces)
{
    WindowId w1 = shell->open_window();
    auto     s  = shell->show_tab(1, w1, "https://a.test");
    ASSERT_TRUE(s.has_value());

    int cleanups = 0;
    shell->windows().add_observer(
        [&](WindowRegistry::Change c, WindowId)
        {
            if (c == WindowRegistry::Change::Unregistered)
                ++cleanups;
        });

    EXPECT_TRUE(shell->close_window(w1));
    EXPECT_FALSE(shell->surfaces().get(1, w1).has_value());
    EXPECT_TRUE(shell->surfaces().for_window(w1).empty());
    EXPECT_EQ(engine.dispose_count(s->handle), 1u);
    EXPECT_EQ(cleanups, 1);

    EXPECT_FALSE(shell->close_window(w1));
    EXPECT_EQ(engine.dispose_count(s->handle), 1u);
}

TEST_F(ShellTest, ClosingActivePromotesEarliestRemaining)
{
    WindowId a = shell->open_window();
    WindowId b = shell->open_window();
    WindowId c = shell->open_window();
    shell->focus_window(c);

    shell->close_window(c);
    EXPECT_EQ(shell->windows().active_id(), std::optional<WindowId>(a));
    shell->close_window(b);
    EXPECT_EQ(shell->windows().active_id(), std::optional<WindowId>(a));
    shell->close_window(a);
    EXPECT_FALSE(shell->windows().active_id().has_value());
}

TEST_F(ShellTest, FocusUnknownWindowIgnored)
{
    WindowId a = shell->open_window();
    EXPECT_FALSE(shell->focus_window(999));
    EXPECT_EQ(shell->windows().active_id(), std::optional<WindowId>(a));
}

TEST_F(ShellTest, CloseWindowKeepsOtherWindowsSurfaces)
{
    WindowId w1 = shell->open_window();
    WindowId w2 = shell->open_window();
    shell->show_tab(1, w1, "https://a.test");
    auto keep = shell->show_tab(1, w2, "https://a.test");

    shell->close_window(w1);
    EXPECT_EQ(shell->surfaces().get(1, w2), keep);
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

TEST_F(ShellTest, ShowTabRecordsSelection)
{
    WindowId w = shell->open_window();
    shell->show_tab(3, w, "https://a.test");
    EXPECT_EQ(shell->windows().get(w)->selected_tab, std::optional<TabId>(3));
}

TEST_F(ShellTest, ShowTabInUnknownWindowFails)
{
    EXPECT_FALSE(shell->show_tab(3, 42, "https://a.test").has_value());
    EXPECT_EQ(engine.created.size(), 0u);
}

TEST_F(ShellTest, NavigatePropagatesToOtherWindows)
{
    WindowId w1 = shell->open_window();
    WindowId w2 = shell->open_window();
    shell->show_tab(1, w1, "https://a.test");
    shell->show_tab(1, w2, "https://a.test");

    EXPECT_EQ(shell->navigate_tab(1, w1, "https://b.test"), 1u);
    EXPECT_EQ(engine.locators[shell->surfaces().get(1, w2)->handle], "https://b.test");
}

TEST_F(ShellTest, CloseTabRemovesEverywhereAndClearsSelection)
{
    WindowId w1 = shell->open_window();
    WindowId w2 = shell->open_window();
    shell->show_tab(1, w1, "https://a.test");
    shell->show_tab(1, w2, "https://a.test");

    EXPECT_EQ(shell->close_tab(1), 2u);
    EXPECT_TRUE(shell->surfaces().all_for_tab(1).empty());
    EXPECT_FALSE(shell->windows().get(w1)->selected_tab.has_value());
    EXPECT_FALSE(shell->windows().get(w2)->selected_tab.has_value());
}

// ─── Drag pipeline ───────────────────────────────────────────────────────────

TEST_F(ShellTest, CommittedCrossContainerMoveIsAppliedAndPersisted)
{
    WindowId w = shell->open_window();
    tabs.list(essentials) = {10, 11, 12};
    tabs.list(pinned)     = {20};
    shell->show_tab(12, w, "https://a.test");

    ASSERT_TRUE(shell->begin_tab_drag(12, essentials, 2, w));
    shell->update_tab_drag(pinned, 0);
    auto op = shell->finish_tab_drag();

    ASSERT_TRUE(op.has_value());
    EXPECT_TRUE(op->moving_between_containers());
    EXPECT_FALSE(op->is_reordering());
    EXPECT_EQ(tabs.list(essentials), (std::vector<TabId>{10, 11}));
    EXPECT_EQ(tabs.list(pinned), (std::vector<TabId>{12, 20}));
    ASSERT_EQ(persistence.changes.size(), 1u);
    EXPECT_EQ(persistence.changes[0], *op);
    EXPECT_FALSE(shell->drag().is_dragging());
    EXPECT_FALSE(shell->drag_lock().is_locked());
}

TEST_F(ShellTest, ReleaseAtOriginChangesNothing)
{
    WindowId w = shell->open_window();
    tabs.list(regular) = {1, 2, 3};

    shell->begin_tab_drag(2, regular, 1, w);
    shell->update_tab_drag(regular, 2);
    shell->update_tab_drag(regular, 1);
    EXPECT_FALSE(shell->finish_tab_drag().has_value());
    EXPECT_TRUE(tabs.applied.empty());
    EXPECT_TRUE(persistence.changes.empty());
    EXPECT_FALSE(shell->drag_lock().is_locked());
}

TEST_F(ShellTest, CancelLeavesNoResidualState)
{
    WindowId w = shell->open_window();
    tabs.list(regular) = {1, 2, 3};

    shell->begin_tab_drag(2, regular, 1, w);
    shell->update_tab_drag(pinned, 0);
    shell->cancel_tab_drag();

    EXPECT_FALSE(shell->drag().is_dragging());
    EXPECT_TRUE(shell->drag().target_container().is_none());
    EXPECT_FALSE(shell->drag_lock().is_locked());
    EXPECT_EQ(shell->drag_window(), INVALID_WINDOW_ID);
    EXPECT_TRUE(tabs.applied.empty());
}

TEST_F(ShellTest, SecondDragRefusedWhileOneRuns)
{
    WindowId a = shell->open_window();
    WindowId b = shell->open_window();
    EXPECT_TRUE(shell->begin_tab_drag(1, regular, 0, a));
    EXPECT_FALSE(shell->begin_tab_drag(2, regular, 1, b));
    EXPECT_EQ(shell->drag().dragged_item(), 1u);
}

TEST_F(ShellTest, InvalidItemDoesNotHoldLock)
{
    WindowId a = shell->open_window();
    EXPECT_FALSE(shell->begin_tab_drag(INVALID_TAB_ID, regular, 0, a));
    EXPECT_FALSE(shell->drag_lock().is_locked());
}

TEST_F(ShellTest, RejectedByTabListNotPersisted)
{
    WindowId w = shell->open_window();
    tabs.list(regular) = {1, 2, 3};
    tabs.reject        = true;

    shell->begin_tab_drag(1, regular, 0, w);
    shell->update_tab_drag(regular, 2);
    EXPECT_FALSE(shell->finish_tab_drag().has_value());
    EXPECT_EQ(tabs.applied.size(), 1u);
    EXPECT_TRUE(persistence.changes.empty());
}

TEST_F(ShellTest, StaleSourceIndexRejected)
{
    WindowId w = shell->open_window();
    tabs.list(regular) = {1};

    shell->begin_tab_drag(5, regular, 3, w);
    shell->update_tab_drag(pinned, 0);
    EXPECT_FALSE(shell->finish_tab_drag().has_value());
    EXPECT_TRUE(tabs.applied.empty());
}

TEST_F(ShellTest, DropIntoOtherWindowCreatesSurfaceThere)
{
    WindowId w1 = shell->open_window();
    WindowId w2 = shell->open_window();
    Container left  = Container::space_regular(w1);
    Container right = Container::space_regular(w2);
    tabs.list(left)  = {1, 2};
    tabs.list(right) = {3};
    shell->show_tab(2, w1, "https://two.test");

    shell->begin_tab_drag(2, left, 1, w1);
    shell->update_tab_drag(right, 1);
    auto op = shell->finish_tab_drag(w2);

    ASSERT_TRUE(op.has_value());
    auto moved = shell->surfaces().get(2, w2);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(engine.locators[moved->handle], "https://two.test");
}

TEST_F(ShellTest, ClosingDragWindowCancelsDrag)
{
    WindowId w = shell->open_window();
    shell->begin_tab_drag(1, regular, 0, w);
    shell->close_window(w);
    EXPECT_FALSE(shell->drag().is_dragging());
    EXPECT_FALSE(shell->drag_lock().is_locked());
}

TEST_F(ShellTest, ClosingDraggedTabCancelsDrag)
{
    WindowId w = shell->open_window();
    shell->show_tab(1, w, "https://a.test");
    shell->begin_tab_drag(1, regular, 0, w);
    shell->close_tab(1);
    EXPECT_FALSE(shell->drag().is_dragging());
}

// ─── Pointer-driven drag ─────────────────────────────────────────────────────

TEST_F(ShellTest, PressBelowThresholdIsAClick)
{
    WindowId w = shell->open_window();
    shell->press_tab(1, regular, 0, w, {10.0f, 10.0f});
    EXPECT_FALSE(shell->pointer_moved({12.0f, 11.0f}));
    EXPECT_FALSE(shell->drag().is_dragging());
    EXPECT_FALSE(shell->release_pointer().has_value());
    EXPECT_FALSE(shell->pointer_moved({100.0f, 100.0f}));
}

TEST_F(ShellTest, PressPastThresholdStartsDrag)
{
    WindowId w = shell->open_window();
    tabs.list(regular) = {1, 2, 3, 4};

    DropZoneLayout layout;
    layout.frame      = {0.0f, 0.0f, 200.0f, 400.0f};
    layout.item_count = 4;
    shell->layouts().set_layout(regular, layout);

    shell->press_tab(1, regular, 0, w, {10.0f, 10.0f});
    EXPECT_TRUE(shell->pointer_moved({10.0f, 20.0f}));
    EXPECT_TRUE(shell->drag().is_dragging());

    shell->update_tab_drag_at(regular, {10.0f, 76.0f});   // row 2
    EXPECT_EQ(shell->drag().target_index(), 2);
    EXPECT_EQ(feedback.pulses, 1);
    EXPECT_EQ(feedback.indicators.size(), 1u);

    auto op = shell->release_pointer();
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(tabs.list(regular), (std::vector<TabId>{2, 3, 1, 4}));
}

TEST_F(ShellTest, HapticsFollowConfig)
{
    WindowId            w = shell->open_window();
    ShellConfig::Values v = shell->config().values();
    v.haptics_enabled     = false;
    shell->config().set_values(v);

    shell->begin_tab_drag(1, regular, 0, w);
    shell->update_tab_drag(pinned, 0);
    EXPECT_EQ(feedback.pulses, 0);
}

// ─── Selection reconciliation ────────────────────────────────────────────────

TEST_F(ShellTest, ReconcileCorrectsDrift)
{
    WindowId w = shell->open_window();
    shell->push_selection(w, TabId{1});
    tabs.selected[w] = 2;

    EXPECT_EQ(shell->reconcile_now(), 1u);
    EXPECT_EQ(shell->windows().get(w)->selected_tab, std::optional<TabId>(2));
    EXPECT_EQ(shell->reconcile_now(), 0u);
}

TEST_F(ShellTest, PollNeverRegressesConcurrentPush)
{
    WindowId w = shell->open_window();
    tabs.selected[w] = 2;   // stale answer
    tabs.on_query    = [&](WindowId id) { shell->push_selection(id, TabId{3}); };

    EXPECT_EQ(shell->reconcile_now(), 0u);
    EXPECT_EQ(shell->windows().get(w)->selected_tab, std::optional<TabId>(3));
}

TEST_F(ShellTest, RequestReconcileIsDebounced)
{
    WindowId w = shell->open_window();
    int      queries = 0;
    tabs.on_query    = [&](WindowId) { ++queries; };
    tabs.selected[w] = 5;

    auto start = shell->scheduler().now();
    for (int i = 0; i < 5; ++i)
        shell->request_reconcile();
    shell->tick(start + milliseconds(49));
    EXPECT_EQ(queries, 0);
    shell->tick(start + milliseconds(50));
    EXPECT_EQ(queries, 1);
    EXPECT_EQ(shell->windows().get(w)->selected_tab, std::optional<TabId>(5));
}

TEST_F(ShellTest, PollingRunsPeriodically)
{
    shell->open_window();
    int queries   = 0;
    tabs.on_query = [&](WindowId) { ++queries; };

    EXPECT_TRUE(shell->start_polling());
    EXPECT_FALSE(shell->start_polling());
    auto start = shell->scheduler().now();
    shell->tick(start + milliseconds(1000));
    shell->tick(start + milliseconds(2000));
    EXPECT_EQ(queries, 2);

    shell->stop_polling();
    shell->tick(start + milliseconds(3000));
    EXPECT_EQ(queries, 2);
}

// ─── Shutdown ────────────────────────────────────────────────────────────────

TEST_F(ShellTest, DestructionDisposesEverything)
{
    WindowId w1 = shell->open_window();
    WindowId w2 = shell->open_window();
    shell->show_tab(1, w1, "https://a.test");
    shell->show_tab(1, w2, "https://a.test");
    shell->show_tab(2, w2, "https://b.test");

    shell.reset();
    EXPECT_EQ(engine.disposed.size(), 3u);
}
