#pragma once

#include <functional>
#include <kestrel/collaborators.hpp>
#include <kestrel/container.hpp>
#include <kestrel/drag_operation.hpp>
#include <kestrel/fwd.hpp>
#include <kestrel/geometry.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "../src/ui/drag/drag_lock.hpp"
#include "../src/ui/drag/drag_session.hpp"
#include "../src/ui/drag/drop_zone_layout.hpp"
#include "../src/ui/scheduler/reconciled.hpp"
#include "../src/ui/scheduler/task_scheduler.hpp"
#include "../src/ui/shell_config.hpp"
#include "../src/ui/surfaces/surface_coordinator.hpp"
#include "../src/ui/surfaces/surface_registry.hpp"
#include "../src/ui/window/window_registry.hpp"

namespace kestrel
{

struct ShellOptions
{
    std::string config_path;   // non-empty → load ShellConfig from this file
};

// Root object of the shell core.  Built once at startup and passed by
// reference; owns every registry and the timer queue, and wires them
// together:
//
//   WindowRegistry ──close──► SurfaceCoordinator::cleanup_window
//   DragSession ──commit──► TabListModel::apply ──► SurfaceCoordinator::apply
//                                                └─► PersistenceSink
//
// Collaborators are not owned and must outlive the Shell (or be reset to
// nullptr first).
class Shell
{
   public:
    explicit Shell(const ShellOptions& options = {});
    ~Shell();

    Shell(const Shell&)            = delete;
    Shell& operator=(const Shell&) = delete;

    // ── Collaborators ───────────────────────────────────────────────────

    void set_render_engine(RenderEngine* engine) { coordinator_.set_engine(engine); }
    void set_tab_list(TabListModel* model) { tab_list_ = model; }
    void set_feedback(FeedbackSink* sink) { drag_.set_feedback(sink); }
    void set_persistence(PersistenceSink* sink) { persistence_ = sink; }

    // ── Windows ─────────────────────────────────────────────────────────

    // Register a window.  An invalid id is replaced by a fresh one.  The
    // first window opened becomes active.  Returns INVALID_WINDOW_ID if the
    // id is already taken.
    WindowId open_window(WindowContext context = {});

    // Unregister (surfaces are disposed by the close hook).  When the active
    // window closes, the earliest remaining window is promoted.
    bool close_window(WindowId id);

    bool focus_window(WindowId id);

    void attach_compositor_host(WindowId id, std::weak_ptr<CompositorHost> host)
    {
        surfaces_.set_compositor_host(id, std::move(host));
    }

    // ── Tabs ────────────────────────────────────────────────────────────

    // Show `tab` in `window`: ensure a surface and record the selection.
    std::optional<RenderSurface> show_tab(TabId tab, WindowId window, const std::string& locator);

    // A surface in `origin` navigated; bring the tab's other windows along.
    size_t navigate_tab(TabId tab, WindowId origin, const std::string& locator);

    size_t close_tab(TabId tab);
    size_t set_tab_muted(TabId tab, bool muted, WindowId origin = INVALID_WINDOW_ID)
    {
        return coordinator_.set_muted(tab, muted, origin);
    }
    size_t reload_tab(TabId tab) { return coordinator_.reload_tab(tab); }

    // ── Tab drag ────────────────────────────────────────────────────────

    // Start a drag immediately.  Fails while any window is dragging.
    bool begin_tab_drag(TabId tab, const Container& origin, int origin_index, WindowId window);

    // Pointer-driven start: press arms a drag, which begins once the pointer
    // travels further than drag_threshold_px.  A release before that is a
    // plain click.
    bool press_tab(TabId tab, const Container& origin, int origin_index, WindowId window, Point pos);
    bool pointer_moved(Point pos);
    std::optional<DragOperation> release_pointer(WindowId drop_window = INVALID_WINDOW_ID);

    bool update_tab_drag(const Container& target, int index, std::optional<SpaceId> group = std::nullopt);

    // Target from geometry: `local` is relative to the zone's frame.
    bool update_tab_drag_at(const Container& zone, Point local);

    void set_drag_outside_window(bool outside) { drag_.set_outside_window(outside); }

    // Commit the drag.  The operation is validated against the tab list,
    // applied, given a surface in the drop window and reported to the
    // persistence sink.  Returns the operation as applied, or nullopt if
    // nothing changed.
    std::optional<DragOperation> finish_tab_drag(WindowId drop_window = INVALID_WINDOW_ID);

    void cancel_tab_drag();

    // ── Selection reconciliation ────────────────────────────────────────

    // Authoritative selection change reported by the tab list.
    bool push_selection(WindowId window, std::optional<TabId> tab, std::optional<SpaceId> space = std::nullopt);

    // Ask the tab list for every window's selection and correct any drift.
    // Results older than a concurrent push are discarded.  Returns the number
    // of windows corrected.
    size_t reconcile_now();

    // Debounced reconcile_now(): bursts collapse into one pass after
    // reconcile_delay_ms.
    void request_reconcile();

    // Periodic reconcile_now() every poll_interval_ms.
    bool start_polling();
    void stop_polling();
    bool is_polling() const { return poll_task_ != TaskScheduler::INVALID_TASK_ID; }

    // Run due timers.  Call once per event-loop iteration.
    size_t tick(TaskScheduler::TimePoint now) { return scheduler_.tick(now); }
    size_t tick() { return scheduler_.tick(); }

    // ── Components ──────────────────────────────────────────────────────

    WindowRegistry&     windows() { return windows_; }
    SurfaceRegistry&    surfaces() { return surfaces_; }
    SurfaceCoordinator& coordinator() { return coordinator_; }
    DragSession&        drag() { return drag_; }
    DragLock&           drag_lock() { return drag_lock_; }
    DropZoneLayouts&    layouts() { return layouts_; }
    TaskScheduler&      scheduler() { return scheduler_; }
    ShellConfig&        config() { return config_; }

    const WindowRegistry&  windows() const { return windows_; }
    const SurfaceRegistry& surfaces() const { return surfaces_; }

    WindowId drag_window() const { return drag_window_; }

   private:
    void apply_config(const ShellConfig::Values& values);
    void forget_window(WindowId id);

    struct PendingPress
    {
        TabId     tab;
        Container origin;
        int       index;
        WindowId  window;
        Point     start;
    };

    ShellConfig        config_;
    WindowRegistry     windows_;
    SurfaceRegistry    surfaces_;
    SurfaceCoordinator coordinator_;
    DropZoneLayouts    layouts_;
    DragSession        drag_;
    DragLock           drag_lock_;
    TaskScheduler      scheduler_;

    TabListModel*    tab_list_    = nullptr;
    PersistenceSink* persistence_ = nullptr;

    DragLock::Guard             drag_guard_;
    WindowId                    drag_window_ = INVALID_WINDOW_ID;
    std::optional<PendingPress> pending_press_;

    std::unordered_map<WindowId, Reconciled<std::optional<TabId>>> selection_;
    TaskScheduler::TaskId poll_task_      = TaskScheduler::INVALID_TASK_ID;
    WindowId              next_window_id_ = 1;
};

}  // namespace kestrel
