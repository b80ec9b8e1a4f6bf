#pragma once

#include <kestrel/collaborators.hpp>
#include <kestrel/fwd.hpp>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kestrel
{

class SurfaceRegistry;

// Scoped reentrancy token for one tab.  Obtained from
// SurfaceRegistry::try_begin_sync(); releases the tab on destruction, so a
// propagation pass is unlocked on every exit path including exceptions.
class SyncGuard
{
   public:
    SyncGuard() = default;
    ~SyncGuard() { release(); }

    SyncGuard(const SyncGuard&)            = delete;
    SyncGuard& operator=(const SyncGuard&) = delete;

    SyncGuard(SyncGuard&& other) noexcept : registry_(other.registry_), tab_(other.tab_)
    {
        other.registry_ = nullptr;
    }
    SyncGuard& operator=(SyncGuard&& other) noexcept;

    // True if this guard holds the token (i.e. the caller may propagate).
    explicit operator bool() const { return registry_ != nullptr; }

    TabId tab() const { return tab_; }

    void release();

   private:
    friend class SurfaceRegistry;
    SyncGuard(SurfaceRegistry* registry, TabId tab) : registry_(registry), tab_(tab) {}

    SurfaceRegistry* registry_ = nullptr;
    TabId            tab_      = INVALID_TAB_ID;
};

/**
 * SurfaceRegistry: (tab, window) → RenderSurface map.
 *
 * At most one surface exists per key.  A tab may be resident in several
 * windows at once; each window keeps its own surface.  The registry never
 * creates or destroys content: every handle that leaves the map (remove,
 * remove_all, remove_window, a replaced store) is returned to the caller,
 * which must hand it to RenderEngine::dispose_surface().
 *
 * Also keeps weak references to the per-window compositor hosts.  Those
 * are owned by the platform; entries whose host has died are pruned the
 * next time they are read.
 *
 * UI-thread confined.
 */
class SurfaceRegistry
{
   public:
    using WindowSurfaces = std::map<WindowId, RenderSurface>;
    using TabSurface     = std::pair<TabId, RenderSurface>;

    SurfaceRegistry()  = default;
    ~SurfaceRegistry() = default;

    SurfaceRegistry(const SurfaceRegistry&)            = delete;
    SurfaceRegistry& operator=(const SurfaceRegistry&) = delete;

    std::optional<RenderSurface> get(TabId tab, WindowId window) const;

    // Store (or replace) the surface for a key.  Returns the surface that was
    // displaced, if a different one was stored under the same key.  Invalid
    // handles, and handles already stored under another key, are refused.
    std::optional<RenderSurface> store(const RenderSurface& surface, TabId tab, WindowId window);

    // Remove one key.  Absent keys return nullopt.
    std::optional<RenderSurface> remove(TabId tab, WindowId window);

    // Remove every surface of a tab, across all windows.
    WindowSurfaces remove_all(TabId tab);

    // Remove every surface owned by one window.
    std::vector<TabSurface> remove_window(WindowId window);

    // Enumerate the surfaces owned by one window (sorted by tab id).
    std::vector<TabSurface> for_window(WindowId window) const;

    // Every surface of a tab, keyed by window.
    WindowSurfaces all_for_tab(TabId tab) const;

    // Key currently holding `handle`, if any.
    std::optional<std::pair<TabId, WindowId>> owner_of(uint64_t handle) const;

    bool               contains(TabId tab, WindowId window) const { return get(tab, window).has_value(); }
    size_t             total_count() const;
    std::vector<TabId> tracked_tabs() const;

    // Drop all entries, sync tokens and compositor hosts (shutdown).
    void clear();

    // ── Reentrancy guard ────────────────────────────────────────────────

    bool begin_sync(TabId tab);
    bool is_syncing(TabId tab) const { return syncing_.count(tab) > 0; }
    void end_sync(TabId tab);

    // Acquire the sync token for `tab`.  The returned guard is empty if a
    // pass for this tab is already running.
    SyncGuard try_begin_sync(TabId tab);

    // ── Compositor hosts (weak) ─────────────────────────────────────────

    void set_compositor_host(WindowId window, std::weak_ptr<CompositorHost> host);
    void remove_compositor_host(WindowId window);

    // Live host for a window; prunes and returns nullptr if it has died.
    std::shared_ptr<CompositorHost> compositor_host(WindowId window);

    // All live hosts; dead entries are pruned as a side effect.
    std::vector<std::pair<WindowId, std::shared_ptr<CompositorHost>>> compositor_hosts();

    size_t compositor_host_count() const { return hosts_.size(); }

   private:
    std::unordered_map<TabId, WindowSurfaces>                   surfaces_;
    std::unordered_map<uint64_t, std::pair<TabId, WindowId>>    owners_;   // handle -> key
    std::unordered_set<TabId>                                   syncing_;
    std::unordered_map<WindowId, std::weak_ptr<CompositorHost>> hosts_;
};

}  // namespace kestrel
