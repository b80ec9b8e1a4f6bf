#pragma once

#include <kestrel/collaborators.hpp>
#include <kestrel/fwd.hpp>
#include <optional>
#include <string>

namespace kestrel
{

class SurfaceRegistry;

// Glue between SurfaceRegistry and the RenderEngine.
//
// The registry only tracks handles; this class is where surfaces are
// created, kept in step across windows and disposed.  Every handle that
// leaves the registry through here is handed to RenderEngine::dispose_surface
// exactly once.
//
// Cross-window propagation (navigation, mute, reload) is bracketed by the
// registry's SyncGuard, so an engine callback that re-enters for the same
// tab is dropped instead of recursing.
class SurfaceCoordinator
{
   public:
    SurfaceCoordinator(SurfaceRegistry& registry, RenderEngine* engine = nullptr)
        : registry_(registry), engine_(engine)
    {
    }

    SurfaceCoordinator(const SurfaceCoordinator&)            = delete;
    SurfaceCoordinator& operator=(const SurfaceCoordinator&) = delete;

    void          set_engine(RenderEngine* engine) { engine_ = engine; }
    RenderEngine* engine() const { return engine_; }

    // Existing surface for (tab, window), or a new one loaded with `locator`.
    // A tab already shown elsewhere gets a clone of its primary surface.
    // Returns nullopt when no engine is attached or the engine refuses.
    std::optional<RenderSurface> get_or_create(TabId tab, WindowId window, const std::string& locator);

    // The surface other windows clone from: the one in the lowest window id.
    std::optional<RenderSurface> primary_surface(TabId tab) const;

    // Load `locator` into every surface of `tab` except the one in `origin`
    // (the window that navigated).  Surfaces already showing `locator` are
    // left alone.  Returns the number of surfaces updated; a reentrant call
    // for the same tab updates nothing.
    size_t sync_tab(TabId tab, const std::string& locator, WindowId origin = INVALID_WINDOW_ID);

    // Mute state follows the tab; the window that changed it (`origin`)
    // already has it and is skipped.
    size_t set_muted(TabId tab, bool muted, WindowId origin = INVALID_WINDOW_ID);
    size_t reload_tab(TabId tab);

    // Tab closed: drop and dispose its surfaces in every window.
    size_t close_tab(TabId tab);

    // Window closed: drop and dispose that window's surfaces and forget its
    // compositor host.  Wired as the WindowRegistry close callback.
    size_t cleanup_window(WindowId window);

    // Shutdown: dispose everything the registry still holds.
    size_t cleanup_all();

    // After the tab list applied a committed move, make sure the moved tab
    // has a surface in `window`.  With an empty `locator` the primary
    // surface's current locator is used, if the engine reports one.
    std::optional<RenderSurface> apply(const DragOperation& op,
                                       WindowId window,
                                       const std::string& locator = {});

    uint64_t disposed_count() const { return disposed_count_; }

   private:
    void dispose(const RenderSurface& surface, WindowId window);

    SurfaceRegistry& registry_;
    RenderEngine*    engine_         = nullptr;
    uint64_t         disposed_count_ = 0;
};

}  // namespace kestrel
