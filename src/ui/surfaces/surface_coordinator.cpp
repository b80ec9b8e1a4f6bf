#include "surface_coordinator.hpp"

#include <kestrel/logger.hpp>

#include "surface_registry.hpp"

namespace kestrel
{

std::optional<RenderSurface> SurfaceCoordinator::get_or_create(TabId              tab,
                                                               WindowId           window,
                                                               const std::string& locator)
{
    if (auto existing = registry_.get(tab, window))
        return existing;

    if (!engine_)
    {
        KESTREL_LOG_WARN("surface_coordinator",
                         "get_or_create: no render engine attached (tab {}, window {})",
                         tab, window);
        return std::nullopt;
    }

    auto          primary = primary_surface(tab);
    RenderSurface created = engine_->create_surface(tab, primary);
    if (!created.valid())
    {
        KESTREL_LOG_ERROR("surface_coordinator", "Engine refused a surface for tab {} in window {}",
                          tab, window);
        return std::nullopt;
    }
    created.tab = tab;

    if (auto displaced = registry_.store(created, tab, window))
        dispose(*displaced, window);
    if (registry_.get(tab, window) != created)
    {
        // A handle still owned by another key belongs to that key; disposing
        // it here would destroy a live surface.
        if (auto owner = registry_.owner_of(created.handle))
        {
            KESTREL_LOG_ERROR("surface_coordinator",
                              "Engine reused handle {} (owned by tab {} window {}); not stored",
                              created.handle, owner->first, owner->second);
            return std::nullopt;
        }
        engine_->dispose_surface(created);
        ++disposed_count_;
        return std::nullopt;
    }

    if (!locator.empty())
        engine_->load_content(created, locator);

    KESTREL_LOG_DEBUG("surface_coordinator", "Created surface {} for tab {} in window {}{}",
                      created.handle, tab, window, primary ? " (clone)" : "");
    return created;
}

std::optional<RenderSurface> SurfaceCoordinator::primary_surface(TabId tab) const
{
    auto all = registry_.all_for_tab(tab);
    if (all.empty())
        return std::nullopt;
    return all.begin()->second;
}

// ─── Cross-window propagation ────────────────────────────────────────────────

size_t SurfaceCoordinator::sync_tab(TabId tab, const std::string& locator, WindowId origin)
{
    if (!engine_)
        return 0;

    SyncGuard guard = registry_.try_begin_sync(tab);
    if (!guard)
    {
        KESTREL_LOG_TRACE("surface_coordinator", "sync_tab: tab {} already syncing, skipped", tab);
        return 0;
    }

    size_t updated = 0;
    for (const auto& [window, surface] : registry_.all_for_tab(tab))
    {
        if (window == origin)
            continue;
        auto current = engine_->current_locator(surface);
        if (current && *current == locator)
            continue;
        engine_->load_content(surface, locator);
        ++updated;
    }

    if (updated > 0)
        KESTREL_LOG_DEBUG("surface_coordinator", "Synced tab {} to {} in {} window(s)", tab,
                          locator, updated);
    return updated;
}

size_t SurfaceCoordinator::set_muted(TabId tab, bool muted, WindowId origin)
{
    if (!engine_)
        return 0;

    SyncGuard guard = registry_.try_begin_sync(tab);
    if (!guard)
        return 0;

    size_t count = 0;
    for (const auto& [window, surface] : registry_.all_for_tab(tab))
    {
        if (window == origin)
            continue;
        engine_->set_muted(surface, muted);
        ++count;
    }
    return count;
}

size_t SurfaceCoordinator::reload_tab(TabId tab)
{
    if (!engine_)
        return 0;

    SyncGuard guard = registry_.try_begin_sync(tab);
    if (!guard)
        return 0;

    size_t count = 0;
    for (const auto& [window, surface] : registry_.all_for_tab(tab))
    {
        engine_->reload(surface);
        ++count;
    }
    return count;
}

// ─── Teardown ────────────────────────────────────────────────────────────────

size_t SurfaceCoordinator::close_tab(TabId tab)
{
    auto removed = registry_.remove_all(tab);
    for (const auto& [window, surface] : removed)
        dispose(surface, window);

    if (!removed.empty())
        KESTREL_LOG_INFO("surface_coordinator", "Closed tab {} ({} surface(s))", tab,
                         removed.size());
    return removed.size();
}

size_t SurfaceCoordinator::cleanup_window(WindowId window)
{
    auto removed = registry_.remove_window(window);
    for (const auto& [tab, surface] : removed)
        dispose(surface, window);
    registry_.remove_compositor_host(window);

    KESTREL_LOG_INFO("surface_coordinator", "Cleaned up window {} ({} surface(s))", window,
                     removed.size());
    return removed.size();
}

size_t SurfaceCoordinator::cleanup_all()
{
    size_t count = 0;
    for (TabId tab : registry_.tracked_tabs())
    {
        for (const auto& [window, surface] : registry_.remove_all(tab))
        {
            dispose(surface, window);
            ++count;
        }
    }
    registry_.clear();
    KESTREL_LOG_INFO("surface_coordinator", "Disposed all surfaces ({})", count);
    return count;
}

std::optional<RenderSurface> SurfaceCoordinator::apply(const DragOperation& op,
                                                       WindowId             window,
                                                       const std::string&   locator)
{
    if (op.item == INVALID_TAB_ID || window == INVALID_WINDOW_ID)
        return std::nullopt;

    if (auto existing = registry_.get(op.item, window))
        return existing;

    std::string target = locator;
    if (target.empty() && engine_)
    {
        if (auto primary = primary_surface(op.item))
            target = engine_->current_locator(*primary).value_or(std::string{});
    }
    return get_or_create(op.item, window, target);
}

void SurfaceCoordinator::dispose(const RenderSurface& surface, WindowId window)
{
    if (auto host = registry_.compositor_host(window))
        host->detach_surface(surface);
    if (engine_)
        engine_->dispose_surface(surface);
    ++disposed_count_;
}

}  // namespace kestrel
