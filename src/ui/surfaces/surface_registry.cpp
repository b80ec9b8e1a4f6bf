#include "surface_registry.hpp"

#include <algorithm>
#include <kestrel/logger.hpp>

namespace kestrel
{

// ─── SyncGuard ───────────────────────────────────────────────────────────────

SyncGuard& SyncGuard::operator=(SyncGuard&& other) noexcept
{
    if (this != &other)
    {
        release();
        registry_       = other.registry_;
        tab_            = other.tab_;
        other.registry_ = nullptr;
    }
    return *this;
}

void SyncGuard::release()
{
    if (registry_)
    {
        registry_->end_sync(tab_);
        registry_ = nullptr;
    }
}

// ─── Surface map ─────────────────────────────────────────────────────────────

std::optional<RenderSurface> SurfaceRegistry::get(TabId tab, WindowId window) const
{
    auto tab_it = surfaces_.find(tab);
    if (tab_it == surfaces_.end())
        return std::nullopt;
    auto win_it = tab_it->second.find(window);
    if (win_it == tab_it->second.end())
        return std::nullopt;
    return win_it->second;
}

std::optional<RenderSurface> SurfaceRegistry::store(const RenderSurface& surface,
                                                    TabId                tab,
                                                    WindowId             window)
{
    if (!surface.valid() || tab == INVALID_TAB_ID || window == INVALID_WINDOW_ID)
    {
        KESTREL_LOG_WARN("surface_registry", "store: refusing invalid key or handle");
        return std::nullopt;
    }

    auto owner = owners_.find(surface.handle);
    if (owner != owners_.end() && owner->second != std::make_pair(tab, window))
    {
        KESTREL_LOG_ERROR("surface_registry",
                          "store: handle {} already owned by tab {} window {}",
                          surface.handle,
                          owner->second.first,
                          owner->second.second);
        return std::nullopt;
    }

    auto& slot = surfaces_[tab];
    auto  it   = slot.find(window);
    if (it == slot.end())
    {
        slot.emplace(window, surface);
        owners_[surface.handle] = {tab, window};
        KESTREL_LOG_DEBUG("surface_registry", "Stored surface {} for tab {} in window {}",
                          surface.handle, tab, window);
        return std::nullopt;
    }

    // Same handle under the same key: refresh the record, nothing to dispose.
    if (it->second.handle == surface.handle)
    {
        it->second     = surface;
        it->second.tab = tab;
        return std::nullopt;
    }

    RenderSurface displaced = it->second;
    owners_.erase(displaced.handle);
    it->second              = surface;
    owners_[surface.handle] = {tab, window};
    KESTREL_LOG_DEBUG("surface_registry", "Replaced surface {} with {} for tab {} in window {}",
                      displaced.handle, surface.handle, tab, window);
    return displaced;
}

std::optional<RenderSurface> SurfaceRegistry::remove(TabId tab, WindowId window)
{
    auto tab_it = surfaces_.find(tab);
    if (tab_it == surfaces_.end())
        return std::nullopt;

    auto win_it = tab_it->second.find(window);
    if (win_it == tab_it->second.end())
        return std::nullopt;

    RenderSurface removed = win_it->second;
    tab_it->second.erase(win_it);
    if (tab_it->second.empty())
        surfaces_.erase(tab_it);
    owners_.erase(removed.handle);
    return removed;
}

SurfaceRegistry::WindowSurfaces SurfaceRegistry::remove_all(TabId tab)
{
    auto it = surfaces_.find(tab);
    if (it == surfaces_.end())
        return {};

    WindowSurfaces removed = std::move(it->second);
    surfaces_.erase(it);
    for (const auto& [window, surface] : removed)
        owners_.erase(surface.handle);
    return removed;
}

std::vector<SurfaceRegistry::TabSurface> SurfaceRegistry::remove_window(WindowId window)
{
    std::vector<TabSurface> removed = for_window(window);
    for (const auto& [tab, surface] : removed)
        remove(tab, window);
    return removed;
}

std::vector<SurfaceRegistry::TabSurface> SurfaceRegistry::for_window(WindowId window) const
{
    std::vector<TabSurface> result;
    for (const auto& [tab, windows] : surfaces_)
    {
        auto it = windows.find(window);
        if (it != windows.end())
            result.emplace_back(tab, it->second);
    }
    std::sort(result.begin(), result.end(),
              [](const TabSurface& a, const TabSurface& b) { return a.first < b.first; });
    return result;
}

SurfaceRegistry::WindowSurfaces SurfaceRegistry::all_for_tab(TabId tab) const
{
    auto it = surfaces_.find(tab);
    return (it != surfaces_.end()) ? it->second : WindowSurfaces{};
}

std::optional<std::pair<TabId, WindowId>> SurfaceRegistry::owner_of(uint64_t handle) const
{
    auto it = owners_.find(handle);
    if (it == owners_.end())
        return std::nullopt;
    return it->second;
}

size_t SurfaceRegistry::total_count() const
{
    size_t n = 0;
    for (const auto& [tab, windows] : surfaces_)
        n += windows.size();
    return n;
}

std::vector<TabId> SurfaceRegistry::tracked_tabs() const
{
    std::vector<TabId> tabs;
    tabs.reserve(surfaces_.size());
    for (const auto& [tab, windows] : surfaces_)
        tabs.push_back(tab);
    std::sort(tabs.begin(), tabs.end());
    return tabs;
}

void SurfaceRegistry::clear()
{
    surfaces_.clear();
    owners_.clear();
    syncing_.clear();
    hosts_.clear();
}

// ─── Reentrancy guard ────────────────────────────────────────────────────────

bool SurfaceRegistry::begin_sync(TabId tab)
{
    return syncing_.insert(tab).second;
}

void SurfaceRegistry::end_sync(TabId tab)
{
    syncing_.erase(tab);
}

SyncGuard SurfaceRegistry::try_begin_sync(TabId tab)
{
    if (!begin_sync(tab))
    {
        KESTREL_LOG_DEBUG("surface_registry", "Skipping reentrant sync for tab {}", tab);
        return SyncGuard();
    }
    return SyncGuard(this, tab);
}

// ─── Compositor hosts ────────────────────────────────────────────────────────

void SurfaceRegistry::set_compositor_host(WindowId window, std::weak_ptr<CompositorHost> host)
{
    if (host.expired())
    {
        hosts_.erase(window);
        return;
    }
    hosts_[window] = std::move(host);
}

void SurfaceRegistry::remove_compositor_host(WindowId window)
{
    hosts_.erase(window);
}

std::shared_ptr<CompositorHost> SurfaceRegistry::compositor_host(WindowId window)
{
    auto it = hosts_.find(window);
    if (it == hosts_.end())
        return nullptr;

    auto host = it->second.lock();
    if (!host)
    {
        KESTREL_LOG_DEBUG("surface_registry", "Pruned stale compositor host for window {}", window);
        hosts_.erase(it);
    }
    return host;
}

std::vector<std::pair<WindowId, std::shared_ptr<CompositorHost>>>
SurfaceRegistry::compositor_hosts()
{
    std::vector<std::pair<WindowId, std::shared_ptr<CompositorHost>>> live;
    for (auto it = hosts_.begin(); it != hosts_.end();)
    {
        if (auto host = it->second.lock())
        {
            live.emplace_back(it->first, std::move(host));
            ++it;
        }
        else
        {
            it = hosts_.erase(it);
        }
    }
    std::sort(live.begin(), live.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return live;
}

}  // namespace kestrel
