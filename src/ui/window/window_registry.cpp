#include "window_registry.hpp"

#include <algorithm>
#include <kestrel/logger.hpp>

namespace kestrel
{

bool WindowRegistry::register_window(WindowContext window)
{
    if (window.id == INVALID_WINDOW_ID)
    {
        KESTREL_LOG_WARN("window_registry", "register_window: invalid window id");
        return false;
    }
    if (windows_.count(window.id) > 0)
    {
        KESTREL_LOG_DEBUG("window_registry", "register_window: {} already registered", window.id);
        return false;
    }

    WindowId id = window.id;
    windows_.emplace(id, std::move(window));
    order_.push_back(id);

    KESTREL_LOG_INFO("window_registry", "Registered window {}", id);
    notify(Change::Registered, id);
    return true;
}

bool WindowRegistry::unregister_window(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
        return false;

    // A close callback that re-enters unregister_window() for the same id
    // must not run cleanup a second time.
    if (std::find(closing_.begin(), closing_.end(), id) != closing_.end())
        return false;

    closing_.push_back(id);
    struct ClosingScope
    {
        std::vector<WindowId>& closing;
        WindowId               id;
        ~ClosingScope() { std::erase(closing, id); }
    } scope{closing_, id};

    if (on_window_close_)
        on_window_close_(id);

    windows_.erase(id);
    std::erase(order_, id);

    if (active_id_ && *active_id_ == id)
        active_id_.reset();

    KESTREL_LOG_INFO("window_registry", "Unregistered window {} ({} remaining)", id,
                     windows_.size());
    notify(Change::Unregistered, id);
    return true;
}

bool WindowRegistry::set_active(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
    {
        KESTREL_LOG_DEBUG("window_registry", "set_active: unknown window {}", id);
        return false;
    }

    if (active_id_ && *active_id_ != id)
    {
        auto prev = windows_.find(*active_id_);
        if (prev != windows_.end())
            prev->second.is_focused = false;
    }
    it->second.is_focused = true;
    active_id_            = id;

    KESTREL_LOG_DEBUG("window_registry", "Active window {}", id);
    if (on_active_changed_)
        on_active_changed_(id);
    notify(Change::ActiveChanged, id);
    return true;
}

bool WindowRegistry::update_selection(WindowId               id,
                                      std::optional<TabId>   tab,
                                      std::optional<SpaceId> space)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
        return false;

    if (it->second.selected_tab == tab && it->second.selected_space == space)
        return true;

    it->second.selected_tab   = tab;
    it->second.selected_space = space;
    notify(Change::SelectionChanged, id);
    return true;
}

WindowRegistry::ObserverId WindowRegistry::add_observer(Observer cb)
{
    ObserverId id = next_observer_id_++;
    observers_.emplace_back(id, std::move(cb));
    return id;
}

void WindowRegistry::remove_observer(ObserverId id)
{
    std::erase_if(observers_, [id](const auto& entry) { return entry.first == id; });
}

WindowContext* WindowRegistry::get(WindowId id)
{
    auto it = windows_.find(id);
    return (it != windows_.end()) ? &it->second : nullptr;
}

const WindowContext* WindowRegistry::get(WindowId id) const
{
    auto it = windows_.find(id);
    return (it != windows_.end()) ? &it->second : nullptr;
}

std::vector<const WindowContext*> WindowRegistry::all() const
{
    std::vector<const WindowContext*> result;
    result.reserve(order_.size());
    for (WindowId id : order_)
    {
        auto it = windows_.find(id);
        if (it != windows_.end())
            result.push_back(&it->second);
    }
    return result;
}

const WindowContext* WindowRegistry::active() const
{
    return active_id_ ? get(*active_id_) : nullptr;
}

void WindowRegistry::notify(Change change, WindowId id)
{
    // Observers may add or remove observers while being notified.
    auto snapshot = observers_;
    for (const auto& [oid, cb] : snapshot)
    {
        if (cb)
            cb(change, id);
    }
}

}  // namespace kestrel
