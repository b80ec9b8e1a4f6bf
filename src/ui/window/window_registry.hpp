#pragma once

#include <cstdint>
#include <functional>
#include <kestrel/fwd.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kestrel
{

// One open top-level window.  Owned by WindowRegistry while open; everything
// else refers to it by id.
struct WindowContext
{
    WindowId id = INVALID_WINDOW_ID;

    std::optional<TabId>   selected_tab;
    std::optional<SpaceId> selected_space;

    // Layout fields mirrored from the window host.  Not interpreted here.
    std::string title;
    int         x             = 0;
    int         y             = 0;
    uint32_t    width         = 0;
    uint32_t    height        = 0;
    float       sidebar_width = 250.0f;
    bool        is_focused    = false;
};

// Single source of truth for which windows exist and which one is active.
//
// UI-thread confined: there is exactly one writer (the event loop), so no
// locking is done.  All operations outside their valid state are no-ops.
//
// Usage:
//   WindowRegistry reg;
//   reg.set_on_window_close([&](WindowId id) { coordinator.cleanup_window(id); });
//   reg.register_window({.id = 1});
//   reg.set_active(1);
//   ...
//   reg.unregister_window(1);   // cleanup fires, active cleared
class WindowRegistry
{
   public:
    enum class Change
    {
        Registered,
        Unregistered,
        ActiveChanged,
        SelectionChanged,
    };

    using CloseCallback  = std::function<void(WindowId id)>;
    using ActiveCallback = std::function<void(WindowId id)>;
    using Observer       = std::function<void(Change change, WindowId id)>;
    using ObserverId     = uint32_t;

    WindowRegistry()  = default;
    ~WindowRegistry() = default;

    WindowRegistry(const WindowRegistry&)            = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;

    // Insert a window by id.  Returns false (and changes nothing) if the id
    // is invalid or already registered.
    bool register_window(WindowContext window);

    // Fire the close callback, then drop the window.  Clears the active id if
    // it pointed at this window; picking a replacement is the caller's job.
    // Returns false for unknown ids, in which case no callback fires.
    bool unregister_window(WindowId id);

    // Make `id` the active window.  Unknown ids are ignored.
    bool set_active(WindowId id);

    // Record the tab/space currently shown in a window.
    bool update_selection(WindowId id, std::optional<TabId> tab, std::optional<SpaceId> space);

    // Cleanup hook run before a window entry disappears.
    void set_on_window_close(CloseCallback cb) { on_window_close_ = std::move(cb); }

    // Notified after set_active() changes the active window.
    void set_on_active_changed(ActiveCallback cb) { on_active_changed_ = std::move(cb); }

    // Generic state-change subscription, invoked synchronously after every
    // mutating call.
    ObserverId add_observer(Observer cb);
    void       remove_observer(ObserverId id);

    WindowContext*                     get(WindowId id);
    const WindowContext*               get(WindowId id) const;
    std::vector<const WindowContext*>  all() const;
    std::vector<WindowId>              ids() const { return order_; }
    std::optional<WindowId>            active_id() const { return active_id_; }
    const WindowContext*               active() const;
    bool                               contains(WindowId id) const { return windows_.count(id) > 0; }
    size_t                             count() const { return windows_.size(); }

   private:
    void notify(Change change, WindowId id);

    std::unordered_map<WindowId, WindowContext> windows_;
    std::vector<WindowId>                       order_;   // registration order
    std::optional<WindowId>                     active_id_;
    std::vector<WindowId>                       closing_;   // ids inside unregister_window()

    CloseCallback  on_window_close_;
    ActiveCallback on_active_changed_;

    std::vector<std::pair<ObserverId, Observer>> observers_;
    ObserverId                                   next_observer_id_ = 1;
};

}  // namespace kestrel
