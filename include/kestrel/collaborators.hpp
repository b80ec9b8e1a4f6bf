#pragma once

#include <cstdint>
#include <kestrel/container.hpp>
#include <kestrel/drag_operation.hpp>
#include <kestrel/fwd.hpp>
#include <kestrel/geometry.hpp>
#include <optional>
#include <string>

namespace kestrel
{

// Opaque handle to one tab's rendered content inside one window.  The
// handle value is issued by the RenderEngine; the shell only stores it.
struct RenderSurface
{
    uint64_t handle = 0;
    TabId    tab    = INVALID_TAB_ID;

    bool valid() const { return handle != 0; }
};

inline bool operator==(const RenderSurface& a, const RenderSurface& b)
{
    return a.handle == b.handle && a.tab == b.tab;
}
inline bool operator!=(const RenderSurface& a, const RenderSurface& b)
{
    return !(a == b);
}

// ─── Collaborator interfaces ─────────────────────────────────────────────────
// The shell never loads or paints content itself.  Everything below is
// implemented by the embedding application (or by fakes in tests).

class RenderEngine
{
   public:
    virtual ~RenderEngine() = default;

    // Create a fresh surface for `tab`.  When `clone_of` is set, the new
    // surface should share configuration (process pool, profile) with it.
    virtual RenderSurface create_surface(TabId tab, const std::optional<RenderSurface>& clone_of) = 0;

    virtual void load_content(const RenderSurface& surface, const std::string& locator) = 0;
    virtual void dispose_surface(const RenderSurface& surface)                          = 0;

    virtual void set_muted(const RenderSurface& /*surface*/, bool /*muted*/) {}
    virtual void reload(const RenderSurface& /*surface*/) {}

    // Locator currently loaded in the surface, if the engine tracks it.
    virtual std::optional<std::string> current_locator(const RenderSurface& /*surface*/) const
    {
        return std::nullopt;
    }
};

class TabListModel
{
   public:
    virtual ~TabListModel() = default;

    virtual int  item_count(const Container& container) const = 0;
    virtual bool apply(const DragOperation& op)               = 0;

    // Tab currently selected in `window`, if any.
    virtual std::optional<TabId> selected_tab(WindowId /*window*/) const { return std::nullopt; }
};

class FeedbackSink
{
   public:
    virtual ~FeedbackSink() = default;

    virtual void pulse() = 0;
    virtual void indicator(const Rect& /*rect*/) {}
    virtual void clear_indicator() {}
};

class PersistenceSink
{
   public:
    virtual ~PersistenceSink() = default;

    virtual void ordering_changed(const DragOperation& op) = 0;
};

// Platform-owned view that hosts the surfaces of one window.  The shell
// only ever holds a weak_ptr to it.
class CompositorHost
{
   public:
    virtual ~CompositorHost() = default;

    virtual void detach_surface(const RenderSurface& /*surface*/) {}
};

}  // namespace kestrel
