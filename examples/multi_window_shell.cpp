// Two GLFW windows sharing one shell.  Each window shows a sidebar of tabs
// (36 px rows at the left edge); drag a row to reorder it.  Nothing is
// painted: the demo engine only logs what a real renderer would do.

#include <algorithm>
#include <chrono>
#include <kestrel/logger.hpp>
#include <kestrel/shell.hpp>
#include <map>
#include <thread>
#include <vector>

#include "ui/glfw_window_host.hpp"

using namespace kestrel;

namespace
{

class DemoEngine : public RenderEngine
{
   public:
    RenderSurface create_surface(TabId tab, const std::optional<RenderSurface>& clone_of) override
    {
        RenderSurface s{next_handle_++, tab};
        KESTREL_LOG_INFO("demo", "create surface {} for tab {}{}", s.handle, tab,
                         clone_of ? " (clone)" : "");
        return s;
    }

    void load_content(const RenderSurface& surface, const std::string& locator) override
    {
        loaded_[surface.handle] = locator;
        KESTREL_LOG_INFO("demo", "surface {} -> {}", surface.handle, locator);
    }

    void dispose_surface(const RenderSurface& surface) override
    {
        loaded_.erase(surface.handle);
        KESTREL_LOG_INFO("demo", "dispose surface {}", surface.handle);
    }

    std::optional<std::string> current_locator(const RenderSurface& surface) const override
    {
        auto it = loaded_.find(surface.handle);
        if (it == loaded_.end())
            return std::nullopt;
        return it->second;
    }

   private:
    uint64_t                          next_handle_ = 1;
    std::map<uint64_t, std::string> loaded_;
};

// One regular-tab list per space; space N belongs to window N.
class DemoTabList : public TabListModel
{
   public:
    std::vector<TabId>& tabs(SpaceId space) { return lists_[space]; }

    int item_count(const Container& c) const override
    {
        auto space = c.space_id();
        if (!space)
            return 0;
        auto it = lists_.find(*space);
        return it == lists_.end() ? 0 : static_cast<int>(it->second.size());
    }

    bool apply(const DragOperation& op) override
    {
        auto from = op.from_container.space_id();
        auto to   = op.to_container.space_id();
        if (!from || !to)
            return false;

        auto& src = lists_[*from];
        if (op.from_index < 0 || op.from_index >= static_cast<int>(src.size()))
            return false;
        src.erase(src.begin() + op.from_index);

        auto& dst = lists_[*to];
        int   at  = std::clamp(op.to_index, 0, static_cast<int>(dst.size()));
        dst.insert(dst.begin() + at, op.item);
        return true;
    }

   private:
    std::map<SpaceId, std::vector<TabId>> lists_;
};

constexpr float ROW     = 36.0f;
constexpr float SPACING = 2.0f;
constexpr float SIDEBAR = 250.0f;

void publish_layout(Shell& shell, DemoTabList& model, WindowId window)
{
    DropZoneLayout layout;
    layout.frame      = {0.0f, 0.0f, SIDEBAR, 600.0f};
    layout.item_count = static_cast<int>(model.tabs(window).size());
    shell.layouts().set_layout(Container::space_regular(window), layout);
}

}   // namespace

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Collaborators must outlive the shell.
    DemoEngine  engine;
    DemoTabList model;

    Shell shell(ShellOptions{.config_path = ShellConfig::default_path()});
    shell.set_render_engine(&engine);
    shell.set_tab_list(&model);

    GlfwWindowHost host(shell);
    if (!host.init())
        return 1;

    WindowId w1 = host.open(900, 600, "kestrel 1");
    WindowId w2 = host.open(900, 600, "kestrel 2");
    if (w1 == INVALID_WINDOW_ID || w2 == INVALID_WINDOW_ID)
        return 1;

    TabId next_tab = 1;
    for (WindowId w : {w1, w2})
    {
        for (int i = 0; i < 4; ++i)
            model.tabs(w).push_back(next_tab++);
        publish_layout(shell, model, w);
        shell.show_tab(model.tabs(w).front(), w, "https://example.org/" + std::to_string(w));
    }

    HostCallbacks callbacks;
    callbacks.on_press = [&](WindowId window, double x, double y)
    {
        if (x > SIDEBAR)
            return;
        int row = static_cast<int>(y / (ROW + SPACING));
        auto& tabs = model.tabs(window);
        if (row < 0 || row >= static_cast<int>(tabs.size()))
            return;
        shell.press_tab(tabs[row], Container::space_regular(window), row, window,
                        {static_cast<float>(x), static_cast<float>(y)});
    };
    callbacks.on_drag_move = [&](WindowId window, double x, double y)
    {
        shell.update_tab_drag_at(Container::space_regular(window),
                                 {static_cast<float>(x), static_cast<float>(y)});
    };
    host.set_callbacks(callbacks);

    shell.start_polling();

    while (host.any_open())
    {
        host.poll_events();
        for (WindowId w : shell.windows().ids())
            publish_layout(shell, model, w);
        shell.tick();
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    host.shutdown();
    return 0;
}
