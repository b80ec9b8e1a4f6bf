#include <cmath>
#include <kestrel/logger.hpp>
#include <kestrel/shell.hpp>

#include "ui/drag/drag_resolver.hpp"

namespace kestrel
{

static constexpr const char* RECONCILE_SLOT = "shell.reconcile";

Shell::Shell(const ShellOptions& options) : coordinator_(surfaces_)
{
    drag_.set_layouts(&layouts_);

    windows_.set_on_window_close([this](WindowId id) { coordinator_.cleanup_window(id); });

    config_.set_on_change([this](const ShellConfig::Values& v) { apply_config(v); });
    if (!options.config_path.empty())
        config_.load(options.config_path);
    apply_config(config_.values());

    KESTREL_LOG_DEBUG("shell", "Shell initialized");
}

Shell::~Shell()
{
    stop_polling();
    scheduler_.cancel_all();
    if (drag_.is_dragging())
        cancel_tab_drag();
    coordinator_.cleanup_all();
}

void Shell::apply_config(const ShellConfig::Values& values)
{
    layouts_.set_default_metrics(values.default_cell_size, values.default_cell_spacing);
    drag_.set_haptics_enabled(values.haptics_enabled);

    if (auto level = Logger::level_from_string(values.log_level))
        Logger::instance().set_level(*level);

    // Re-arm the poller so a new interval takes effect.
    if (is_polling())
    {
        stop_polling();
        start_polling();
    }
}

// ─── Windows ─────────────────────────────────────────────────────────────────

WindowId Shell::open_window(WindowContext context)
{
    if (context.id == INVALID_WINDOW_ID)
    {
        while (windows_.contains(next_window_id_))
            ++next_window_id_;
        context.id = next_window_id_++;
    }
    else if (context.id >= next_window_id_)
    {
        next_window_id_ = context.id + 1;
    }

    WindowId id = context.id;
    auto     tab = context.selected_tab;
    if (!windows_.register_window(std::move(context)))
        return INVALID_WINDOW_ID;

    selection_[id] = Reconciled<std::optional<TabId>>(tab);
    if (!windows_.active_id())
        windows_.set_active(id);
    return id;
}

bool Shell::close_window(WindowId id)
{
    if (!windows_.contains(id))
        return false;

    if (drag_.is_dragging() && drag_window_ == id)
        cancel_tab_drag();
    if (pending_press_ && pending_press_->window == id)
        pending_press_.reset();

    const bool was_active = windows_.active_id() == id;
    if (!windows_.unregister_window(id))
        return false;
    forget_window(id);

    if (was_active && windows_.count() > 0)
        windows_.set_active(windows_.ids().front());
    return true;
}

bool Shell::focus_window(WindowId id)
{
    return windows_.set_active(id);
}

void Shell::forget_window(WindowId id)
{
    selection_.erase(id);
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

std::optional<RenderSurface> Shell::show_tab(TabId tab, WindowId window, const std::string& locator)
{
    if (!windows_.contains(window))
    {
        KESTREL_LOG_WARN("shell", "show_tab: unknown window {}", window);
        return std::nullopt;
    }

    auto surface = coordinator_.get_or_create(tab, window, locator);
    if (surface)
        push_selection(window, tab, windows_.get(window)->selected_space);
    return surface;
}

size_t Shell::navigate_tab(TabId tab, WindowId origin, const std::string& locator)
{
    return coordinator_.sync_tab(tab, locator, origin);
}

size_t Shell::close_tab(TabId tab)
{
    if (drag_.is_dragging() && drag_.dragged_item() == tab)
        cancel_tab_drag();

    for (auto& [window, selected] : selection_)
    {
        if (selected.value() == tab)
        {
            selected.apply_push(std::nullopt);
            windows_.update_selection(window, std::nullopt, windows_.get(window)->selected_space);
        }
    }
    return coordinator_.close_tab(tab);
}

// ─── Tab drag ────────────────────────────────────────────────────────────────

bool Shell::begin_tab_drag(TabId tab, const Container& origin, int origin_index, WindowId window)
{
    if (!windows_.contains(window))
    {
        KESTREL_LOG_WARN("shell", "begin_tab_drag: unknown window {}", window);
        return false;
    }

    DragLock::Guard guard = drag_lock_.acquire("window:" + std::to_string(window));
    if (!guard)
        return false;
    if (!drag_.start_drag(tab, origin, origin_index))
        return false;   // guard releases the lock

    drag_guard_  = std::move(guard);
    drag_window_ = window;
    pending_press_.reset();
    return true;
}

bool Shell::press_tab(TabId tab, const Container& origin, int origin_index, WindowId window, Point pos)
{
    if (drag_.is_dragging() || !windows_.contains(window) || tab == INVALID_TAB_ID)
        return false;
    pending_press_ = PendingPress{tab, origin, origin_index, window, pos};
    return true;
}

bool Shell::pointer_moved(Point pos)
{
    if (drag_.is_dragging())
        return true;
    if (!pending_press_)
        return false;

    const float dx = pos.x - pending_press_->start.x;
    const float dy = pos.y - pending_press_->start.y;
    if (std::sqrt(dx * dx + dy * dy) <= config_.values().drag_threshold_px)
        return false;

    PendingPress press = *pending_press_;
    pending_press_.reset();
    return begin_tab_drag(press.tab, press.origin, press.index, press.window);
}

std::optional<DragOperation> Shell::release_pointer(WindowId drop_window)
{
    pending_press_.reset();
    if (!drag_.is_dragging())
        return std::nullopt;
    return finish_tab_drag(drop_window);
}

bool Shell::update_tab_drag(const Container& target, int index, std::optional<SpaceId> group)
{
    return drag_.update_target(target, index, group);
}

bool Shell::update_tab_drag_at(const Container& zone, Point local)
{
    if (!drag_.is_dragging())
        return false;
    const bool same = zone == drag_.origin_container();
    return drag_.update_target(zone, layouts_.insertion_index(zone, local, same));
}

std::optional<DragOperation> Shell::finish_tab_drag(WindowId drop_window)
{
    WindowId origin_window = drag_window_;
    auto     op            = drag_.end_drag(true);
    drag_guard_.release();
    drag_window_ = INVALID_WINDOW_ID;

    if (!op)
        return std::nullopt;

    DragOperation applied = *op;
    if (tab_list_)
    {
        auto resolved = drag_resolver::resolve(*op, tab_list_->item_count(op->from_container),
                                               tab_list_->item_count(op->to_container));
        if (!resolved)
            return std::nullopt;
        applied = resolved->op;

        if (!tab_list_->apply(applied))
        {
            KESTREL_LOG_WARN("shell", "Tab list rejected move of tab {} to {}#{}", applied.item,
                             applied.to_container.to_string(), applied.to_index);
            return std::nullopt;
        }
        KESTREL_LOG_INFO("shell", "Applied {} of tab {}",
                         drag_resolver::to_string(resolved->kind), applied.item);
    }
    else
    {
        KESTREL_LOG_WARN("shell", "finish_tab_drag: no tab list attached, move not applied");
    }

    WindowId target_window = windows_.contains(drop_window) ? drop_window : origin_window;
    if (windows_.contains(target_window) && !coordinator_.apply(applied, target_window))
        KESTREL_LOG_WARN("shell", "No surface for tab {} in window {} after move", applied.item,
                         target_window);

    if (persistence_)
        persistence_->ordering_changed(applied);
    return applied;
}

void Shell::cancel_tab_drag()
{
    drag_.cancel();
    drag_guard_.release();
    drag_window_ = INVALID_WINDOW_ID;
    pending_press_.reset();
}

// ─── Selection reconciliation ────────────────────────────────────────────────

bool Shell::push_selection(WindowId window, std::optional<TabId> tab, std::optional<SpaceId> space)
{
    auto it = selection_.find(window);
    if (it == selection_.end())
        return false;

    it->second.apply_push(tab);
    return windows_.update_selection(window, tab, space);
}

size_t Shell::reconcile_now()
{
    if (!tab_list_)
        return 0;

    size_t corrected = 0;
    for (WindowId window : windows_.ids())
    {
        auto it = selection_.find(window);
        if (it == selection_.end())
            continue;

        uint64_t rev    = it->second.begin_poll();
        auto     polled = tab_list_->selected_tab(window);

        // The query may have re-entered and closed the window.
        it = selection_.find(window);
        if (it == selection_.end() || !windows_.contains(window))
            continue;

        if (it->second.apply_poll(polled, rev))
        {
            windows_.update_selection(window, polled, windows_.get(window)->selected_space);
            ++corrected;
        }
    }

    if (corrected > 0)
        KESTREL_LOG_DEBUG("shell", "Reconcile corrected {} window(s)", corrected);
    return corrected;
}

void Shell::request_reconcile()
{
    scheduler_.schedule_debounced(RECONCILE_SLOT,
                                  TaskScheduler::Duration(config_.values().reconcile_delay_ms),
                                  [this]() { reconcile_now(); });
}

bool Shell::start_polling()
{
    if (is_polling())
        return false;
    poll_task_ = scheduler_.add_periodic(TaskScheduler::Duration(config_.values().poll_interval_ms),
                                         [this]() { reconcile_now(); });
    return is_polling();
}

void Shell::stop_polling()
{
    if (!is_polling())
        return;
    scheduler_.cancel(poll_task_);
    poll_task_ = TaskScheduler::INVALID_TASK_ID;
}

}  // namespace kestrel
