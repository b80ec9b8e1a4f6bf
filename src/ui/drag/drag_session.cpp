#include "drag_session.hpp"

#include <algorithm>
#include <kestrel/collaborators.hpp>
#include <kestrel/logger.hpp>

#include "drop_zone_layout.hpp"

namespace kestrel
{

// ─── Transitions ─────────────────────────────────────────────────────────────

bool DragSession::start_drag(TabId item, const Container& origin, int origin_index)
{
    if (state_ != State::Idle)
    {
        KESTREL_LOG_DEBUG("drag", "start_drag: tab {} ignored, drag of {} in progress", item, item_);
        return false;
    }
    if (item == INVALID_TAB_ID)
        return false;

    state_            = State::Dragging;
    item_             = item;
    origin_container_ = origin;
    origin_index_     = std::max(0, origin_index);
    target_container_ = origin;
    target_index_     = origin_index_;
    target_group_     = origin.space_id();
    outside_window_   = false;
    last_pulse_       = std::make_pair(target_container_, target_index_);

    KESTREL_LOG_DEBUG("drag", "start_drag: tab {} from {} at {}", item, origin.to_string(),
                      origin_index_);
    return true;
}

bool DragSession::update_target(const Container& container, int index, std::optional<SpaceId> group)
{
    if (state_ != State::Dragging)
        return false;

    target_container_ = container;
    target_index_     = std::max(0, index);
    target_group_     = group ? group : container.space_id();
    outside_window_   = false;

    auto pair = std::make_pair(target_container_, target_index_);
    if (last_pulse_ != pair)
    {
        last_pulse_ = pair;
        pulse();
        show_indicator();
    }
    return true;
}

void DragSession::set_outside_window(bool outside)
{
    if (state_ != State::Dragging || outside_window_ == outside)
        return;

    outside_window_ = outside;
    if (outside)
    {
        target_container_ = Container::none();
        target_group_.reset();
        last_pulse_ = std::make_pair(target_container_, target_index_);
        if (indicator_shown_ && feedback_)
            feedback_->clear_indicator();
        indicator_shown_ = false;
    }
    pulse();
}

std::optional<DragOperation> DragSession::end_drag(bool commit)
{
    if (state_ != State::Dragging)
    {
        reset();
        return std::nullopt;
    }

    DragOperation op;
    op.item           = item_;
    op.from_container = origin_container_;
    op.from_index     = origin_index_;
    op.to_container   = target_container_;
    op.to_index       = target_index_;
    op.to_space       = target_group_;

    reset();

    if (!commit)
    {
        KESTREL_LOG_DEBUG("drag", "end_drag: tab {} cancelled", op.item);
        return std::nullopt;
    }
    if (op.to_container.is_none())
    {
        KESTREL_LOG_DEBUG("drag", "end_drag: tab {} dropped outside any container", op.item);
        return std::nullopt;
    }
    if (op.to_container == op.from_container && op.to_index == op.from_index)
    {
        KESTREL_LOG_DEBUG("drag", "end_drag: tab {} released at origin", op.item);
        return std::nullopt;
    }

    KESTREL_LOG_INFO("drag", "end_drag: tab {} {}#{} -> {}#{}", op.item,
                     op.from_container.to_string(), op.from_index,
                     op.to_container.to_string(), op.to_index);
    return op;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<int> DragSession::last_pulse_index() const
{
    if (!last_pulse_)
        return std::nullopt;
    return last_pulse_->second;
}

bool DragSession::is_sidebar_reorder() const
{
    if (state_ != State::Dragging || target_container_ != origin_container_)
        return false;
    switch (origin_container_.kind())
    {
        case Container::Kind::SpacePinned:
        case Container::Kind::SpaceRegular:
        case Container::Kind::Folder:
            return true;
        case Container::Kind::None:
        case Container::Kind::Essentials:
            return false;
    }
    return false;
}

float DragSession::reorder_offset(const Container& container, int index, float step) const
{
    if (state_ != State::Dragging || container != origin_container_
        || container != target_container_)
        return 0.0f;

    const int from = origin_index_;
    const int to   = target_index_;
    if (from == to)
        return 0.0f;

    if (from < to)
    {
        if (index > from && index <= to)
            return -step;
    }
    else
    {
        if (index >= to && index < from)
            return step;
    }
    return 0.0f;
}

// ─── Internals ───────────────────────────────────────────────────────────────

void DragSession::reset()
{
    if (indicator_shown_ && feedback_)
        feedback_->clear_indicator();

    state_            = State::Idle;
    item_             = INVALID_TAB_ID;
    origin_container_ = Container::none();
    origin_index_     = 0;
    target_container_ = Container::none();
    target_index_     = 0;
    target_group_.reset();
    last_pulse_.reset();
    outside_window_  = false;
    indicator_shown_ = false;
}

void DragSession::pulse()
{
    ++pulse_count_;
    if (haptics_enabled_ && feedback_)
        feedback_->pulse();
}

void DragSession::show_indicator()
{
    if (!feedback_ || !layouts_)
        return;

    auto rect = layouts_->indicator_rect(target_container_, target_index_);
    if (rect)
    {
        feedback_->indicator(*rect);
        indicator_shown_ = true;
    }
    else if (indicator_shown_)
    {
        feedback_->clear_indicator();
        indicator_shown_ = false;
    }
}

}  // namespace kestrel
