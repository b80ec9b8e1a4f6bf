#pragma once

#include <kestrel/container.hpp>
#include <kestrel/drag_operation.hpp>
#include <kestrel/fwd.hpp>
#include <optional>
#include <utility>

namespace kestrel
{

class DropZoneLayouts;
class FeedbackSink;

// ─── DragSession ─────────────────────────────────────────────────────────────
// State machine for one in-flight tab move.
//
//   Idle ──start_drag──► Dragging ──update_target──► Dragging
//                           │
//                 end_drag(commit) / cancel
//                           │
//                           ▼
//                         Idle   (always; every branch resets first)
//
// Inputs are clamped or ignored, never rejected with an error.  Feedback
// pulses are edge-triggered on the (container, index) pair: repeating the
// same target does not pulse again.
class DragSession
{
   public:
    enum class State
    {
        Idle,
        Dragging,
    };

    DragSession() = default;
    ~DragSession() = default;

    DragSession(const DragSession&)            = delete;
    DragSession& operator=(const DragSession&) = delete;

    // ── Collaborators (not owned) ───────────────────────────────────────

    void set_feedback(FeedbackSink* sink) { feedback_ = sink; }
    void set_layouts(const DropZoneLayouts* layouts) { layouts_ = layouts; }
    void set_haptics_enabled(bool enabled) { haptics_enabled_ = enabled; }

    // ── Transitions ─────────────────────────────────────────────────────

    // Idle → Dragging.  Returns false if a drag is already running or the
    // item id is invalid.
    bool start_drag(TabId item, const Container& origin, int origin_index);

    // Record the current drop target.  Ignored unless dragging.  Negative
    // indices are stored as 0.  Returns true if the call was accepted.
    bool update_target(const Container& container,
                       int index,
                       std::optional<SpaceId> group = std::nullopt);

    // Pointer left (true) or re-entered (false) every window.  Leaving
    // clears the target container.
    void set_outside_window(bool outside);

    // Dragging → Idle.  Returns the operation only when committing to a
    // target that differs from the origin.
    std::optional<DragOperation> end_drag(bool commit);

    void cancel() { (void)end_drag(false); }

    // ── Queries ─────────────────────────────────────────────────────────

    State     state() const { return state_; }
    bool      is_dragging() const { return state_ == State::Dragging; }
    TabId     dragged_item() const { return item_; }
    Container origin_container() const { return origin_container_; }
    int       origin_index() const { return origin_index_; }
    Container target_container() const { return target_container_; }
    int       target_index() const { return target_index_; }
    bool      is_outside_window() const { return outside_window_; }

    std::optional<SpaceId> target_group() const { return target_group_; }
    std::optional<int>     last_pulse_index() const;

    // Same-container drag in a list zone (essentials is a grid).
    bool is_sidebar_reorder() const;

    // Visual displacement of the item at `index` while reordering inside
    // `container`, for a row pitch of `step`.
    float reorder_offset(const Container& container, int index, float step) const;

    uint64_t pulse_count() const { return pulse_count_; }

   private:
    void reset();
    void pulse();
    void show_indicator();

    State     state_            = State::Idle;
    TabId     item_             = INVALID_TAB_ID;
    Container origin_container_ = Container::none();
    int       origin_index_     = 0;
    Container target_container_ = Container::none();
    int       target_index_     = 0;
    bool      outside_window_   = false;

    std::optional<SpaceId>                  target_group_;
    std::optional<std::pair<Container, int>> last_pulse_;
    bool                                    indicator_shown_ = false;

    FeedbackSink*          feedback_        = nullptr;
    const DropZoneLayouts* layouts_         = nullptr;
    bool                   haptics_enabled_ = true;
    uint64_t               pulse_count_     = 0;
};

}  // namespace kestrel
