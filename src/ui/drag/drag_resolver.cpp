#include "drag_resolver.hpp"

#include <algorithm>
#include <kestrel/logger.hpp>

namespace kestrel::drag_resolver
{

MoveKind classify(const DragOperation& op)
{
    if (op.moving_between_containers())
        return MoveKind::CrossContainer;
    if (op.is_reordering())
        return MoveKind::Reorder;
    return MoveKind::None;
}

const char* to_string(MoveKind kind)
{
    switch (kind)
    {
        case MoveKind::None:
            return "none";
        case MoveKind::Reorder:
            return "reorder";
        case MoveKind::CrossContainer:
            return "cross-container";
    }
    return "unknown";
}

int adjusted_insert_index(const DragOperation& op, int target_count)
{
    target_count = std::max(0, target_count);
    if (op.moving_between_containers())
        return std::clamp(op.to_index, 0, target_count);

    // Same list: it shrinks by one once the source item is taken out.
    const int remaining = std::max(0, target_count - 1);
    return std::clamp(op.to_index, 0, remaining);
}

std::optional<ResolvedMove> resolve(const DragOperation& op, int source_count, int target_count)
{
    if (op.from_index < 0 || op.from_index >= source_count)
    {
        KESTREL_LOG_WARN("drag", "resolve: tab {} source index {} out of range ({} items)",
                         op.item, op.from_index, source_count);
        return std::nullopt;
    }

    ResolvedMove move;
    move.op           = op;
    move.insert_index = adjusted_insert_index(op, target_count);
    move.op.to_index  = move.insert_index;
    move.kind         = classify(move.op);

    if (move.kind == MoveKind::None)
        return std::nullopt;
    return move;
}

}  // namespace kestrel::drag_resolver
