#pragma once

#include <kestrel/drag_operation.hpp>
#include <optional>

namespace kestrel
{

// Pure interpretation of a committed DragOperation for the tab-list
// collaborator.  Nothing here touches a tab list.
namespace drag_resolver
{

enum class MoveKind
{
    None,             // same container, same index
    Reorder,          // same container, different index
    CrossContainer,   // container changed
};

struct ResolvedMove
{
    DragOperation op;
    MoveKind      kind         = MoveKind::None;
    int           insert_index = 0;   // index to insert at after removal from the source
};

MoveKind classify(const DragOperation& op);

const char* to_string(MoveKind kind);

// Insertion index once the item has been removed from its source list.
// `target_count` is the target list size before the move.
int adjusted_insert_index(const DragOperation& op, int target_count);

// Validate against the current list sizes.  Returns nullopt when the source
// index does not name an item, or when the operation is a no-op.
std::optional<ResolvedMove> resolve(const DragOperation& op, int source_count, int target_count);

}  // namespace drag_resolver

}  // namespace kestrel
