#pragma once

#include <kestrel/container.hpp>
#include <kestrel/fwd.hpp>
#include <optional>

namespace kestrel
{

// Result of a committed tab drag.  Produced at most once per drag by
// DragSession::end_drag() and consumed by the tab-list collaborator, which
// performs the actual splice.
struct DragOperation
{
    TabId                  item           = INVALID_TAB_ID;
    Container              from_container = Container::none();
    int                    from_index     = 0;
    Container              to_container   = Container::none();
    int                    to_index       = 0;
    std::optional<SpaceId> to_space;

    bool moving_between_containers() const { return from_container != to_container; }

    bool is_reordering() const
    {
        return from_container == to_container && from_index != to_index;
    }
};

inline bool operator==(const DragOperation& a, const DragOperation& b)
{
    return a.item == b.item && a.from_container == b.from_container
           && a.from_index == b.from_index && a.to_container == b.to_container
           && a.to_index == b.to_index && a.to_space == b.to_space;
}

}  // namespace kestrel
