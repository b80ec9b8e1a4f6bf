#pragma once

#include <cstdint>
#include <functional>
#include <kestrel/fwd.hpp>
#include <optional>
#include <string>

namespace kestrel
{

// Logical drop zone a tab can live in.  Immutable value type; the payload id
// is only meaningful for the parameterised kinds and is zero otherwise, so
// two containers compare equal iff kind and payload both match.
class Container
{
   public:
    enum class Kind : uint8_t
    {
        None,
        Essentials,
        SpacePinned,
        SpaceRegular,
        Folder,
    };

    constexpr Container() = default;

    static constexpr Container none() { return Container(); }
    static constexpr Container essentials() { return Container(Kind::Essentials, 0); }
    static constexpr Container space_pinned(SpaceId space)
    {
        return Container(Kind::SpacePinned, space);
    }
    static constexpr Container space_regular(SpaceId space)
    {
        return Container(Kind::SpaceRegular, space);
    }
    static constexpr Container folder(FolderId folder)
    {
        return Container(Kind::Folder, folder);
    }

    constexpr Kind     kind() const { return kind_; }
    constexpr uint64_t payload() const { return payload_; }

    constexpr bool is_none() const { return kind_ == Kind::None; }

    // Space the container belongs to (pinned or regular section only).
    std::optional<SpaceId> space_id() const;

    // Folder id for Kind::Folder.
    std::optional<FolderId> folder_id() const;

    // Short human-readable form used in log lines, e.g. "spacePinned(7)".
    std::string to_string() const;

    friend constexpr bool operator==(const Container& a, const Container& b)
    {
        return a.kind_ == b.kind_ && a.payload_ == b.payload_;
    }
    friend constexpr bool operator!=(const Container& a, const Container& b) { return !(a == b); }

   private:
    constexpr Container(Kind kind, uint64_t payload) : kind_(kind), payload_(payload) {}

    Kind     kind_    = Kind::None;
    uint64_t payload_ = 0;
};

struct ContainerHash
{
    size_t operator()(const Container& c) const noexcept
    {
        return std::hash<uint64_t>{}(c.payload() * 8 + static_cast<uint64_t>(c.kind()));
    }
};

}  // namespace kestrel
