#include <kestrel/container.hpp>

namespace kestrel
{

std::optional<SpaceId> Container::space_id() const
{
    if (kind_ == Kind::SpacePinned || kind_ == Kind::SpaceRegular)
        return payload_;
    return std::nullopt;
}

std::optional<FolderId> Container::folder_id() const
{
    if (kind_ == Kind::Folder)
        return payload_;
    return std::nullopt;
}

std::string Container::to_string() const
{
    switch (kind_)
    {
        case Kind::None:
            return "none";
        case Kind::Essentials:
            return "essentials";
        case Kind::SpacePinned:
            return "spacePinned(" + std::to_string(payload_) + ")";
        case Kind::SpaceRegular:
            return "spaceRegular(" + std::to_string(payload_) + ")";
        case Kind::Folder:
            return "folder(" + std::to_string(payload_) + ")";
    }
    return "unknown";
}

}  // namespace kestrel
