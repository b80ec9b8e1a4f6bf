#include "drag_lock.hpp"

#include <kestrel/logger.hpp>

namespace kestrel
{

bool DragLock::try_lock(const std::string& owner)
{
    if (owner_)
    {
        KESTREL_LOG_DEBUG("drag", "Drag lock denied to {}: held by {}", owner, *owner_);
        return false;
    }
    owner_ = owner;
    since_ = std::chrono::steady_clock::now();
    return true;
}

bool DragLock::release(const std::string& owner)
{
    if (!owner_)
        return false;
    if (*owner_ != owner)
    {
        KESTREL_LOG_WARN("drag", "Drag lock release by {} denied: held by {}", owner, *owner_);
        return false;
    }
    KESTREL_LOG_DEBUG("drag", "Drag lock released by {} after {} ms", owner, held_for().count());
    owner_.reset();
    return true;
}

void DragLock::force_release()
{
    if (owner_)
        KESTREL_LOG_WARN("drag", "Drag lock force-released (was held by {})", *owner_);
    owner_.reset();
}

DragLock::Guard DragLock::acquire(const std::string& owner)
{
    if (!try_lock(owner))
        return Guard();
    return Guard(this, owner);
}

std::chrono::milliseconds DragLock::held_for() const
{
    if (!owner_)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                 - since_);
}

}  // namespace kestrel
