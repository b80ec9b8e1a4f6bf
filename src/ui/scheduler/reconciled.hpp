#pragma once

#include <cstdint>
#include <utility>

namespace kestrel
{

// Value fed by two sources: push events (authoritative, always applied) and
// fallback polls (corrective only).  Every push bumps the revision.  A poll
// carries the revision observed when it started and is dropped if a push
// landed in the meantime, so a slow poll never regresses fresher state.
template <typename T>
class Reconciled
{
   public:
    Reconciled() = default;
    explicit Reconciled(T initial) : value_(std::move(initial)) {}

    // Returns true if the value changed.
    bool apply_push(T value)
    {
        ++revision_;
        if (value_ == value)
            return false;
        value_ = std::move(value);
        return true;
    }

    // Start a poll: remember the returned revision and pass it back to
    // apply_poll() with the result.
    uint64_t begin_poll() const { return revision_; }

    // Returns true if the poll result was applied and changed the value.
    bool apply_poll(T value, uint64_t snapshot_revision)
    {
        if (snapshot_revision != revision_)
            return false;
        if (value_ == value)
            return false;
        value_ = std::move(value);
        ++revision_;
        return true;
    }

    const T& value() const { return value_; }
    uint64_t revision() const { return revision_; }

   private:
    T        value_{};
    uint64_t revision_ = 0;
};

}  // namespace kestrel
