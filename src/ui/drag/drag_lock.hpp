#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace kestrel
{

// Refuses a second drag while one is running, across every window of the
// shell.  Owned by Shell; not a process global.
class DragLock
{
   public:
    class Guard
    {
       public:
        Guard() = default;
        ~Guard() { release(); }

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept : lock_(other.lock_), owner_(std::move(other.owner_))
        {
            other.lock_ = nullptr;
        }
        Guard& operator=(Guard&& other) noexcept
        {
            if (this != &other)
            {
                release();
                lock_       = other.lock_;
                owner_      = std::move(other.owner_);
                other.lock_ = nullptr;
            }
            return *this;
        }

        explicit operator bool() const { return lock_ != nullptr; }

        void release()
        {
            if (lock_)
            {
                lock_->release(owner_);
                lock_ = nullptr;
            }
        }

       private:
        friend class DragLock;
        Guard(DragLock* lock, std::string owner) : lock_(lock), owner_(std::move(owner)) {}

        DragLock*   lock_ = nullptr;
        std::string owner_;
    };

    DragLock() = default;

    DragLock(const DragLock&)            = delete;
    DragLock& operator=(const DragLock&) = delete;

    bool try_lock(const std::string& owner);

    // Ignored unless `owner` holds the lock.
    bool release(const std::string& owner);

    void force_release();

    // Scoped variant of try_lock(); empty guard when the lock is taken.
    Guard acquire(const std::string& owner);

    bool                       is_locked() const { return owner_.has_value(); }
    std::optional<std::string> owner() const { return owner_; }

    // How long the current holder has held the lock (zero when unlocked).
    std::chrono::milliseconds held_for() const;

   private:
    std::optional<std::string>            owner_;
    std::chrono::steady_clock::time_point since_{};
};

}  // namespace kestrel
