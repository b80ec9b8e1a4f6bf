#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>

namespace kestrel
{

// Cooperative timer queue for the UI thread.  Nothing runs on its own: the
// event loop calls tick() once per iteration and due tasks run inline.
//
// Three flavours:
//   schedule_after()     one-shot
//   schedule_debounced() one pending task per named slot; scheduling again
//                        cancels and replaces the pending one, so a burst of
//                        triggers yields exactly one run
//   add_periodic()       repeating safety-net timer
//
// Tasks may schedule or cancel other tasks (including themselves) while
// running.
class TaskScheduler
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::milliseconds;
    using Task      = std::function<void()>;
    using TaskId    = uint64_t;

    static constexpr TaskId INVALID_TASK_ID = 0;

    TaskScheduler() : now_(Clock::now()) {}
    explicit TaskScheduler(TimePoint start) : now_(start) {}

    TaskScheduler(const TaskScheduler&)            = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    TaskId schedule_after(Duration delay, Task fn);
    TaskId schedule_debounced(const std::string& slot, Duration delay, Task fn);
    TaskId add_periodic(Duration interval, Task fn);

    bool cancel(TaskId id);
    bool cancel_slot(const std::string& slot);
    void cancel_all();

    bool   has_pending(const std::string& slot) const { return slots_.count(slot) > 0; }
    bool   is_scheduled(TaskId id) const { return tasks_.count(id) > 0; }
    size_t pending_count() const { return tasks_.size(); }

    // Run every task due at or before `now`, in due order.  Returns the
    // number of tasks run.  Time never moves backwards.
    size_t tick(TimePoint now);
    size_t tick() { return tick(Clock::now()); }

    // Convenience for tests: tick(now() + d).
    size_t advance(Duration d) { return tick(now_ + d); }

    TimePoint now() const { return now_; }

    // Time until the next task is due; Duration::max() when idle.
    Duration time_until_next() const;

   private:
    struct Entry
    {
        TimePoint   due;
        Duration    interval{0};   // > 0 for periodic tasks
        Task        fn;
        std::string slot;          // non-empty for debounced tasks
    };

    TaskId insert(Entry entry);
    void   erase(std::map<TaskId, Entry>::iterator it);

    TimePoint                               now_;
    std::map<TaskId, Entry>                 tasks_;
    std::unordered_map<std::string, TaskId> slots_;
    TaskId                                  next_id_ = 1;
};

}  // namespace kestrel
