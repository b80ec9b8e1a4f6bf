#include "task_scheduler.hpp"

#include <algorithm>
#include <kestrel/logger.hpp>
#include <utility>
#include <vector>

namespace kestrel
{

TaskScheduler::TaskId TaskScheduler::schedule_after(Duration delay, Task fn)
{
    if (!fn)
        return INVALID_TASK_ID;
    Entry e;
    e.due = now_ + std::max(delay, Duration(0));
    e.fn  = std::move(fn);
    return insert(std::move(e));
}

TaskScheduler::TaskId TaskScheduler::schedule_debounced(const std::string& slot,
                                                        Duration           delay,
                                                        Task               fn)
{
    if (!fn)
        return INVALID_TASK_ID;

    if (cancel_slot(slot))
        KESTREL_LOG_TRACE("scheduler", "Debounce slot '{}' rescheduled", slot);

    Entry e;
    e.due  = now_ + std::max(delay, Duration(0));
    e.fn   = std::move(fn);
    e.slot = slot;
    TaskId id = insert(std::move(e));
    slots_[slot] = id;
    return id;
}

TaskScheduler::TaskId TaskScheduler::add_periodic(Duration interval, Task fn)
{
    if (!fn || interval <= Duration(0))
    {
        KESTREL_LOG_WARN("scheduler", "add_periodic: rejected non-positive interval");
        return INVALID_TASK_ID;
    }
    Entry e;
    e.due      = now_ + interval;
    e.interval = interval;
    e.fn       = std::move(fn);
    return insert(std::move(e));
}

bool TaskScheduler::cancel(TaskId id)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return false;
    erase(it);
    return true;
}

bool TaskScheduler::cancel_slot(const std::string& slot)
{
    auto it = slots_.find(slot);
    if (it == slots_.end())
        return false;
    return cancel(it->second);
}

void TaskScheduler::cancel_all()
{
    tasks_.clear();
    slots_.clear();
}

size_t TaskScheduler::tick(TimePoint now)
{
    if (now > now_)
        now_ = now;

    // Snapshot what is due now; tasks scheduled while running wait for the
    // next tick even if their delay is zero.
    std::vector<std::pair<TimePoint, TaskId>> due;
    for (const auto& [id, entry] : tasks_)
    {
        if (entry.due <= now_)
            due.emplace_back(entry.due, id);
    }
    std::sort(due.begin(), due.end());

    size_t ran = 0;
    for (const auto& [when, id] : due)
    {
        auto it = tasks_.find(id);
        if (it == tasks_.end())
            continue;   // cancelled by an earlier task

        Task fn;
        if (it->second.interval > Duration(0))
        {
            // Skip missed periods instead of running a burst.
            it->second.due = now_ + it->second.interval;
            fn             = it->second.fn;
        }
        else
        {
            fn = std::move(it->second.fn);
            erase(it);
        }

        fn();
        ++ran;
    }
    return ran;
}

TaskScheduler::Duration TaskScheduler::time_until_next() const
{
    if (tasks_.empty())
        return Duration::max();

    TimePoint next = TimePoint::max();
    for (const auto& [id, entry] : tasks_)
        next = std::min(next, entry.due);
    if (next <= now_)
        return Duration(0);
    return std::chrono::duration_cast<Duration>(next - now_);
}

TaskScheduler::TaskId TaskScheduler::insert(Entry entry)
{
    TaskId id = next_id_++;
    tasks_.emplace(id, std::move(entry));
    return id;
}

void TaskScheduler::erase(std::map<TaskId, Entry>::iterator it)
{
    if (!it->second.slot.empty())
    {
        auto slot = slots_.find(it->second.slot);
        if (slot != slots_.end() && slot->second == it->first)
            slots_.erase(slot);
    }
    tasks_.erase(it);
}

}  // namespace kestrel
