#include <curlmux/core/TaskQueue.hpp>

#include <exception>
#include <utility>

namespace curlmux::core
{

void TaskQueue::push(Task &&task)
{
    queue_.push_back(std::move(task));
}

bool TaskQueue::tryPop(Task &outTask)
{
    if (queue_.empty())
    {
        return false;
    }

    outTask = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

std::size_t TaskQueue::drainSnapshot(const std::function<void(const char *what)> &onError)
{
    std::size_t budget = queue_.size();
    std::size_t executed = 0;

    Task task;
    while (budget > 0 && tryPop(task))
    {
        --budget;
        if (!task)
        {
            continue;
        }
        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            if (onError)
            {
                onError(e.what());
            }
        }
        ++executed;
    }
    return executed;
}

} // namespace curlmux::core
