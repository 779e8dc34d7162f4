#include "worker_pool.hpp"

#include "tools.hpp"


//------------------------------------------------------------------------------
// WorkerPool

void WorkerPool::Start(int worker_count)
{
    Stop();

    if (worker_count <= 0) {
        worker_count = (int)std::thread::hardware_concurrency();
        if (worker_count <= 0) {
            worker_count = 1;
        }
    }

    Terminated = false;
    for (int worker_index = 0; worker_index < worker_count; ++worker_index) {
        Threads.emplace_back(std::make_shared<std::thread>(&WorkerPool::Loop, this, worker_index));
    }
}

void WorkerPool::Stop()
{
    {
        std::lock_guard<std::mutex> lock(Lock);
        Terminated = true;

        ActiveTasks -= (int32_t)Tasks.size();
        Tasks.clear();
    }
    TaskCondition.notify_all();
    DoneCondition.notify_all();

    for (auto& thread : Threads) {
        JoinThread(thread);
    }
    Threads.clear();
}

void WorkerPool::Loop(int worker_index)
{
    for (;;) {
        TaskFn task;

        // Wait for new work to be submitted
        {
            std::unique_lock<std::mutex> lock(Lock);
            TaskCondition.wait(lock, [this]{ return Terminated || !Tasks.empty(); });
            if (Terminated) {
                break;
            }
            task = std::move(Tasks.front());
            Tasks.pop_front();
        }

        task(worker_index);

        // Notify all waiting threads that new work can be submitted
        {
            std::lock_guard<std::mutex> lock(Lock);
            --ActiveTasks;
        }
        DoneCondition.notify_all();
    }
}

void WorkerPool::WaitForTasks()
{
    std::unique_lock<std::mutex> lock(Lock);
    DoneCondition.wait(lock, [this]{ return Terminated || ActiveTasks <= 0; });
}

void WorkerPool::QueueTask(TaskFn task, int max_active_tasks)
{
    std::unique_lock<std::mutex> lock(Lock);

    if (Threads.empty()) {
        LOG_ERROR() << "WorkerPool::QueueTask called before Start";
        return;
    }

    if (max_active_tasks > 0) {
        const int32_t limit = max_active_tasks * (int32_t)Threads.size();
        DoneCondition.wait(lock, [this, limit]{ return Terminated || ActiveTasks < limit; });
        if (Terminated) {
            return;
        }
    }

    ++ActiveTasks;
    Tasks.emplace_back(std::move(task));
    TaskCondition.notify_one();
}
