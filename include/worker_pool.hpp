#pragma once

#include <vector>
#include <deque>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>


//------------------------------------------------------------------------------
// WorkerPool

using TaskFn = std::function<void(int worker_index)>;

/*
    Fixed set of threads pulling tasks from one shared queue.

    Used for batch jobs like indexing a directory of containers, where each
    task is a whole file and tasks are independent.
*/
class WorkerPool {
public:
    ~WorkerPool() {
        Stop();
    }

    // worker_count <= 0 selects the number of logical cores
    void Start(int worker_count = 0);

    // Abandons queued tasks that have not started and joins all threads
    void Stop();

    // Blocks until every queued task has finished
    void WaitForTasks();

    int GetWorkerCount() const { return (int)Threads.size(); }

    // Queued plus running tasks
    int32_t GetActiveTaskCount() const { return ActiveTasks; }

    // max_active_tasks: 0 means no limit.  Otherwise, block while the number
    // of active tasks per worker is at the limit.
    void QueueTask(TaskFn task, int max_active_tasks = 0);

private:
    std::vector<std::shared_ptr<std::thread>> Threads;
    std::atomic<bool> Terminated = ATOMIC_VAR_INIT(false);

    std::atomic<int32_t> ActiveTasks = ATOMIC_VAR_INIT(0);

    std::mutex Lock;
    std::condition_variable TaskCondition, DoneCondition;
    std::deque<TaskFn> Tasks;

    void Loop(int worker_index);
};
