#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace agentrun::runs {

// Bounded task queue drained by a fixed number of worker threads.
class WorkQueue {
public:
    using Task = std::function<void()>;

    WorkQueue(std::size_t workers, std::size_t capacity);
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void Start();

    // Returns false when the queue is full or stopped; the task is not retained.
    // on_accept runs under the queue lock, before any worker can see the task.
    bool TrySubmit(Task task, const std::function<void()>& on_accept = {});

    // Stops accepting work and discards tasks not yet started. Workers finish
    // their current task and exit. Returns the number of discarded tasks.
    std::size_t Close();
    // Waits for every worker to exit. Call after Close().
    void Join();
    // Close() followed by Join().
    std::size_t Stop();

    std::size_t Pending() const;

private:
    void WorkerLoop();

    std::size_t worker_count_;
    std::size_t capacity_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
};

}  // namespace agentrun::runs
