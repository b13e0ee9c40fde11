#include "runs/work_queue.hpp"

#include <exception>
#include <string>

#include "utils/logging.hpp"

namespace agentrun::runs {

WorkQueue::WorkQueue(std::size_t workers, std::size_t capacity)
    : worker_count_(workers == 0 ? 1 : workers)
    , capacity_(capacity == 0 ? 1 : capacity) {}

WorkQueue::~WorkQueue() {
    Stop();
}

void WorkQueue::Start() {
    if (running_.exchange(true)) {
        return;
    }
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
}

bool WorkQueue::TrySubmit(Task task, const std::function<void()>& on_accept) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || tasks_.size() >= capacity_) {
            return false;
        }
        if (on_accept) {
            on_accept();
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

std::size_t WorkQueue::Close() {
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return 0;
        }
        discarded = tasks_.size();
        std::queue<Task> empty;
        tasks_.swap(empty);
    }
    cv_.notify_all();
    return discarded;
}

void WorkQueue::Join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t WorkQueue::Stop() {
    const auto discarded = Close();
    Join();
    return discarded;
}

std::size_t WorkQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkQueue::WorkerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            if (!running_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            agentrun::utils::LogError("runs", std::string("worker task failed: ") + ex.what());
        }
    }
}

}  // namespace agentrun::runs
