///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file task_queue.cpp
 * @brief TaskQueue implementation
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include "util/task_queue.h"
#include "logging/logger.h"

#include <exception>
#include <utility>

namespace FlightBridge {

TaskQueue::TaskQueue(std::string name, size_t workers)
    : name_(std::move(name)) {
    if (workers == 0) {
        workers = 1;
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&TaskQueue::WorkerLoop, this);
    }
}

TaskQueue::~TaskQueue() {
    Stop();
}

bool TaskQueue::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void TaskQueue::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t TaskQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskQueue::WorkerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& ex) {
            LOG_ERROR("Task on worker '{}' failed: {}", name_, ex.what());
        }
    }
}

} // namespace FlightBridge
