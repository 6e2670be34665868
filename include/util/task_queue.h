///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file task_queue.h
 * @brief Background workers executing posted tasks
 *
 * Used for blocking collaborator calls (coordinate lookups, persistence) so
 * they never run on the producer loop or the transport thread. With one
 * worker, tasks run in posting order.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace FlightBridge {

class TaskQueue {
public:
    using Task = std::function<void()>;

    explicit TaskQueue(std::string name, size_t workers = 1);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /// @return false once Stop() has been called
    bool Post(Task task);

    /// Run the remaining tasks, then join the worker. Idempotent.
    void Stop();

    /// Number of tasks waiting (not counting the ones running)
    size_t Pending() const;

private:
    void WorkerLoop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Task> tasks_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace FlightBridge
