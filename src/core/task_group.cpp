// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Task Group Implementation

#include "faultline/core/task_group.hpp"

#include <exception>

namespace faultline {
namespace core {

TaskGroup::TaskGroup(std::string name, std::shared_ptr<StructuredLogger> logger)
    : name_(std::move(name))
    , logger_(logger ? std::move(logger) : defaultLogger()) {
}

TaskGroup::~TaskGroup() {
    joinAll();
}

bool TaskGroup::spawn(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    reapFinishedLocked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto logger = logger_;
    std::string name = name_;

    Task entry;
    entry.done = done;
    entry.thread = std::thread([task = std::move(task), done, logger, name]() {
        try {
            task();
        } catch (const std::exception& e) {
            logger->error("Task failed: " + std::string(e.what()), name);
        }
        done->store(true);
    });
    tasks_.push_back(std::move(entry));
    return true;
}

void TaskGroup::joinAll() {
    std::list<Task> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        pending.swap(tasks_);
    }

    for (auto& task : pending) {
        if (!task.thread.joinable()) {
            continue;
        }
        if (task.thread.get_id() == std::this_thread::get_id()) {
            task.thread.detach();
        } else {
            task.thread.join();
        }
    }
}

size_t TaskGroup::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& task : tasks_) {
        if (!task.done->load()) {
            ++count;
        }
    }
    return count;
}

void TaskGroup::reapFinishedLocked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace core
} // namespace faultline
