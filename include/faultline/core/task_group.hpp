// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Task Group
//
// Owner for short-lived worker threads: one thread per proxied request,
// per outbound notification, or per delivered callback event.

#ifndef FAULTLINE_CORE_TASK_GROUP_HPP
#define FAULTLINE_CORE_TASK_GROUP_HPP

#include "faultline/core/structured_logger.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace faultline {
namespace core {

/**
 * @brief A set of worker threads that are joined together.
 *
 * spawn() starts the task on its own thread and returns immediately; the
 * caller never waits for the task. Finished threads are reaped on each
 * spawn so a long-running group does not accumulate them. joinAll() closes
 * the group and waits for every outstanding task.
 *
 * A std::exception escaping a task is logged under the group's name and
 * does not affect other tasks.
 */
class TaskGroup {
public:
    explicit TaskGroup(std::string name,
                       std::shared_ptr<StructuredLogger> logger = nullptr);

    /**
     * @brief Joins all outstanding tasks.
     */
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Start a task.
     * @return false if the group was already closed by joinAll()
     */
    bool spawn(std::function<void()> task);

    /**
     * @brief Close the group and wait for every task. Idempotent.
     *
     * When called from one of the group's own tasks, that task's thread is
     * detached instead of joined.
     */
    void joinAll();

    /**
     * @brief Number of tasks that have not finished yet.
     */
    size_t activeCount() const;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedLocked();

    std::string name_;
    std::shared_ptr<StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::list<Task> tasks_;
    bool closed_ = false;
};

} // namespace core
} // namespace faultline

#endif // FAULTLINE_CORE_TASK_GROUP_HPP
