//
// A group of tasks tied to the lifetime of one screen. Destroying the scope stops every task and
// waits for them to exit.
//

#ifndef LRR_CLIENT_TASKSCOPE_H
#define LRR_CLIENT_TASKSCOPE_H

#include "GeneralUtils.h"
#include <exception>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

class TaskScope {
public:
    TaskScope() = default;
    ~TaskScope();
    TaskScope(TaskScope const&) = delete;
    auto operator =(TaskScope const&) -> TaskScope& = delete;
    TaskScope(TaskScope&&) = delete;
    auto operator=(TaskScope&&) -> TaskScope& = delete;

    // Runs task on its own thread. Launching into a cancelled scope does nothing.
    void launch(std::function<void(std::stop_token)> task);

    void cancel();
    auto isCancelled() const -> bool;

    // Waits for every launched task
    void join();

private:
    mutable std::mutex mutex_;
    std::stop_source stopSource;
    std::vector<std::jthread> vTasks;
};

#endif //LRR_CLIENT_TASKSCOPE_H
