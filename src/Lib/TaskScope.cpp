#include "TaskScope.h"
#include <iostream>
#include <utility>

TaskScope::~TaskScope() {
    cancel();
    join();
}

void TaskScope::launch(std::function<void(std::stop_token)> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopSource.stop_requested()) {
        return;
    }

    vTasks.emplace_back([task = std::move(task), token = stopSource.get_token()] {
        try {
            task(token);
        } catch (std::exception& exception) {
            std::cerr << "APP: Task failed" << std::endl;
            dumpExceptions(exception);
        }
    });
}

void TaskScope::cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    stopSource.request_stop();
}

auto TaskScope::isCancelled() const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return stopSource.stop_requested();
}

void TaskScope::join() {
    std::vector<std::jthread> tasks;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        tasks.swap(vTasks);
    }

    for (auto& task : tasks) {
        if (task.joinable()) {
            task.join();
        }
    }
}
