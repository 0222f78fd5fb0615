#include "task_group.hpp"

TaskGroup::~TaskGroup() {
    joinAll();
}

void TaskGroup::spawn(std::function<void()> task) {
    workers.emplace_back([this, task = std::move(task)]() {
        try {
            task();
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    });
}

void TaskGroup::joinAll() {
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

void TaskGroup::wait() {
    joinAll();

    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        error = first_error;
        first_error = nullptr;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}
