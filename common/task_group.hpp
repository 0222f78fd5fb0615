#pragma once

#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Runs each spawned task on its own thread. wait() is a join barrier: it
// returns only after every task has finished, then rethrows the first
// exception a task raised (in completion order), if any. Tasks that already
// succeeded are not undone.
class TaskGroup {
private:
    std::vector<std::thread> workers;
    std::mutex error_mutex;
    std::exception_ptr first_error;

    void joinAll();

public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::function<void()> task);

    void wait();
};
