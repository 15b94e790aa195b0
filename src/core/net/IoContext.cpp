#include "eventtap/core/net/IoContext.h"

namespace eventtap::core::net {
IoContext::IoContext() = default;
IoContext::~IoContext() { stop(); }

bool IoContext::post(Task task, std::size_t max_pending) {
    {
        std::lock_guard lock(guard);
        if (!running.load()) return false;
        if (max_pending > 0 && tasks.size() >= max_pending) return false;
        tasks.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

void IoContext::run() {
    while (running.load()) {
        Task task;
        {
            std::unique_lock lock(guard);
            cv.wait(lock, [&]{ return !running.load() || !tasks.empty(); });
            if (!running.load()) return;
            task = std::move(tasks.front());
            tasks.pop();
        }
        if (task) task();
    }
}

void IoContext::stop() {
    {
        std::lock_guard lock(guard);
        running.store(false);
    }
    cv.notify_all();
}

void IoContext::restart() {
    std::lock_guard lock(guard);
    std::queue<Task> empty;
    tasks.swap(empty);
    running.store(true);
}

std::size_t IoContext::pending() const {
    std::lock_guard lock(guard);
    return tasks.size();
}
}
