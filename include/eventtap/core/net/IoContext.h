#pragma once
#include <thread>
#include <atomic>
#include <functional>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>

namespace eventtap::core::net {
// Task queue drained by whichever threads call run(). Several threads may run() at once.
class IoContext {
public:
    using Task = std::function<void()>;

    IoContext();
    ~IoContext();

    // Returns false once the queue is stopped or holds max_pending tasks (0 = unbounded).
    bool post(Task task, std::size_t max_pending = 0);
    void run();
    void stop();
    void restart();
    std::size_t pending() const;

private:
    std::atomic<bool> running{true};
    mutable std::mutex guard;
    std::condition_variable cv;
    std::queue<Task> tasks;
};
}
