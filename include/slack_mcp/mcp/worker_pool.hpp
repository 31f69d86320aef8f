#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// WorkerPool - fixed set of threads draining a FIFO job queue.
//
// Jobs must not throw. Drain() blocks until the queue is empty and no job is
// running; the destructor drains and then joins.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void Submit(std::function<void()> job);
    void Drain();

    [[nodiscard]] size_t ThreadCount() const noexcept { return threads_.size(); }

private:
    void Loop();

    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    std::deque<std::function<void()>> jobs_;
    size_t running_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace slack_mcp
