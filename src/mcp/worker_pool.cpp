#include <slack_mcp/mcp/worker_pool.hpp>

namespace slack_mcp {

WorkerPool::WorkerPool(size_t thread_count) {
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this] { Loop(); });
    }
}

WorkerPool::~WorkerPool() {
    Drain();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::Submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    work_available_.notify_one();
}

void WorkerPool::Drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return jobs_.empty() && running_ == 0; });
}

void WorkerPool::Loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock,
                                 [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) return;  // stopping and nothing left
            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++running_;
        }

        job();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
            if (jobs_.empty() && running_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace slack_mcp
