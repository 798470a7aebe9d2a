#include "lyacorr/ThreadPool.hpp"

#include <algorithm>

namespace lyacorr {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = std::max(1u, std::thread::hardware_concurrency());
    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i)
        workers_.emplace_back([this] { worker_loop(); });
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void ThreadPool::worker_loop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lk(mtx_);
            cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();   // packaged_task stores any exception in its future
    }
}

} // namespace lyacorr
