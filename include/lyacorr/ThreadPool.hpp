#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace lyacorr {

/*
 * Fixed-size worker pool.  Tasks are run in submission order by whichever
 * worker is free; results and exceptions travel back through the returned
 * future.  The destructor drains the queue before joining.
 */
class ThreadPool {
public:
    // 0 selects std::thread::hardware_concurrency()
    explicit ThreadPool(unsigned nthreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    std::size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::jthread>         workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        mtx_;
    std::condition_variable           cv_;
    bool                              stop_ = false;
};

template <class F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>>
{
    using Ret = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<F>(f));
    std::future<Ret> res = task->get_future();
    {
        std::lock_guard lk(mtx_);
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

} // namespace lyacorr
