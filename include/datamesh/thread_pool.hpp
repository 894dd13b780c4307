#pragma once
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace datamesh {

// ---------------------------------------------------------------------------
// ThreadPool
//
// Executor behind the connector's *_async calls. Tasks are blocking calls
// run to completion; a submitted task cannot be cancelled. Destruction
// drains the queue before joining, so every future handed out is
// satisfied.
// ---------------------------------------------------------------------------
class ThreadPool final {
public:
    explicit ThreadPool(std::size_t num_workers = 0)
        : active_{0}
    {
        if (num_workers == 0)
            num_workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());

        workers_.reserve(num_workers);
        for (std::size_t i = 0; i < num_workers; ++i)
            workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }

    ~ThreadPool() {
        {
            // under the lock so a worker between its predicate check and
            // wait() cannot miss the wakeup
            std::lock_guard lk(mu_);
            for (auto& w : workers_)
                w.request_stop();
        }
        cv_.notify_all();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // The callable's exception, if any, is rethrown from future::get().
    template <typename F, typename... Args>
    [[nodiscard]] auto submit(F&& func, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using R = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<R()>>(
            std::bind_front(std::forward<F>(func), std::forward<Args>(args)...));
        auto fut = task->get_future();
        {
            std::lock_guard lk(mu_);
            queue_.emplace([t = std::move(task)]() { (*t)(); });
        }
        cv_.notify_one();
        return fut;
    }

    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

    [[nodiscard]] std::size_t pending() const noexcept {
        std::lock_guard lk(mu_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t active() const noexcept {
        return active_.load(std::memory_order_relaxed);
    }

    void wait_idle() {
        std::unique_lock lk(mu_);
        idle_cv_.wait(lk, [this] {
            return queue_.empty() && active_.load(std::memory_order_relaxed) == 0;
        });
    }

private:
    void worker_loop(std::stop_token stop) {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock lk(mu_);
                cv_.wait(lk, [&] { return stop.stop_requested() || !queue_.empty(); });
                if (queue_.empty()) return;  // stop requested and drained
                task = std::move(queue_.front());
                queue_.pop();
                active_.fetch_add(1, std::memory_order_relaxed);
            }
            task();
            {
                std::lock_guard lk(mu_);
                active_.fetch_sub(1, std::memory_order_relaxed);
            }
            idle_cv_.notify_all();
        }
    }

    std::queue<std::function<void()>> queue_;
    mutable std::mutex                mu_;
    std::condition_variable           cv_;
    std::condition_variable           idle_cv_;
    std::atomic<std::size_t>          active_;
    std::vector<std::jthread>         workers_;  // last: joined before the queue is destroyed
};

} // namespace datamesh
