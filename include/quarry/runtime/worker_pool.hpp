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

namespace quarry::runtime {

/// Fixed set of worker threads draining one shared task queue.
///
/// Tasks still queued or running when a caller stops waiting keep running to
/// completion; the destructor drains the queue and joins every worker.
class WorkerPool {
   public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    auto operator=(const WorkerPool&) -> WorkerPool& = delete;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

    /// Queue `fn` and return a future for its result.
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task] { (*task)(); });
        }
        condition_.notify_one();
        return future;
    }

   private:
    void run();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

}  // namespace quarry::runtime
