// src/core/ThreadPool.hpp
//
// Fixed-size worker pool used by the thread-pool gradient backend of the
// **ParallelPreferenceEngine**.
//
// One pool is created per backend instance and reused for every optimization
// round, so the per-round cost is one enqueue per item chunk and no thread
// creation. Tasks return their partial results through `std::future`, which
// also serves as the completion barrier of a round: the engine collects every
// future before it touches the parameter matrix again.
//
// Workers are joined in the destructor after the queue drains.
#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @class ThreadPool
 * @brief FIFO task queue served by a fixed set of worker threads.
 *
 * @note Non-copyable; intended to live as long as the backend that owns it.
 */
class ThreadPool {
public:
    /**
     * @brief Starts `threads` workers (at least one).
     *
     * @param threads Worker count; defaults to the hardware concurrency.
     */
    explicit ThreadPool(size_t threads = std::thread::hardware_concurrency());

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Stops accepting work, lets queued tasks finish and joins workers.
     */
    ~ThreadPool();

    /**
     * @brief Schedules `f` and returns a future for its result.
     *
     * Exceptions thrown by `f` are stored in the future and rethrown by
     * `get()` on the calling thread.
     */
    template<class F, class R = std::invoke_result_t<std::decay_t<F>>>
    std::future<R> enqueue(F&& f);

    size_t thread_count() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex mtx;
    std::condition_variable cv;
    bool stop = false; ///< Guarded by mtx.
};

inline ThreadPool::ThreadPool(size_t threads) {
    if (threads == 0) threads = 1;
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mtx);
                    cv.wait(lock, [this] { return stop || !tasks.empty(); });
                    if (stop && tasks.empty()) return;
                    task = std::move(tasks.front());
                    tasks.pop();
                }
                task();
            }
        });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stop = true;
    }
    cv.notify_all();
    for (auto& w : workers) w.join();
}

template<class F, class R>
inline std::future<R> ThreadPool::enqueue(F&& f) {
    // std::function needs a copyable target, so the packaged_task is shared.
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stop) {
            throw std::runtime_error("enqueue on a stopped ThreadPool");
        }
        tasks.emplace([task = std::move(task)]() { (*task)(); });
    }
    cv.notify_one();
    return future;
}

#endif // THREAD_POOL_HPP
