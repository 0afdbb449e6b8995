#pragma once

#include "config.hpp"
#include "transform.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace jsxform {

// Fixed set of workers, each with its own syntax engine, QuickJS verifier
// and Transformer. Tasks receive the worker's Transformer.
class ThreadPool {
public:
    explicit ThreadPool(const Config& config);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template <typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Transformer&, Args...>>;

    // Runs `f` on a worker, then `callback` with its result on the same
    // worker. An exception from either goes to `on_error` instead.
    template <typename F, typename Callback, typename ErrorCallback>
    void enqueue_with_callback(F&& f, Callback&& callback, ErrorCallback&& on_error);

    [[nodiscard]] size_t size() const noexcept { return workers_.size(); }

    void shutdown();

private:
    void worker_thread(size_t thread_id);

    const Config& config_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void(Transformer&)>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Transformer&, Args...>>
{
    using return_type = std::invoke_result_t<F, Transformer&, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type(Transformer&)>>(
        [func = std::forward<F>(f), ... captured_args = std::forward<Args>(args)]
        (Transformer& transformer) mutable {
            return func(transformer, std::forward<Args>(captured_args)...);
        }
    );

    std::future<return_type> result = task->get_future();
    {
        std::unique_lock lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        tasks_.emplace([task = std::move(task)](Transformer& transformer) {
            (*task)(transformer);
        });
    }
    condition_.notify_one();
    return result;
}

template <typename F, typename Callback, typename ErrorCallback>
void ThreadPool::enqueue_with_callback(F&& f, Callback&& callback, ErrorCallback&& on_error) {
    auto task_fn = std::make_shared<std::decay_t<F>>(std::forward<F>(f));
    auto callback_fn = std::make_shared<std::decay_t<Callback>>(std::forward<Callback>(callback));
    auto error_fn = std::make_shared<std::decay_t<ErrorCallback>>(std::forward<ErrorCallback>(on_error));

    {
        std::unique_lock lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        tasks_.emplace([task_fn, callback_fn, error_fn](Transformer& transformer) {
            try {
                auto result = (*task_fn)(transformer);
                (*callback_fn)(std::move(result));
            } catch (const std::exception& e) {
                (*error_fn)(std::string(e.what()));
            }
        });
    }
    condition_.notify_one();
}

}  // namespace jsxform
