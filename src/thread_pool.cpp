#include "thread_pool.hpp"
#include "output_verifier.hpp"
#include "syntax_engine.hpp"

#include <algorithm>
#include <iostream>

namespace jsxform {

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    const size_t num_threads = std::max<size_t>(1, config_.get_thread_count());

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_thread, this, i);
    }

    std::cout << "Thread pool started with " << num_threads << " threads\n";
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_thread(size_t thread_id) {
    // Each thread gets its own engine and QuickJS runtime
    BuiltinSyntaxEngine engine;
    std::unique_ptr<QuickJsVerifier> verifier;
    if (config_.verify_output) {
        try {
            verifier = std::make_unique<QuickJsVerifier>(config_.max_memory_mb);
        } catch (const std::exception& e) {
            std::cerr << "Warning: worker " << thread_id << " runs without output verification: " << e.what() << "\n";
        }
    }
    Transformer transformer(engine, verifier.get());

    while (true) {
        std::function<void(Transformer&)> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task(transformer);
        } catch (const std::exception& e) {
            std::cerr << "Error: task failed in worker " << thread_id << ": " << e.what() << "\n";
        }
    }
}

}  // namespace jsxform
