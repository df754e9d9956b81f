/**
 * Worker pool for parallel index estimation.
 *
 * Fixed number of threads consuming a FIFO queue. Each indexing call owns or
 * borrows a pool; there is no process-wide instance.
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace otree {

class WorkerPool {
public:
    using Task = std::function<void()>;

    // 0 threads means hardware concurrency
    explicit WorkerPool(size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t size() const { return workers_.size(); }

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    // Run func(i) for every i in [begin, end) in chunks and wait for all of them.
    // The first exception thrown by a chunk is rethrown after every chunk finished.
    template<typename Func>
    void parallel_for(size_t begin, size_t end, Func&& func) {
        if (begin >= end) return;

        const size_t total = end - begin;
        if (total == 1 || workers_.size() == 1) {
            for (size_t i = begin; i < end; ++i) {
                func(i);
            }
            return;
        }

        const size_t chunk_size = std::max(size_t(1), total / (workers_.size() * 4));

        std::vector<std::future<void>> futures;
        futures.reserve(total / chunk_size + 1);
        for (size_t i = begin; i < end; i += chunk_size) {
            size_t chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([&func, i, chunk_end]() {
                for (size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }

        std::exception_ptr first_error;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) first_error = std::current_exception();
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

private:
    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
                if (stopping_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace otree
