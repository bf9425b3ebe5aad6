#include "kiln/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <numeric>
#include <queue>
#include <thread>

namespace kiln {

WorkerPool::WorkerPool(size_t workers) : workers_(std::max<size_t>(workers, 1)) {
}

size_t WorkerPool::run(size_t task_count, const std::function<void(size_t)> &task, std::stop_token stop) {
    std::vector<size_t> order(task_count);
    std::iota(order.begin(), order.end(), size_t{0});
    return run(order, task, stop);
}

size_t WorkerPool::run(const std::vector<size_t> &order, const std::function<void(size_t)> &task,
                       std::stop_token stop) {
    if (workers_ == 1 || order.size() <= 1) {
        size_t started = 0;
        for (size_t idx : order) {
            if (stop.stop_requested())
                break;
            ++started;
            task(idx);
        }
        return started;
    }

    std::mutex mtx;
    std::queue<size_t> ready_queue;
    for (size_t idx : order)
        ready_queue.push(idx);

    std::atomic<size_t> started = 0;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (true) {
            size_t idx;
            {
                std::lock_guard lock(mtx);
                if (ready_queue.empty() || stop.stop_requested() || first_error)
                    return;
                idx = ready_queue.front();
                ready_queue.pop();
            }

            started.fetch_add(1, std::memory_order_relaxed);
            try {
                task(idx);
            } catch (...) {
                std::lock_guard lock(mtx);
                if (!first_error)
                    first_error = std::current_exception();
                return;
            }
        }
    };

    size_t thread_count = std::min(workers_, order.size());
    {
        std::vector<std::jthread> pool;
        pool.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i)
            pool.emplace_back(worker);
    } // join all threads

    if (first_error)
        std::rethrow_exception(first_error);
    return started.load();
}

} // namespace kiln
