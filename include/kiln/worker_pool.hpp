#pragma once

#include <cstddef>
#include <functional>
#include <stop_token>
#include <vector>

namespace kiln {

/**
 * @brief Bounded pool that runs one batch of independent tasks.
 *
 * Workers pull task indices from a shared ready queue. Tasks must not touch
 * each other's state; each one writes only its own result slot. With one worker
 * the batch runs inline on the calling thread, in order.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t workers);

    /**
     * @brief Runs `task(i)` for every index in `order`.
     *
     * Once `stop` is requested no further task is started; tasks already running
     * finish. An exception escaping a task is rethrown here after every worker
     * has been joined.
     *
     * @return The number of tasks started.
     */
    size_t run(const std::vector<size_t> &order, const std::function<void(size_t)> &task, std::stop_token stop = {});

    size_t run(size_t task_count, const std::function<void(size_t)> &task, std::stop_token stop = {});

    size_t workers() const {
        return workers_;
    }

private:
    size_t workers_;
};

} // namespace kiln
