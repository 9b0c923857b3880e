/**
 * @file i_task_executor.h
 * @brief Interface for fire-and-forget task execution
 */

#pragma once

#include <functional>

namespace snapfetch {

/**
 * @brief Runs tasks asynchronously
 *
 * Contract:
 * - submit() returns without waiting for the task
 * - submit() throws std::runtime_error if the executor no longer accepts
 *   work; the task is then never run
 */
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    virtual void submit(std::function<void()> task) = 0;
};

} // namespace snapfetch
