/**
 * @file events.hpp
 * @brief Events published by the worker pool.
 */

#ifndef CRUSHER_EVENTS_HPP
#define CRUSHER_EVENTS_HPP

#include "errors.hpp"
#include "task.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <sys/types.h>

namespace crusher {

    /// Pool-local worker number, unique for the lifetime of a pool.
    using WorkerId = unsigned;

    /**
     * @brief Events describing the life of workers and tasks.
     *
     * These lightweight structs are used with EventBus to notify subscribers
     * (e.g. the CLI progress output, tests) about what the pool does. They are
     * simple data carriers without behavior.
     */

    // --- Workers ---

    /**
     * @brief Emitted after a worker process has been started.
     */
    struct WorkerSpawnedEvent {
        WorkerId worker = 0; ///< Pool-local id
        pid_t pid = 0;       ///< Process id
    };

    /**
     * @brief Emitted when a worker has left the pool.
     */
    struct WorkerExitedEvent {
        WorkerId worker = 0;
        pid_t pid = 0;
        bool expected = true;       ///< False if the worker went away without being killed
        std::size_t dropped = 0;    ///< Callbacks dropped by a kill
    };

    /**
     * @brief Emitted when a reply could not be correlated; the worker is torn down.
     */
    struct WorkerFaultEvent {
        WorkerId worker = 0;
        TaskId task_id;     ///< Id carried by the offending reply, if it could be decoded
        std::string reason;
    };

    // --- Tasks ---

    /**
     * @brief Emitted when a task has been handed to a worker.
     */
    struct TaskDispatchedEvent {
        TaskId task_id;
        WorkerId worker = 0;
    };

    /**
     * @brief Emitted after the callback of a task has returned.
     */
    struct TaskCompletedEvent {
        TaskId task_id;
        WorkerId worker = 0;
        std::optional<TaskError> error;
    };

} // namespace crusher

#endif // CRUSHER_EVENTS_HPP
