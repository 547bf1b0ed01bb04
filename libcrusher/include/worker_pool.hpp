/**
 * @file worker_pool.hpp
 * @brief Round-robin pool of worker processes with reply correlation.
 */

#ifndef CRUSHER_WORKER_POOL_HPP
#define CRUSHER_WORKER_POOL_HPP

#include "config.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "task.hpp"
#include "worker_handle.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace crusher {

    /**
     * @brief Outcome of matching a reply against the queue of its worker.
     */
    enum class Correlation {
        Delivered,    ///< The registered callback was invoked and removed
        Discarded,    ///< The worker had already been killed; nobody is waiting
        Unrecoverable ///< No callback under that id: the worker is torn down
    };

    /**
     * @brief Spreads tasks over worker processes and routes replies back.
     *
     * @details Workers sit in a rotation list. send() takes the worker at the
     * tail, registers the callback under the task id in that worker's queue,
     * hands the task over without waiting and puts the worker back at the head.
     * Assignment is strict rotation, independent of load.
     *
     * Replies are correlated on the reader thread of the answering worker; the
     * callback runs on that thread, outside the pool lock, exactly once. A reply
     * whose id is not pending is a protocol violation: the worker is removed and
     * its other pending tasks are answered with ErrorKind::WorkerLost. A worker
     * that exits on its own is handled the same way. Killing workers drops their
     * pending callbacks without calling them.
     *
     * All mutations of the rotation list and of the queues happen under one
     * mutex, so send(), kill() and reply handling are serialized.
     */
    class WorkerPool {
    public:
        explicit WorkerPool(PoolOptions options = {});

        /// Kills every worker.
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        /**
         * @brief Spawn the workers and mark the pool ready. Does nothing if it already is.
         * @param count Number of workers; defaults to PoolOptions::workers, then to the CPU count.
         * @throws std::invalid_argument for a count of zero.
         * @throws std::system_error if a worker cannot be started.
         */
        void initialize(std::optional<unsigned> count = std::nullopt);

        /// @return True between a successful initialize() and the removal of the last worker.
        [[nodiscard]] bool ready() const;

        /**
         * @brief Dispatch a task; never waits for the worker.
         *
         * Initializes the pool with the default count if it is not ready. An
         * empty task id is replaced by generate_task_id(); a caller-supplied id
         * is kept verbatim.
         *
         * @return The id the task was registered under.
         * @throws std::runtime_error if the pool has no workers.
         * @throws std::invalid_argument if the id is already pending on the chosen worker.
         */
        TaskId send(Task task, ReplyCallback callback);

        /// Kill every worker.
        void kill();

        /// Kill one worker; unknown ids are ignored.
        void kill(WorkerId worker);

        /// Kill the listed workers; unknown ids are ignored.
        void kill(std::span<const WorkerId> workers);

        /// @return Worker ids in rotation order, head first; the tail receives the next task.
        [[nodiscard]] std::vector<WorkerId> worker_ids() const;

        /// @return Number of tasks dispatched and not yet answered.
        [[nodiscard]] std::size_t pending() const;

        /// @return The bus the pool publishes its events on.
        [[nodiscard]] EventBus& events() noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace crusher

#endif // CRUSHER_WORKER_POOL_HPP
