/**
 * @file worker_handle.hpp
 * @brief One worker process, its channel and its queue of pending tasks.
 */

#ifndef CRUSHER_WORKER_HANDLE_HPP
#define CRUSHER_WORKER_HANDLE_HPP

#include "channel.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "task.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <sys/types.h>

namespace crusher {

    /// Receives the outcome of one task: its error, if any, and the task as returned.
    using ReplyCallback = std::function<void(const std::optional<TaskError>& error, Task task)>;

    /**
     * @brief A dispatched task waiting for its reply.
     */
    struct PendingTask {
        ReplyCallback callback;
        Task request; ///< As sent; returned with ErrorKind::WorkerLost if the worker dies
    };

    /**
     * @brief Owns a worker process and the socket connected to it.
     *
     * The handle itself is not synchronized: WorkerPool guards the queue and
     * every call except the channel handlers with its own mutex.
     */
    class WorkerHandle {
    public:
        /**
         * @brief Start a worker process.
         *
         * The child gets its end of a socket pair as fd 3 and is executed as
         * `<worker_executable> --channel-fd=3 --index=<id> --log-level=<level>`
         * followed by the forwarded CrusherConfig flags.
         *
         * @throws std::system_error if the socket pair or the process cannot be created.
         */
        static std::unique_ptr<WorkerHandle> spawn(WorkerId id,
                                                   const PoolOptions& options,
                                                   Channel::FrameHandler on_frame,
                                                   Channel::CloseHandler on_close);

        ~WorkerHandle();

        WorkerHandle(const WorkerHandle&) = delete;
        WorkerHandle& operator=(const WorkerHandle&) = delete;

        [[nodiscard]] WorkerId id() const noexcept { return id_; }
        [[nodiscard]] pid_t pid() const noexcept { return pid_; }

        /// Queue an encoded task frame; never blocks.
        void post(std::string payload) { channel_->post(std::move(payload)); }

        /// Hang up the channel without waiting; safe from the reader thread.
        void hang_up() noexcept { channel_->close(); }

        /// @return True when called from this worker's reply reader.
        [[nodiscard]] bool on_reader_thread() const noexcept { return channel_->is_reader_thread(); }

        /**
         * @brief Stop the worker and reap it.
         *
         * Hangs up the channel so the worker exits on end of stream, then
         * escalates to SIGTERM and SIGKILL if it is still running after grace.
         * Must not be called from the reader thread.
         */
        void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

        /// Tasks sent to this worker and not answered yet, by id.
        std::map<TaskId, PendingTask> queue;

    private:
        WorkerHandle(WorkerId id, pid_t pid) : id_(id), pid_(pid) {}

        bool wait_exit(std::chrono::milliseconds timeout);

        WorkerId id_;
        pid_t pid_;
        bool reaped_ = false;
        std::unique_ptr<Channel> channel_;
    };

} // namespace crusher

#endif // CRUSHER_WORKER_HANDLE_HPP
