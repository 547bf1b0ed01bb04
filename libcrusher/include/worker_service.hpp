/**
 * @file worker_service.hpp
 * @brief Request loop run inside a worker process.
 */

#ifndef CRUSHER_WORKER_SERVICE_HPP
#define CRUSHER_WORKER_SERVICE_HPP

#include "pipeline_executor.hpp"

namespace crusher {

    /**
     * @brief Serves task frames arriving on one socket.
     *
     * Each task frame is decoded, run through the PipelineExecutor and answered
     * with a reply frame carrying the same id. Tasks are handled one at a time
     * in arrival order.
     */
    class WorkerService {
    public:
        WorkerService(int fd, const PipelineExecutor& executor, int index = 0)
            : fd_(fd), executor_(executor), index_(index) {}

        /**
         * @brief Serve until the peer closes the socket.
         *
         * Marks the socket close-on-exec first, so processes started by the
         * crushers never inherit it.
         * @return 0 on a clean end of stream, 1 on a protocol violation or socket failure.
         */
        int serve();

        /// Decode one task payload, execute it and return the encoded reply.
        [[nodiscard]] std::string handle(std::string_view payload) const;

    private:
        int fd_;
        const PipelineExecutor& executor_;
        int index_;
    };

} // namespace crusher

#endif // CRUSHER_WORKER_SERVICE_HPP
