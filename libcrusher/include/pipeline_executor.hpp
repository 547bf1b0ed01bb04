/**
 * @file pipeline_executor.hpp
 * @brief Folds a task's content through its engines.
 */

#ifndef CRUSHER_PIPELINE_EXECUTOR_HPP
#define CRUSHER_PIPELINE_EXECUTOR_HPP

#include "crusher_registry.hpp"
#include "errors.hpp"
#include "task.hpp"
#include <optional>

namespace crusher {

    /**
     * @brief Runs the engines of a task left to right over its content.
     *
     * @details The fold stops at the first failure. Content is replaced only
     * by a successful step, so after a failure at step k the task holds the
     * output of step k-1 (or the original input). Every attempted engine gets
     * an entry in Task::individual, including the failing one; an engine name
     * that does not resolve is not attempted and gets none. Task::duration is
     * always set. The gzip size is measured only after a successful fold.
     *
     * Nothing is thrown: every failure becomes the returned TaskError.
     */
    class PipelineExecutor {
    public:
        explicit PipelineExecutor(const CrusherRegistry& registry) : registry_(registry) {}

        /**
         * @brief Execute the pipeline in place.
         * @param task Task to enrich; content, duration, individual and gzip_size are written.
         * @return The error that stopped the fold, or std::nullopt on success.
         */
        [[nodiscard]] std::optional<TaskError> run(Task& task) const;

    private:
        const CrusherRegistry& registry_;
    };

} // namespace crusher

#endif // CRUSHER_PIPELINE_EXECUTOR_HPP
