#include "../../include/pipeline_executor.hpp"
#include "../../include/gzip_size.hpp"
#include "../../include/logger.hpp"
#include <chrono>

namespace crusher {

    namespace {

    std::chrono::milliseconds since(const std::chrono::steady_clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

    } // namespace

    std::optional<TaskError> PipelineExecutor::run(Task& task) const {
        const auto start = std::chrono::steady_clock::now();
        std::optional<TaskError> error;

        for (const auto& name : task.engines) {
            const ICrusher* crusher = nullptr;
            try {
                crusher = &registry_.resolve(name, task.extension);
            } catch (const CrushError& e) {
                error = TaskError{e.kind(), e.what()};
                break;
            }

            // resolve() succeeded, so the tag parses
            const ContentType type = *parse_content_type(task.extension);
            const auto step_start = std::chrono::steady_clock::now();
            try {
                std::string output = crusher->crush(type, task.content);
                task.individual[name] += since(step_start);
                task.content = std::move(output);
            } catch (const CrushError& e) {
                task.individual[name] += since(step_start);
                error = TaskError{e.kind(), e.what()};
            } catch (const std::exception& e) {
                task.individual[name] += since(step_start);
                error = TaskError{ErrorKind::TransformFailed, e.what()};
            }
            if (error) break;
        }

        task.duration = since(start);

        if (!error && task.gzip) {
            try {
                task.gzip_size = gzip_size(task.content);
            } catch (const CrushError& e) {
                error = TaskError{e.kind(), e.what()};
            }
        }

        if (error) {
            Logger::log(LogLevel::Debug,
                        "task " + task.id + " failed (" + std::string(error_kind_name(error->kind)) + "): " + error->message,
                        "pipeline");
        }
        return error;
    }

} // namespace crusher
