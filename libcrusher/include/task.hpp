/**
 * @file task.hpp
 * @brief The unit of work and of reply correlation.
 */

#ifndef CRUSHER_TASK_HPP
#define CRUSHER_TASK_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crusher {

    /// Opaque correlation id. Unique among the tasks in flight on one worker.
    using TaskId = std::string;

    /**
     * @brief One piece of content plus the ordered engines to fold it through.
     *
     * The request half (id, engines, extension, content, gzip) is filled by the
     * caller. The worker fills duration, individual and gzip_size and replaces
     * content in place. The pool never touches id.
     */
    struct Task {
        TaskId id;                          ///< Correlation id, generated by the pool when empty
        std::vector<std::string> engines;   ///< Crusher names, applied left to right
        std::string extension;              ///< Content type tag ("js", "css")
        std::string content;                ///< Buffer replaced step by step
        bool gzip = false;                  ///< Request gzip sizing of the final content

        std::chrono::milliseconds duration{0};                       ///< Wall time of the whole pipeline
        std::map<std::string, std::chrono::milliseconds> individual; ///< Wall time per attempted engine
        std::optional<std::uint64_t> gzip_size;                      ///< Gzipped byte count, when requested and computed

        bool operator==(const Task&) const = default;
    };

    /**
     * @brief Split a delimited engine list ("jsmin, yui") into names.
     *
     * Commas separate names; surrounding whitespace is trimmed and empty
     * entries are dropped, so "a,b", "a, b" and "a ,  b," are equivalent.
     */
    std::vector<std::string> parse_engines(std::string_view list);

    /// @return The engines joined with ", ", the inverse of parse_engines().
    std::string join_engines(const std::vector<std::string>& engines);

    /**
     * @brief Build a request task.
     * @param engines Delimited engine list, see parse_engines().
     * @param extension Content type tag.
     * @param content Content to crush.
     * @param gzip Whether to measure the gzipped size of the result.
     * @param id Optional caller-supplied id; leave empty to have one generated.
     */
    Task make_task(std::string_view engines,
                   std::string extension,
                   std::string content,
                   bool gzip = false,
                   TaskId id = {});

    /**
     * @brief Generate a task id that is unique within this process.
     *
     * Combines the process id, a process-wide monotonic counter and a random
     * suffix, so two tasks dispatched in the same clock tick never collide.
     */
    TaskId generate_task_id();

} // namespace crusher

#endif // CRUSHER_TASK_HPP
