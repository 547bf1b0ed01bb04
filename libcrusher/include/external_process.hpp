/**
 * @file external_process.hpp
 * @brief Adapter that runs an external executable as a content transform.
 *
 * The content is written to the child's stdin while stdout and stderr are
 * drained concurrently; the exit status and the two buffers are then
 * classified into a result or a CrushError.
 */

#ifndef CRUSHER_EXTERNAL_PROCESS_HPP
#define CRUSHER_EXTERNAL_PROCESS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace crusher {

    /// Value of a `--key value` option; bools are flags.
    using OptionValue = std::variant<bool, long long, std::string>;

    /// Ordered option list; order is preserved on the command line.
    using ProcessOptions = std::vector<std::pair<std::string, OptionValue>>;

    /**
     * @brief Whether an option contributes to the command line.
     *
     * false, 0 and the empty string are dropped; everything else is kept.
     */
    [[nodiscard]] bool is_truthy(const OptionValue& value) noexcept;

    /**
     * @brief Append the truthy options to an argument vector.
     *
     * A true bool contributes `--key` alone; any other kept value contributes
     * `--key` followed by its string form as a separate argument.
     */
    std::vector<std::string> build_arguments(std::vector<std::string> args,
                                             const ProcessOptions& options);

    /**
     * @brief Raw outcome of a finished child process.
     */
    struct ProcessResult {
        int exit_code = 0;      ///< Exit status, valid when term_signal is 0
        int term_signal = 0;    ///< Signal that killed the child, or 0
        std::string out;        ///< Everything written to stdout
        std::string err;        ///< Everything written to stderr
    };

    /**
     * @brief Spawn executable with args, feed input to stdin, collect both outputs.
     *
     * SIGPIPE is blocked for the calling thread while the child runs, so a
     * child that exits without reading its input does not kill the caller.
     *
     * @throws std::system_error if the pipes or the process cannot be created.
     */
    ProcessResult run_process(const std::filesystem::path& executable,
                              const std::vector<std::string>& args,
                              std::string_view input);

    /**
     * @brief Run an external transform and classify its outcome.
     *
     * Failure order: any stderr output (ProcessDiagnostic, with the stderr
     * text as message) wins over a non-zero exit (ProcessExitCode), which wins
     * over an empty stdout (ProcessEmptyOutput).
     *
     * @return The child's stdout.
     * @throws CrushError for the classified failures above.
     * @throws std::system_error if the process cannot be spawned.
     */
    std::string invoke_external(const std::filesystem::path& executable,
                                std::vector<std::string> args,
                                const ProcessOptions& options,
                                std::string_view content);

} // namespace crusher

#endif // CRUSHER_EXTERNAL_PROCESS_HPP
