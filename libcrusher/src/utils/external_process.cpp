#include "../../include/external_process.hpp"
#include "../../include/errors.hpp"
#include "../../include/fd_utils.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace crusher {

    namespace {

    // Blocks SIGPIPE for the calling thread and discards one raised while blocked.
    class SigpipeBlock {
    public:
        SigpipeBlock() {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGPIPE);
            pthread_sigmask(SIG_BLOCK, &set, &old_);

            sigset_t pending;
            sigpending(&pending);
            already_pending_ = sigismember(&pending, SIGPIPE) == 1;
        }

        ~SigpipeBlock() {
            if (!already_pending_) {
                sigset_t pending;
                sigpending(&pending);
                if (sigismember(&pending, SIGPIPE) == 1) {
                    sigset_t set;
                    sigemptyset(&set);
                    sigaddset(&set, SIGPIPE);
                    const timespec zero{0, 0};
                    while (sigtimedwait(&set, nullptr, &zero) == -1 && errno == EINTR) {}
                }
            }
            pthread_sigmask(SIG_SETMASK, &old_, nullptr);
        }

        SigpipeBlock(const SigpipeBlock&) = delete;
        SigpipeBlock& operator=(const SigpipeBlock&) = delete;

    private:
        sigset_t old_{};
        bool already_pending_ = false;
    };

    // Kills and reaps the child if the parent leaves early.
    class ChildGuard {
    public:
        explicit ChildGuard(const pid_t pid) noexcept : pid_(pid) {}
        ~ChildGuard() {
            if (pid_ > 0) {
                ::kill(pid_, SIGKILL);
                while (::waitpid(pid_, nullptr, 0) == -1 && errno == EINTR) {}
            }
        }

        ChildGuard(const ChildGuard&) = delete;
        ChildGuard& operator=(const ChildGuard&) = delete;

        int wait() {
            int status = 0;
            while (::waitpid(pid_, &status, 0) == -1) {
                if (errno != EINTR) {
                    throw std::system_error(errno, std::generic_category(), "waitpid");
                }
            }
            pid_ = -1;
            return status;
        }

    private:
        pid_t pid_;
    };

    struct PipePair {
        UniqueFd read;
        UniqueFd write;
    };

    PipePair make_pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
        return {UniqueFd(fds[0]), UniqueFd(fds[1])};
    }

    void child_write(const char* text) noexcept {
        const auto len = std::strlen(text);
        [[maybe_unused]] const auto n = ::write(STDERR_FILENO, text, len);
    }

    // Reads what is available; returns false once the stream hit EOF.
    bool drain(const int fd, std::string& into) {
        std::array<char, 65536> buffer{};
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            into.append(buffer.data(), static_cast<std::size_t>(n));
            return true;
        }
        if (n == 0) return false;
        if (errno == EINTR || errno == EAGAIN) return true;
        throw std::system_error(errno, std::generic_category(), "read");
    }

    std::string option_to_string(const OptionValue& value) {
        if (const auto* s = std::get_if<std::string>(&value)) return *s;
        if (const auto* n = std::get_if<long long>(&value)) return std::to_string(*n);
        return std::get<bool>(value) ? "true" : "false";
    }

    } // namespace

    bool is_truthy(const OptionValue& value) noexcept {
        if (const auto* b = std::get_if<bool>(&value)) return *b;
        if (const auto* n = std::get_if<long long>(&value)) return *n != 0;
        return !std::get<std::string>(value).empty();
    }

    std::vector<std::string> build_arguments(std::vector<std::string> args,
                                             const ProcessOptions& options) {
        for (const auto& [key, value] : options) {
            if (!is_truthy(value)) continue;
            args.push_back("--" + key);
            if (!std::holds_alternative<bool>(value)) {
                args.push_back(option_to_string(value));
            }
        }
        return args;
    }

    ProcessResult run_process(const std::filesystem::path& executable,
                              const std::vector<std::string>& args,
                              const std::string_view input) {
        SigpipeBlock sigpipe;

        PipePair in = make_pipe();
        PipePair out = make_pipe();
        PipePair err = make_pipe();

        // argv is assembled before fork: the child may only call async-signal-safe functions
        const std::string exe = executable.string();
        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(exe.c_str()));
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid == -1) {
            throw std::system_error(errno, std::generic_category(), "fork");
        }

        if (pid == 0) {
            sigset_t none;
            sigemptyset(&none);
            pthread_sigmask(SIG_SETMASK, &none, nullptr);

            if (::dup2(in.read.get(), STDIN_FILENO) == -1 ||
                ::dup2(out.write.get(), STDOUT_FILENO) == -1 ||
                ::dup2(err.write.get(), STDERR_FILENO) == -1) {
                _exit(127);
            }
            ::execv(exe.c_str(), argv.data());
            child_write("crusher: cannot execute ");
            child_write(exe.c_str());
            child_write("\n");
            _exit(127);
        }

        ChildGuard child(pid);
        in.read.reset();
        out.write.reset();
        err.write.reset();

        if (::fcntl(in.write.get(), F_SETFL, ::fcntl(in.write.get(), F_GETFL) | O_NONBLOCK) == -1) {
            throw std::system_error(errno, std::generic_category(), "fcntl");
        }

        ProcessResult result;
        std::size_t written = 0;
        if (input.empty()) in.write.reset();

        while (out.read || err.read) {
            std::array<pollfd, 3> fds{};
            nfds_t count = 0;
            int in_slot = -1, out_slot = -1, err_slot = -1;
            if (in.write) {
                in_slot = static_cast<int>(count);
                fds[count++] = {in.write.get(), POLLOUT, 0};
            }
            if (out.read) {
                out_slot = static_cast<int>(count);
                fds[count++] = {out.read.get(), POLLIN, 0};
            }
            if (err.read) {
                err_slot = static_cast<int>(count);
                fds[count++] = {err.read.get(), POLLIN, 0};
            }

            if (::poll(fds.data(), count, -1) == -1) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "poll");
            }

            if (in_slot >= 0 && fds[in_slot].revents != 0) {
                const std::size_t chunk = std::min<std::size_t>(input.size() - written, 65536);
                const ssize_t n = ::write(in.write.get(), input.data() + written, chunk);
                if (n >= 0) {
                    written += static_cast<std::size_t>(n);
                    if (written == input.size()) in.write.reset();
                } else if (errno == EPIPE) {
                    // the child stopped reading; whatever it printed still counts
                    in.write.reset();
                } else if (errno != EAGAIN && errno != EINTR) {
                    throw std::system_error(errno, std::generic_category(), "write");
                }
            }
            if (out_slot >= 0 && fds[out_slot].revents != 0 && !drain(out.read.get(), result.out)) {
                out.read.reset();
            }
            if (err_slot >= 0 && fds[err_slot].revents != 0 && !drain(err.read.get(), result.err)) {
                err.read.reset();
            }
        }
        in.write.reset();

        const int status = child.wait();
        if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        return result;
    }

    std::string invoke_external(const std::filesystem::path& executable,
                                std::vector<std::string> args,
                                const ProcessOptions& options,
                                const std::string_view content) {
        args = build_arguments(std::move(args), options);

        std::string command = executable.string();
        for (const auto& a : args) command += " " + a;
        Logger::log(LogLevel::Debug, "Running " + command, "process");

        ProcessResult result = run_process(executable, args, content);

        if (!result.err.empty()) {
            throw CrushError(ErrorKind::ProcessDiagnostic, result.err);
        }
        if (result.term_signal != 0) {
            throw CrushError(ErrorKind::ProcessExitCode,
                             "Process terminated by signal " + std::to_string(result.term_signal));
        }
        if (result.exit_code != 0) {
            throw CrushError(ErrorKind::ProcessExitCode,
                             "Process exited with code " + std::to_string(result.exit_code));
        }
        if (result.out.empty()) {
            throw CrushError(ErrorKind::ProcessEmptyOutput, "No data returned " + command);
        }
        return std::move(result.out);
    }

} // namespace crusher
