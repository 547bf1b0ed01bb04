#include "../../include/worker_handle.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace crusher {

    namespace {

    constexpr int kChildChannelFd = 3;

    void child_fail(const char* what) noexcept {
        const char prefix[] = "crusher worker spawn failed: ";
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        n = ::write(STDERR_FILENO, what, std::strlen(what));
        n = ::write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    } // namespace

    std::unique_ptr<WorkerHandle> WorkerHandle::spawn(const WorkerId id,
                                                      const PoolOptions& options,
                                                      Channel::FrameHandler on_frame,
                                                      Channel::CloseHandler on_close) {
        int sv[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == -1) {
            throw std::system_error(errno, std::generic_category(), "socketpair");
        }
        UniqueFd parent_end(sv[0]);
        UniqueFd child_end(sv[1]);

        const std::filesystem::path exe = options.worker_executable.empty()
            ? default_worker_executable()
            : options.worker_executable;

        // everything the child needs is prepared before fork
        std::vector<std::string> args = {
            exe.string(),
            "--channel-fd=" + std::to_string(kChildChannelFd),
            "--index=" + std::to_string(id),
            "--log-level=" + std::string(Logger::level_to_string(options.worker_log_level)),
        };
        for (auto& a : options.crusher.to_arguments()) args.push_back(std::move(a));
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid == -1) {
            throw std::system_error(errno, std::generic_category(), "fork");
        }

        if (pid == 0) {
            if (child_end.get() == kChildChannelFd) {
                // dup2 onto itself keeps FD_CLOEXEC set
                if (::fcntl(kChildChannelFd, F_SETFD, 0) == -1) child_fail("fcntl");
            } else if (::dup2(child_end.get(), kChildChannelFd) == -1) {
                child_fail("dup2");
            }
            ::execv(argv[0], argv.data());
            child_fail(argv[0]);
        }

        child_end.reset();

        std::unique_ptr<WorkerHandle> handle(new WorkerHandle(id, pid));
        handle->channel_ = std::make_unique<Channel>(std::move(parent_end), std::move(on_frame), std::move(on_close));

        Logger::log(LogLevel::Debug,
                    "spawned worker " + std::to_string(id) + " (pid " + std::to_string(pid) + ")", "pool");
        return handle;
    }

    WorkerHandle::~WorkerHandle() {
        if (!reaped_ && !on_reader_thread()) {
            terminate(std::chrono::milliseconds(200));
        }
    }

    bool WorkerHandle::wait_exit(const std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            const pid_t r = ::waitpid(pid_, nullptr, WNOHANG);
            if (r == pid_ || (r == -1 && errno == ECHILD)) {
                reaped_ = true;
                return true;
            }
            if (r == -1 && errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "waitpid");
            }
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void WorkerHandle::terminate(const std::chrono::milliseconds grace) {
        channel_->close();

        if (!reaped_ && !wait_exit(grace)) {
            Logger::log(LogLevel::Warning,
                        "worker " + std::to_string(id_) + " did not exit, sending SIGTERM", "pool");
            ::kill(pid_, SIGTERM);
            if (!wait_exit(std::chrono::milliseconds(200))) {
                ::kill(pid_, SIGKILL);
                wait_exit(std::chrono::hours(1));
            }
        }

        channel_->join();
    }

} // namespace crusher
