#include "../../include/worker_service.hpp"
#include "../../include/channel.hpp"
#include "../../include/logger.hpp"
#include "../../include/wire_codec.hpp"
#include <cerrno>
#include <fcntl.h>
#include <system_error>

namespace crusher {

    std::string WorkerService::handle(const std::string_view payload) const {
        Reply reply;
        reply.task = decode_task(payload);
        reply.error = executor_.run(reply.task);
        return encode_reply(reply);
    }

    int WorkerService::serve() {
        const std::string tag = "worker " + std::to_string(index_);
        Logger::log(LogLevel::Debug, "serving", tag);
        // the channel came through dup2 without close-on-exec; external tools must not hold it open
        if (::fcntl(fd_, F_SETFD, FD_CLOEXEC) == -1) {
            const std::error_code ec(errno, std::generic_category());
            Logger::log(LogLevel::Error, "cannot mark channel close-on-exec: " + ec.message(), tag);
            return 1;
        }
        try {
            while (auto payload = read_frame(fd_)) {
                write_frame(fd_, handle(*payload));
            }
        } catch (const ProtocolError& e) {
            Logger::log(LogLevel::Error, std::string("protocol violation: ") + e.what(), tag);
            return 1;
        } catch (const std::system_error& e) {
            Logger::log(LogLevel::Error, std::string("channel failure: ") + e.what(), tag);
            return 1;
        }
        Logger::log(LogLevel::Debug, "channel closed, exiting", tag);
        return 0;
    }

} // namespace crusher
