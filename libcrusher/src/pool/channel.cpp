#include "../../include/channel.hpp"
#include "../../include/logger.hpp"
#include "../../include/wire_codec.hpp"
#include <array>
#include <cerrno>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace crusher {

    namespace {

    void write_all(const int fd, const char* data, std::size_t size) {
        while (size > 0) {
            const ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "send");
            }
            data += n;
            size -= static_cast<std::size_t>(n);
        }
    }

    // false if the stream ended before the first byte
    bool read_all(const int fd, char* data, std::size_t size) {
        std::size_t got = 0;
        while (got < size) {
            const ssize_t n = ::read(fd, data + got, size - got);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::system_error(errno, std::generic_category(), "read");
            }
            if (n == 0) {
                if (got == 0) return false;
                throw ProtocolError("stream ended inside a frame");
            }
            got += static_cast<std::size_t>(n);
        }
        return true;
    }

    } // namespace

    void write_frame(const int fd, const std::string_view payload) {
        const auto len = static_cast<std::uint32_t>(payload.size());
        const std::array<char, 4> header = {
            static_cast<char>(len & 0xFF),
            static_cast<char>((len >> 8) & 0xFF),
            static_cast<char>((len >> 16) & 0xFF),
            static_cast<char>((len >> 24) & 0xFF),
        };
        write_all(fd, header.data(), header.size());
        write_all(fd, payload.data(), payload.size());
    }

    std::optional<std::string> read_frame(const int fd) {
        std::array<char, 4> header{};
        if (!read_all(fd, header.data(), header.size())) {
            return std::nullopt;
        }
        std::uint32_t len = 0;
        for (int i = 0; i < 4; ++i) {
            len |= static_cast<std::uint32_t>(static_cast<unsigned char>(header[i])) << (8 * i);
        }
        if (len > kMaxFrameSize) {
            throw ProtocolError("frame of " + std::to_string(len) + " bytes exceeds the limit");
        }
        std::string payload(len, '\0');
        if (len > 0 && !read_all(fd, payload.data(), len)) {
            throw ProtocolError("stream ended inside a frame");
        }
        return payload;
    }

    Channel::Channel(UniqueFd fd, FrameHandler on_frame, CloseHandler on_close)
        : fd_(std::move(fd)),
          on_frame_(std::move(on_frame)),
          on_close_(std::move(on_close)) {
        writer_ = std::jthread([this](const std::stop_token& st) { writer_loop(st); });
        reader_ = std::jthread([this] { reader_loop(); });
    }

    Channel::~Channel() {
        close();
        join();
    }

    void Channel::post(std::string payload) {
        {
            std::lock_guard lock(mtx_);
            outbox_.push_back(std::move(payload));
        }
        cv_.notify_one();
    }

    void Channel::close() noexcept {
        if (fd_) {
            ::shutdown(fd_.get(), SHUT_RDWR);
        }
        writer_.request_stop();
    }

    bool Channel::is_reader_thread() const noexcept {
        return reader_.get_id() == std::this_thread::get_id();
    }

    void Channel::join() {
        writer_.request_stop();
        if (writer_.joinable()) writer_.join();
        if (reader_.joinable()) reader_.join();
    }

    void Channel::writer_loop(const std::stop_token& st) {
        for (;;) {
            std::string payload;
            {
                std::unique_lock lock(mtx_);
                if (!cv_.wait(lock, st, [this] { return !outbox_.empty(); })) {
                    return;
                }
                payload = std::move(outbox_.front());
                outbox_.pop_front();
            }
            try {
                write_frame(fd_.get(), payload);
            } catch (const std::system_error& e) {
                // the reader sees the shutdown and reports the channel closed
                Logger::log(LogLevel::Debug, std::string("channel write failed: ") + e.what(), "channel");
                ::shutdown(fd_.get(), SHUT_RDWR);
                return;
            }
        }
    }

    void Channel::reader_loop() {
        std::string reason;
        try {
            while (auto payload = read_frame(fd_.get())) {
                on_frame_(std::move(*payload));
            }
        } catch (const std::exception& e) {
            reason = e.what();
        }
        on_close_(reason);
    }

} // namespace crusher
