/**
 * @file channel.hpp
 * @brief Length-prefixed framing over a stream socket.
 */

#ifndef CRUSHER_CHANNEL_HPP
#define CRUSHER_CHANNEL_HPP

#include "fd_utils.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace crusher {

    /**
     * @brief Write one frame (length prefix plus payload), blocking until sent.
     * @throws std::system_error if the socket fails.
     */
    void write_frame(int fd, std::string_view payload);

    /**
     * @brief Read one frame, blocking.
     * @return The payload, or std::nullopt on end of stream before a new frame.
     * @throws ProtocolError for a stream that ends inside a frame or an oversized length.
     * @throws std::system_error if the socket fails.
     */
    std::optional<std::string> read_frame(int fd);

    /**
     * @brief Asynchronous, full-duplex frame channel owning one socket.
     *
     * A writer thread drains an outbox so post() never blocks; a reader thread
     * hands each received payload to the frame handler and calls the close
     * handler exactly once when the stream ends. Both handlers run on the
     * reader thread.
     */
    class Channel {
    public:
        using FrameHandler = std::function<void(std::string payload)>;
        /// Receives an empty string on a clean end of stream, otherwise the failure.
        using CloseHandler = std::function<void(const std::string& reason)>;

        Channel(UniqueFd fd, FrameHandler on_frame, CloseHandler on_close);

        /// Closes the socket and joins both threads.
        ~Channel();

        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;

        /// Queue a payload for sending; frames are sent in post() order.
        void post(std::string payload);

        /// Shut the socket down in both directions; pending frames are dropped.
        void close() noexcept;

        /// @return True when called from this channel's reader thread.
        [[nodiscard]] bool is_reader_thread() const noexcept;

        /// Wait for both threads; requires close() or a peer that hung up.
        void join();

    private:
        void reader_loop();
        void writer_loop(const std::stop_token& st);

        UniqueFd fd_;
        FrameHandler on_frame_;
        CloseHandler on_close_;

        std::mutex mtx_;
        std::condition_variable_any cv_;
        std::deque<std::string> outbox_;

        std::jthread writer_;
        std::jthread reader_;
    };

} // namespace crusher

#endif // CRUSHER_CHANNEL_HPP
