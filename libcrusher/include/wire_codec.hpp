/**
 * @file wire_codec.hpp
 * @brief Binary encoding of the messages exchanged with worker processes.
 *
 * A frame on the socket is a 4-byte little-endian payload length followed by
 * the payload. Every payload starts with kWireMagic and a FrameType byte.
 * Integers are little-endian, strings are a u32 length plus bytes, lists
 * and maps are a u32 count plus their elements.
 */

#ifndef CRUSHER_WIRE_CODEC_HPP
#define CRUSHER_WIRE_CODEC_HPP

#include "errors.hpp"
#include "task.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace crusher {

    constexpr std::uint8_t kWireMagic = 0xC7;

    /// Upper bound on a payload; anything larger is a protocol violation.
    constexpr std::uint32_t kMaxFrameSize = 1u << 30;

    enum class FrameType : std::uint8_t {
        Task = 'T',  ///< control -> worker: the request half of a Task
        Reply = 'R'  ///< worker -> control: optional error plus the enriched Task
    };

    /**
     * @brief Raised for payloads that cannot be decoded.
     */
    class ProtocolError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief What a worker sends back for one task.
     */
    struct Reply {
        std::optional<TaskError> error;
        Task task;

        bool operator==(const Reply&) const = default;
    };

    /// Encode the request fields (id, engines, extension, content, gzip).
    std::string encode_task(const Task& task);

    /// @throws ProtocolError if payload is not a well-formed task frame.
    Task decode_task(std::string_view payload);

    /// Encode the error and every field of the task, results included.
    std::string encode_reply(const Reply& reply);

    /// @throws ProtocolError if payload is not a well-formed reply frame.
    Reply decode_reply(std::string_view payload);

    /// @throws ProtocolError if the header is missing, has the wrong magic or an unknown type.
    FrameType frame_type(std::string_view payload);

} // namespace crusher

#endif // CRUSHER_WIRE_CODEC_HPP
