/**
 * @file test_wire_codec.cpp
 * @brief Unit tests for the control <-> worker wire protocol
 *
 * Tests cover:
 * - Task and reply frames
 * - Malformed payloads
 * - Length-prefixed framing over a socket pair
 */

#include "../../libcrusher/include/channel.hpp"
#include "../../libcrusher/include/fd_utils.hpp"
#include "../../libcrusher/include/wire_codec.hpp"

#include <chrono>
#include <string>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

using namespace crusher;
using namespace std::chrono_literals;

// ============================================================================
// Frames
// ============================================================================

TEST(WireCodecTest, TaskFrameCarriesOnlyTheRequest) {
    Task task = make_task("jsmin, yui", "js", std::string("a\0b", 3), true, "t-1");
    task.duration = 42ms;
    task.individual["jsmin"] = 7ms;

    const std::string payload = encode_task(task);
    EXPECT_EQ(frame_type(payload), FrameType::Task);

    const Task decoded = decode_task(payload);
    EXPECT_EQ(decoded.id, "t-1");
    EXPECT_EQ(decoded.engines, task.engines);
    EXPECT_EQ(decoded.extension, "js");
    EXPECT_EQ(decoded.content, task.content);
    EXPECT_TRUE(decoded.gzip);
    EXPECT_EQ(decoded.duration.count(), 0);
    EXPECT_TRUE(decoded.individual.empty());
}

TEST(WireCodecTest, ReplyFrameCarriesErrorAndResults) {
    Reply reply;
    reply.error = TaskError{ErrorKind::ProcessDiagnostic, "[ERROR] in 1:1"};
    reply.task = make_task("jsmin, yui", "js", "var a=1;", true, "t-2");
    reply.task.duration = 15ms;
    reply.task.individual["jsmin"] = 3ms;
    reply.task.individual["yui"] = 11ms;
    reply.task.gzip_size = 28;

    const std::string payload = encode_reply(reply);
    EXPECT_EQ(frame_type(payload), FrameType::Reply);
    EXPECT_EQ(decode_reply(payload), reply);
}

TEST(WireCodecTest, ReplyWithoutErrorOrGzip) {
    Reply reply;
    reply.task = make_task("sqwish", "css", "a{}", false, "t-3");

    const Reply decoded = decode_reply(encode_reply(reply));
    EXPECT_FALSE(decoded.error.has_value());
    EXPECT_FALSE(decoded.task.gzip_size.has_value());
    EXPECT_EQ(decoded, reply);
}

TEST(WireCodecTest, RejectsBadHeader) {
    EXPECT_THROW((void)frame_type(""), ProtocolError);
    EXPECT_THROW((void)frame_type("\x01T"), ProtocolError);

    std::string payload = encode_task(make_task("jsmin", "js", "x"));
    payload[1] = 'Z';
    EXPECT_THROW((void)decode_task(payload), ProtocolError);
}

TEST(WireCodecTest, RejectsWrongFrameType) {
    const std::string task_payload = encode_task(make_task("jsmin", "js", "x"));
    EXPECT_THROW((void)decode_reply(task_payload), ProtocolError);

    Reply reply;
    reply.task = make_task("jsmin", "js", "x");
    EXPECT_THROW((void)decode_task(encode_reply(reply)), ProtocolError);
}

TEST(WireCodecTest, RejectsTruncatedAndTrailingBytes) {
    const std::string payload = encode_task(make_task("jsmin", "js", "var a = 1;", false, "id"));

    EXPECT_THROW((void)decode_task(payload.substr(0, payload.size() - 1)), ProtocolError);
    EXPECT_THROW((void)decode_task(payload + "x"), ProtocolError);
}

TEST(WireCodecTest, RejectsUnknownErrorKind) {
    Reply reply;
    reply.error = TaskError{ErrorKind::WorkerLost, "gone"};
    reply.task = make_task("jsmin", "js", "x");

    std::string payload = encode_reply(reply);
    // header (2) + error flag (1), then the kind byte
    payload[3] = static_cast<char>(0x7F);
    EXPECT_THROW((void)decode_reply(payload), ProtocolError);
}

// ============================================================================
// Framing
// ============================================================================

class FramingTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
        left_.reset(fds[0]);
        right_.reset(fds[1]);
    }

    UniqueFd left_;
    UniqueFd right_;
};

TEST_F(FramingTest, FramesArriveWhole) {
    const std::string big(256 * 1024, 'q');
    write_frame(left_.get(), "hello");
    write_frame(left_.get(), "");

    // too large for the socket buffer: the reader has to drain concurrently
    std::jthread writer([&] { write_frame(left_.get(), big); });

    EXPECT_EQ(read_frame(right_.get()), std::optional<std::string>("hello"));
    EXPECT_EQ(read_frame(right_.get()), std::optional<std::string>(""));
    EXPECT_EQ(read_frame(right_.get()), std::optional<std::string>(big));
}

TEST_F(FramingTest, EndOfStreamAtFrameBoundary) {
    write_frame(left_.get(), "last");
    left_.reset();

    EXPECT_EQ(read_frame(right_.get()), std::optional<std::string>("last"));
    EXPECT_EQ(read_frame(right_.get()), std::nullopt);
}

TEST_F(FramingTest, EndOfStreamInsideFrameIsAnError) {
    // header announces 10 bytes, only 3 follow
    const char partial[] = {10, 0, 0, 0, 'a', 'b', 'c'};
    ASSERT_EQ(::write(left_.get(), partial, sizeof(partial)), static_cast<ssize_t>(sizeof(partial)));
    left_.reset();

    EXPECT_THROW((void)read_frame(right_.get()), ProtocolError);
}

TEST_F(FramingTest, OversizedFrameIsAnError) {
    const char header[] = {'\xff', '\xff', '\xff', '\x7f'};
    ASSERT_EQ(::write(left_.get(), header, sizeof(header)), static_cast<ssize_t>(sizeof(header)));

    EXPECT_THROW((void)read_frame(right_.get()), ProtocolError);
}
