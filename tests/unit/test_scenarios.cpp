/**
 * @file test_scenarios.cpp
 * @brief End-to-end scenarios through the pool and the real worker executable
 */

#include "../../libcrusher/include/worker_pool.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>

#include <gtest/gtest.h>

using namespace crusher;
using namespace crusher::test;
using namespace std::chrono_literals;

class ScenarioTest : public ::testing::Test {
protected:
    static PoolOptions single_worker() {
        PoolOptions options;
        options.worker_executable = CRUSHER_WORKER_PATH;
        options.workers = 1;
        options.worker_log_level = LogLevel::Error;
        options.crusher.disable_java = true;
        options.crusher.closure_url = "http://127.0.0.1:1/compile";
        options.crusher.remote_timeout = 2000ms;
        return options;
    }

    // sends one task and waits for its reply
    ReplyCollector::Entry round_trip(Task task) {
        const TaskId id = pool_.send(std::move(task), replies_.callback());
        EXPECT_TRUE(replies_.wait_for(1));
        return replies_.find(id).value_or(ReplyCollector::Entry{});
    }

    // outlives the pool, whose threads run the callbacks
    ReplyCollector replies_;
    WorkerPool pool_{single_worker()};
};

// A: a successful single-step pipeline
TEST_F(ScenarioTest, JsminShrinksAFunction) {
    const std::string input = "function f(){ return 1; }";

    const auto reply = round_trip(make_task("jsmin", "js", input));

    EXPECT_FALSE(reply.error.has_value());
    EXPECT_LT(reply.task.content.size(), input.size());
    ASSERT_TRUE(reply.task.individual.contains("jsmin"));
    EXPECT_GE(reply.task.individual.at("jsmin").count(), 0);
    EXPECT_GE(reply.task.duration, reply.task.individual.at("jsmin"));
}

// B: an unknown engine
TEST_F(ScenarioTest, UnknownEngineLeavesContentUnchanged) {
    const auto reply = round_trip(make_task("nonexistent", "js", "x"));

    ASSERT_TRUE(reply.error.has_value());
    EXPECT_EQ(reply.error->kind, ErrorKind::UnknownTransform);
    EXPECT_NE(reply.error->message.find("nonexistent"), std::string::npos);
    EXPECT_EQ(reply.task.content, "x");
}

// C: gzip sizing of a successful pipeline
TEST_F(ScenarioTest, GzipSizeIsPositiveAndNotLargerThanContent) {
    std::string input;
    for (int i = 0; i < 40; ++i) {
        input += "function handler" + std::to_string(i) + "(event) {\n    return event.target.value;\n}\n";
    }

    const auto reply = round_trip(make_task("jsmin", "js", input, true));

    EXPECT_FALSE(reply.error.has_value());
    ASSERT_TRUE(reply.task.gzip_size.has_value());
    EXPECT_GT(*reply.task.gzip_size, 0u);
    EXPECT_LE(*reply.task.gzip_size, reply.task.content.size());
}

TEST_F(ScenarioTest, TypeMismatchCrossesTheProcessBoundary) {
    const std::string css = "a { color: red; }";

    const auto reply = round_trip(make_task("jsmin", "css", css));

    ASSERT_TRUE(reply.error.has_value());
    EXPECT_EQ(reply.error->kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(reply.task.content, css);
}

TEST_F(ScenarioTest, FailedStepRollsBackToPreviousOutput) {
    const auto reply = round_trip(make_task("jsmin, closure", "js", "var a = 1;"));

    ASSERT_TRUE(reply.error.has_value());
    EXPECT_EQ(reply.error->kind, ErrorKind::RemoteServiceFailed);
    EXPECT_EQ(reply.task.content, "var a=1;");
    EXPECT_EQ(reply.task.individual.size(), 2u);
}

TEST_F(ScenarioTest, CssPipeline) {
    const auto reply = round_trip(make_task("sqwish, yui", "css", "a {\n  color : #ffffff ;\n}\n"));

    EXPECT_FALSE(reply.error.has_value());
    EXPECT_EQ(reply.task.content, "a{color:#fff}");
    EXPECT_EQ(reply.task.extension, "css");
}

// a tool started by a worker must not hold the pool channel open
TEST(WorkerChannelTest, ExternalToolsDoNotInheritTheChannel) {
    TempDir dir;
    PoolOptions options;
    options.worker_executable = CRUSHER_WORKER_PATH;
    options.workers = 1;
    options.worker_log_level = LogLevel::Error;
    options.crusher.java_path = dir.script("java",
        "if [ -e /dev/fd/3 ]; then echo 'inherited fd 3' >&2; fi; cat");
    options.crusher.vendor_dir = dir.path();

    ReplyCollector replies;
    WorkerPool pool(options);
    const TaskId id = pool.send(make_task("yui", "js", "var a = 1;"), replies.callback());
    ASSERT_TRUE(replies.wait_for(1));

    const auto reply = replies.find(id);
    ASSERT_TRUE(reply.has_value());
    EXPECT_FALSE(reply->error.has_value()) << reply->error->message;
    EXPECT_EQ(reply->task.content, "var a = 1;");
}
