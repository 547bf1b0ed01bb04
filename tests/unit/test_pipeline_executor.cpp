/**
 * @file test_pipeline_executor.cpp
 * @brief Unit tests for the pipeline fold
 *
 * Tests cover:
 * - Successful multi-step pipelines
 * - Rollback to the last successful step on failure
 * - Per-step and total timing
 * - Type gating and unknown engines
 * - Gzip sizing
 */

#include "../../libcrusher/include/capabilities.hpp"
#include "../../libcrusher/include/crusher_registry.hpp"
#include "../../libcrusher/include/gzip_size.hpp"
#include "../../libcrusher/include/pipeline_executor.hpp"
#include "test_support.hpp"

#include <chrono>
#include <string>

#include <gtest/gtest.h>

using namespace crusher;
using namespace crusher::test;
using namespace std::chrono_literals;

namespace {

constexpr const char* kScript = "function f(){ return 1; }";

CrusherConfig offline_config() {
    CrusherConfig config;
    config.closure_url = "http://127.0.0.1:1/compile";
    config.remote_timeout = 2000ms;
    return config;
}

std::chrono::milliseconds sum_individual(const Task& task) {
    std::chrono::milliseconds total{0};
    for (const auto& [name, ms] : task.individual) total += ms;
    return total;
}

} // namespace

class PipelineExecutorTest : public ::testing::Test {
protected:
    static Capabilities failing_java() {
        // java that always fails without writing to stderr
        Capabilities caps;
        caps.java = std::filesystem::path("/bin/false");
        return caps;
    }

    Capabilities caps_{};
    Capabilities failing_caps_ = failing_java();
    CrusherConfig config_ = offline_config();
    CrusherRegistry registry_{caps_, config_};
    CrusherRegistry failing_registry_{failing_caps_, config_};
    PipelineExecutor executor_{registry_};
    PipelineExecutor failing_executor_{failing_registry_};
};

// ============================================================================
// Success
// ============================================================================

TEST_F(PipelineExecutorTest, SingleStep) {
    Task task = make_task("jsmin", "js", kScript);

    const auto error = executor_.run(task);

    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(task.content, "function f(){return 1;}");
    ASSERT_EQ(task.individual.size(), 1u);
    EXPECT_GE(task.individual.at("jsmin").count(), 0);
    EXPECT_GE(task.duration, task.individual.at("jsmin"));
}

TEST_F(PipelineExecutorTest, StepsApplyLeftToRight) {
    Task task = make_task("sqwish, yui", "css", "a { color : #aabbcc ; }");

    const auto error = executor_.run(task);

    EXPECT_FALSE(error.has_value());
    // yui passes through without java
    EXPECT_EQ(task.content, "a{color:#abc}");
    EXPECT_EQ(task.individual.size(), 2u);
    EXPECT_GE(task.duration, sum_individual(task));
}

TEST_F(PipelineExecutorTest, EmptyPipelineLeavesContentAlone) {
    Task task = make_task("", "js", kScript);

    EXPECT_FALSE(executor_.run(task).has_value());
    EXPECT_EQ(task.content, kScript);
    EXPECT_TRUE(task.individual.empty());
}

TEST_F(PipelineExecutorTest, RepeatedEngineAccumulatesTime) {
    Task task = make_task("jsmin, jsmin", "js", kScript);

    EXPECT_FALSE(executor_.run(task).has_value());
    EXPECT_EQ(task.content, "function f(){return 1;}");
    EXPECT_EQ(task.individual.size(), 1u);
}

TEST_F(PipelineExecutorTest, IdIsNeverTouched) {
    Task task = make_task("jsmin", "js", kScript, false, "caller-id");
    (void)executor_.run(task);
    EXPECT_EQ(task.id, "caller-id");
}

// ============================================================================
// Rollback
// ============================================================================

TEST_F(PipelineExecutorTest, FailureOnFirstStepKeepsOriginal) {
    Task task = make_task("yui, jsmin", "js", kScript);

    const auto error = failing_executor_.run(task);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ProcessExitCode);
    EXPECT_EQ(task.content, kScript);
    // the fold stops at the failing step
    EXPECT_EQ(task.individual.count("yui"), 1u);
    EXPECT_EQ(task.individual.count("jsmin"), 0u);
}

TEST_F(PipelineExecutorTest, FailureKeepsPreviousStepOutput) {
    Task task = make_task("jsmin, yui, jscrush", "js", kScript);

    const auto error = failing_executor_.run(task);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::ProcessExitCode);
    EXPECT_EQ(error->message, "Process exited with code 1");
    EXPECT_EQ(task.content, "function f(){return 1;}");
    EXPECT_EQ(task.individual.size(), 2u);
    EXPECT_EQ(task.individual.count("jscrush"), 0u);
    EXPECT_GE(task.duration, sum_individual(task));
}

TEST_F(PipelineExecutorTest, UnknownEngineStopsWithoutTiming) {
    Task task = make_task("jsmin, nonexistent", "js", kScript);

    const auto error = executor_.run(task);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::UnknownTransform);
    EXPECT_EQ(error->message, "The engine nonexistent does not exist");
    EXPECT_EQ(task.content, "function f(){return 1;}");
    EXPECT_EQ(task.individual.size(), 1u);
    EXPECT_EQ(task.individual.count("nonexistent"), 0u);
}

TEST_F(PipelineExecutorTest, TypeMismatchNeverMutatesContent) {
    const std::string css = "a { color: red; }";
    Task task = make_task("jsmin", "css", css);

    const auto error = executor_.run(task);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(task.content, css);
    EXPECT_EQ(task.individual.count("jsmin"), 1u);
}

TEST_F(PipelineExecutorTest, TransformErrorIsReported) {
    Task task = make_task("jsmin", "js", "var s = 'open");

    const auto error = executor_.run(task);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::TransformFailed);
    EXPECT_EQ(task.content, "var s = 'open");
}

TEST_F(PipelineExecutorTest, RemoteFailureIsReported) {
    Task task = make_task("jsmin, closure", "js", kScript);

    const auto error = executor_.run(task);

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::RemoteServiceFailed);
    EXPECT_EQ(task.content, "function f(){return 1;}");
    EXPECT_EQ(task.individual.size(), 2u);
}

// ============================================================================
// Gzip
// ============================================================================

TEST_F(PipelineExecutorTest, GzipSizeOfFinalContent) {
    std::string js;
    for (int i = 0; i < 50; ++i) js += "function f" + std::to_string(i) + "() { return " + std::to_string(i) + "; }\n";
    Task task = make_task("jsmin", "js", js, true);

    EXPECT_FALSE(executor_.run(task).has_value());
    ASSERT_TRUE(task.gzip_size.has_value());
    EXPECT_GT(*task.gzip_size, 0u);
    EXPECT_LE(*task.gzip_size, task.content.size());
    EXPECT_EQ(*task.gzip_size, gzip_size(task.content));
}

TEST_F(PipelineExecutorTest, NoGzipUnlessRequested) {
    Task task = make_task("jsmin", "js", kScript, false);
    EXPECT_FALSE(executor_.run(task).has_value());
    EXPECT_FALSE(task.gzip_size.has_value());
}

TEST_F(PipelineExecutorTest, NoGzipAfterFailure) {
    Task task = make_task("nonexistent", "js", kScript, true);
    EXPECT_TRUE(executor_.run(task).has_value());
    EXPECT_FALSE(task.gzip_size.has_value());
}
