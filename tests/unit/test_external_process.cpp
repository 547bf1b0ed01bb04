/**
 * @file test_external_process.cpp
 * @brief Unit tests for the external process adapter
 *
 * Tests cover:
 * - Option truthiness and argument assembly
 * - Raw process execution (streams, exit status, signals)
 * - Failure classification order of invoke_external
 */

#include "../../libcrusher/include/errors.hpp"
#include "../../libcrusher/include/external_process.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace crusher;

namespace {

const std::filesystem::path kShell = "/bin/sh";

// runs invoke_external and returns the error it raised
CrushError invoke_failure(const std::string& script, const std::string& input = "input") {
    try {
        (void)invoke_external(kShell, {"-c", script}, {}, input);
    } catch (const CrushError& e) {
        return e;
    }
    ADD_FAILURE() << "no CrushError for: " << script;
    return CrushError(ErrorKind::TransformFailed, "");
}

} // namespace

// ============================================================================
// Argument assembly
// ============================================================================

TEST(BuildArgumentsTest, FalsyOptionsAreDropped) {
    EXPECT_FALSE(is_truthy(OptionValue{false}));
    EXPECT_FALSE(is_truthy(OptionValue{0LL}));
    EXPECT_FALSE(is_truthy(OptionValue{std::string()}));

    EXPECT_TRUE(is_truthy(OptionValue{true}));
    EXPECT_TRUE(is_truthy(OptionValue{-1LL}));
    EXPECT_TRUE(is_truthy(OptionValue{std::string("0")}));
}

TEST(BuildArgumentsTest, AppendsFlagsInOrder) {
    const ProcessOptions options = {
        {"type", std::string("js")},
        {"line-break", 256LL},
        {"verbose", false},
        {"nomunge", true},
        {"charset", std::string()},
    };

    const auto args = build_arguments({"-jar", "vendor/yui.jar"}, options);
    EXPECT_EQ(args, (std::vector<std::string>{
        "-jar", "vendor/yui.jar", "--type", "js", "--line-break", "256", "--nomunge"}));
}

TEST(BuildArgumentsTest, NoOptionsKeepsBaseArguments) {
    EXPECT_EQ(build_arguments({"-a"}, {}), (std::vector<std::string>{"-a"}));
}

// ============================================================================
// run_process
// ============================================================================

TEST(RunProcessTest, CapturesBothStreams) {
    const auto result = run_process(kShell, {"-c", "cat; echo warn >&2"}, "payload");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.term_signal, 0);
    EXPECT_EQ(result.out, "payload");
    EXPECT_EQ(result.err, "warn\n");
}

TEST(RunProcessTest, LargeInputDoesNotDeadlock) {
    // larger than any pipe buffer in both directions
    const std::string big(4 * 1024 * 1024, 'z');
    const auto result = run_process("/bin/cat", {}, big);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out.size(), big.size());
    EXPECT_EQ(result.out, big);
}

TEST(RunProcessTest, ChildIgnoringStdinIsNotAnError) {
    const std::string big(1024 * 1024, 'z');
    const auto result = run_process(kShell, {"-c", "echo done"}, big);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, "done\n");
}

TEST(RunProcessTest, ReportsExitCodeAndSignal) {
    EXPECT_EQ(run_process(kShell, {"-c", "exit 7"}, "").exit_code, 7);

    const auto killed = run_process(kShell, {"-c", "kill -9 $$"}, "");
    EXPECT_EQ(killed.term_signal, 9);
}

TEST(RunProcessTest, MissingExecutableExitsWith127) {
    const auto result = run_process("/nonexistent/crusher-tool", {}, "x");
    EXPECT_EQ(result.exit_code, 127);
}

// ============================================================================
// invoke_external
// ============================================================================

TEST(InvokeExternalTest, SuccessReturnsStdout) {
    EXPECT_EQ(invoke_external("/bin/cat", {}, {}, "var a = 1;"), "var a = 1;");
}

TEST(InvokeExternalTest, OptionsReachTheCommandLine) {
    const ProcessOptions options = {{"type", std::string("css")}, {"verbose", false}, {"flag", true}};
    const auto out = invoke_external(kShell, {"-c", "printf '%s ' \"$@\"", "sh"}, options, "");
    EXPECT_EQ(out, "--type css --flag ");
}

TEST(InvokeExternalTest, DiagnosticOutputIsAFailureEvenOnExitZero) {
    const auto error = invoke_failure("cat; echo 'warning: deprecated' >&2");
    EXPECT_EQ(error.kind(), ErrorKind::ProcessDiagnostic);
    EXPECT_STREQ(error.what(), "warning: deprecated\n");
}

TEST(InvokeExternalTest, DiagnosticOutputWinsOverExitCode) {
    const auto error = invoke_failure("echo broken >&2; exit 4");
    EXPECT_EQ(error.kind(), ErrorKind::ProcessDiagnostic);
    EXPECT_STREQ(error.what(), "broken\n");
}

TEST(InvokeExternalTest, NonZeroExitNamesTheCode) {
    const auto error = invoke_failure("cat; exit 3");
    EXPECT_EQ(error.kind(), ErrorKind::ProcessExitCode);
    EXPECT_STREQ(error.what(), "Process exited with code 3");
}

TEST(InvokeExternalTest, SignalNamesTheSignal) {
    const auto error = invoke_failure("kill -9 $$");
    EXPECT_EQ(error.kind(), ErrorKind::ProcessExitCode);
    EXPECT_STREQ(error.what(), "Process terminated by signal 9");
}

TEST(InvokeExternalTest, EmptyOutputNamesTheCommand) {
    const auto error = invoke_failure("cat > /dev/null");
    EXPECT_EQ(error.kind(), ErrorKind::ProcessEmptyOutput);
    EXPECT_STREQ(error.what(), "No data returned /bin/sh -c cat > /dev/null");
}

TEST(InvokeExternalTest, EmptyOutputFromTrue) {
    try {
        (void)invoke_external("/bin/true", {}, {}, "ignored");
        FAIL() << "expected ProcessEmptyOutput";
    } catch (const CrushError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessEmptyOutput);
        EXPECT_STREQ(e.what(), "No data returned /bin/true");
    }
}
