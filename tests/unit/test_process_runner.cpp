#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "conversion/process_runner.hpp"
#include "test_support.hpp"

namespace {

using docgate::conversion::ProcessSpec;
using docgate::conversion::run_process;
using docgate::conversion::tail_excerpt;
using docgate::core::errors::get_error;
using docgate::core::errors::get_value;
using docgate::core::errors::is_error;
using docgate::testing::TempWorkspace;

ProcessSpec shell(const std::string& script, const std::uint32_t timeout_ms = 5000) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.timeout_ms = timeout_ms;
    return spec;
}

TEST(ProcessRunnerTest, CapturesExitCodeAndBothStreams) {
    auto result = run_process(shell("echo out; echo err >&2; exit 3"));
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
    EXPECT_GE(capture.duration_ms, 0.0);
}

TEST(ProcessRunnerTest, RunsInRequestedWorkingDirectory) {
    TempWorkspace workspace;
    auto spec = shell("pwd");
    spec.working_directory = workspace.root();

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(get_value(result).stdout_text, workspace.root().string() + "\n");
}

TEST(ProcessRunnerTest, TimesOutAndKillsProcess) {
    auto result = run_process(shell("sleep 5", 200));
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_TRUE(capture.timed_out);
    EXPECT_NE(capture.exit_code, 0);
    EXPECT_LT(capture.duration_ms, 3000.0);
}

TEST(ProcessRunnerTest, TimeoutKillsBackgroundHelpersHoldingPipes) {
    auto result = run_process(shell("sleep 5 & sleep 5; wait", 200));
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_LT(get_value(result).duration_ms, 3000.0);
}

TEST(ProcessRunnerTest, HelpersOutlivingChildDoNotBlockReturn) {
    auto result = run_process(shell("sleep 5 & exit 0", 10000));
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).timed_out);
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_LT(get_value(result).duration_ms, 3000.0);
}

TEST(ProcessRunnerTest, MissingExecutableExitsWith127) {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/docgate-engine"};

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
}

TEST(ProcessRunnerTest, ArgumentsReachChildUnchanged) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "printf '[%s]' \"$@\"", "sh", "two words", "",
                 "--convert-to=pdf:calc_pdf_Export"};
    spec.timeout_ms = 5000;

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "[two words][][--convert-to=pdf:calc_pdf_Export]");
    EXPECT_EQ(spec.argv.size(), 7u);
    EXPECT_EQ(spec.argv[4], "two words");
}

TEST(ProcessRunnerTest, RejectsEmptyArgv) {
    ProcessSpec spec;

    auto result = run_process(spec);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_argv");
}

TEST(ProcessRunnerTest, TailExcerptKeepsEndAndTrimsWhitespace) {
    EXPECT_EQ(tail_excerpt("short message \n\n"), "short message");
    EXPECT_EQ(tail_excerpt(""), "");

    const std::string long_text = std::string(1000, 'a') + "the last words";
    const auto excerpt = tail_excerpt(long_text, 20);
    EXPECT_EQ(excerpt, "...aaaaaathe last words");
}

}  // namespace
