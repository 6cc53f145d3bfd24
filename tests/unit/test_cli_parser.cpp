#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/gateway_errors.hpp"

namespace {

using docgate::app::CliCommand;
using docgate::app::GatewayConfig;
using docgate::app::ServeMode;
using docgate::app::cli::parse_and_validate;
using docgate::core::errors::ErrorKind;
using docgate::core::errors::get_error;
using docgate::core::errors::get_value;
using docgate::core::errors::is_error;
using docgate::core::logging::LogLevel;

docgate::core::errors::Result<GatewayConfig> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("docgate");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Validation);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ToolsCommandTakesNoArguments) {
    auto tools = parse_tokens({"tools"});
    ASSERT_FALSE(is_error(tools));
    EXPECT_EQ(get_value(tools).command, CliCommand::Tools);

    auto extra = parse_tokens({"tools", "--http"});
    ASSERT_TRUE(is_error(extra));
    EXPECT_EQ(get_error(extra).code, "unknown_argument");
}

TEST(CliParserTest, ServeDefaultsToStdio) {
    auto result = parse_tokens({"serve"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.command, CliCommand::Serve);
    EXPECT_EQ(config.mode, ServeMode::Stdio);
    EXPECT_EQ(config.port, 8766);
    EXPECT_EQ(config.engine_port, 8765);
    EXPECT_EQ(config.timeout_ms, 60000u);
    EXPECT_EQ(config.max_jobs, 4u);
    EXPECT_FALSE(config.engine_path.has_value());
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    ASSERT_FALSE(config.search_paths.empty());
    EXPECT_EQ(config.search_paths.back(), config.working_directory);
}

TEST(CliParserTest, FailsWhenStdioAndHttpBothProvided) {
    auto result = parse_tokens({"serve", "--stdio", "--http"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"serve", "--port"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens({"serve", "--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenPortNotNumeric) {
    auto result = parse_tokens({"serve", "--http", "--port", "80a"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenNumbersOutOfBounds) {
    auto port = parse_tokens({"serve", "--engine-port", "70000"});
    ASSERT_TRUE(is_error(port));
    EXPECT_EQ(get_error(port).code, "bounds_error");

    auto jobs = parse_tokens({"serve", "--max-jobs", "0"});
    ASSERT_TRUE(is_error(jobs));
    EXPECT_EQ(get_error(jobs).code, "bounds_error");

    auto timeout = parse_tokens({"serve", "--timeout-ms", "3600001"});
    ASSERT_TRUE(is_error(timeout));
    EXPECT_EQ(get_error(timeout).code, "bounds_error");
}

TEST(CliParserTest, FailsOnUnknownLogLevel) {
    auto result = parse_tokens({"serve", "--log-level", "trace"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsOnEmptyHost) {
    auto result = parse_tokens({"serve", "--host", ""});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_host");
}

TEST(CliParserTest, FailsWhenWorkdirInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens({"serve", "--workdir", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullHttpConfiguration) {
    const auto cwd = std::filesystem::canonical(std::filesystem::current_path());
    auto result = parse_tokens({"serve", "--http", "--host", "0.0.0.0", "--port", "9000",
                                "--engine-host", "office.local", "--engine-port", "2002",
                                "--engine-path", "/opt/lo/soffice", "--timeout-ms", "1500",
                                "--max-jobs", "8", "--workdir", cwd.string(),
                                "--search-path", "docs", "--search-path", "/srv/shared",
                                "--log-level", "debug"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.mode, ServeMode::Http);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.engine_host, "office.local");
    EXPECT_EQ(config.engine_port, 2002);
    ASSERT_TRUE(config.engine_path.has_value());
    EXPECT_EQ(config.engine_path.value(), "/opt/lo/soffice");
    EXPECT_EQ(config.timeout_ms, 1500u);
    EXPECT_EQ(config.max_jobs, 8u);
    EXPECT_EQ(config.working_directory, cwd);
    ASSERT_EQ(config.search_paths.size(), 2u);
    EXPECT_EQ(config.search_paths[0], cwd / "docs");
    EXPECT_EQ(config.search_paths[1], std::filesystem::path("/srv/shared"));
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

}  // namespace
