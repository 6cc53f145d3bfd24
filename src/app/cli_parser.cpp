#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace docgate::app::cli {

    using namespace docgate::core::errors;
    using docgate::core::logging::LogLevel;

    namespace {

        constexpr const char* kUsage =
            "Usage: docgate serve [--stdio | --http] [--host H] [--port N] [--engine-host H] "
            "[--engine-port N] [--engine-path P] [--timeout-ms N] [--max-jobs N] "
            "[--search-path DIR]... [--workdir DIR] [--log-level debug|info|warn|error]\n"
            "       docgate tools";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            bool stdio = false;
            bool http = false;
            std::optional<std::string> host;
            std::optional<std::string> port;
            std::optional<std::string> engine_host;
            std::optional<std::string> engine_port;
            std::optional<std::string> engine_path;
            std::optional<std::string> timeout_ms;
            std::optional<std::string> max_jobs;
            std::vector<std::string> search_paths;
            std::optional<std::string> workdir;
            std::optional<std::string> log_level;
        };

        // Exception-free integer parsing with inclusive bounds
        Result<std::uint64_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint64_t min, std::uint64_t max) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end || text.empty()) {
                return GatewayError{ErrorKind::Validation, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min || value > max) {
                return GatewayError{ErrorKind::Validation, flag + " out of bounds", "bounds_error",
                                    "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_directory(const std::string& flag, const std::string& raw) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return GatewayError{ErrorKind::Validation, flag + " does not exist or is not a directory: " + raw, "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return GatewayError{ErrorKind::Validation, "Failed to canonicalize " + flag + ": " + raw, "invalid_path"};
            }
            return canonical_path;
        }

        std::vector<std::filesystem::path> default_search_paths(const std::filesystem::path& workdir) {
            std::vector<std::filesystem::path> paths;
            if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
                paths.emplace_back(std::filesystem::path(home) / "Documents");
                paths.emplace_back(std::filesystem::path(home) / "Desktop");
            }
            paths.push_back(workdir);
            return paths;
        }

    } // namespace

    Result<GatewayConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GatewayError{ErrorKind::Validation, "No command provided.", "missing_command", kUsage};
        }

        GatewayConfig config;
        std::string command = argv[1];
        if (command == "tools") {
            config.command = CliCommand::Tools;
            if (argc > 2) {
                return GatewayError{ErrorKind::Validation, "Unknown argument: " + std::string(argv[2]), "unknown_argument"};
            }
            return config;
        }
        if (command != "serve") {
            return GatewayError{ErrorKind::Validation, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            auto take = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };
            auto missing = [&]() {
                return GatewayError{ErrorKind::Validation, "Missing value for " + args[i], "missing_value"};
            };

            if (args[i] == "--stdio") {
                raw.stdio = true;
            } else if (args[i] == "--http") {
                raw.http = true;
            } else if (args[i] == "--host") {
                if (!take(raw.host)) return missing();
            } else if (args[i] == "--port") {
                if (!take(raw.port)) return missing();
            } else if (args[i] == "--engine-host") {
                if (!take(raw.engine_host)) return missing();
            } else if (args[i] == "--engine-port") {
                if (!take(raw.engine_port)) return missing();
            } else if (args[i] == "--engine-path") {
                if (!take(raw.engine_path)) return missing();
            } else if (args[i] == "--timeout-ms") {
                if (!take(raw.timeout_ms)) return missing();
            } else if (args[i] == "--max-jobs") {
                if (!take(raw.max_jobs)) return missing();
            } else if (args[i] == "--search-path") {
                std::optional<std::string> value;
                if (!take(value)) return missing();
                raw.search_paths.push_back(value.value());
            } else if (args[i] == "--workdir") {
                if (!take(raw.workdir)) return missing();
            } else if (args[i] == "--log-level") {
                if (!take(raw.log_level)) return missing();
            } else {
                return GatewayError{ErrorKind::Validation, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (raw.stdio && raw.http) {
            return GatewayError{ErrorKind::Validation, "Cannot provide both --stdio and --http", "conflicting_flags"};
        }
        config.mode = raw.http ? ServeMode::Http : ServeMode::Stdio;

        if (raw.host) {
            if (raw.host->empty()) {
                return GatewayError{ErrorKind::Validation, "--host must not be empty", "invalid_host"};
            }
            config.host = raw.host.value();
        }
        if (raw.engine_host) {
            if (raw.engine_host->empty()) {
                return GatewayError{ErrorKind::Validation, "--engine-host must not be empty", "invalid_host"};
            }
            config.engine_host = raw.engine_host.value();
        }

        if (raw.port) {
            auto port = parse_bounded("--port", raw.port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.port = static_cast<int>(get_value(port));
        }
        if (raw.engine_port) {
            auto port = parse_bounded("--engine-port", raw.engine_port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.engine_port = static_cast<int>(get_value(port));
        }
        if (raw.timeout_ms) {
            auto timeout = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 1,
                                         docgate::protocol::kMaxTimeoutMs);
            if (is_error(timeout)) return get_error(timeout);
            config.timeout_ms = static_cast<std::uint32_t>(get_value(timeout));
        }
        if (raw.max_jobs) {
            auto jobs = parse_bounded("--max-jobs", raw.max_jobs.value(), 1, 64);
            if (is_error(jobs)) return get_error(jobs);
            config.max_jobs = static_cast<std::size_t>(get_value(jobs));
        }

        if (raw.engine_path) {
            if (raw.engine_path->empty()) {
                return GatewayError{ErrorKind::Validation, "--engine-path must not be empty", "invalid_path"};
            }
            config.engine_path = raw.engine_path.value();
        }

        if (raw.log_level) {
            const std::string& level = raw.log_level.value();
            if (level == "debug") config.log_level = LogLevel::DEBUG;
            else if (level == "info") config.log_level = LogLevel::INFO;
            else if (level == "warn") config.log_level = LogLevel::WARN;
            else if (level == "error") config.log_level = LogLevel::ERROR;
            else {
                return GatewayError{ErrorKind::Validation, "Unknown log level: " + level, "invalid_log_level", "Use debug, info, warn or error."};
            }
        }

        // Path validation
        if (raw.workdir) {
            auto workdir = existing_directory("--workdir", raw.workdir.value());
            if (is_error(workdir)) return get_error(workdir);
            config.working_directory = get_value(workdir);
        }

        // Search paths need not exist yet; relative ones hang off the working directory
        if (raw.search_paths.empty()) {
            config.search_paths = default_search_paths(config.working_directory);
        } else {
            for (const auto& entry : raw.search_paths) {
                if (entry.empty()) {
                    return GatewayError{ErrorKind::Validation, "--search-path must not be empty", "invalid_path"};
                }
                std::filesystem::path p(entry);
                config.search_paths.push_back(p.is_relative() ? config.working_directory / p : p);
            }
        }

        return config;
    }

} // namespace docgate::app::cli
