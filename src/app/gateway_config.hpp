#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace docgate::app {

    enum class CliCommand {
        Serve,  // run a transport until input ends or the process is stopped
        Tools   // print the tool descriptors and exit
    };

    enum class ServeMode {
        Stdio,
        Http
    };

    // Validated process configuration produced by the CLI parser
    struct GatewayConfig {
        CliCommand command = CliCommand::Serve;
        ServeMode mode = ServeMode::Stdio;

        std::string host = "127.0.0.1";
        int port = 8766;

        std::string engine_host = "127.0.0.1";
        int engine_port = 8765;
        std::optional<std::string> engine_path;

        std::uint32_t timeout_ms = 60000;
        std::size_t max_jobs = 4;

        std::vector<std::filesystem::path> search_paths;
        std::filesystem::path working_directory = std::filesystem::current_path();
        core::logging::LogLevel log_level = core::logging::LogLevel::INFO;
    };

} // namespace docgate::app
