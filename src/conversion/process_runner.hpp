#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/gateway_errors.hpp"

namespace docgate::conversion {

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is the executable path
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 30000;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs one process in its own process group and waits for it. On timeout the
// whole group is killed, so helpers forked by the child die with it.
core::errors::Result<ProcessCapture> run_process(const ProcessSpec& spec);

// Last `max_bytes` of a diagnostic stream, trimmed of trailing whitespace.
std::string tail_excerpt(const std::string& text, std::size_t max_bytes = 400);

}  // namespace docgate::conversion
