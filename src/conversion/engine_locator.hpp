#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/gateway_errors.hpp"

namespace docgate::conversion {

inline constexpr const char* kEnginePathEnv = "DOCGATE_ENGINE_PATH";

// Finds the headless engine executable: explicit override, then the
// DOCGATE_ENGINE_PATH environment variable, then PATH, then fixed
// platform install locations.
core::errors::Result<std::filesystem::path> locate_engine(
    const std::optional<std::string>& configured_path);

}  // namespace docgate::conversion
