#include "policy/path_policy.hpp"

#include <system_error>
#include <unistd.h>
#include <utility>

namespace docgate::policy {

using core::errors::ErrorKind;
using core::errors::GatewayError;

PathPolicy::PathPolicy(std::filesystem::path working_directory)
    : working_directory_(std::move(working_directory)) {}

core::errors::Result<std::filesystem::path> PathPolicy::resolve(
    const std::string& raw_path, const std::string& parameter_name) const {
    if (raw_path.empty()) {
        return GatewayError{ErrorKind::Validation,
                            "Parameter '" + parameter_name + "' must not be empty.",
                            "empty_path"};
    }

    std::filesystem::path candidate(raw_path);
    if (candidate.is_relative()) {
        candidate = working_directory_ / candidate;
    }

    std::error_code ec;
    auto normalized = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return GatewayError{ErrorKind::Validation,
                            "Unable to resolve path for '" + parameter_name +
                                "': " + raw_path,
                            "invalid_path"};
    }
    return normalized;
}

core::errors::Result<std::filesystem::path> PathPolicy::require_file(
    const std::string& raw_path, const std::string& parameter_name) const {
    auto resolved = resolve(raw_path, parameter_name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return GatewayError{ErrorKind::Validation, "File not found: " + path.string(),
                            "file_not_found"};
    }
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return GatewayError{ErrorKind::Validation,
                            "Path is not a regular file: " + path.string(),
                            "not_a_file"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> PathPolicy::require_directory(
    const std::string& raw_path, const std::string& parameter_name) const {
    auto resolved = resolve(raw_path, parameter_name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec) || ec) {
        return GatewayError{ErrorKind::Validation,
                            "Directory not found: " + path.string(),
                            "directory_not_found"};
    }
    return path;
}

core::errors::Status PathPolicy::prepare_writable_directory(
    const std::filesystem::path& directory) const {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return GatewayError{ErrorKind::Validation,
                            "Unable to create directory: " + directory.string(),
                            "directory_create_failed", ec.message()};
    }
    if (!std::filesystem::is_directory(directory, ec) || ec) {
        return GatewayError{ErrorKind::Validation,
                            "Not a directory: " + directory.string(),
                            "directory_not_found"};
    }
    if (access(directory.c_str(), W_OK) != 0) {
        return GatewayError{ErrorKind::Validation,
                            "Directory is not writable: " + directory.string(),
                            "directory_not_writable"};
    }
    return core::errors::ok();
}

}  // namespace docgate::policy
