#pragma once

#include <filesystem>
#include <string>
#include "core/errors/gateway_errors.hpp"

namespace docgate::policy {

// Resolves caller-supplied paths against an explicit working directory and
// performs the only checks the gateway makes on caller-owned files:
// existence and writability. No locking, no confinement.
class PathPolicy {
public:
    explicit PathPolicy(std::filesystem::path working_directory);

    core::errors::Result<std::filesystem::path> resolve(
        const std::string& raw_path, const std::string& parameter_name) const;

    core::errors::Result<std::filesystem::path> require_file(
        const std::string& raw_path, const std::string& parameter_name) const;

    core::errors::Result<std::filesystem::path> require_directory(
        const std::string& raw_path, const std::string& parameter_name) const;

    // Creates the directory when missing, then checks write permission.
    core::errors::Status prepare_writable_directory(
        const std::filesystem::path& directory) const;

    const std::filesystem::path& working_directory() const { return working_directory_; }

private:
    std::filesystem::path working_directory_;
};

}  // namespace docgate::policy
