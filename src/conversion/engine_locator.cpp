#include "conversion/engine_locator.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace docgate::conversion {

using core::errors::ErrorKind;
using core::errors::GatewayError;

namespace {

bool is_executable(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec &&
           access(path.c_str(), X_OK) == 0;
}

core::errors::Result<std::filesystem::path> require_executable(
    const std::string& raw, const std::string& origin) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(raw, ec);
    if (ec || !is_executable(absolute)) {
        return GatewayError{ErrorKind::EngineUnreachable,
                            "Engine executable from " + origin +
                                " is not runnable: " + raw,
                            "engine_not_found"};
    }
    return absolute;
}

}  // namespace

core::errors::Result<std::filesystem::path> locate_engine(
    const std::optional<std::string>& configured_path) {
    if (configured_path.has_value() && !configured_path->empty()) {
        return require_executable(*configured_path, "configuration");
    }

    const char* env_path = std::getenv(kEnginePathEnv);
    if (env_path != nullptr && env_path[0] != '\0') {
        return require_executable(env_path, kEnginePathEnv);
    }

    const char* search_path = std::getenv("PATH");
    if (search_path != nullptr) {
        const std::vector<std::string> names = {"libreoffice", "soffice", "loffice"};
        for (const auto& name : names) {
            std::istringstream dirs(search_path);
            std::string dir;
            while (std::getline(dirs, dir, ':')) {
                if (dir.empty()) {
                    continue;
                }
                const auto candidate = std::filesystem::path(dir) / name;
                if (is_executable(candidate)) {
                    return candidate;
                }
            }
        }
    }

    const std::vector<std::filesystem::path> defaults = {
        "/usr/bin/soffice",
        "/usr/lib/libreoffice/program/soffice",
        "/opt/libreoffice/program/soffice",
        "/Applications/LibreOffice.app/Contents/MacOS/soffice"};
    for (const auto& candidate : defaults) {
        if (is_executable(candidate)) {
            return candidate;
        }
    }

    return GatewayError{ErrorKind::EngineUnreachable,
                        "LibreOffice executable not found.", "engine_not_found",
                        std::string("Install LibreOffice or set ") + kEnginePathEnv + "."};
}

}  // namespace docgate::conversion
