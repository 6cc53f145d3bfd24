#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace docgate::core::fs {

// Owns a scratch directory and removes it, contents included, on every exit path.
class ScopedDirectory {
public:
    explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ".ODT" -> ".odt"; empty when the path has no extension.
inline std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return ext;
}

}  // namespace docgate::core::fs
