#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gateway_errors.hpp"
#include "formats/format_registry.hpp"
#include "policy/path_policy.hpp"
#include "protocol/conversion_contract.hpp"
#include "protocol/document_contract.hpp"
#include "runtime/deadline.hpp"

namespace docgate::conversion {

struct ConversionSettings {
    std::optional<std::string> engine_path;
    std::filesystem::path working_directory = std::filesystem::current_path();
    std::size_t max_concurrent_jobs = 4;
};

// Bounds how many engine processes run at once.
class JobSlots {
public:
    explicit JobSlots(std::size_t capacity);

    bool acquire(const runtime::Deadline& deadline);
    void release();
    std::size_t in_use() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::size_t capacity_;
    std::size_t in_use_ = 0;
};

// Forces how the engine opens a source file, e.g. an SVG as a presentation.
struct ImportOverride {
    std::string filter;
    protocol::DocumentKind family = protocol::DocumentKind::Writer;
};

// Runs the engine in headless batch mode, one isolated process per job.
class ConversionManager {
public:
    ConversionManager(ConversionSettings settings, const formats::FormatRegistry& registry);

    core::errors::Result<protocol::ConversionResult> convert(
        const std::filesystem::path& source_path,
        const std::filesystem::path& target_path, const std::string& target_format,
        const runtime::Deadline& deadline,
        const std::optional<ImportOverride>& import = std::nullopt);

    // One result per matched file, in path order. Per-file failures are
    // recorded in the results and never stop the batch. Source subdirectories
    // are mirrored below `target_dir`; a second source mapping onto an already
    // claimed target fails with target_collision instead of overwriting it.
    core::errors::Result<std::vector<protocol::ConversionResult>> batch_convert(
        const std::filesystem::path& source_dir, const std::filesystem::path& target_dir,
        const std::string& target_format, const std::vector<std::string>& extensions,
        const runtime::Deadline& deadline);

    core::errors::Result<protocol::TextContent> extract_text(
        const std::filesystem::path& path, const runtime::Deadline& deadline);

    // Converts to `format_name` in a scratch directory and returns the bytes.
    // `filter_options` is appended only when a filter matching the source's
    // module is known.
    core::errors::Result<std::string> render_to_string(
        const std::filesystem::path& path, const std::string& format_name,
        const std::string& filter_options, const runtime::Deadline& deadline);

    // Where the headless engine would be launched from right now.
    core::errors::Result<std::filesystem::path> engine_executable() const;

    static const std::vector<std::string>& default_batch_extensions();

    const policy::PathPolicy& paths() const { return paths_; }
    const formats::FormatRegistry& registry() const { return registry_; }

private:
    protocol::ConversionResult run_engine(const std::filesystem::path& source,
                                          const std::filesystem::path& staging_dir,
                                          const protocol::FormatSpec& target,
                                          const std::string& filter_with_options,
                                          const std::optional<ImportOverride>& import,
                                          const runtime::Deadline& deadline,
                                          std::filesystem::path& produced);

    protocol::ConversionResult convert_one(const std::filesystem::path& source,
                                           const std::filesystem::path& target,
                                           const protocol::FormatSpec& spec,
                                           const std::optional<ImportOverride>& import,
                                           const runtime::Deadline& deadline);

    ConversionSettings settings_;
    const formats::FormatRegistry& registry_;
    policy::PathPolicy paths_;
    JobSlots slots_;
};

}  // namespace docgate::conversion
