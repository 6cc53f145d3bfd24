#include "conversion/conversion_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <utility>
#include "conversion/engine_locator.hpp"
#include "conversion/process_runner.hpp"
#include "core/config/unique_id.hpp"
#include "core/fs/file_utils.hpp"
#include "core/logging/logger.hpp"
#include "text/text_stats.hpp"

namespace docgate::conversion {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using core::fs::lowercase_extension;
using core::fs::ScopedDirectory;
using protocol::ConversionResult;
using protocol::FormatDirection;
using protocol::FormatSpec;
using protocol::JobState;

namespace {

class SlotGuard {
public:
    explicit SlotGuard(JobSlots& slots) : slots_(slots) {}
    ~SlotGuard() { slots_.release(); }
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    JobSlots& slots_;
};

std::string normalize_extension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

std::string source_format_of(const std::filesystem::path& path) {
    const std::string ext = lowercase_extension(path);
    return ext.empty() ? "" : ext.substr(1);
}

std::string file_url(const std::filesystem::path& path) {
    return "file://" + path.string();
}

// The engine names its output after the source stem; anything regular in
// the staging directory other than the profile is the product.
std::optional<std::filesystem::path> find_output(const std::filesystem::path& staging_dir,
                                                 const std::filesystem::path& expected) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(expected, ec) && !ec) {
        return expected;
    }
    for (const auto& entry : std::filesystem::directory_iterator(staging_dir, ec)) {
        if (entry.is_regular_file(ec) && !ec) {
            return entry.path();
        }
    }
    return std::nullopt;
}

ConversionResult failed_result(ConversionResult result, const JobState state,
                               GatewayError error) {
    result.state = state;
    result.error = std::move(error);
    return result;
}

}  // namespace

JobSlots::JobSlots(const std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool JobSlots::acquire(const runtime::Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool granted = available_.wait_until(lock, deadline.at(), [this] {
        return in_use_ < capacity_;
    });
    if (granted) {
        ++in_use_;
    }
    return granted;
}

void JobSlots::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    available_.notify_one();
}

std::size_t JobSlots::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

ConversionManager::ConversionManager(ConversionSettings settings,
                                     const formats::FormatRegistry& registry)
    : settings_(std::move(settings)),
      registry_(registry),
      paths_(settings_.working_directory),
      slots_(settings_.max_concurrent_jobs) {}

core::errors::Result<std::filesystem::path> ConversionManager::engine_executable() const {
    return locate_engine(settings_.engine_path);
}

const std::vector<std::string>& ConversionManager::default_batch_extensions() {
    static const std::vector<std::string> extensions = {
        ".odt", ".ods", ".odp", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx"};
    return extensions;
}

ConversionResult ConversionManager::run_engine(const std::filesystem::path& source,
                                               const std::filesystem::path& staging_dir,
                                               const FormatSpec& target,
                                               const std::string& filter_with_options,
                                               const std::optional<ImportOverride>& import,
                                               const runtime::Deadline& deadline,
                                               std::filesystem::path& produced) {
    ConversionResult result;
    result.source_path = source;
    result.source_format = source_format_of(source);
    result.target_format = target.logical_name;
    result.state = JobState::Pending;

    auto engine = locate_engine(settings_.engine_path);
    if (core::errors::is_error(engine)) {
        return failed_result(result, JobState::Failed, core::errors::get_error(engine));
    }

    if (!slots_.acquire(deadline)) {
        return failed_result(result, JobState::TimedOut,
                             GatewayError{ErrorKind::ConversionTimedOut,
                                          "Timed out waiting for a conversion slot: " +
                                              source.string(),
                                          "conversion_timed_out"});
    }
    SlotGuard slot(slots_);

    ProcessSpec spec;
    spec.working_directory = staging_dir;
    spec.timeout_ms = std::max<std::uint32_t>(deadline.remaining_ms(), 1);
    spec.argv = {core::errors::get_value(engine).string(),
                 "--headless",
                 "--invisible",
                 "--nologo",
                 "--norestore",
                 "--nolockcheck",
                 "-env:UserInstallation=" + file_url(staging_dir / "profile"),
                 "--convert-to",
                 filter_with_options.empty() ? target.logical_name
                                             : target.logical_name + ":" + filter_with_options,
                 "--outdir",
                 staging_dir.string()};
    if (import.has_value()) {
        spec.argv.push_back("--infilter=" + import->filter);
    }
    spec.argv.push_back(source.string());

    result.state = JobState::Running;
    LOG_DEBUG("ConversionManager: " + source.string() + " -> " + target.logical_name +
              " (timeout " + std::to_string(spec.timeout_ms) + "ms)");

    auto capture_result = run_process(spec);
    if (core::errors::is_error(capture_result)) {
        return failed_result(result, JobState::Failed,
                             core::errors::get_error(capture_result));
    }
    const auto& capture = core::errors::get_value(capture_result);
    result.duration_ms = capture.duration_ms;

    if (capture.timed_out) {
        return failed_result(result, JobState::TimedOut,
                             GatewayError{ErrorKind::ConversionTimedOut,
                                          "Conversion timed out after " +
                                              std::to_string(spec.timeout_ms) + "ms: " +
                                              source.string(),
                                          "conversion_timed_out",
                                          tail_excerpt(capture.stderr_text)});
    }

    if (capture.exit_code != 0) {
        const std::string excerpt = tail_excerpt(
            capture.stderr_text.empty() ? capture.stdout_text : capture.stderr_text);
        return failed_result(result, JobState::Failed,
                             GatewayError{ErrorKind::ConversionFailed,
                                          "Engine exited with code " +
                                              std::to_string(capture.exit_code) +
                                              (excerpt.empty() ? "" : ": " + excerpt),
                                          "engine_exit_nonzero", excerpt});
    }

    const auto expected = staging_dir / (source.stem().string() + target.file_extension);
    const auto output = find_output(staging_dir, expected);
    std::error_code ec;
    const auto size = output.has_value() ? std::filesystem::file_size(*output, ec) : 0;
    if (!output.has_value() || ec || size == 0) {
        // Exit code zero alone is not success: the engine skips some inputs silently.
        return failed_result(result, JobState::Failed,
                             GatewayError{ErrorKind::ConversionFailed,
                                          "Engine produced no output for " + source.string(),
                                          "empty_output",
                                          tail_excerpt(capture.stderr_text + capture.stdout_text)});
    }

    produced = *output;
    result.output_bytes = size;
    result.state = JobState::Succeeded;
    return result;
}

ConversionResult ConversionManager::convert_one(const std::filesystem::path& source,
                                                const std::filesystem::path& target,
                                                const FormatSpec& spec,
                                                const std::optional<ImportOverride>& import,
                                                const runtime::Deadline& deadline) {
    ConversionResult result;
    result.source_path = source;
    result.target_path = target;
    result.source_format = source_format_of(source);
    result.target_format = spec.logical_name;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec) || ec) {
        return failed_result(result, JobState::Failed,
                             GatewayError{ErrorKind::Validation,
                                          "Source file not found: " + source.string(),
                                          "file_not_found"});
    }

    auto writable = paths_.prepare_writable_directory(target.parent_path());
    if (core::errors::is_error(writable)) {
        return failed_result(result, JobState::Failed, core::errors::get_error(writable));
    }

    ScopedDirectory staging(target.parent_path() /
                            ("." + core::config::generate_id("docgate-job")));
    std::filesystem::create_directories(staging.path(), ec);
    if (ec) {
        return failed_result(result, JobState::Failed,
                             GatewayError{ErrorKind::Internal,
                                          "Unable to create staging directory: " +
                                              staging.path().string(),
                                          "staging_create_failed"});
    }

    std::filesystem::path produced;
    const auto family = import.has_value() ? import->family : registry_.family_of(source);
    auto engine_result =
        run_engine(source, staging.path(), spec,
                   formats::FormatRegistry::export_filter(spec, family), import, deadline,
                   produced);
    engine_result.target_path = target;
    if (!engine_result.succeeded()) {
        LOG_WARN("ConversionManager: " + source.string() + " " +
                 protocol::to_string(engine_result.state) + ": " +
                 (engine_result.error ? engine_result.error->message : ""));
        return engine_result;
    }

    std::filesystem::rename(produced, target, ec);
    if (ec) {
        return failed_result(engine_result, JobState::Failed,
                             GatewayError{ErrorKind::Internal,
                                          "Unable to move output into place: " +
                                              target.string(),
                                          "output_move_failed", ec.message()});
    }

    LOG_INFO("ConversionManager: converted " + source.string() + " -> " +
             target.string() + " (" + std::to_string(engine_result.output_bytes) +
             " bytes)");
    return engine_result;
}

core::errors::Result<ConversionResult> ConversionManager::convert(
    const std::filesystem::path& source_path, const std::filesystem::path& target_path,
    const std::string& target_format, const runtime::Deadline& deadline,
    const std::optional<ImportOverride>& import) {
    auto spec = registry_.resolve(target_format, FormatDirection::Export);
    if (core::errors::is_error(spec)) {
        return core::errors::get_error(spec);
    }

    auto source = paths_.require_file(source_path.string(), "source_path");
    if (core::errors::is_error(source)) {
        return core::errors::get_error(source);
    }
    auto target = paths_.resolve(target_path.string(), "target_path");
    if (core::errors::is_error(target)) {
        return core::errors::get_error(target);
    }

    auto result = convert_one(core::errors::get_value(source), core::errors::get_value(target),
                              core::errors::get_value(spec), import, deadline);
    if (!result.succeeded()) {
        return *result.error;
    }
    return result;
}

core::errors::Result<std::vector<ConversionResult>> ConversionManager::batch_convert(
    const std::filesystem::path& source_dir, const std::filesystem::path& target_dir,
    const std::string& target_format, const std::vector<std::string>& extensions,
    const runtime::Deadline& deadline) {
    auto spec_result = registry_.resolve(target_format, FormatDirection::Export);
    if (core::errors::is_error(spec_result)) {
        return core::errors::get_error(spec_result);
    }
    const auto spec = core::errors::get_value(spec_result);

    auto source_root = paths_.require_directory(source_dir.string(), "source_dir");
    if (core::errors::is_error(source_root)) {
        return core::errors::get_error(source_root);
    }
    auto target_root = paths_.resolve(target_dir.string(), "target_dir");
    if (core::errors::is_error(target_root)) {
        return core::errors::get_error(target_root);
    }
    auto writable = paths_.prepare_writable_directory(core::errors::get_value(target_root));
    if (core::errors::is_error(writable)) {
        return core::errors::get_error(writable);
    }

    std::vector<std::string> wanted;
    for (const auto& ext : extensions.empty() ? default_batch_extensions() : extensions) {
        wanted.push_back(normalize_extension(ext));
    }

    std::vector<std::filesystem::path> inputs;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(
             core::errors::get_value(source_root), options, ec)) {
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        const auto ext = lowercase_extension(entry.path());
        if (std::find(wanted.begin(), wanted.end(), ext) != wanted.end()) {
            inputs.push_back(entry.path());
        }
    }
    if (ec) {
        return GatewayError{ErrorKind::Validation,
                            "Unable to scan source directory: " + source_dir.string(),
                            "directory_scan_failed", ec.message()};
    }
    std::sort(inputs.begin(), inputs.end());

    std::vector<ConversionResult> results;
    results.reserve(inputs.size());
    std::size_t failures = 0;
    std::set<std::filesystem::path> claimed;
    for (const auto& input : inputs) {
        // Subdirectories are mirrored below the target root.
        const auto relative_dir =
            input.parent_path().lexically_relative(core::errors::get_value(source_root));
        const auto target = (core::errors::get_value(target_root) / relative_dir /
                             (input.stem().string() + spec.file_extension))
                                .lexically_normal();
        if (!claimed.insert(target).second) {
            ConversionResult duplicate;
            duplicate.source_path = input;
            duplicate.target_path = target;
            duplicate.source_format = source_format_of(input);
            duplicate.target_format = spec.logical_name;
            results.push_back(failed_result(
                duplicate, JobState::Failed,
                GatewayError{ErrorKind::Validation,
                             "Another file in this batch already converts to " +
                                 target.string(),
                             "target_collision",
                             "Rename one of the sources or convert them separately."}));
            LOG_WARN("ConversionManager: " + input.string() + " skipped, " + target.string() +
                     " already claimed");
            ++failures;
            continue;
        }
        if (deadline.expired()) {
            ConversionResult skipped;
            skipped.source_path = input;
            skipped.target_path = target;
            skipped.source_format = source_format_of(input);
            skipped.target_format = spec.logical_name;
            results.push_back(failed_result(
                skipped, JobState::TimedOut,
                GatewayError{ErrorKind::ConversionTimedOut,
                             "Batch deadline exhausted before " + input.string(),
                             "conversion_timed_out"}));
            ++failures;
            continue;
        }
        results.push_back(convert_one(input, target, spec, std::nullopt, deadline));
        if (!results.back().succeeded()) {
            ++failures;
        }
    }

    LOG_INFO("ConversionManager: batch " + std::to_string(results.size()) + " files, " +
             std::to_string(failures) + " failed");
    return results;
}

core::errors::Result<std::string> ConversionManager::render_to_string(
    const std::filesystem::path& path, const std::string& format_name,
    const std::string& filter_options, const runtime::Deadline& deadline) {
    auto source = paths_.require_file(path.string(), "path");
    if (core::errors::is_error(source)) {
        return core::errors::get_error(source);
    }
    auto spec = registry_.resolve(format_name, FormatDirection::Export);
    if (core::errors::is_error(spec)) {
        return core::errors::get_error(spec);
    }

    std::error_code ec;
    ScopedDirectory scratch(std::filesystem::temp_directory_path(ec) /
                            core::config::generate_id("docgate-render"));
    std::filesystem::create_directories(scratch.path(), ec);
    if (ec) {
        return GatewayError{ErrorKind::Internal,
                            "Unable to create scratch directory: " + scratch.path().string(),
                            "scratch_create_failed"};
    }

    const auto& target = core::errors::get_value(spec);
    std::string filter = formats::FormatRegistry::export_filter(
        target, registry_.family_of(core::errors::get_value(source)));
    if (!filter.empty() && !filter_options.empty()) {
        filter += ":" + filter_options;
    }

    std::filesystem::path produced;
    const auto result = run_engine(core::errors::get_value(source), scratch.path(), target,
                                   filter, std::nullopt, deadline, produced);
    if (!result.succeeded()) {
        return *result.error;
    }

    std::ifstream in(produced, std::ios::binary);
    if (!in.is_open()) {
        return GatewayError{ErrorKind::Internal,
                            "Unable to open engine output: " + produced.string(),
                            "output_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

core::errors::Result<protocol::TextContent> ConversionManager::extract_text(
    const std::filesystem::path& path, const runtime::Deadline& deadline) {
    // Writer's text filter takes a charset; Calc's takes separator, quote and charset.
    const auto family = registry_.family_of(path);
    auto rendered = render_to_string(path, "txt",
                                     family == protocol::DocumentKind::Calc ? "9,34,76" : "UTF8",
                                     deadline);
    if (core::errors::is_error(rendered)) {
        return core::errors::get_error(rendered);
    }
    std::string content = core::errors::get_value(rendered);

    // UTF-8 byte order mark written by the text export filter.
    if (content.rfind("\xEF\xBB\xBF", 0) == 0) {
        content.erase(0, 3);
    }
    return text::make_text_content(std::move(content));
}

}  // namespace docgate::conversion
