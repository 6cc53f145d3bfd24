#include "tools/document_tools.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <set>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <utility>
#include "core/config/unique_id.hpp"
#include "core/fs/file_utils.hpp"
#include "core/logging/logger.hpp"

namespace docgate::tools {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using core::fs::lowercase_extension;
using core::fs::ScopedDirectory;

namespace {

// Comma separated, double-quoted, UTF-8.
constexpr const char* kSpreadsheetCsvOptions = "44,34,76";
constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

// Smallest picture the SVG import filters accept; it opens as one empty page.
constexpr const char* kBlankSvg =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"210mm\" height=\"297mm\"/>\n";

void strip_bom(std::string& content) {
    if (content.rfind(kUtf8Bom, 0) == 0) {
        content.erase(0, 3);
    }
}

core::errors::Result<std::string> read_whole_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return GatewayError{ErrorKind::Validation,
                            "Failed to open file: " + path.string(), "file_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return GatewayError{ErrorKind::Internal,
                            "I/O error while reading file: " + path.string(),
                            "file_read_failed"};
    }
    return buffer.str();
}

core::errors::Status write_whole_file(const std::filesystem::path& path,
                                      const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    out.close();
    if (!out.good()) {
        return GatewayError{ErrorKind::Internal, "Unable to write file: " + path.string(),
                            "file_write_failed"};
    }
    return core::errors::ok();
}

// Writes beside the destination first so readers never see a half-written file.
core::errors::Status replace_file(const std::filesystem::path& path,
                                  const std::string& content) {
    const auto staged =
        path.parent_path() / ("." + core::config::generate_id("docgate-edit") + ".txt");
    auto written = write_whole_file(staged, content);
    if (core::errors::is_error(written)) {
        std::error_code ignored;
        std::filesystem::remove(staged, ignored);
        return written;
    }
    std::error_code ec;
    std::filesystem::rename(staged, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staged, ignored);
        return GatewayError{ErrorKind::Internal, "Unable to replace file: " + path.string(),
                            "file_write_failed", ec.message()};
    }
    return core::errors::ok();
}

std::string native_extension(const protocol::DocumentKind kind) {
    switch (kind) {
        case protocol::DocumentKind::Calc:
            return ".ods";
        case protocol::DocumentKind::Impress:
            return ".odp";
        case protocol::DocumentKind::Draw:
            return ".odg";
        case protocol::DocumentKind::Writer:
        default:
            return ".odt";
    }
}

std::string place_text(const std::string& existing, const std::string& text,
                       const protocol::InsertPosition& position) {
    if (std::holds_alternative<protocol::ReplaceAll>(position)) {
        return text;
    }
    if (const auto* at = std::get_if<protocol::InsertAtOffset>(&position)) {
        const auto length = static_cast<std::int64_t>(text::count_code_points(existing));
        const auto offset =
            static_cast<std::size_t>(std::clamp<std::int64_t>(at->offset, 0, length));
        std::string placed = existing;
        placed.insert(text::byte_offset_of(existing, offset), text);
        return placed;
    }
    if (existing.empty()) {
        return text;
    }
    if (std::holds_alternative<protocol::InsertAtStart>(position)) {
        return text + "\n" + existing;
    }
    return existing + "\n" + text;
}

void collect_candidates(const std::filesystem::path& root,
                        const std::set<std::string>& extensions,
                        std::set<std::filesystem::path>& out) {
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root, options, ec);
    const std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        if (it->is_regular_file(ec) && !ec &&
            extensions.count(lowercase_extension(it->path())) > 0) {
            out.insert(it->path());
        }
        ec.clear();
        it.increment(ec);
    }
    if (ec) {
        LOG_DEBUG("DocumentTools: stopped scanning " + root.string() + ": " + ec.message());
    }
}

}  // namespace

DocumentTools::DocumentTools(conversion::ConversionManager& converter,
                             std::vector<std::filesystem::path> search_paths)
    : converter_(converter), search_paths_(std::move(search_paths)) {}

const std::vector<std::string>& DocumentTools::searchable_extensions() {
    static const std::vector<std::string> extensions = {".odt", ".ods", ".odp", ".odg",
                                                        ".doc", ".docx", ".txt"};
    return extensions;
}

core::errors::Result<DocumentFileInfo> DocumentTools::file_info(
    const std::string& raw_path) const {
    auto resolved = converter_.paths().resolve(raw_path, "path");
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    DocumentFileInfo info;
    info.path = core::errors::get_value(resolved);
    info.filename = info.path.filename().string();
    const std::string ext = lowercase_extension(info.path);
    info.format = ext.empty() ? "" : ext.substr(1);
    info.modified_time = std::chrono::system_clock::now();

    struct stat st {};
    if (::stat(info.path.c_str(), &st) == 0) {
        info.exists = true;
        info.size_bytes = static_cast<std::uintmax_t>(st.st_size);
        info.modified_time = std::chrono::system_clock::from_time_t(st.st_mtime);
    }
    return info;
}

core::errors::Result<protocol::TextContent> DocumentTools::read_text(
    const std::string& raw_path, const runtime::Deadline& deadline) {
    auto source = converter_.paths().require_file(raw_path, "path");
    if (core::errors::is_error(source)) {
        return core::errors::get_error(source);
    }
    const auto path = core::errors::get_value(source);

    if (lowercase_extension(path) != ".txt") {
        return converter_.extract_text(path, deadline);
    }
    auto content = read_whole_file(path);
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }
    std::string text = core::errors::get_value(content);
    strip_bom(text);
    return text::make_text_content(std::move(text));
}

core::errors::Result<DocumentStatistics> DocumentTools::statistics(
    const std::string& raw_path, const runtime::Deadline& deadline) {
    auto info = file_info(raw_path);
    if (core::errors::is_error(info)) {
        return core::errors::get_error(info);
    }

    DocumentStatistics stats;
    stats.file = core::errors::get_value(info);
    if (!stats.file.exists) {
        return GatewayError{ErrorKind::Validation,
                            "Document not found: " + stats.file.path.string(),
                            "file_not_found"};
    }

    auto content = read_text(stats.file.path.string(), deadline);
    if (core::errors::is_error(content)) {
        stats.content_error = core::errors::get_error(content);
        LOG_WARN("DocumentTools: could not analyze " + stats.file.path.string() + ": " +
                 stats.content_error->message);
        return stats;
    }
    stats.content = text::compute_statistics(core::errors::get_value(content).content);
    return stats;
}

core::errors::Result<SpreadsheetData> DocumentTools::read_spreadsheet(
    const std::string& raw_path, const std::optional<std::string>& sheet_name,
    const std::size_t max_rows, const runtime::Deadline& deadline) {
    if (max_rows == 0) {
        return GatewayError{ErrorKind::Validation, "max_rows must be greater than zero.",
                            "invalid_max_rows"};
    }

    auto rendered = converter_.render_to_string(raw_path, "csv", kSpreadsheetCsvOptions,
                                                deadline);
    if (core::errors::is_error(rendered)) {
        return core::errors::get_error(rendered);
    }
    std::string csv = core::errors::get_value(rendered);
    strip_bom(csv);

    SpreadsheetData data;
    data.sheet_name = sheet_name.value_or("Sheet1");
    data.rows = text::parse_csv(csv, max_rows);
    data.row_count = data.rows.size();
    for (const auto& row : data.rows) {
        data.col_count = std::max(data.col_count, row.size());
    }
    return data;
}

core::errors::Result<SearchOutcome> DocumentTools::search(
    const std::string& query, const std::optional<std::string>& search_path,
    const runtime::Deadline& deadline) {
    if (query.empty()) {
        return GatewayError{ErrorKind::Validation, "Search query cannot be empty.",
                            "empty_search_query"};
    }

    std::vector<std::filesystem::path> roots;
    if (search_path.has_value()) {
        auto root = converter_.paths().require_directory(*search_path, "search_path");
        if (core::errors::is_error(root)) {
            return core::errors::get_error(root);
        }
        roots.push_back(core::errors::get_value(root));
    } else {
        roots = search_paths_;
    }

    const std::set<std::string> extensions(searchable_extensions().begin(),
                                           searchable_extensions().end());
    std::set<std::filesystem::path> candidates;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec) || ec) {
            continue;
        }
        const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
        collect_candidates(ec ? root : canonical_root, extensions, candidates);
    }

    SearchOutcome outcome;
    for (const auto& candidate : candidates) {
        if (deadline.expired()) {
            outcome.truncated = true;
            break;
        }
        ++outcome.scanned;

        auto content = read_text(candidate.string(), deadline);
        if (core::errors::is_error(content)) {
            LOG_DEBUG("DocumentTools: skipping " + candidate.string() + ": " +
                      core::errors::get_error(content).message);
            continue;
        }
        const auto& text_content = core::errors::get_value(content);
        if (!text::contains_ignore_case(text_content.content, query)) {
            continue;
        }

        SearchHit hit;
        hit.path = candidate;
        hit.filename = candidate.filename().string();
        hit.format = lowercase_extension(candidate);
        hit.word_count = text_content.word_count;
        hit.match_context = text::match_context(text_content.content, query);
        outcome.hits.push_back(std::move(hit));
    }

    LOG_INFO("DocumentTools: search matched " + std::to_string(outcome.hits.size()) + " of " +
             std::to_string(outcome.scanned) + " documents");
    return outcome;
}

core::errors::Result<DocumentFileInfo> DocumentTools::merge(
    const std::vector<std::string>& raw_paths, const std::string& output_path,
    const std::string& separator, const runtime::Deadline& deadline) {
    if (raw_paths.empty()) {
        return GatewayError{ErrorKind::Validation, "document_paths must not be empty.",
                            "empty_document_list"};
    }
    auto resolved_output = converter_.paths().resolve(output_path, "output_path");
    if (core::errors::is_error(resolved_output)) {
        return core::errors::get_error(resolved_output);
    }
    const auto output = core::errors::get_value(resolved_output);
    auto writable = converter_.paths().prepare_writable_directory(output.parent_path());
    if (core::errors::is_error(writable)) {
        return core::errors::get_error(writable);
    }

    std::string merged;
    for (std::size_t i = 0; i < raw_paths.size(); ++i) {
        if (i > 0) {
            merged += separator;
        }
        const std::string name = std::filesystem::path(raw_paths[i]).filename().string();
        auto content = read_text(raw_paths[i], deadline);
        if (core::errors::is_error(content)) {
            merged += "=== " + name + " ===\n\nError reading document: " +
                      core::errors::get_error(content).message;
        } else {
            merged += "=== " + name + " ===\n\n" + core::errors::get_value(content).content;
        }
    }

    const std::string ext = lowercase_extension(output);
    const std::string target_format = ext.empty() ? "odt" : ext.substr(1);

    if (target_format == "txt") {
        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        out << merged;
        if (!out.good()) {
            return GatewayError{ErrorKind::Internal,
                                "Unable to write merged document: " + output.string(),
                                "merge_write_failed"};
        }
        return file_info(output.string());
    }

    std::error_code ec;
    ScopedDirectory scratch(std::filesystem::temp_directory_path(ec) /
                             core::config::generate_id("docgate-merge"));
    std::filesystem::create_directories(scratch.path(), ec);
    if (ec) {
        return GatewayError{ErrorKind::Internal,
                            "Unable to create scratch directory: " + scratch.path().string(),
                            "scratch_create_failed", ec.message()};
    }
    const auto staged = scratch.path() / (output.stem().string() + ".txt");
    {
        std::ofstream out(staged, std::ios::binary | std::ios::trunc);
        out << merged;
        if (!out.good()) {
            return GatewayError{ErrorKind::Internal,
                                "Unable to stage merged text: " + staged.string(),
                                "merge_write_failed"};
        }
    }

    auto converted = converter_.convert(staged, output, target_format, deadline);
    if (core::errors::is_error(converted)) {
        return core::errors::get_error(converted);
    }
    return file_info(output.string());
}

core::errors::Result<DocumentFileInfo> DocumentTools::create_document(
    const std::string& raw_path, const protocol::DocumentKind kind, const std::string& content,
    const runtime::Deadline& deadline) {
    auto resolved = converter_.paths().resolve(raw_path, "path");
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    auto target = core::errors::get_value(resolved);
    if (target.extension().empty()) {
        target += native_extension(kind);
    }

    auto spec = converter_.registry().resolve(target.extension().string(),
                                             protocol::FormatDirection::Export);
    if (core::errors::is_error(spec)) {
        return core::errors::get_error(spec);
    }
    const auto& format = core::errors::get_value(spec);
    if (format.family != kind) {
        return GatewayError{ErrorKind::Validation,
                            "A " + protocol::to_string(kind) + " document cannot be created as " +
                                target.filename().string() + ".",
                            "extension_mismatch",
                            "Use a " + native_extension(kind) + " path."};
    }
    const bool starts_empty =
        kind == protocol::DocumentKind::Impress || kind == protocol::DocumentKind::Draw;
    if (starts_empty && !content.empty()) {
        return GatewayError{ErrorKind::Validation,
                            "Initial content is only supported for writer and calc documents.",
                            "content_not_supported",
                            "Create the document empty, then edit it live."};
    }

    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        return GatewayError{ErrorKind::Validation, "File already exists: " + target.string(),
                            "file_exists"};
    }
    auto writable = converter_.paths().prepare_writable_directory(target.parent_path());
    if (core::errors::is_error(writable)) {
        return core::errors::get_error(writable);
    }

    if (format.logical_name == "txt") {
        auto written = write_whole_file(target, content);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
        LOG_INFO("DocumentTools: created " + target.string());
        return file_info(target.string());
    }

    ScopedDirectory scratch(std::filesystem::temp_directory_path(ec) /
                            core::config::generate_id("docgate-create"));
    std::filesystem::create_directories(scratch.path(), ec);
    if (ec) {
        return GatewayError{ErrorKind::Internal,
                            "Unable to create scratch directory: " + scratch.path().string(),
                            "scratch_create_failed", ec.message()};
    }

    std::optional<conversion::ImportOverride> import;
    std::filesystem::path staged;
    switch (kind) {
        case protocol::DocumentKind::Calc:
            staged = scratch.path() / (target.stem().string() + ".csv");
            break;
        case protocol::DocumentKind::Impress:
            staged = scratch.path() / (target.stem().string() + ".svg");
            import = conversion::ImportOverride{"impress_svg_Import", kind};
            break;
        case protocol::DocumentKind::Draw:
            staged = scratch.path() / (target.stem().string() + ".svg");
            import = conversion::ImportOverride{"draw_svg_Import", kind};
            break;
        case protocol::DocumentKind::Writer:
        default:
            staged = scratch.path() / (target.stem().string() + ".txt");
            break;
    }
    auto written = write_whole_file(staged, starts_empty ? std::string(kBlankSvg) : content);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    auto converted =
        converter_.convert(staged, target, format.logical_name, deadline, import);
    if (core::errors::is_error(converted)) {
        return core::errors::get_error(converted);
    }
    LOG_INFO("DocumentTools: created " + protocol::to_string(kind) + " document " +
             target.string());
    return file_info(target.string());
}

core::errors::Result<DocumentFileInfo> DocumentTools::insert_text(
    const std::string& raw_path, const std::string& text,
    const protocol::InsertPosition& position, const runtime::Deadline& deadline) {
    auto source = converter_.paths().require_file(raw_path, "path");
    if (core::errors::is_error(source)) {
        return core::errors::get_error(source);
    }
    const auto path = core::errors::get_value(source);

    auto spec = converter_.registry().resolve_extension(path);
    if (core::errors::is_error(spec)) {
        return core::errors::get_error(spec);
    }
    const auto& format = core::errors::get_value(spec);
    if (format.family != protocol::DocumentKind::Writer) {
        return GatewayError{ErrorKind::Validation,
                            "Text insertion is not supported for " +
                                protocol::to_string(format.family) + " documents.",
                            "unsupported_document_kind", "Use a writer document."};
    }

    auto existing = read_text(path.string(), deadline);
    if (core::errors::is_error(existing)) {
        return core::errors::get_error(existing);
    }
    const std::string updated =
        place_text(core::errors::get_value(existing).content, text, position);

    if (format.logical_name == "txt") {
        auto replaced = replace_file(path, updated);
        if (core::errors::is_error(replaced)) {
            return core::errors::get_error(replaced);
        }
        return file_info(path.string());
    }

    std::error_code ec;
    ScopedDirectory scratch(std::filesystem::temp_directory_path(ec) /
                            core::config::generate_id("docgate-edit"));
    std::filesystem::create_directories(scratch.path(), ec);
    if (ec) {
        return GatewayError{ErrorKind::Internal,
                            "Unable to create scratch directory: " + scratch.path().string(),
                            "scratch_create_failed", ec.message()};
    }
    const auto staged = scratch.path() / (path.stem().string() + ".txt");
    auto written = write_whole_file(staged, updated);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    // The converter renames its output over the original only once it is verified.
    auto converted = converter_.convert(staged, path, format.logical_name, deadline);
    if (core::errors::is_error(converted)) {
        return core::errors::get_error(converted);
    }
    LOG_INFO("DocumentTools: rewrote " + path.string() + " with " +
             std::to_string(text::count_code_points(text)) + " inserted characters");
    return file_info(path.string());
}

}  // namespace docgate::tools
