#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "conversion/conversion_manager.hpp"
#include "core/errors/gateway_errors.hpp"
#include "protocol/document_contract.hpp"
#include "runtime/deadline.hpp"
#include "text/csv_reader.hpp"
#include "text/text_stats.hpp"

namespace docgate::tools {

struct DocumentFileInfo {
    std::filesystem::path path;
    std::string filename;
    std::string format;
    std::uintmax_t size_bytes = 0;
    protocol::TimePoint modified_time;
    bool exists = false;
};

struct DocumentStatistics {
    DocumentFileInfo file;
    std::optional<text::TextStatistics> content;
    // Set when the file exists but its text could not be extracted.
    std::optional<core::errors::GatewayError> content_error;
};

struct SpreadsheetData {
    std::string sheet_name;
    std::vector<text::CsvRow> rows;
    std::size_t row_count = 0;
    std::size_t col_count = 0;
};

struct SearchHit {
    std::filesystem::path path;
    std::string filename;
    std::string format;
    std::size_t word_count = 0;
    std::string match_context;
};

struct SearchOutcome {
    std::vector<SearchHit> hits;
    std::size_t scanned = 0;
    // The deadline ran out before every candidate was read.
    bool truncated = false;
};

// File-level document operations built on the headless converter. None of
// them touch the live engine.
class DocumentTools {
public:
    DocumentTools(conversion::ConversionManager& converter,
                  std::vector<std::filesystem::path> search_paths);

    // Never fails on a missing file; reports exists=false instead.
    core::errors::Result<DocumentFileInfo> file_info(const std::string& raw_path) const;

    // Plain .txt files are read directly, everything else goes through the engine.
    core::errors::Result<protocol::TextContent> read_text(const std::string& raw_path,
                                                          const runtime::Deadline& deadline);

    core::errors::Result<DocumentStatistics> statistics(const std::string& raw_path,
                                                        const runtime::Deadline& deadline);

    core::errors::Result<SpreadsheetData> read_spreadsheet(
        const std::string& raw_path, const std::optional<std::string>& sheet_name,
        std::size_t max_rows, const runtime::Deadline& deadline);

    // Case-insensitive substring search over extracted text. Unreadable
    // files are skipped.
    core::errors::Result<SearchOutcome> search(const std::string& query,
                                               const std::optional<std::string>& search_path,
                                               const runtime::Deadline& deadline);

    core::errors::Result<DocumentFileInfo> merge(const std::vector<std::string>& raw_paths,
                                                 const std::string& output_path,
                                                 const std::string& separator,
                                                 const runtime::Deadline& deadline);

    // Writer content is imported as plain text and Calc content as CSV.
    // Presentations and drawings always start empty. Never overwrites a file.
    core::errors::Result<DocumentFileInfo> create_document(const std::string& raw_path,
                                                           protocol::DocumentKind kind,
                                                           const std::string& content,
                                                           const runtime::Deadline& deadline);

    // Rewrites a text document in its own format with `text` placed in it.
    // Character formatting of the original is not kept.
    core::errors::Result<DocumentFileInfo> insert_text(const std::string& raw_path,
                                                       const std::string& text,
                                                       const protocol::InsertPosition& position,
                                                       const runtime::Deadline& deadline);

    static const std::vector<std::string>& searchable_extensions();

    const std::vector<std::filesystem::path>& search_paths() const { return search_paths_; }

private:
    conversion::ConversionManager& converter_;
    std::vector<std::filesystem::path> search_paths_;
};

}  // namespace docgate::tools
