#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "core/errors/gateway_errors.hpp"
#include "protocol/document_contract.hpp"

namespace docgate::protocol {

enum class FormatDirection {
    Import,
    Export,
    Both
};

struct FormatSpec {
    std::string logical_name;
    std::string engine_filter_id;
    std::string file_extension;
    FormatDirection direction = FormatDirection::Both;
    // Engine module that opens files of this format and owns engine_filter_id.
    DocumentKind family = DocumentKind::Writer;
    // Filters writing this format from documents of other modules.
    std::map<DocumentKind, std::string> family_filters;
};

enum class JobState {
    Pending,
    Running,
    Succeeded,
    Failed,
    TimedOut
};

struct ConversionResult {
    std::filesystem::path source_path;
    std::filesystem::path target_path;
    std::string source_format;
    std::string target_format;
    JobState state = JobState::Pending;
    std::optional<core::errors::GatewayError> error;
    std::uintmax_t output_bytes = 0;
    double duration_ms = 0.0;

    bool succeeded() const { return state == JobState::Succeeded; }
};

inline std::string to_string(const FormatDirection direction) {
    switch (direction) {
        case FormatDirection::Import:
            return "import";
        case FormatDirection::Export:
            return "export";
        case FormatDirection::Both:
            return "both";
        default:
            return "unknown";
    }
}

inline std::string to_string(const JobState state) {
    switch (state) {
        case JobState::Pending:
            return "pending";
        case JobState::Running:
            return "running";
        case JobState::Succeeded:
            return "succeeded";
        case JobState::Failed:
            return "failed";
        case JobState::TimedOut:
            return "timed_out";
        default:
            return "unknown";
    }
}

}  // namespace docgate::protocol
