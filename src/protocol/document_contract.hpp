#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docgate::protocol {

enum class DocumentKind {
    Writer,
    Calc,
    Impress,
    Draw
};

using TimePoint = std::chrono::system_clock::time_point;

// Gateway-side bookkeeping for one open live document. The handle is
// engine-issued and never interpreted.
struct SessionEntry {
    std::string handle;
    DocumentKind kind = DocumentKind::Writer;
    TimePoint created_at;
    TimePoint last_modified_at;
    TimePoint last_accessed_at;
    bool dirty = false;
};

struct TextContent {
    std::string content;
    std::size_t word_count = 0;
    std::size_t char_count = 0;
};

struct TextFormat {
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;
    std::optional<std::string> font_name;
    std::optional<double> font_size;

    bool empty() const {
        return !bold && !italic && !underline && !font_name && !font_size;
    }
};

struct InsertAtStart {};
struct InsertAtEnd {};
struct ReplaceAll {};
struct InsertAtOffset {
    std::int64_t offset = 0;
};

using InsertPosition =
    std::variant<InsertAtStart, InsertAtEnd, ReplaceAll, InsertAtOffset>;

// What the engine reports about a document it holds.
struct EngineDocument {
    std::string handle;
    DocumentKind kind = DocumentKind::Writer;
    bool modified = false;
};

struct InsertOutcome {
    SessionEntry entry;
    std::size_t applied_offset = 0;
    std::size_t inserted_chars = 0;
};

struct LiveDocumentInfo {
    SessionEntry entry;
    TextContent text;
    bool has_selection = false;
};

inline std::string to_string(const DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Writer:
            return "writer";
        case DocumentKind::Calc:
            return "calc";
        case DocumentKind::Impress:
            return "impress";
        case DocumentKind::Draw:
            return "draw";
        default:
            return "unknown";
    }
}

inline std::optional<DocumentKind> parse_document_kind(const std::string& text) {
    if (text == "writer") {
        return DocumentKind::Writer;
    }
    if (text == "calc") {
        return DocumentKind::Calc;
    }
    if (text == "impress") {
        return DocumentKind::Impress;
    }
    if (text == "draw") {
        return DocumentKind::Draw;
    }
    return std::nullopt;
}

inline const std::vector<std::string>& document_kind_names() {
    static const std::vector<std::string> names = {"writer", "calc", "impress", "draw"};
    return names;
}

}  // namespace docgate::protocol
