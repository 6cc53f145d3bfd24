#include "formats/format_registry.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace docgate::formats {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using protocol::DocumentKind;
using protocol::FormatDirection;
using protocol::FormatSpec;

namespace {

std::vector<FormatSpec> default_table() {
    constexpr auto writer = DocumentKind::Writer;
    constexpr auto calc = DocumentKind::Calc;
    constexpr auto impress = DocumentKind::Impress;
    constexpr auto draw = DocumentKind::Draw;
    return {
        {"pdf", "writer_pdf_Export", ".pdf", FormatDirection::Export, writer,
         {{calc, "calc_pdf_Export"}, {impress, "impress_pdf_Export"}, {draw, "draw_pdf_Export"}}},
        {"odt", "writer8", ".odt", FormatDirection::Both, writer, {}},
        {"docx", "MS Word 2007 XML", ".docx", FormatDirection::Both, writer, {}},
        {"doc", "MS Word 97", ".doc", FormatDirection::Both, writer, {}},
        {"rtf", "Rich Text Format", ".rtf", FormatDirection::Both, writer, {}},
        {"txt", "Text (encoded)", ".txt", FormatDirection::Both, writer,
         {{calc, "Text - txt - csv (StarCalc)"}}},
        {"html", "HTML (StarWriter)", ".html", FormatDirection::Both, writer,
         {{calc, "HTML (StarCalc)"}, {impress, "impress_html_Export"}, {draw, "draw_html_Export"}}},
        {"epub", "EPUB", ".epub", FormatDirection::Export, writer, {}},
        {"ods", "calc8", ".ods", FormatDirection::Both, calc, {}},
        {"xlsx", "Calc MS Excel 2007 XML", ".xlsx", FormatDirection::Both, calc, {}},
        {"xls", "MS Excel 97", ".xls", FormatDirection::Both, calc, {}},
        {"csv", "Text - txt - csv (StarCalc)", ".csv", FormatDirection::Both, calc, {}},
        {"odp", "impress8", ".odp", FormatDirection::Both, impress, {}},
        {"pptx", "Impress MS PowerPoint 2007 XML", ".pptx", FormatDirection::Both, impress, {}},
        {"ppt", "MS PowerPoint 97", ".ppt", FormatDirection::Both, impress, {}},
        {"odg", "draw8", ".odg", FormatDirection::Both, draw, {}},
        {"png", "writer_png_Export", ".png", FormatDirection::Export, writer,
         {{calc, "calc_png_Export"}, {impress, "impress_png_Export"}, {draw, "draw_png_Export"}}},
        {"wpd", "WordPerfect", ".wpd", FormatDirection::Import, writer, {}}};
}

std::string normalize_name(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (!value.empty() && value.front() == '.') {
        value.erase(0, 1);
    }
    return value;
}

}  // namespace

FormatRegistry::FormatRegistry() : FormatRegistry(default_table()) {}

FormatRegistry::FormatRegistry(std::vector<FormatSpec> table)
    : table_(std::move(table)) {}

bool FormatRegistry::supports(const FormatSpec& spec, const FormatDirection direction) {
    return spec.direction == FormatDirection::Both || spec.direction == direction;
}

core::errors::Result<FormatSpec> FormatRegistry::resolve(
    const std::string& logical_name, const FormatDirection direction) const {
    const std::string wanted = normalize_name(logical_name);
    for (const auto& spec : table_) {
        if (spec.logical_name != wanted) {
            continue;
        }
        if (!supports(spec, direction)) {
            return GatewayError{ErrorKind::UnsupportedFormat,
                                "Format '" + wanted + "' does not support " +
                                    protocol::to_string(direction) + ".",
                                "unsupported_direction",
                                "Supported: " + protocol::to_string(spec.direction)};
        }
        return spec;
    }
    return GatewayError{ErrorKind::UnsupportedFormat,
                        "Unsupported format: " + logical_name, "unsupported_format"};
}

core::errors::Result<FormatSpec> FormatRegistry::resolve_extension(
    const std::filesystem::path& path) const {
    const std::string extension = path.extension().string();
    if (extension.empty()) {
        return GatewayError{ErrorKind::UnsupportedFormat,
                            "File has no extension: " + path.string(),
                            "unsupported_format"};
    }
    return resolve(extension, FormatDirection::Import);
}

FormatSpec FormatRegistry::native_format(const DocumentKind kind) const {
    std::string name = "odt";
    switch (kind) {
        case DocumentKind::Writer:
            name = "odt";
            break;
        case DocumentKind::Calc:
            name = "ods";
            break;
        case DocumentKind::Impress:
            name = "odp";
            break;
        case DocumentKind::Draw:
            name = "odg";
            break;
    }
    const auto resolved = resolve(name, FormatDirection::Export);
    if (core::errors::is_error(resolved)) {
        FormatSpec fallback;
        fallback.logical_name = name;
        fallback.file_extension = "." + name;
        fallback.family = kind;
        return fallback;
    }
    return core::errors::get_value(resolved);
}

DocumentKind FormatRegistry::family_of(const std::filesystem::path& source) const {
    const auto spec = resolve_extension(source);
    return core::errors::is_error(spec) ? DocumentKind::Writer
                                        : core::errors::get_value(spec).family;
}

std::string FormatRegistry::export_filter(const FormatSpec& target,
                                          const DocumentKind source_family) {
    if (target.family == source_family) {
        return target.engine_filter_id;
    }
    const auto it = target.family_filters.find(source_family);
    return it == target.family_filters.end() ? std::string() : it->second;
}

std::vector<std::string> FormatRegistry::names(const FormatDirection direction) const {
    std::vector<std::string> result;
    for (const auto& spec : table_) {
        if (supports(spec, direction)) {
            result.push_back(spec.logical_name);
        }
    }
    return result;
}

}  // namespace docgate::formats
