#include "dispatch/command_table.hpp"

#include <utility>
#include "protocol/json_codec.hpp"
#include "text/text_stats.hpp"

namespace docgate::dispatch {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using nlohmann::json;
using protocol::FormatDirection;

namespace {

std::string string_param(const json& params, const std::string& name) {
    return params.value(name, std::string());
}

std::optional<std::string> optional_string(const json& params, const std::string& name) {
    if (!params.contains(name)) {
        return std::nullopt;
    }
    return params.at(name).get<std::string>();
}

std::vector<std::string> string_list(const json& params, const std::string& name) {
    if (!params.contains(name)) {
        return {};
    }
    return params.at(name).get<std::vector<std::string>>();
}

// Lifts a typed result into a JSON payload.
template <typename T, typename Encode>
core::errors::Result<json> encode(const core::errors::Result<T>& result, Encode&& to_payload) {
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return to_payload(core::errors::get_value(result));
}

json file_info_to_json(const tools::DocumentFileInfo& info) {
    json payload;
    payload["path"] = info.path.string();
    payload["filename"] = info.filename;
    payload["format"] = info.format;
    payload["size_bytes"] = info.size_bytes;
    payload["modified_time"] = protocol::format_timestamp(info.modified_time);
    payload["exists"] = info.exists;
    return payload;
}

json statistics_to_json(const tools::DocumentStatistics& stats) {
    json payload;
    payload["file_info"] = file_info_to_json(stats.file);
    if (stats.content.has_value()) {
        const auto& content = *stats.content;
        payload["content_stats"] = {
            {"word_count", content.word_count},
            {"character_count", content.char_count},
            {"line_count", content.line_count},
            {"paragraph_count", content.paragraph_count},
            {"sentence_count", content.sentence_count},
            {"average_words_per_sentence", content.average_words_per_sentence},
            {"average_chars_per_word", content.average_chars_per_word}};
    }
    if (stats.content_error.has_value()) {
        payload["error"] = protocol::error_to_json(*stats.content_error);
    }
    return payload;
}

json search_to_json(const std::string& query, const tools::SearchOutcome& outcome) {
    json results = json::array();
    for (const auto& hit : outcome.hits) {
        results.push_back({{"path", hit.path.string()},
                           {"filename", hit.filename},
                           {"format", hit.format},
                           {"word_count", hit.word_count},
                           {"match_context", hit.match_context}});
    }
    json payload;
    payload["query"] = query;
    payload["results"] = results;
    payload["count"] = outcome.hits.size();
    payload["scanned"] = outcome.scanned;
    payload["truncated"] = outcome.truncated;
    return payload;
}

json document_payload(const protocol::SessionEntry& entry) {
    return json{{"document", protocol::entry_to_json(entry)}};
}

ParameterSpec handle_parameter() {
    ParameterSpec spec;
    spec.name = "handle";
    spec.description = "Document handle; the active document when omitted";
    return spec;
}

ParameterSpec string_parameter(std::string name, std::string description,
                               const bool required = true) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.description = std::move(description);
    spec.required = required;
    return spec;
}

ParameterSpec boolean_parameter(std::string name, std::string description) {
    ParameterSpec spec;
    spec.name = std::move(name);
    spec.type = ParameterType::Boolean;
    spec.description = std::move(description);
    return spec;
}

core::errors::Result<protocol::InsertPosition> insert_position(const json& params) {
    const std::string position = string_param(params, "position");
    if (position == "start") {
        return protocol::InsertPosition{protocol::InsertAtStart{}};
    }
    if (position == "replace") {
        return protocol::InsertPosition{protocol::ReplaceAll{}};
    }
    if (position == "offset") {
        if (!params.contains("offset")) {
            return GatewayError{ErrorKind::Validation,
                                "Parameter 'offset' is required when position is 'offset'.",
                                "missing_parameter"};
        }
        return protocol::InsertPosition{
            protocol::InsertAtOffset{params.at("offset").get<std::int64_t>()}};
    }
    return protocol::InsertPosition{protocol::InsertAtEnd{}};
}

std::vector<CommandSpec> live_commands(const formats::FormatRegistry& formats) {
    std::vector<CommandSpec> commands;

    {
        CommandSpec command;
        command.name = "create_document_live";
        command.description = "Create a new document in the running engine";
        command.target = CommandTarget::Bridge;
        ParameterSpec doc_type = string_parameter("doc_type", "Type of document to create", false);
        doc_type.enum_values = protocol::document_kind_names();
        doc_type.default_value = "writer";
        command.parameters = {doc_type};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) -> core::errors::Result<json> {
            const std::string doc_type = string_param(params, "doc_type");
            const auto kind = protocol::parse_document_kind(doc_type);
            if (!kind) {
                return GatewayError{ErrorKind::Validation, "Unknown doc_type: " + doc_type,
                                    "invalid_enum_value"};
            }
            return encode(context.bridge.create_document(*kind, deadline),
                          [&doc_type](const protocol::SessionEntry& entry) {
                              json payload = document_payload(entry);
                              payload["message"] = "Created new " + doc_type + " document";
                              return payload;
                          });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "get_active_document";
        command.description = "Describe the document that currently has focus";
        command.target = CommandTarget::Bridge;
        command.handler = [](const json&, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.bridge.get_active_document(deadline), document_payload);
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "insert_text_live";
        command.description = "Insert text into a live writer document";
        command.target = CommandTarget::Bridge;
        ParameterSpec position = string_parameter("position", "Where to insert", false);
        position.enum_values = {"start", "end", "replace", "offset"};
        position.default_value = "end";
        ParameterSpec offset;
        offset.name = "offset";
        offset.type = ParameterType::Integer;
        offset.description = "Character offset, used when position is 'offset'";
        command.parameters = {string_parameter("text", "Text to insert"), handle_parameter(),
                              position, offset};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) -> core::errors::Result<json> {
            auto position = insert_position(params);
            if (core::errors::is_error(position)) {
                return core::errors::get_error(position);
            }
            return encode(
                context.bridge.insert_text(string_param(params, "handle"),
                                           string_param(params, "text"),
                                           core::errors::get_value(position), deadline),
                [](const protocol::InsertOutcome& outcome) {
                    json payload = document_payload(outcome.entry);
                    payload["applied_offset"] = outcome.applied_offset;
                    payload["inserted_chars"] = outcome.inserted_chars;
                    return payload;
                });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "get_text_content_live";
        command.description = "Read the full text of a live document";
        command.target = CommandTarget::Bridge;
        command.parameters = {handle_parameter()};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.bridge.read_text(string_param(params, "handle"), deadline),
                          protocol::text_to_json);
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "format_text_live";
        command.description = "Apply character formatting to the current selection";
        command.target = CommandTarget::Bridge;
        ParameterSpec font_size;
        font_size.name = "font_size";
        font_size.type = ParameterType::Number;
        font_size.description = "Font size in points";
        font_size.minimum = 1;
        font_size.maximum = 999;
        command.parameters = {handle_parameter(),
                              boolean_parameter("bold", "Apply bold formatting"),
                              boolean_parameter("italic", "Apply italic formatting"),
                              boolean_parameter("underline", "Apply underline formatting"),
                              string_parameter("font_name", "Font family name", false),
                              font_size};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            protocol::TextFormat format;
            json applied = json::object();
            if (params.contains("bold")) {
                format.bold = params.at("bold").get<bool>();
                applied["bold"] = *format.bold;
            }
            if (params.contains("italic")) {
                format.italic = params.at("italic").get<bool>();
                applied["italic"] = *format.italic;
            }
            if (params.contains("underline")) {
                format.underline = params.at("underline").get<bool>();
                applied["underline"] = *format.underline;
            }
            if (params.contains("font_name")) {
                format.font_name = params.at("font_name").get<std::string>();
                applied["font_name"] = *format.font_name;
            }
            if (params.contains("font_size")) {
                format.font_size = params.at("font_size").get<double>();
                applied["font_size"] = *format.font_size;
            }
            return encode(context.bridge.format_selection(string_param(params, "handle"),
                                                          format, deadline),
                          [&applied](const protocol::SessionEntry& entry) {
                              json payload = document_payload(entry);
                              payload["applied"] = applied;
                              return payload;
                          });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "save_document_live";
        command.description = "Save a live document, in place or to a new path";
        command.target = CommandTarget::Bridge;
        command.parameters = {
            handle_parameter(),
            string_parameter("file_path",
                             "Path to save the document to; its current location when omitted",
                             false)};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) -> core::errors::Result<json> {
            if (!params.contains("file_path")) {
                return encode(context.bridge.save(string_param(params, "handle"), deadline),
                              [](const protocol::SessionEntry& entry) {
                                  json payload = document_payload(entry);
                                  payload["saved_in_place"] = true;
                                  return payload;
                              });
            }
            auto path = context.converter.paths().resolve(string_param(params, "file_path"),
                                                          "file_path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            const auto target = core::errors::get_value(path);
            auto writable = context.converter.paths().prepare_writable_directory(
                target.parent_path());
            if (core::errors::is_error(writable)) {
                return core::errors::get_error(writable);
            }
            return encode(
                context.bridge.save_as(string_param(params, "handle"), target, deadline),
                [&target](const protocol::SessionEntry& entry) {
                    json payload = document_payload(entry);
                    payload["file_path"] = target.string();
                    payload["saved_in_place"] = false;
                    return payload;
                });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "export_document_live";
        command.description = "Export a live document to another format";
        command.target = CommandTarget::Bridge;
        ParameterSpec export_format = string_parameter("export_format", "Format to export to");
        export_format.enum_values = formats.names(FormatDirection::Export);
        command.parameters = {handle_parameter(), export_format,
                              string_parameter("file_path", "Path to export the document to")};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) -> core::errors::Result<json> {
            auto path = context.converter.paths().resolve(string_param(params, "file_path"),
                                                          "file_path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            const auto target = core::errors::get_value(path);
            auto writable = context.converter.paths().prepare_writable_directory(
                target.parent_path());
            if (core::errors::is_error(writable)) {
                return core::errors::get_error(writable);
            }
            const std::string format = string_param(params, "export_format");
            return encode(context.bridge.export_document(string_param(params, "handle"), target,
                                                         format, deadline),
                          [&target, &format](const protocol::SessionEntry& entry) {
                              json payload = document_payload(entry);
                              payload["file_path"] = target.string();
                              payload["export_format"] = format;
                              return payload;
                          });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "get_document_info_live";
        command.description = "Session state and text statistics of a live document";
        command.target = CommandTarget::Bridge;
        command.parameters = {handle_parameter()};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(
                context.bridge.document_info(string_param(params, "handle"), deadline),
                [](const protocol::LiveDocumentInfo& info) {
                    json payload = document_payload(info.entry);
                    payload["word_count"] = info.text.word_count;
                    payload["char_count"] = info.text.char_count;
                    payload["has_selection"] = info.has_selection;
                    return payload;
                });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "list_open_documents";
        command.description = "List every document open in the running engine";
        command.target = CommandTarget::Bridge;
        command.handler = [](const json&, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.bridge.list_open_documents(deadline),
                          [](const std::vector<protocol::SessionEntry>& entries) {
                              json documents = json::array();
                              for (const auto& entry : entries) {
                                  documents.push_back(protocol::entry_to_json(entry));
                              }
                              return json{{"documents", documents},
                                          {"count", entries.size()}};
                          });
        };
        commands.push_back(std::move(command));
    }
    return commands;
}

std::vector<CommandSpec> file_commands(const formats::FormatRegistry& formats) {
    std::vector<CommandSpec> commands;

    {
        CommandSpec command;
        command.name = "convert_document";
        command.description = "Convert a document file to another format";
        command.target = CommandTarget::Converter;
        ParameterSpec target_format = string_parameter("target_format", "Target format");
        target_format.enum_values = formats.names(FormatDirection::Export);
        command.parameters = {string_parameter("source_path", "Document to convert"),
                              string_parameter("target_path", "Where to write the result"),
                              target_format};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.converter.convert(string_param(params, "source_path"),
                                                    string_param(params, "target_path"),
                                                    string_param(params, "target_format"),
                                                    deadline),
                          protocol::conversion_to_json);
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "batch_convert_documents";
        command.description = "Convert every matching document below a directory";
        command.target = CommandTarget::Converter;
        ParameterSpec target_format = string_parameter("target_format", "Target format");
        target_format.enum_values = formats.names(FormatDirection::Export);
        ParameterSpec extensions;
        extensions.name = "source_extensions";
        extensions.type = ParameterType::StringArray;
        extensions.description = "Source file extensions to convert";
        extensions.default_value = conversion::ConversionManager::default_batch_extensions();
        command.parameters = {string_parameter("source_dir", "Directory to scan"),
                              string_parameter("target_dir", "Directory for converted files"),
                              target_format, extensions};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(
                context.converter.batch_convert(string_param(params, "source_dir"),
                                                string_param(params, "target_dir"),
                                                string_param(params, "target_format"),
                                                string_list(params, "source_extensions"),
                                                deadline),
                [](const std::vector<protocol::ConversionResult>& results) {
                    json items = json::array();
                    std::size_t succeeded = 0;
                    for (const auto& result : results) {
                        items.push_back(protocol::conversion_to_json(result));
                        if (result.succeeded()) {
                            ++succeeded;
                        }
                    }
                    return json{{"results", items},
                                {"total", results.size()},
                                {"succeeded", succeeded},
                                {"failed", results.size() - succeeded}};
                });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "read_document_text";
        command.description = "Extract the plain text of a document file";
        command.target = CommandTarget::Converter;
        command.parameters = {string_parameter("path", "Document to read")};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.documents.read_text(string_param(params, "path"), deadline),
                          protocol::text_to_json);
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "get_document_statistics";
        command.description = "Word, sentence and paragraph statistics of a document file";
        command.target = CommandTarget::Converter;
        command.parameters = {string_parameter("path", "Document to analyze")};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.documents.statistics(string_param(params, "path"), deadline),
                          statistics_to_json);
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "read_spreadsheet_data";
        command.description = "Read the first rows of a spreadsheet file";
        command.target = CommandTarget::Converter;
        ParameterSpec max_rows;
        max_rows.name = "max_rows";
        max_rows.type = ParameterType::Integer;
        max_rows.description = "Maximum number of rows to read";
        max_rows.default_value = 100;
        max_rows.minimum = 1;
        max_rows.maximum = 100000;
        command.parameters = {string_parameter("path", "Spreadsheet to read"),
                              string_parameter("sheet_name", "Sheet label to report", false),
                              max_rows};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(
                context.documents.read_spreadsheet(
                    string_param(params, "path"), optional_string(params, "sheet_name"),
                    params.at("max_rows").get<std::size_t>(), deadline),
                [](const tools::SpreadsheetData& data) {
                    return json{{"sheet_name", data.sheet_name},
                                {"data", data.rows},
                                {"row_count", data.row_count},
                                {"col_count", data.col_count}};
                });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "search_documents";
        command.description = "Find documents whose text contains a phrase";
        command.target = CommandTarget::Converter;
        command.parameters = {
            string_parameter("query", "Text to search for"),
            string_parameter("search_path",
                             "Directory to search; the configured search paths when omitted",
                             false)};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            const std::string query = string_param(params, "query");
            return encode(context.documents.search(query, optional_string(params, "search_path"),
                                                   deadline),
                          [&query](const tools::SearchOutcome& outcome) {
                              return search_to_json(query, outcome);
                          });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "merge_text_documents";
        command.description = "Concatenate the text of several documents into a new one";
        command.target = CommandTarget::Converter;
        ParameterSpec paths;
        paths.name = "document_paths";
        paths.type = ParameterType::StringArray;
        paths.required = true;
        paths.description = "Documents to merge, in order";
        ParameterSpec separator = string_parameter("separator", "Text between documents", false);
        separator.default_value = "\n\n---\n\n";
        command.parameters = {paths,
                              string_parameter("output_path", "Where to write the merge"),
                              separator};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) {
            return encode(context.documents.merge(string_list(params, "document_paths"),
                                                  string_param(params, "output_path"),
                                                  string_param(params, "separator"), deadline),
                          file_info_to_json);
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "create_document";
        command.description = "Create a new document file, optionally with initial content";
        command.target = CommandTarget::Converter;
        ParameterSpec doc_type = string_parameter("doc_type", "Type of document to create", false);
        doc_type.enum_values = protocol::document_kind_names();
        doc_type.default_value = "writer";
        ParameterSpec content = string_parameter(
            "content", "Initial text; comma separated rows for calc documents", false);
        content.default_value = "";
        command.parameters = {
            string_parameter("path", "Where to create the document; the extension is added "
                                     "when missing"),
            doc_type, content};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) -> core::errors::Result<json> {
            const std::string doc_type = string_param(params, "doc_type");
            const auto kind = protocol::parse_document_kind(doc_type);
            if (!kind) {
                return GatewayError{ErrorKind::Validation, "Unknown doc_type: " + doc_type,
                                    "invalid_enum_value"};
            }
            return encode(context.documents.create_document(string_param(params, "path"), *kind,
                                                            string_param(params, "content"),
                                                            deadline),
                          [&doc_type](const tools::DocumentFileInfo& info) {
                              json payload = file_info_to_json(info);
                              payload["doc_type"] = doc_type;
                              return payload;
                          });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "insert_text_at_position";
        command.description = "Insert text into a text document file and save it in place";
        command.target = CommandTarget::Converter;
        ParameterSpec position = string_parameter("position", "Where to insert", false);
        position.enum_values = {"start", "end", "replace", "offset"};
        position.default_value = "end";
        ParameterSpec offset;
        offset.name = "offset";
        offset.type = ParameterType::Integer;
        offset.description = "Character offset, used when position is 'offset'";
        command.parameters = {string_parameter("path", "Document to edit"),
                              string_parameter("text", "Text to insert"), position, offset};
        command.handler = [](const json& params, const runtime::Deadline& deadline,
                             CommandContext& context) -> core::errors::Result<json> {
            auto position = insert_position(params);
            if (core::errors::is_error(position)) {
                return core::errors::get_error(position);
            }
            const std::string text = string_param(params, "text");
            return encode(context.documents.insert_text(string_param(params, "path"), text,
                                                        core::errors::get_value(position),
                                                        deadline),
                          [&params, &text](const tools::DocumentFileInfo& info) {
                              json payload = file_info_to_json(info);
                              payload["position"] = params.at("position");
                              payload["inserted_chars"] = text::count_code_points(text);
                              return payload;
                          });
        };
        commands.push_back(std::move(command));
    }
    {
        CommandSpec command;
        command.name = "get_document_info";
        command.description = "File metadata of a document";
        command.target = CommandTarget::Local;
        command.parameters = {string_parameter("path", "Document to describe")};
        command.handler = [](const json& params, const runtime::Deadline&,
                             CommandContext& context) {
            return encode(context.documents.file_info(string_param(params, "path")),
                          file_info_to_json);
        };
        commands.push_back(std::move(command));
    }
    return commands;
}

}  // namespace

std::string to_string(const ParameterType type) {
    switch (type) {
        case ParameterType::String:
            return "string";
        case ParameterType::Integer:
            return "integer";
        case ParameterType::Number:
            return "number";
        case ParameterType::Boolean:
            return "boolean";
        case ParameterType::StringArray:
            return "array";
        default:
            return "unknown";
    }
}

std::string to_string(const CommandTarget target) {
    switch (target) {
        case CommandTarget::Bridge:
            return "bridge";
        case CommandTarget::Converter:
            return "converter";
        case CommandTarget::Local:
            return "local";
        default:
            return "unknown";
    }
}

std::vector<CommandSpec> build_command_table(const formats::FormatRegistry& formats) {
    auto commands = live_commands(formats);
    auto files = file_commands(formats);
    for (auto& command : files) {
        commands.push_back(std::move(command));
    }
    return commands;
}

}  // namespace docgate::dispatch
