#include "bridge/remote_engine.hpp"

#include <httplib.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace docgate::bridge {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

GatewayError malformed_reply(const std::string& op, const std::string& detail) {
    return GatewayError{ErrorKind::Internal,
                        "Engine reply to " + op + " is malformed: " + detail,
                        "engine_protocol_error"};
}

ErrorKind kind_for_engine_code(const std::string& code) {
    if (code == "stale_handle") {
        return ErrorKind::StaleHandle;
    }
    if (code == "no_selection") {
        return ErrorKind::NoSelection;
    }
    if (code == "no_active_document") {
        return ErrorKind::NoActiveDocument;
    }
    if (code == "no_location") {
        return ErrorKind::Validation;
    }
    return ErrorKind::Internal;
}

core::errors::Result<protocol::DocumentKind> read_kind(const std::string& op,
                                                       const json& value) {
    if (!value.is_string()) {
        return malformed_reply(op, "kind is not a string");
    }
    const auto kind = protocol::parse_document_kind(value.get<std::string>());
    if (!kind) {
        return malformed_reply(op, "unknown document kind " + value.get<std::string>());
    }
    return *kind;
}

core::errors::Status as_status(const core::errors::Result<json>& reply) {
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return core::errors::ok();
}

}  // namespace

RemoteEngine::RemoteEngine(RemoteEngineSettings settings)
    : settings_(std::move(settings)),
      client_(std::make_unique<httplib::Client>(settings_.host, settings_.port)) {
    client_->set_connection_timeout(settings_.connect_timeout_ms / 1000,
                                    (settings_.connect_timeout_ms % 1000) * 1000);
    client_->set_read_timeout(settings_.read_timeout_ms / 1000,
                              (settings_.read_timeout_ms % 1000) * 1000);
    client_->set_write_timeout(settings_.read_timeout_ms / 1000,
                               (settings_.read_timeout_ms % 1000) * 1000);
}

RemoteEngine::~RemoteEngine() = default;

core::errors::Result<json> RemoteEngine::call(const std::string& op, const json& body) {
    auto res = client_->Post("/engine/" + op, body.dump(), "application/json");
    if (!res) {
        const std::string reason = httplib::to_string(res.error());
        LOG_WARN("RemoteEngine: " + op + " failed: " + reason);
        return GatewayError{ErrorKind::EngineUnreachable,
                            "Engine at " + settings_.host + ":" +
                                std::to_string(settings_.port) + " is unreachable: " + reason,
                            "engine_unreachable",
                            "Start the engine with the gateway add-in enabled."};
    }

    json reply;
    try {
        reply = json::parse(res->body);
    } catch (const json::parse_error& e) {
        return malformed_reply(op, std::string("HTTP ") + std::to_string(res->status) + ", " +
                                       e.what());
    }
    if (!reply.is_object() || !reply.contains("ok") || !reply["ok"].is_boolean()) {
        return malformed_reply(op, "missing ok flag");
    }

    if (!reply["ok"].get<bool>()) {
        const json error = reply.value("error", json::object());
        const std::string code =
            error.is_object() ? error.value("code", std::string("engine_error")) : "engine_error";
        const std::string message =
            error.is_object() ? error.value("message", std::string("Engine rejected " + op))
                              : "Engine rejected " + op;
        const ErrorKind kind = kind_for_engine_code(code);
        LOG_DEBUG("RemoteEngine: " + op + " rejected [" + code + "] " + message);
        return GatewayError{kind, message, kind == ErrorKind::Internal ? "engine_error" : code};
    }
    return reply.value("result", json::object());
}

core::errors::Result<std::string> RemoteEngine::create_document(
    const protocol::DocumentKind kind) {
    auto reply = call("create_document", {{"kind", protocol::to_string(kind)}});
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& result = core::errors::get_value(reply);
    if (!result.contains("handle") || !result["handle"].is_string()) {
        return malformed_reply("create_document", "missing handle");
    }
    return result["handle"].get<std::string>();
}

core::errors::Result<std::optional<std::string>> RemoteEngine::active_document() {
    auto reply = call("active_document", json::object());
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& result = core::errors::get_value(reply);
    if (!result.contains("handle") || result["handle"].is_null()) {
        return std::optional<std::string>{};
    }
    if (!result["handle"].is_string()) {
        return malformed_reply("active_document", "handle is not a string");
    }
    return std::optional<std::string>{result["handle"].get<std::string>()};
}

core::errors::Result<DocumentState> RemoteEngine::document_state(const std::string& handle) {
    auto reply = call("document_state", {{"handle", handle}});
    if (core::errors::is_error(reply)) {
        const auto& error = core::errors::get_error(reply);
        // The add-in may answer a dead handle either way.
        if (error.kind == ErrorKind::StaleHandle) {
            return DocumentState{};
        }
        return error;
    }
    const auto& result = core::errors::get_value(reply);

    DocumentState state;
    state.open = result.value("open", false);
    if (!state.open) {
        return state;
    }
    auto kind = read_kind("document_state", result.value("kind", json()));
    if (core::errors::is_error(kind)) {
        return core::errors::get_error(kind);
    }
    state.kind = core::errors::get_value(kind);
    state.modified = result.value("modified", false);
    return state;
}

core::errors::Result<std::string> RemoteEngine::get_text(const std::string& handle) {
    auto reply = call("get_text", {{"handle", handle}});
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& result = core::errors::get_value(reply);
    if (!result.contains("text") || !result["text"].is_string()) {
        return malformed_reply("get_text", "missing text");
    }
    return result["text"].get<std::string>();
}

core::errors::Status RemoteEngine::set_text(const std::string& handle,
                                            const std::string& text) {
    return as_status(call("set_text", {{"handle", handle}, {"text", text}}));
}

core::errors::Status RemoteEngine::insert_text(const std::string& handle,
                                               const std::size_t offset,
                                               const std::string& text) {
    return as_status(
        call("insert_text", {{"handle", handle}, {"offset", offset}, {"text", text}}));
}

core::errors::Result<bool> RemoteEngine::has_selection(const std::string& handle) {
    auto reply = call("has_selection", {{"handle", handle}});
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return core::errors::get_value(reply).value("selected", false);
}

core::errors::Status RemoteEngine::format_selection(const std::string& handle,
                                                    const protocol::TextFormat& format) {
    json body = {{"handle", handle}};
    if (format.bold) {
        body["bold"] = *format.bold;
    }
    if (format.italic) {
        body["italic"] = *format.italic;
    }
    if (format.underline) {
        body["underline"] = *format.underline;
    }
    if (format.font_name) {
        body["font_name"] = *format.font_name;
    }
    if (format.font_size) {
        body["font_size"] = *format.font_size;
    }
    return as_status(call("format_selection", body));
}

core::errors::Status RemoteEngine::store(const std::string& handle,
                                         const std::filesystem::path& path,
                                         const std::string& filter) {
    const json target = path.empty() ? json(nullptr) : json(path.string());
    return as_status(call("store", {{"handle", handle}, {"path", target}, {"filter", filter}}));
}

core::errors::Result<std::vector<protocol::EngineDocument>> RemoteEngine::list_documents() {
    auto reply = call("list_documents", json::object());
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& result = core::errors::get_value(reply);
    const json documents = result.value("documents", json::array());
    if (!documents.is_array()) {
        return malformed_reply("list_documents", "documents is not an array");
    }

    std::vector<protocol::EngineDocument> listed;
    for (const auto& item : documents) {
        if (!item.is_object() || !item.contains("handle") || !item["handle"].is_string()) {
            return malformed_reply("list_documents", "entry without handle");
        }
        auto kind = read_kind("list_documents", item.value("kind", json()));
        if (core::errors::is_error(kind)) {
            return core::errors::get_error(kind);
        }
        protocol::EngineDocument document;
        document.handle = item["handle"].get<std::string>();
        document.kind = core::errors::get_value(kind);
        document.modified = item.value("modified", false);
        listed.push_back(std::move(document));
    }
    return listed;
}

}  // namespace docgate::bridge
