#include "transport/stdio_transport.hpp"

#include <istream>
#include <ostream>
#include <utility>
#include "core/config/build_info.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace docgate::transport {

using nlohmann::json;

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

json error_response(const json& id, const int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json result_response(const json& id, json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

}  // namespace

StdioTransport::StdioTransport(dispatch::RequestDispatcher& dispatcher, std::istream& in,
                               std::ostream& out)
    : dispatcher_(dispatcher), in_(in), out_(out) {}

void StdioTransport::run() {
    LOG_INFO("stdio transport ready");
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        const auto response = handle_line(line);
        if (response.has_value()) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    LOG_INFO("stdio transport: input closed");
}

std::optional<json> StdioTransport::handle_line(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        LOG_WARN(std::string("stdio transport: unparseable message: ") + e.what());
        return error_response(nullptr, kParseError, std::string("Parse error: ") + e.what());
    }

    if (!message.is_object()) {
        return error_response(nullptr, kInvalidRequest, "Invalid Request - not an object");
    }
    const bool is_notification = !message.contains("id");
    try {
        json response = handle_request(message);
        if (is_notification) {
            return std::nullopt;
        }
        return response;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("stdio transport: ") + e.what());
        if (is_notification) {
            return std::nullopt;
        }
        return error_response(message["id"], kInternalError,
                              std::string("Internal error: ") + e.what());
    }
}

json StdioTransport::handle_request(const json& message) {
    const json id = message.contains("id") ? message["id"] : json(nullptr);
    if (message.value("jsonrpc", std::string()) != "2.0") {
        return error_response(id, kInvalidRequest, "Invalid Request - missing or invalid jsonrpc");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return error_response(id, kInvalidRequest, "Invalid Request - missing method");
    }

    const std::string method = message["method"].get<std::string>();
    const json params = message.value("params", json::object());

    if (method == "initialize") {
        return result_response(
            id, {{"protocolVersion", core::config::kProtocolVersion},
                 {"capabilities", {{"tools", json::object()}}},
                 {"serverInfo",
                  {{"name", core::config::kServerName},
                   {"version", core::config::kServerVersion}}}});
    }
    if (method == "tools/list") {
        json tools = json::array();
        for (const auto& tool : dispatcher_.list_tools()) {
            tools.push_back({{"name", tool["name"]},
                             {"description", tool["description"]},
                             {"inputSchema", tool["parameters"]}});
        }
        return result_response(id, {{"tools", tools}});
    }
    if (method == "tools/call") {
        return call_tool(id, params);
    }
    if (method == "ping") {
        return result_response(id, json::object());
    }
    if (method == "health") {
        return result_response(id, dispatcher_.health());
    }
    if (method.rfind("notifications/", 0) == 0) {
        LOG_DEBUG("stdio transport: notification " + method);
        return result_response(id, json::object());
    }
    return error_response(id, kMethodNotFound, "Method not found: " + method);
}

json StdioTransport::call_tool(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return error_response(id, kInvalidParams, "tools/call requires a string 'name'");
    }

    protocol::ToolCallRequest request;
    request.name = params["name"].get<std::string>();
    request.parameters = params.value("arguments", json::object());
    request.request_id = id;

    protocol::ToolCallResult result;
    auto timeout = protocol::read_timeout_ms(params);
    if (core::errors::is_error(timeout)) {
        LOG_INFO("stdio transport: rejected " + request.name + " [invalid_timeout]");
        result.request_id = id;
        result.error = core::errors::get_error(timeout);
    } else {
        request.timeout_ms = core::errors::get_value(timeout);
        result = dispatcher_.dispatch(request);
    }
    const json structured =
        result.success ? result.payload
                       : (result.error ? protocol::error_to_json(*result.error) : json::object());
    const json text_block = {{"type", "text"}, {"text", structured.dump()}};
    return result_response(
        id, {{"content", json::array({text_block})},
             {"isError", !result.success},
             {"structuredContent", structured}});
}

}  // namespace docgate::transport
