#include "dispatch/request_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "dispatch/parameter_schema.hpp"
#include "protocol/json_codec.hpp"

namespace docgate::dispatch {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

constexpr std::uint32_t kHealthCheckMs = 2000;

}  // namespace

RequestDispatcher::RequestDispatcher(CommandContext context,
                                     const std::uint32_t default_timeout_ms)
    : context_(context),
      default_timeout_ms_(default_timeout_ms),
      commands_(build_command_table(context.formats)) {}

const CommandSpec* RequestDispatcher::find(const std::string& name) const {
    for (const auto& command : commands_) {
        if (command.name == name) {
            return &command;
        }
    }
    return nullptr;
}

bool RequestDispatcher::has_tool(const std::string& name) const {
    return find(name) != nullptr;
}

protocol::ToolCallResult RequestDispatcher::dispatch(const protocol::ToolCallRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    protocol::ToolCallResult result;
    result.request_id = request.request_id;

    auto finish = [&result, &started](core::errors::Result<json> outcome) {
        if (core::errors::is_error(outcome)) {
            result.success = false;
            result.error = core::errors::get_error(outcome);
        } else {
            result.success = true;
            result.payload = core::errors::get_value(outcome);
        }
        result.duration_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        return result;
    };

    const CommandSpec* command = find(request.name);
    if (command == nullptr) {
        LOG_WARN("Dispatcher: unknown tool '" + request.name + "'");
        return finish(GatewayError{ErrorKind::Validation, "Unknown tool: " + request.name,
                                   "unknown_tool", "List the available tools first."});
    }

    auto params = validate_parameters(*command, request.parameters);
    if (core::errors::is_error(params)) {
        const auto& error = core::errors::get_error(params);
        LOG_INFO("Dispatcher: rejected " + request.name + " [" + error.code + "] " +
                 error.message);
        return finish(error);
    }

    if (request.timeout_ms.has_value() &&
        (*request.timeout_ms == 0 || *request.timeout_ms > protocol::kMaxTimeoutMs)) {
        return finish(GatewayError{ErrorKind::Validation,
                                   "timeout_ms must be between 1 and " +
                                       std::to_string(protocol::kMaxTimeoutMs) + ".",
                                   "invalid_timeout"});
    }
    const auto deadline =
        runtime::Deadline::after_ms(request.timeout_ms.value_or(default_timeout_ms_));

    LOG_DEBUG("Dispatcher: " + request.name + " -> " + to_string(command->target));
    core::errors::Result<json> outcome = json();
    try {
        outcome = command->handler(core::errors::get_value(params), deadline, context_);
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher: " + request.name + " raised: " + e.what());
        outcome = GatewayError{ErrorKind::Internal, request.name + " failed: " + e.what(),
                               "internal_error"};
    }

    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        LOG_INFO("Dispatcher: " + request.name + " failed [" + error.code + "] " +
                 error.message);
    }
    return finish(std::move(outcome));
}

json RequestDispatcher::list_tools() const {
    json tools = json::array();
    for (const auto& command : commands_) {
        tools.push_back({{"name", command.name},
                         {"description", command.description},
                         {"target", to_string(command.target)},
                         {"parameters", parameters_schema(command)}});
    }
    return tools;
}

json RequestDispatcher::health() {
    json payload;
    payload["status"] = "ok";

    const auto deadline = runtime::Deadline::after_ms(
        std::min(default_timeout_ms_, kHealthCheckMs));
    auto documents = context_.bridge.list_open_documents(deadline);
    if (core::errors::is_error(documents)) {
        payload["engine_reachable"] = false;
        payload["active_document_count"] = 0;
        payload["engine_error"] = protocol::error_to_json(core::errors::get_error(documents));
    } else {
        payload["engine_reachable"] = true;
        payload["active_document_count"] = core::errors::get_value(documents).size();
    }

    auto executable = context_.converter.engine_executable();
    payload["conversion_engine"] = core::errors::is_error(executable)
                                       ? json()
                                       : json(core::errors::get_value(executable).string());
    payload["tool_count"] = commands_.size();
    return payload;
}

}  // namespace docgate::dispatch
