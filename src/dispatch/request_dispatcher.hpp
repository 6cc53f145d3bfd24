#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "dispatch/command_table.hpp"
#include "protocol/tool_contract.hpp"

namespace docgate::dispatch {

// Entry point for every tool call regardless of transport. Holds no state
// besides the command table, so concurrent dispatch calls are safe as long
// as the components in the context are.
class RequestDispatcher {
public:
    RequestDispatcher(CommandContext context, std::uint32_t default_timeout_ms);

    protocol::ToolCallResult dispatch(const protocol::ToolCallRequest& request);

    // [{name, description, target, parameters}] with parameters as JSON Schema.
    nlohmann::json list_tools() const;

    // {status, engine_reachable, active_document_count, conversion_engine}
    nlohmann::json health();

    bool has_tool(const std::string& name) const;

    std::uint32_t default_timeout_ms() const { return default_timeout_ms_; }

private:
    const CommandSpec* find(const std::string& name) const;

    CommandContext context_;
    std::uint32_t default_timeout_ms_;
    std::vector<CommandSpec> commands_;
};

}  // namespace docgate::dispatch
