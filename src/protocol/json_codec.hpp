#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"
#include "protocol/conversion_contract.hpp"
#include "protocol/document_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace docgate::protocol {

// ISO-8601, UTC, second precision: "2024-05-01T09:30:00Z".
std::string format_timestamp(TimePoint at);

nlohmann::json error_to_json(const core::errors::GatewayError& error);
nlohmann::json entry_to_json(const SessionEntry& entry);
nlohmann::json text_to_json(const TextContent& text);
nlohmann::json conversion_to_json(const ConversionResult& result);

// Optional "timeout_ms" member of a request envelope. Absent or null gives
// nullopt; anything but an integer in 1..kMaxTimeoutMs is invalid_timeout.
core::errors::Result<std::optional<std::uint32_t>> read_timeout_ms(const nlohmann::json& envelope);

// {success, result | error, request_id, duration_ms}
nlohmann::json tool_result_to_json(const ToolCallResult& result);

}  // namespace docgate::protocol
