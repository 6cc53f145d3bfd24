#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"

namespace docgate::protocol {

    // Upper bound on any per-call or default timeout: one hour.
    constexpr std::uint32_t kMaxTimeoutMs = 3600000;

    // How a transport asks the dispatcher to do something
    struct ToolCallRequest {
        std::string name;                       // e.g. "insert_text_live", "convert_document"
        nlohmann::json parameters = nlohmann::json::object();
        nlohmann::json request_id;              // opaque, echoed back untouched
        std::optional<std::uint32_t> timeout_ms;
    };

    // How the dispatcher replies. Exactly one of payload / error is populated.
    struct ToolCallResult {
        nlohmann::json request_id;
        bool success = false;
        nlohmann::json payload;
        std::optional<core::errors::GatewayError> error;
        double duration_ms = 0.0;
    };

} // namespace docgate::protocol
