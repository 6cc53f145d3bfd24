#include "protocol/json_codec.hpp"

#include <ctime>

namespace docgate::protocol {

using nlohmann::json;

std::string format_timestamp(const TimePoint at) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(at);
    std::tm utc{};
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return "";
    }
    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

json error_to_json(const core::errors::GatewayError& error) {
    json payload;
    payload["type"] = core::errors::to_wire_type(error.kind);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

json entry_to_json(const SessionEntry& entry) {
    json payload;
    payload["handle"] = entry.handle;
    payload["doc_type"] = to_string(entry.kind);
    payload["created_at"] = format_timestamp(entry.created_at);
    payload["last_modified_at"] = format_timestamp(entry.last_modified_at);
    payload["last_accessed_at"] = format_timestamp(entry.last_accessed_at);
    payload["dirty"] = entry.dirty;
    return payload;
}

json text_to_json(const TextContent& text) {
    json payload;
    payload["content"] = text.content;
    payload["word_count"] = text.word_count;
    payload["char_count"] = text.char_count;
    return payload;
}

json conversion_to_json(const ConversionResult& result) {
    json payload;
    payload["source_path"] = result.source_path.string();
    payload["target_path"] = result.target_path.string();
    payload["source_format"] = result.source_format;
    payload["target_format"] = result.target_format;
    payload["state"] = to_string(result.state);
    payload["success"] = result.succeeded();
    payload["output_bytes"] = result.output_bytes;
    payload["duration_ms"] = result.duration_ms;
    if (result.error.has_value()) {
        payload["error"] = error_to_json(*result.error);
    }
    return payload;
}

json tool_result_to_json(const ToolCallResult& result) {
    json payload;
    payload["success"] = result.success;
    if (result.success) {
        payload["result"] = result.payload;
    } else if (result.error.has_value()) {
        payload["error"] = error_to_json(*result.error);
    }
    payload["request_id"] = result.request_id;
    payload["duration_ms"] = result.duration_ms;
    return payload;
}

core::errors::Result<std::optional<std::uint32_t>> read_timeout_ms(const json& envelope) {
    if (!envelope.is_object() || !envelope.contains("timeout_ms") ||
        envelope["timeout_ms"].is_null()) {
        return std::optional<std::uint32_t>();
    }
    const auto& value = envelope["timeout_ms"];
    if (value.is_number_unsigned()) {
        const auto ms = value.get<std::uint64_t>();
        if (ms >= 1 && ms <= kMaxTimeoutMs) {
            return std::optional<std::uint32_t>(static_cast<std::uint32_t>(ms));
        }
    } else if (value.is_number_integer() && value.get<std::int64_t>() > 0) {
        const auto ms = value.get<std::int64_t>();
        if (ms <= static_cast<std::int64_t>(kMaxTimeoutMs)) {
            return std::optional<std::uint32_t>(static_cast<std::uint32_t>(ms));
        }
    }
    return core::errors::GatewayError{
        core::errors::ErrorKind::Validation,
        "timeout_ms must be an integer between 1 and " + std::to_string(kMaxTimeoutMs) + ".",
        "invalid_timeout"};
}

}  // namespace docgate::protocol
