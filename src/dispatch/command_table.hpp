#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bridge/live_document_bridge.hpp"
#include "conversion/conversion_manager.hpp"
#include "core/errors/gateway_errors.hpp"
#include "formats/format_registry.hpp"
#include "runtime/deadline.hpp"
#include "tools/document_tools.hpp"

namespace docgate::dispatch {

enum class ParameterType {
    String,
    Integer,
    Number,
    Boolean,
    StringArray
};

struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::String;
    bool required = false;
    std::string description;
    std::vector<std::string> enum_values;
    nlohmann::json default_value;  // null when there is none
    std::optional<std::int64_t> minimum;
    std::optional<std::int64_t> maximum;
};

enum class CommandTarget {
    Bridge,
    Converter,
    Local
};

// Components a handler may reach. Owned by the caller of the dispatcher.
struct CommandContext {
    bridge::LiveDocumentBridge& bridge;
    conversion::ConversionManager& converter;
    tools::DocumentTools& documents;
    const formats::FormatRegistry& formats;
};

// Handlers receive parameters already validated, coerced and defaulted.
using CommandHandler = std::function<core::errors::Result<nlohmann::json>(
    const nlohmann::json& params, const runtime::Deadline& deadline, CommandContext& context)>;

struct CommandSpec {
    std::string name;
    std::string description;
    CommandTarget target = CommandTarget::Local;
    std::vector<ParameterSpec> parameters;
    CommandHandler handler;
};

std::string to_string(ParameterType type);
std::string to_string(CommandTarget target);

// The fixed tool surface. Built once at startup.
std::vector<CommandSpec> build_command_table(const formats::FormatRegistry& formats);

}  // namespace docgate::dispatch
