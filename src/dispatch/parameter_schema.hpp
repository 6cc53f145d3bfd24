#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/gateway_errors.hpp"
#include "dispatch/command_table.hpp"

namespace docgate::dispatch {

// Checks `raw` against the command's parameters and returns a normalized
// object: every declared parameter coerced to its type, defaults filled in,
// unknown keys dropped. Absent optional parameters without a default stay absent.
core::errors::Result<nlohmann::json> validate_parameters(const CommandSpec& command,
                                                         const nlohmann::json& raw);

// JSON Schema (draft 7 subset) describing the command's parameters.
nlohmann::json parameters_schema(const CommandSpec& command);

}  // namespace docgate::dispatch
