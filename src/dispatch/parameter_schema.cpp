#include "dispatch/parameter_schema.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace docgate::dispatch {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

GatewayError invalid(const ParameterSpec& spec, const std::string& expected) {
    return GatewayError{ErrorKind::Validation,
                        "Parameter '" + spec.name + "' must be " + expected + ".",
                        "invalid_parameter_type"};
}

constexpr std::int64_t kIntegerMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kIntegerMin = std::numeric_limits<std::int64_t>::min();

// Out-of-range digit strings saturate rather than fail; range checks apply afterwards.
std::optional<std::int64_t> parse_integer(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    if (errno == ERANGE) {
        return value < 0 ? kIntegerMin : kIntegerMax;
    }
    if (errno != 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

core::errors::Result<json> coerce_integer(const ParameterSpec& spec, const json& value) {
    std::optional<std::int64_t> parsed;
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        parsed = number > static_cast<std::uint64_t>(kIntegerMax)
                     ? kIntegerMax
                     : static_cast<std::int64_t>(number);
    } else if (value.is_number_integer()) {
        parsed = value.get<std::int64_t>();
    } else if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isfinite(number) && std::floor(number) == number) {
            // 2^63 is the first double past the int64 range.
            if (number >= 9223372036854775808.0) {
                parsed = kIntegerMax;
            } else if (number < -9223372036854775808.0) {
                parsed = kIntegerMin;
            } else {
                parsed = static_cast<std::int64_t>(number);
            }
        }
    } else if (value.is_string()) {
        parsed = parse_integer(value.get<std::string>());
    }
    if (!parsed) {
        return invalid(spec, "an integer");
    }
    if (spec.minimum && *parsed < *spec.minimum) {
        return GatewayError{ErrorKind::Validation,
                            "Parameter '" + spec.name + "' must be at least " +
                                std::to_string(*spec.minimum) + ".",
                            "parameter_out_of_range"};
    }
    if (spec.maximum && *parsed > *spec.maximum) {
        return GatewayError{ErrorKind::Validation,
                            "Parameter '" + spec.name + "' must be at most " +
                                std::to_string(*spec.maximum) + ".",
                            "parameter_out_of_range"};
    }
    return json(*parsed);
}

core::errors::Result<json> coerce_number(const ParameterSpec& spec, const json& value) {
    std::optional<double> parsed;
    if (value.is_number()) {
        parsed = value.get<double>();
    } else if (value.is_string()) {
        parsed = parse_number(value.get<std::string>());
    }
    if (!parsed) {
        return invalid(spec, "a number");
    }
    if ((spec.minimum && *parsed < static_cast<double>(*spec.minimum)) ||
        (spec.maximum && *parsed > static_cast<double>(*spec.maximum))) {
        return GatewayError{ErrorKind::Validation,
                            "Parameter '" + spec.name + "' is out of range.",
                            "parameter_out_of_range"};
    }
    return json(*parsed);
}

core::errors::Result<json> coerce_boolean(const ParameterSpec& spec, const json& value) {
    if (value.is_boolean()) {
        return value;
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text == "true") {
            return json(true);
        }
        if (text == "false") {
            return json(false);
        }
    }
    return invalid(spec, "a boolean");
}

core::errors::Result<json> coerce_string(const ParameterSpec& spec, const json& value) {
    if (!value.is_string()) {
        return invalid(spec, "a string");
    }
    if (!spec.enum_values.empty() &&
        std::find(spec.enum_values.begin(), spec.enum_values.end(),
                  value.get<std::string>()) == spec.enum_values.end()) {
        std::string allowed;
        for (const auto& option : spec.enum_values) {
            allowed += allowed.empty() ? option : ", " + option;
        }
        return GatewayError{ErrorKind::Validation,
                            "Parameter '" + spec.name + "' must be one of: " + allowed + ".",
                            "invalid_enum_value"};
    }
    return value;
}

core::errors::Result<json> coerce_string_array(const ParameterSpec& spec, const json& value) {
    if (!value.is_array()) {
        return invalid(spec, "an array of strings");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid(spec, "an array of strings");
        }
    }
    return value;
}

core::errors::Result<json> coerce(const ParameterSpec& spec, const json& value) {
    switch (spec.type) {
        case ParameterType::Integer:
            return coerce_integer(spec, value);
        case ParameterType::Number:
            return coerce_number(spec, value);
        case ParameterType::Boolean:
            return coerce_boolean(spec, value);
        case ParameterType::StringArray:
            return coerce_string_array(spec, value);
        case ParameterType::String:
        default:
            return coerce_string(spec, value);
    }
}

}  // namespace

core::errors::Result<json> validate_parameters(const CommandSpec& command, const json& raw) {
    if (!raw.is_null() && !raw.is_object()) {
        return GatewayError{ErrorKind::Validation,
                            "Parameters for '" + command.name + "' must be a JSON object.",
                            "invalid_parameters"};
    }

    json normalized = json::object();
    for (const auto& spec : command.parameters) {
        const bool present = raw.is_object() && raw.contains(spec.name) &&
                             !raw.at(spec.name).is_null();
        if (!present) {
            if (spec.required) {
                return GatewayError{ErrorKind::Validation,
                                    "Missing required parameter '" + spec.name + "'.",
                                    "missing_parameter"};
            }
            if (!spec.default_value.is_null()) {
                normalized[spec.name] = spec.default_value;
            }
            continue;
        }

        auto coerced = coerce(spec, raw.at(spec.name));
        if (core::errors::is_error(coerced)) {
            return core::errors::get_error(coerced);
        }
        normalized[spec.name] = core::errors::get_value(coerced);
    }
    return normalized;
}

json parameters_schema(const CommandSpec& command) {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    json required = json::array();

    for (const auto& spec : command.parameters) {
        json property;
        switch (spec.type) {
            case ParameterType::Integer:
                property["type"] = "integer";
                break;
            case ParameterType::Number:
                property["type"] = "number";
                break;
            case ParameterType::Boolean:
                property["type"] = "boolean";
                break;
            case ParameterType::StringArray:
                property["type"] = "array";
                property["items"] = {{"type", "string"}};
                break;
            case ParameterType::String:
            default:
                property["type"] = "string";
                break;
        }
        if (!spec.description.empty()) {
            property["description"] = spec.description;
        }
        if (!spec.enum_values.empty()) {
            property["enum"] = spec.enum_values;
        }
        if (!spec.default_value.is_null()) {
            property["default"] = spec.default_value;
        }
        if (spec.minimum) {
            property["minimum"] = *spec.minimum;
        }
        if (spec.maximum) {
            property["maximum"] = *spec.maximum;
        }
        schema["properties"][spec.name] = property;
        if (spec.required) {
            required.push_back(spec.name);
        }
    }
    schema["required"] = required;
    return schema;
}

}  // namespace docgate::dispatch
