#pragma once
#include "app/gateway_config.hpp"
#include "core/errors/gateway_errors.hpp"

namespace docgate::app::cli {
    docgate::core::errors::Result<docgate::app::GatewayConfig> parse_and_validate(int argc, char* argv[]);
}
