#pragma once

namespace docgate::core::config {

    inline constexpr const char* kServerName = "docgate";
    inline constexpr const char* kServerVersion = "0.3.0";

    // MCP revision announced during initialize
    inline constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace docgate::core::config
