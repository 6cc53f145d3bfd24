#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "dispatch/request_dispatcher.hpp"

namespace docgate::transport {

// JSON-RPC 2.0, one message per line. Requests are answered in arrival
// order; notifications (no "id") are processed but never answered.
class StdioTransport {
public:
    StdioTransport(dispatch::RequestDispatcher& dispatcher, std::istream& in,
                   std::ostream& out);

    // Reads until end of input.
    void run();

    // Response for one raw line, if it warrants one.
    std::optional<nlohmann::json> handle_line(const std::string& line);

private:
    nlohmann::json handle_request(const nlohmann::json& message);
    nlohmann::json call_tool(const nlohmann::json& id, const nlohmann::json& params);

    dispatch::RequestDispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace docgate::transport
