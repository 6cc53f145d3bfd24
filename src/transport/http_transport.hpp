#pragma once

#include <memory>
#include <string>
#include "dispatch/request_dispatcher.hpp"
#include "protocol/tool_contract.hpp"

namespace httplib {
class Server;
}

namespace docgate::transport {

// REST binding over cpp-httplib:
//   GET  /tools           tool descriptors
//   POST /tools/{name}    body is the parameter object
//   POST /execute         {tool, parameters, timeout_ms?}
//   GET  /health
class HttpTransport {
public:
    explicit HttpTransport(dispatch::RequestDispatcher& dispatcher);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Blocks until stop() is called or the socket fails.
    bool listen(const std::string& host, int port);

    // Binds an ephemeral port and returns it, or -1. Serve with listen_after_bind().
    int bind_to_any_port(const std::string& host);
    bool listen_after_bind();

    void stop();
    bool running() const;

    static int status_for(const protocol::ToolCallResult& result);

private:
    void register_routes();

    dispatch::RequestDispatcher& dispatcher_;
    std::unique_ptr<httplib::Server> server_;
};

}  // namespace docgate::transport
