#include "transport/http_transport.hpp"

#include <httplib.h>
#include <exception>
#include <nlohmann/json.hpp>
#include "core/config/unique_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace docgate::transport {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using nlohmann::json;

namespace {

constexpr const char* kJson = "application/json";

void reply(httplib::Response& res, const int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), kJson);
}

void reply_error(httplib::Response& res, const int status, const GatewayError& error,
                 const std::string& request_id) {
    reply(res, status,
          {{"success", false},
           {"error", protocol::error_to_json(error)},
           {"request_id", request_id}});
}

}  // namespace

HttpTransport::HttpTransport(dispatch::RequestDispatcher& dispatcher)
    : dispatcher_(dispatcher), server_(std::make_unique<httplib::Server>()) {
    register_routes();
}

HttpTransport::~HttpTransport() {
    stop();
}

int HttpTransport::status_for(const protocol::ToolCallResult& result) {
    if (result.success || !result.error.has_value()) {
        return 200;
    }
    if (result.error->code == "unknown_tool") {
        return 404;
    }
    if (result.error->kind == ErrorKind::Validation) {
        return 400;
    }
    return 200;
}

void HttpTransport::register_routes() {
    server_->set_exception_handler(
        [](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
            std::string message = "unknown exception";
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    message = e.what();
                }
            }
            LOG_ERROR("http transport: " + message);
            reply_error(res, 500,
                        GatewayError{ErrorKind::Internal, message, "internal_error"}, "");
        });

    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        const GatewayError error{ErrorKind::Validation,
                                 "No route for " + req.method + " " + req.path,
                                 res.status == 404 ? "route_not_found" : "bad_request"};
        reply_error(res, res.status, error, "");
    });

    server_->Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, {{"tools", dispatcher_.list_tools()}});
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, 200, dispatcher_.health());
    });

    server_->Post(R"(/tools/([A-Za-z0-9_]+))",
                  [this](const httplib::Request& req, httplib::Response& res) {
                      protocol::ToolCallRequest request;
                      request.name = req.matches[1].str();
                      request.request_id = core::config::generate_id("req");
                      if (!req.body.empty()) {
                          try {
                              request.parameters = json::parse(req.body);
                          } catch (const json::parse_error& e) {
                              reply_error(res, 400,
                                          GatewayError{ErrorKind::Validation,
                                                       std::string("Malformed JSON body: ") +
                                                           e.what(),
                                                       "malformed_json"},
                                          request.request_id.get<std::string>());
                              return;
                          }
                      }
                      const auto result = dispatcher_.dispatch(request);
                      reply(res, status_for(result), protocol::tool_result_to_json(result));
                  });

    server_->Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string request_id = core::config::generate_id("req");
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            reply_error(res, 400,
                        GatewayError{ErrorKind::Validation,
                                     std::string("Malformed JSON body: ") + e.what(),
                                     "malformed_json"},
                        request_id);
            return;
        }
        if (!body.is_object() || !body.contains("tool") || !body["tool"].is_string()) {
            reply_error(res, 400,
                        GatewayError{ErrorKind::Validation,
                                     "Body must be an object with a string 'tool'.",
                                     "invalid_request"},
                        request_id);
            return;
        }

        protocol::ToolCallRequest request;
        request.name = body["tool"].get<std::string>();
        request.parameters = body.value("parameters", json::object());
        request.request_id = body.value("request_id", json(request_id));
        auto timeout = protocol::read_timeout_ms(body);
        if (core::errors::is_error(timeout)) {
            reply_error(res, 400, core::errors::get_error(timeout), request_id);
            return;
        }
        request.timeout_ms = core::errors::get_value(timeout);

        const auto result = dispatcher_.dispatch(request);
        reply(res, status_for(result), protocol::tool_result_to_json(result));
    });
}

bool HttpTransport::listen(const std::string& host, const int port) {
    LOG_INFO("http transport listening on " + host + ":" + std::to_string(port));
    const bool ok = server_->listen(host, port);
    if (!ok) {
        LOG_ERROR("http transport could not listen on " + host + ":" + std::to_string(port));
    }
    return ok;
}

int HttpTransport::bind_to_any_port(const std::string& host) {
    return server_->bind_to_any_port(host);
}

bool HttpTransport::listen_after_bind() {
    return server_->listen_after_bind();
}

void HttpTransport::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

bool HttpTransport::running() const {
    return server_ && server_->is_running();
}

}  // namespace docgate::transport
