#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "bridge/live_document_bridge.hpp"
#include "bridge/remote_engine.hpp"
#include "conversion/conversion_manager.hpp"
#include "core/config/build_info.hpp"
#include "core/errors/gateway_errors.hpp"
#include "core/logging/logger.hpp"
#include "dispatch/request_dispatcher.hpp"
#include "formats/format_registry.hpp"
#include "tools/document_tools.hpp"
#include "transport/http_transport.hpp"
#include "transport/stdio_transport.hpp"

int main(int argc, char* argv[]) {
    using docgate::app::CliCommand;
    using docgate::app::ServeMode;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = docgate::app::cli::parse_and_validate(argc, argv);
    if (docgate::core::errors::is_error(parsed)) {
        const auto& err = docgate::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = docgate::core::errors::get_value(parsed);

    // 2. Logger context is the serving mode
    auto& logger = docgate::core::logging::Logger::get();
    logger.set_min_level(config.log_level);
    logger.set_context(config.command == CliCommand::Tools
                           ? "tools"
                           : (config.mode == ServeMode::Http ? "http" : "stdio"));
    LOG_INFO(std::string(docgate::core::config::kServerName) + " " +
             docgate::core::config::kServerVersion + " starting in " +
             config.working_directory.string());

    // 3. Components, leaves first
    const docgate::formats::FormatRegistry formats;

    docgate::conversion::ConversionSettings conversion_settings;
    conversion_settings.engine_path = config.engine_path;
    conversion_settings.working_directory = config.working_directory;
    conversion_settings.max_concurrent_jobs = config.max_jobs;
    docgate::conversion::ConversionManager converter(conversion_settings, formats);

    auto executable = converter.engine_executable();
    if (docgate::core::errors::is_error(executable)) {
        LOG_WARN("Headless engine not found; conversion tools will fail: " +
                 docgate::core::errors::get_error(executable).message);
    } else {
        LOG_INFO("Headless engine: " + docgate::core::errors::get_value(executable).string());
    }

    docgate::tools::DocumentTools documents(converter, config.search_paths);

    docgate::bridge::RemoteEngineSettings engine_settings;
    engine_settings.host = config.engine_host;
    engine_settings.port = config.engine_port;
    engine_settings.read_timeout_ms = config.timeout_ms;
    docgate::bridge::LiveDocumentBridge bridge(
        std::make_unique<docgate::bridge::RemoteEngine>(engine_settings), formats);

    docgate::dispatch::CommandContext context{bridge, converter, documents, formats};
    docgate::dispatch::RequestDispatcher dispatcher(context, config.timeout_ms);

    if (config.command == CliCommand::Tools) {
        std::cout << dispatcher.list_tools().dump(2) << std::endl;
        return 0;
    }

    // 4. Serve until input ends or the server stops
    if (config.mode == ServeMode::Http) {
        docgate::transport::HttpTransport http(dispatcher);
        return http.listen(config.host, config.port) ? 0 : 1;
    }

    docgate::transport::StdioTransport stdio(dispatcher, std::cin, std::cout);
    stdio.run();
    LOG_INFO("Shutting down");
    return 0;
}
