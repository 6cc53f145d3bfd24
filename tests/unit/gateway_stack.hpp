#pragma once

#include <memory>
#include <vector>
#include "bridge/live_document_bridge.hpp"
#include "conversion/conversion_manager.hpp"
#include "dispatch/request_dispatcher.hpp"
#include "formats/format_registry.hpp"
#include "test_support.hpp"
#include "tools/document_tools.hpp"

namespace docgate::testing {

// Full dispatcher wiring over the fake live engine and the mock converter.
class GatewayStack {
public:
    explicit GatewayStack(const std::uint32_t default_timeout_ms = 5000) {
        conversion::ConversionSettings settings;
        settings.engine_path = install_mock_engine(workspace.root()).string();
        settings.working_directory = workspace.root();
        converter = std::make_unique<conversion::ConversionManager>(settings, formats);
        documents = std::make_unique<tools::DocumentTools>(
            *converter, std::vector<std::filesystem::path>{workspace.root()});

        auto fake = std::make_unique<FakeEngine>();
        engine = fake.get();
        bridge = std::make_unique<bridge::LiveDocumentBridge>(std::move(fake), formats);

        dispatcher = std::make_unique<dispatch::RequestDispatcher>(
            dispatch::CommandContext{*bridge, *converter, *documents, formats},
            default_timeout_ms);
    }

    ~GatewayStack() { engine->release(); }

    protocol::ToolCallResult call(const std::string& name,
                                  const nlohmann::json& parameters = nlohmann::json::object()) {
        protocol::ToolCallRequest request;
        request.name = name;
        request.parameters = parameters;
        return dispatcher->dispatch(request);
    }

    TempWorkspace workspace;
    formats::FormatRegistry formats;
    std::unique_ptr<conversion::ConversionManager> converter;
    std::unique_ptr<tools::DocumentTools> documents;
    FakeEngine* engine = nullptr;
    std::unique_ptr<bridge::LiveDocumentBridge> bridge;
    std::unique_ptr<dispatch::RequestDispatcher> dispatcher;
};

}  // namespace docgate::testing
