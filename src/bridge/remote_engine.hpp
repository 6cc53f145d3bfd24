#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "bridge/engine_connection.hpp"

namespace httplib {
class Client;
}

namespace docgate::bridge {

struct RemoteEngineSettings {
    std::string host = "127.0.0.1";
    int port = 8765;
    std::uint32_t connect_timeout_ms = 2000;
    std::uint32_t read_timeout_ms = 30000;
};

// EngineConnection backed by the add-in running inside the engine process.
// Each primitive is one POST /engine/<op> round trip.
class RemoteEngine : public EngineConnection {
public:
    explicit RemoteEngine(RemoteEngineSettings settings);
    ~RemoteEngine() override;

    core::errors::Result<std::string> create_document(protocol::DocumentKind kind) override;
    core::errors::Result<std::optional<std::string>> active_document() override;
    core::errors::Result<DocumentState> document_state(const std::string& handle) override;
    core::errors::Result<std::string> get_text(const std::string& handle) override;
    core::errors::Status set_text(const std::string& handle, const std::string& text) override;
    core::errors::Status insert_text(const std::string& handle, std::size_t offset,
                                     const std::string& text) override;
    core::errors::Result<bool> has_selection(const std::string& handle) override;
    core::errors::Status format_selection(const std::string& handle,
                                          const protocol::TextFormat& format) override;
    core::errors::Status store(const std::string& handle, const std::filesystem::path& path,
                               const std::string& filter) override;
    core::errors::Result<std::vector<protocol::EngineDocument>> list_documents() override;

private:
    core::errors::Result<nlohmann::json> call(const std::string& op,
                                              const nlohmann::json& body);

    RemoteEngineSettings settings_;
    std::unique_ptr<httplib::Client> client_;
};

}  // namespace docgate::bridge
