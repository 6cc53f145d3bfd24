#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gateway_errors.hpp"
#include "protocol/document_contract.hpp"

namespace docgate::bridge {

struct DocumentState {
    bool open = false;
    protocol::DocumentKind kind = protocol::DocumentKind::Writer;
    bool modified = false;
};

// Primitive operations of the long-running engine's automation interface.
// Implementations are not thread-safe; the bridge calls them from a single
// worker thread only. Offsets are in Unicode code points.
class EngineConnection {
public:
    virtual ~EngineConnection() = default;

    virtual core::errors::Result<std::string> create_document(protocol::DocumentKind kind) = 0;
    virtual core::errors::Result<std::optional<std::string>> active_document() = 0;
    virtual core::errors::Result<DocumentState> document_state(const std::string& handle) = 0;
    virtual core::errors::Result<std::string> get_text(const std::string& handle) = 0;
    virtual core::errors::Status set_text(const std::string& handle, const std::string& text) = 0;
    virtual core::errors::Status insert_text(const std::string& handle, std::size_t offset,
                                             const std::string& text) = 0;
    virtual core::errors::Result<bool> has_selection(const std::string& handle) = 0;
    virtual core::errors::Status format_selection(const std::string& handle,
                                                  const protocol::TextFormat& format) = 0;
    // An empty path stores the document in place with its current filter.
    virtual core::errors::Status store(const std::string& handle,
                                       const std::filesystem::path& path,
                                       const std::string& filter) = 0;
    virtual core::errors::Result<std::vector<protocol::EngineDocument>> list_documents() = 0;
};

}  // namespace docgate::bridge
