#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/gateway_errors.hpp"
#include "protocol/document_contract.hpp"

namespace docgate::session {

// Bookkeeping for live documents. Holds no lock: only the bridge worker
// thread ever touches it.
class SessionRegistry {
public:
    core::errors::Result<protocol::SessionEntry> register_document(
        const std::string& handle, protocol::DocumentKind kind);

    core::errors::Result<protocol::SessionEntry> lookup(const std::string& handle) const;

    bool contains(const std::string& handle) const;

    core::errors::Result<protocol::SessionEntry> touch(const std::string& handle);
    core::errors::Result<protocol::SessionEntry> mark_dirty(const std::string& handle);
    core::errors::Result<protocol::SessionEntry> mark_clean(const std::string& handle);

    // Returns false when the handle was not registered.
    bool unregister(const std::string& handle);

    // Ordered by creation.
    std::vector<protocol::SessionEntry> list_active() const;

    std::size_t size() const;

private:
    core::errors::GatewayError not_found(const std::string& handle) const;

    std::unordered_map<std::string, protocol::SessionEntry> entries_;
    std::vector<std::string> order_;
};

}  // namespace docgate::session
