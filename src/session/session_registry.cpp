#include "session/session_registry.hpp"

#include <algorithm>
#include <chrono>
#include "core/logging/logger.hpp"

namespace docgate::session {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using protocol::DocumentKind;
using protocol::SessionEntry;

GatewayError SessionRegistry::not_found(const std::string& handle) const {
    return GatewayError{ErrorKind::StaleHandle,
                        "Document handle is not open: " + handle, "session_not_found",
                        "Re-acquire a handle with create_document_live or "
                        "get_active_document."};
}

core::errors::Result<SessionEntry> SessionRegistry::register_document(
    const std::string& handle, const DocumentKind kind) {
    if (handle.empty()) {
        return GatewayError{ErrorKind::Internal, "Engine returned an empty handle.",
                            "empty_handle"};
    }
    if (entries_.find(handle) != entries_.end()) {
        return GatewayError{ErrorKind::Internal,
                            "Document handle already registered: " + handle,
                            "duplicate_handle"};
    }

    const auto now = std::chrono::system_clock::now();
    SessionEntry entry;
    entry.handle = handle;
    entry.kind = kind;
    entry.created_at = now;
    entry.last_modified_at = now;
    entry.last_accessed_at = now;
    entry.dirty = false;

    entries_.emplace(handle, entry);
    order_.push_back(handle);
    LOG_DEBUG("SessionRegistry: registered " + handle + " (" + protocol::to_string(kind) +
              ")");
    return entry;
}

core::errors::Result<SessionEntry> SessionRegistry::lookup(const std::string& handle) const {
    const auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return not_found(handle);
    }
    return it->second;
}

bool SessionRegistry::contains(const std::string& handle) const {
    return entries_.find(handle) != entries_.end();
}

core::errors::Result<SessionEntry> SessionRegistry::touch(const std::string& handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return not_found(handle);
    }
    it->second.last_accessed_at = std::chrono::system_clock::now();
    return it->second;
}

core::errors::Result<SessionEntry> SessionRegistry::mark_dirty(const std::string& handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return not_found(handle);
    }
    const auto now = std::chrono::system_clock::now();
    it->second.dirty = true;
    it->second.last_modified_at = now;
    it->second.last_accessed_at = now;
    return it->second;
}

core::errors::Result<SessionEntry> SessionRegistry::mark_clean(const std::string& handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return not_found(handle);
    }
    it->second.dirty = false;
    it->second.last_accessed_at = std::chrono::system_clock::now();
    return it->second;
}

bool SessionRegistry::unregister(const std::string& handle) {
    if (entries_.erase(handle) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), handle), order_.end());
    LOG_DEBUG("SessionRegistry: unregistered " + handle);
    return true;
}

std::vector<SessionEntry> SessionRegistry::list_active() const {
    std::vector<SessionEntry> result;
    result.reserve(order_.size());
    for (const auto& handle : order_) {
        result.push_back(entries_.at(handle));
    }
    return result;
}

std::size_t SessionRegistry::size() const {
    return entries_.size();
}

}  // namespace docgate::session
