#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "bridge/engine_connection.hpp"
#include "core/errors/gateway_errors.hpp"
#include "formats/format_registry.hpp"
#include "protocol/document_contract.hpp"
#include "runtime/deadline.hpp"
#include "session/session_registry.hpp"

namespace docgate::bridge {

// Sole owner of the engine connection. Every operation becomes a command on
// one FIFO queue drained by a single worker thread, so engine calls never
// overlap and the session registry needs no lock. Callers block on their own
// future until it completes or their deadline passes.
//
// An empty handle means "the engine's active document".
class LiveDocumentBridge {
public:
    LiveDocumentBridge(std::unique_ptr<EngineConnection> engine,
                       const formats::FormatRegistry& formats);
    ~LiveDocumentBridge();

    LiveDocumentBridge(const LiveDocumentBridge&) = delete;
    LiveDocumentBridge& operator=(const LiveDocumentBridge&) = delete;

    core::errors::Result<protocol::SessionEntry> create_document(
        protocol::DocumentKind kind, const runtime::Deadline& deadline);

    core::errors::Result<protocol::SessionEntry> get_active_document(
        const runtime::Deadline& deadline);

    // Offsets outside the document saturate to its bounds.
    core::errors::Result<protocol::InsertOutcome> insert_text(
        const std::string& handle, const std::string& text,
        const protocol::InsertPosition& position, const runtime::Deadline& deadline);

    core::errors::Result<protocol::TextContent> read_text(const std::string& handle,
                                                          const runtime::Deadline& deadline);

    core::errors::Result<protocol::SessionEntry> format_selection(
        const std::string& handle, const protocol::TextFormat& format,
        const runtime::Deadline& deadline);

    // Stores the document where it was last loaded or saved. The engine
    // rejects documents that have never had a location.
    core::errors::Result<protocol::SessionEntry> save(const std::string& handle,
                                                      const runtime::Deadline& deadline);

    // Filter is picked from the path's extension, else the kind's native format.
    core::errors::Result<protocol::SessionEntry> save_as(const std::string& handle,
                                                         const std::filesystem::path& path,
                                                         const runtime::Deadline& deadline);

    core::errors::Result<protocol::SessionEntry> export_document(
        const std::string& handle, const std::filesystem::path& path,
        const std::string& format_name, const runtime::Deadline& deadline);

    core::errors::Result<protocol::LiveDocumentInfo> document_info(
        const std::string& handle, const runtime::Deadline& deadline);

    // Reconciles the registry with what the engine actually has open.
    core::errors::Result<std::vector<protocol::SessionEntry>> list_open_documents(
        const runtime::Deadline& deadline);

    // Commands queued but not yet started.
    std::size_t pending() const;

private:
    struct Command {
        std::string label;
        std::function<void()> run;
        std::function<void()> cancel;
        std::shared_ptr<std::atomic_bool> abandoned;
    };

    template <typename T>
    core::errors::Result<T> submit(const std::string& label,
                                   std::function<core::errors::Result<T>()> work,
                                   const runtime::Deadline& deadline);

    void worker_loop();

    // Worker thread only.
    core::errors::Result<protocol::SessionEntry> resolve_handle(const std::string& handle);
    core::errors::Result<protocol::SessionEntry> store_document(
        const std::string& handle, const std::filesystem::path& path,
        const std::optional<protocol::FormatSpec>& format, bool is_save);

    std::unique_ptr<EngineConnection> engine_;
    const formats::FormatRegistry& formats_;
    session::SessionRegistry sessions_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::deque<Command> queue_;
    bool stopping_ = false;
    std::thread worker_;
};

template <typename T>
core::errors::Result<T> LiveDocumentBridge::submit(
    const std::string& label, std::function<core::errors::Result<T>()> work,
    const runtime::Deadline& deadline) {
    using core::errors::ErrorKind;
    using core::errors::GatewayError;

    auto promise = std::make_shared<std::promise<core::errors::Result<T>>>();
    auto future = promise->get_future();
    auto abandoned = std::make_shared<std::atomic_bool>(false);

    Command command;
    command.label = label;
    command.abandoned = abandoned;
    command.run = [promise, label, work = std::move(work)]() {
        try {
            promise->set_value(work());
        } catch (const std::exception& e) {
            promise->set_value(GatewayError{ErrorKind::Internal,
                                            label + " raised: " + e.what(),
                                            "engine_exception"});
        }
    };
    command.cancel = [promise, label]() {
        promise->set_value(GatewayError{ErrorKind::EngineUnreachable,
                                        label + " cancelled: bridge is shutting down.",
                                        "bridge_stopped"});
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return GatewayError{ErrorKind::EngineUnreachable,
                                "Bridge is shutting down.", "bridge_stopped"};
        }
        queue_.push_back(std::move(command));
    }
    work_available_.notify_one();

    if (future.wait_until(deadline.at()) != std::future_status::ready) {
        abandoned->store(true);
        return GatewayError{ErrorKind::Timeout,
                            label + " did not complete before the deadline.",
                            "bridge_timeout",
                            "The engine may still apply the change; re-read the "
                            "document before retrying."};
    }
    return future.get();
}

}  // namespace docgate::bridge
