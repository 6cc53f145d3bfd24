#include "bridge/live_document_bridge.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "text/text_stats.hpp"

namespace docgate::bridge {

using core::errors::ErrorKind;
using core::errors::GatewayError;
using protocol::DocumentKind;
using protocol::FormatDirection;
using protocol::SessionEntry;

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

GatewayError requires_writer(const SessionEntry& entry, const std::string& operation) {
    return GatewayError{ErrorKind::Validation,
                        operation + " is not supported for " +
                            protocol::to_string(entry.kind) + " documents.",
                        "unsupported_document_kind",
                        "Use a writer document."};
}

}  // namespace

LiveDocumentBridge::LiveDocumentBridge(std::unique_ptr<EngineConnection> engine,
                                       const formats::FormatRegistry& formats)
    : engine_(std::move(engine)), formats_(formats) {
    worker_ = std::thread([this] { worker_loop(); });
}

LiveDocumentBridge::~LiveDocumentBridge() {
    std::deque<Command> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        leftover.swap(queue_);
    }
    work_available_.notify_all();
    for (auto& command : leftover) {
        command.cancel();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

void LiveDocumentBridge::worker_loop() {
    for (;;) {
        Command command;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            command = std::move(queue_.front());
            queue_.pop_front();
        }

        // The caller gave up before the command started; running it now
        // would only mutate state nobody is waiting on.
        if (command.abandoned->load()) {
            LOG_DEBUG("LiveDocumentBridge: skipping abandoned " + command.label);
            continue;
        }
        command.run();
    }
}

std::size_t LiveDocumentBridge::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

core::errors::Result<SessionEntry> LiveDocumentBridge::resolve_handle(
    const std::string& handle) {
    std::string target = handle;
    if (target.empty()) {
        auto active = engine_->active_document();
        if (core::errors::is_error(active)) {
            return core::errors::get_error(active);
        }
        const auto& active_handle = core::errors::get_value(active);
        if (!active_handle.has_value()) {
            return GatewayError{ErrorKind::NoActiveDocument, "No active document.",
                                "no_active_document",
                                "Create one with create_document_live."};
        }
        target = *active_handle;
    }

    auto state = engine_->document_state(target);
    if (core::errors::is_error(state)) {
        if (core::errors::get_error(state).kind == ErrorKind::StaleHandle) {
            sessions_.unregister(target);
        }
        return core::errors::get_error(state);
    }

    const auto& document = core::errors::get_value(state);
    if (!document.open) {
        if (sessions_.unregister(target)) {
            LOG_INFO("LiveDocumentBridge: " + target + " was closed outside the gateway");
        }
        return GatewayError{ErrorKind::StaleHandle,
                            "Document handle no longer resolves: " + target,
                            "stale_handle",
                            "Re-acquire a handle with create_document_live or "
                            "get_active_document."};
    }

    if (!sessions_.contains(target)) {
        auto adopted = sessions_.register_document(target, document.kind);
        if (core::errors::is_error(adopted)) {
            return core::errors::get_error(adopted);
        }
    }
    return sessions_.touch(target);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::create_document(
    const DocumentKind kind, const runtime::Deadline& deadline) {
    return submit<SessionEntry>(
        "create_document",
        [this, kind]() -> core::errors::Result<SessionEntry> {
            auto created = engine_->create_document(kind);
            if (core::errors::is_error(created)) {
                return core::errors::get_error(created);
            }
            const auto& handle = core::errors::get_value(created);
            LOG_INFO("LiveDocumentBridge: created " + protocol::to_string(kind) +
                     " document " + handle);
            return sessions_.register_document(handle, kind);
        },
        deadline);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::get_active_document(
    const runtime::Deadline& deadline) {
    return submit<SessionEntry>(
        "get_active_document",
        [this]() { return resolve_handle(""); }, deadline);
}

core::errors::Result<protocol::InsertOutcome> LiveDocumentBridge::insert_text(
    const std::string& handle, const std::string& text,
    const protocol::InsertPosition& position, const runtime::Deadline& deadline) {
    return submit<protocol::InsertOutcome>(
        "insert_text",
        [this, handle, text, position]() -> core::errors::Result<protocol::InsertOutcome> {
            auto resolved = resolve_handle(handle);
            if (core::errors::is_error(resolved)) {
                return core::errors::get_error(resolved);
            }
            const auto entry = core::errors::get_value(resolved);
            if (entry.kind != DocumentKind::Writer) {
                return requires_writer(entry, "Text insertion");
            }

            protocol::InsertOutcome outcome;
            outcome.inserted_chars = text::count_code_points(text);

            core::errors::Status applied = core::errors::ok();
            if (std::holds_alternative<protocol::ReplaceAll>(position)) {
                applied = engine_->set_text(entry.handle, text);
            } else if (std::holds_alternative<protocol::InsertAtStart>(position)) {
                applied = engine_->insert_text(entry.handle, 0, text);
            } else {
                auto current = engine_->get_text(entry.handle);
                if (core::errors::is_error(current)) {
                    return core::errors::get_error(current);
                }
                const auto length =
                    static_cast<std::int64_t>(text::count_code_points(core::errors::get_value(current)));
                const std::int64_t requested = std::visit(
                    Overloaded{[](const protocol::InsertAtOffset& at) { return at.offset; },
                               [length](const auto&) { return length; }},
                    position);
                outcome.applied_offset =
                    static_cast<std::size_t>(std::clamp<std::int64_t>(requested, 0, length));
                applied = engine_->insert_text(entry.handle, outcome.applied_offset, text);
            }
            if (core::errors::is_error(applied)) {
                return core::errors::get_error(applied);
            }

            auto dirty = sessions_.mark_dirty(entry.handle);
            if (core::errors::is_error(dirty)) {
                return core::errors::get_error(dirty);
            }
            outcome.entry = core::errors::get_value(dirty);
            return outcome;
        },
        deadline);
}

core::errors::Result<protocol::TextContent> LiveDocumentBridge::read_text(
    const std::string& handle, const runtime::Deadline& deadline) {
    return submit<protocol::TextContent>(
        "read_text",
        [this, handle]() -> core::errors::Result<protocol::TextContent> {
            auto resolved = resolve_handle(handle);
            if (core::errors::is_error(resolved)) {
                return core::errors::get_error(resolved);
            }
            auto content = engine_->get_text(core::errors::get_value(resolved).handle);
            if (core::errors::is_error(content)) {
                return core::errors::get_error(content);
            }
            return text::make_text_content(core::errors::get_value(content));
        },
        deadline);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::format_selection(
    const std::string& handle, const protocol::TextFormat& format,
    const runtime::Deadline& deadline) {
    if (format.empty()) {
        return GatewayError{ErrorKind::Validation, "No formatting attribute given.",
                            "empty_format",
                            "Pass at least one of bold, italic, underline, font_name, "
                            "font_size."};
    }
    return submit<SessionEntry>(
        "format_selection",
        [this, handle, format]() -> core::errors::Result<SessionEntry> {
            auto resolved = resolve_handle(handle);
            if (core::errors::is_error(resolved)) {
                return core::errors::get_error(resolved);
            }
            const auto entry = core::errors::get_value(resolved);
            if (entry.kind != DocumentKind::Writer) {
                return requires_writer(entry, "Text formatting");
            }

            auto selected = engine_->has_selection(entry.handle);
            if (core::errors::is_error(selected)) {
                return core::errors::get_error(selected);
            }
            if (!core::errors::get_value(selected)) {
                return GatewayError{ErrorKind::NoSelection, "No text selected.",
                                    "no_selection"};
            }

            auto applied = engine_->format_selection(entry.handle, format);
            if (core::errors::is_error(applied)) {
                return core::errors::get_error(applied);
            }
            return sessions_.mark_dirty(entry.handle);
        },
        deadline);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::store_document(
    const std::string& handle, const std::filesystem::path& path,
    const std::optional<protocol::FormatSpec>& format, const bool is_save) {
    auto resolved = resolve_handle(handle);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto entry = core::errors::get_value(resolved);

    // In place: the engine keeps the document's own location and filter.
    std::string chosen;
    if (!path.empty()) {
        protocol::FormatSpec target = formats_.native_format(entry.kind);
        if (format.has_value()) {
            target = *format;
        } else {
            auto by_extension =
                formats_.resolve(path.extension().string(), FormatDirection::Export);
            if (!core::errors::is_error(by_extension)) {
                target = core::errors::get_value(by_extension);
            }
        }
        chosen = formats::FormatRegistry::export_filter(target, entry.kind);
    }

    auto stored = engine_->store(entry.handle, path, chosen);
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }
    LOG_INFO("LiveDocumentBridge: stored " + entry.handle + " to " +
             (path.empty() ? std::string("its own location") : path.string()) + " [" +
             chosen + "]");
    return is_save ? sessions_.mark_clean(entry.handle) : sessions_.touch(entry.handle);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::save(const std::string& handle,
                                                            const runtime::Deadline& deadline) {
    return submit<SessionEntry>(
        "save",
        [this, handle]() {
            return store_document(handle, std::filesystem::path(), std::nullopt, true);
        },
        deadline);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::save_as(
    const std::string& handle, const std::filesystem::path& path,
    const runtime::Deadline& deadline) {
    return submit<SessionEntry>(
        "save_as",
        [this, handle, path]() { return store_document(handle, path, std::nullopt, true); },
        deadline);
}

core::errors::Result<SessionEntry> LiveDocumentBridge::export_document(
    const std::string& handle, const std::filesystem::path& path,
    const std::string& format_name, const runtime::Deadline& deadline) {
    auto spec = formats_.resolve(format_name, FormatDirection::Export);
    if (core::errors::is_error(spec)) {
        return core::errors::get_error(spec);
    }
    const protocol::FormatSpec format = core::errors::get_value(spec);
    return submit<SessionEntry>(
        "export_document",
        [this, handle, path, format]() { return store_document(handle, path, format, false); },
        deadline);
}

core::errors::Result<protocol::LiveDocumentInfo> LiveDocumentBridge::document_info(
    const std::string& handle, const runtime::Deadline& deadline) {
    return submit<protocol::LiveDocumentInfo>(
        "document_info",
        [this, handle]() -> core::errors::Result<protocol::LiveDocumentInfo> {
            auto resolved = resolve_handle(handle);
            if (core::errors::is_error(resolved)) {
                return core::errors::get_error(resolved);
            }

            protocol::LiveDocumentInfo info;
            info.entry = core::errors::get_value(resolved);
            if (info.entry.kind != DocumentKind::Writer) {
                return info;
            }

            auto content = engine_->get_text(info.entry.handle);
            if (core::errors::is_error(content)) {
                return core::errors::get_error(content);
            }
            info.text = text::make_text_content(core::errors::get_value(content));

            auto selected = engine_->has_selection(info.entry.handle);
            if (core::errors::is_error(selected)) {
                return core::errors::get_error(selected);
            }
            info.has_selection = core::errors::get_value(selected);
            return info;
        },
        deadline);
}

core::errors::Result<std::vector<SessionEntry>> LiveDocumentBridge::list_open_documents(
    const runtime::Deadline& deadline) {
    return submit<std::vector<SessionEntry>>(
        "list_open_documents",
        [this]() -> core::errors::Result<std::vector<SessionEntry>> {
            auto listed = engine_->list_documents();
            if (core::errors::is_error(listed)) {
                return core::errors::get_error(listed);
            }
            const auto& documents = core::errors::get_value(listed);

            std::unordered_set<std::string> open_handles;
            for (const auto& document : documents) {
                open_handles.insert(document.handle);
            }
            for (const auto& entry : sessions_.list_active()) {
                if (open_handles.count(entry.handle) == 0) {
                    sessions_.unregister(entry.handle);
                    LOG_INFO("LiveDocumentBridge: " + entry.handle +
                             " was closed outside the gateway");
                }
            }

            for (const auto& document : documents) {
                if (!sessions_.contains(document.handle)) {
                    auto adopted = sessions_.register_document(document.handle, document.kind);
                    if (core::errors::is_error(adopted)) {
                        return core::errors::get_error(adopted);
                    }
                }
                auto current = sessions_.lookup(document.handle);
                if (!core::errors::is_error(current) &&
                    core::errors::get_value(current).dirty != document.modified) {
                    auto updated = document.modified ? sessions_.mark_dirty(document.handle)
                                                     : sessions_.mark_clean(document.handle);
                    if (core::errors::is_error(updated)) {
                        return core::errors::get_error(updated);
                    }
                }
            }
            return sessions_.list_active();
        },
        deadline);
}

}  // namespace docgate::bridge
