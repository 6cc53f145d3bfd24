#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/gateway_errors.hpp"
#include "protocol/conversion_contract.hpp"
#include "protocol/document_contract.hpp"

namespace docgate::formats {

// Immutable table of formats the engine can import or export. Built once;
// lookups are pure.
class FormatRegistry {
public:
    FormatRegistry();
    explicit FormatRegistry(std::vector<protocol::FormatSpec> table);

    // Name is case-insensitive and may carry a leading dot ("PDF", ".docx").
    core::errors::Result<protocol::FormatSpec> resolve(
        const std::string& logical_name, protocol::FormatDirection direction) const;

    // Import lookup keyed on the file's extension.
    core::errors::Result<protocol::FormatSpec> resolve_extension(
        const std::filesystem::path& path) const;

    // Native format used when the engine writes a document of this kind.
    protocol::FormatSpec native_format(protocol::DocumentKind kind) const;

    // Engine module a source file opens in; files of unknown type open in Writer.
    protocol::DocumentKind family_of(const std::filesystem::path& source) const;

    // Filter that writes `target` from a document of `source_family`. Empty when
    // no module-specific filter is known and the engine must choose by name.
    static std::string export_filter(const protocol::FormatSpec& target,
                                     protocol::DocumentKind source_family);

    std::vector<std::string> names(protocol::FormatDirection direction) const;

    const std::vector<protocol::FormatSpec>& entries() const { return table_; }

private:
    static bool supports(const protocol::FormatSpec& spec,
                         protocol::FormatDirection direction);

    std::vector<protocol::FormatSpec> table_;
};

}  // namespace docgate::formats
