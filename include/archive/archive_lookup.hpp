//! # Archive Lookup
//!
//! Name-based access on top of the sequential `ArchiveReader` cursor.
//! Every lookup walks the entry list from the start; nothing is indexed
//! or cached.

#ifndef COMEXE_ARCHIVE_ARCHIVE_LOOKUP_HPP
#define COMEXE_ARCHIVE_ARCHIVE_LOOKUP_HPP

#include "archive/archive_reader.hpp"

#include <functional>
#include <string_view>

namespace comexe::archive {

/// Slice size used when draining an entry.
constexpr size_t READ_CHUNK = 64 * 1024;

/// Reads the entry under the cursor to its end.
auto read_current_entry_fully(ArchiveReader& reader) -> Result<std::string, ArchiveError>;

/// Linear scan for an entry named exactly `name`. Returns its decoded
/// content ("" for an empty entry), or nullopt when the entry is missing or
/// cannot be decoded.
auto find_entry(ArchiveReader& reader, std::string_view name) -> std::optional<std::string>;

/// Callbacks handed to a `for_each_entry` visitor. `read` decodes the
/// current entry on demand; `stop` ends the iteration after the visitor
/// returns.
struct EntryVisit {
    const EntryInfo& info;
    std::function<Result<std::string, ArchiveError>()> read;
    std::function<void()> stop;
};

using EntryVisitor = std::function<void(EntryVisit&)>;

/// Visits entries in container order. Returns EndOfList after the last
/// entry, Ok when the visitor stopped early, Error on a broken directory.
auto for_each_entry(ArchiveReader& reader, const EntryVisitor& visitor) -> ArchiveStatus;

} // namespace comexe::archive

#endif // COMEXE_ARCHIVE_ARCHIVE_LOOKUP_HPP
