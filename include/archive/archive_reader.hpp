//! # Archive Reader
//!
//! Sequential, read-only access to the entries of a compressed container.
//! Callers walk the entry list with `goto_first_entry`/`goto_next_entry`
//! and stream the current entry between `open_current_entry` and
//! `close_current_entry`. No random-access index is assumed. Destroying the
//! reader closes the container.

#ifndef COMEXE_ARCHIVE_ARCHIVE_READER_HPP
#define COMEXE_ARCHIVE_ARCHIVE_READER_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace comexe::archive {

enum class ArchiveStatus {
    Ok,
    EndOfList, ///< Cursor moved past the last entry
    Error
};

/// Compression method codes as stored in the container.
enum class EntryMethod : uint16_t { Stored = 0, Deflated = 8 };

struct ArchiveError {
    std::string message;
};

struct EntryInfo {
    std::string name;
    uint64_t uncompressed_size = 0;
    uint64_t compressed_size = 0;
    uint16_t method = 0;
};

class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    virtual auto goto_first_entry() -> ArchiveStatus = 0;
    virtual auto goto_next_entry() -> ArchiveStatus = 0;

    /// Info for the entry under the cursor; nullopt when the cursor is not on one.
    [[nodiscard]] virtual auto current_entry_info() const -> std::optional<EntryInfo> = 0;

    virtual auto open_current_entry() -> ArchiveStatus = 0;

    /// Returns up to `max_bytes` decoded bytes. An empty string marks the
    /// end of the entry.
    virtual auto read_current_entry(size_t max_bytes) -> Result<std::string, ArchiveError> = 0;

    /// Reports Error when a fully read entry fails its integrity check.
    virtual auto close_current_entry() -> ArchiveStatus = 0;
};

} // namespace comexe::archive

#endif // COMEXE_ARCHIVE_ARCHIVE_READER_HPP
