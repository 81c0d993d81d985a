//! # ZIP Archive Reader
//!
//! Reads ZIP containers through zlib. The end-of-central-directory record
//! is located by scanning backwards from the end of the input, so an
//! archive appended to an executable is read in place: entry offsets are
//! rebased on whatever bytes precede the archive.
//!
//! Supported: Stored and Deflated entries. Rejected: ZIP64, encryption.

#ifndef COMEXE_ARCHIVE_ZIP_ARCHIVE_READER_HPP
#define COMEXE_ARCHIVE_ZIP_ARCHIVE_READER_HPP

#include "archive/archive_reader.hpp"

#include <istream>
#include <zlib.h>

namespace comexe::archive {

class ZipArchiveReader : public ArchiveReader {
public:
    /// Opens the archive stored in (or appended to) the file at `path`.
    static auto open(const std::string& path) -> Result<Box<ZipArchiveReader>>;

    /// Opens an archive held in memory.
    static auto from_memory(std::string image) -> Result<Box<ZipArchiveReader>>;

    ~ZipArchiveReader() override;

    ZipArchiveReader(const ZipArchiveReader&) = delete;
    auto operator=(const ZipArchiveReader&) -> ZipArchiveReader& = delete;

    auto goto_first_entry() -> ArchiveStatus override;
    auto goto_next_entry() -> ArchiveStatus override;
    [[nodiscard]] auto current_entry_info() const -> std::optional<EntryInfo> override;
    auto open_current_entry() -> ArchiveStatus override;
    auto read_current_entry(size_t max_bytes) -> Result<std::string, ArchiveError> override;
    auto close_current_entry() -> ArchiveStatus override;

    [[nodiscard]] auto entry_count() const -> size_t {
        return entry_count_;
    }

private:
    struct CentralEntry {
        EntryInfo info;
        uint32_t crc = 0;
        uint16_t flags = 0;
        uint64_t local_header_offset = 0;
        size_t record_size = 0;
    };

    struct OpenEntry {
        uint64_t data_offset = 0;
        uint64_t compressed_left = 0;
        uint64_t produced = 0;
        uint32_t crc = 0;
        bool stream_end = false;
        bool inflating = false;
        z_stream zs{};
        std::string input;
    };

    explicit ZipArchiveReader(Box<std::istream> stream);

    auto load_central_directory() -> Result<bool>;
    auto read_at(uint64_t offset, size_t length) -> std::optional<std::string>;
    auto parse_entry_at_cursor() -> ArchiveStatus;
    auto read_stored(size_t max_bytes) -> Result<std::string, ArchiveError>;
    auto read_deflated(size_t max_bytes) -> Result<std::string, ArchiveError>;
    void release_open_entry();

    Box<std::istream> stream_;
    uint64_t stream_size_ = 0;
    uint64_t base_offset_ = 0;
    std::string central_directory_;
    size_t entry_count_ = 0;

    size_t cursor_ = 0;
    size_t index_ = 0;
    std::optional<CentralEntry> current_;
    std::optional<OpenEntry> open_;
};

} // namespace comexe::archive

#endif // COMEXE_ARCHIVE_ZIP_ARCHIVE_READER_HPP
