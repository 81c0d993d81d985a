//! # ZIP Archive Reader Implementation
//!
//! Record layouts (little-endian):
//!
//! | Record                      | Signature  | Fixed size |
//! |-----------------------------|------------|------------|
//! | Local file header           | 0x04034b50 | 30         |
//! | Central directory header    | 0x02014b50 | 46         |
//! | End of central directory    | 0x06054b50 | 22         |

#include "archive/zip_archive_reader.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace comexe::archive {

namespace {

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_DIR_SIZE = 22;
constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr size_t INPUT_CHUNK = 16 * 1024;

constexpr uint16_t FLAG_ENCRYPTED = 0x0001;

auto get2(const std::string& data, size_t pos) -> uint16_t {
    auto p = reinterpret_cast<const unsigned char*>(data.data()) + pos;
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

auto get4(const std::string& data, size_t pos) -> uint32_t {
    auto p = reinterpret_cast<const unsigned char*>(data.data()) + pos;
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ZipArchiveReader::ZipArchiveReader(Box<std::istream> stream) : stream_(std::move(stream)) {}

ZipArchiveReader::~ZipArchiveReader() {
    release_open_entry();
}

auto ZipArchiveReader::open(const std::string& path) -> Result<Box<ZipArchiveReader>> {
    auto file = make_box<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        return "cannot open archive: " + path;
    }
    Box<ZipArchiveReader> reader(new ZipArchiveReader(std::move(file)));
    auto loaded = reader->load_central_directory();
    if (is_err(loaded)) {
        return unwrap_err(loaded) + ": " + path;
    }
    COMEXE_LOG_DEBUG("archive", "opened " << path << " (" << reader->entry_count_
                                          << " entries, base offset " << reader->base_offset_
                                          << ")");
    return std::move(reader);
}

auto ZipArchiveReader::from_memory(std::string image) -> Result<Box<ZipArchiveReader>> {
    Box<ZipArchiveReader> reader(
        new ZipArchiveReader(make_box<std::istringstream>(std::move(image))));
    auto loaded = reader->load_central_directory();
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    return std::move(reader);
}

auto ZipArchiveReader::read_at(uint64_t offset, size_t length) -> std::optional<std::string> {
    if (offset > stream_size_ || length > stream_size_ - offset) {
        return std::nullopt;
    }
    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(offset));
    std::string bytes(length, '\0');
    if (length > 0 && !stream_->read(bytes.data(), static_cast<std::streamsize>(length))) {
        return std::nullopt;
    }
    return bytes;
}

auto ZipArchiveReader::load_central_directory() -> Result<bool> {
    stream_->seekg(0, std::ios::end);
    auto end = stream_->tellg();
    if (end < 0) {
        return std::string("cannot determine archive size");
    }
    stream_size_ = static_cast<uint64_t>(end);
    if (stream_size_ < END_OF_CENTRAL_DIR_SIZE) {
        return std::string("not a zip archive");
    }

    size_t tail_size = static_cast<size_t>(
        std::min<uint64_t>(stream_size_, END_OF_CENTRAL_DIR_SIZE + MAX_COMMENT_SIZE));
    uint64_t tail_start = stream_size_ - tail_size;
    auto tail = read_at(tail_start, tail_size);
    if (!tail) {
        return std::string("cannot read archive trailer");
    }

    std::optional<size_t> eocd;
    for (size_t pos = tail_size - END_OF_CENTRAL_DIR_SIZE + 1; pos-- > 0;) {
        if (get4(*tail, pos) == END_OF_CENTRAL_DIR_SIGNATURE) {
            eocd = pos;
            break;
        }
    }
    if (!eocd) {
        return std::string("not a zip archive");
    }

    uint16_t total_entries = get2(*tail, *eocd + 10);
    uint32_t cd_size = get4(*tail, *eocd + 12);
    uint32_t cd_offset = get4(*tail, *eocd + 16);
    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        return std::string("zip64 archives are not supported");
    }

    uint64_t eocd_pos = tail_start + *eocd;
    if (eocd_pos < static_cast<uint64_t>(cd_size) + cd_offset) {
        return std::string("corrupt central directory");
    }
    base_offset_ = eocd_pos - cd_size - cd_offset;

    auto directory = read_at(base_offset_ + cd_offset, cd_size);
    if (!directory) {
        return std::string("cannot read central directory");
    }
    central_directory_ = std::move(*directory);
    entry_count_ = total_entries;
    return true;
}

// ============================================================================
// Entry Cursor
// ============================================================================

auto ZipArchiveReader::parse_entry_at_cursor() -> ArchiveStatus {
    current_.reset();
    const auto& cd = central_directory_;
    if (cursor_ + CENTRAL_HEADER_SIZE > cd.size() ||
        get4(cd, cursor_) != CENTRAL_HEADER_SIGNATURE) {
        COMEXE_LOG_WARN("archive", "bad central directory header at entry " << index_);
        return ArchiveStatus::Error;
    }

    uint16_t name_length = get2(cd, cursor_ + 28);
    uint16_t extra_length = get2(cd, cursor_ + 30);
    uint16_t comment_length = get2(cd, cursor_ + 32);
    size_t record_size = CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
    if (cursor_ + record_size > cd.size()) {
        return ArchiveStatus::Error;
    }

    CentralEntry entry;
    entry.flags = get2(cd, cursor_ + 8);
    entry.info.method = get2(cd, cursor_ + 10);
    entry.crc = get4(cd, cursor_ + 16);
    entry.info.compressed_size = get4(cd, cursor_ + 20);
    entry.info.uncompressed_size = get4(cd, cursor_ + 24);
    entry.local_header_offset = get4(cd, cursor_ + 42);
    entry.info.name = cd.substr(cursor_ + CENTRAL_HEADER_SIZE, name_length);
    entry.record_size = record_size;
    current_ = std::move(entry);
    return ArchiveStatus::Ok;
}

auto ZipArchiveReader::goto_first_entry() -> ArchiveStatus {
    release_open_entry();
    cursor_ = 0;
    index_ = 0;
    if (entry_count_ == 0) {
        current_.reset();
        return ArchiveStatus::EndOfList;
    }
    return parse_entry_at_cursor();
}

auto ZipArchiveReader::goto_next_entry() -> ArchiveStatus {
    release_open_entry();
    if (!current_) {
        return ArchiveStatus::Error;
    }
    cursor_ += current_->record_size;
    ++index_;
    if (index_ >= entry_count_) {
        current_.reset();
        return ArchiveStatus::EndOfList;
    }
    return parse_entry_at_cursor();
}

auto ZipArchiveReader::current_entry_info() const -> std::optional<EntryInfo> {
    if (!current_) {
        return std::nullopt;
    }
    return current_->info;
}

// ============================================================================
// Entry Streaming
// ============================================================================

auto ZipArchiveReader::open_current_entry() -> ArchiveStatus {
    release_open_entry();
    if (!current_) {
        return ArchiveStatus::Error;
    }
    if (current_->flags & FLAG_ENCRYPTED) {
        COMEXE_LOG_WARN("archive", "encrypted entry not supported: " << current_->info.name);
        return ArchiveStatus::Error;
    }
    auto method = static_cast<EntryMethod>(current_->info.method);
    if (method != EntryMethod::Stored && method != EntryMethod::Deflated) {
        COMEXE_LOG_WARN("archive", "unsupported compression method " << current_->info.method
                                                                       << " for "
                                                                       << current_->info.name);
        return ArchiveStatus::Error;
    }

    uint64_t header_pos = base_offset_ + current_->local_header_offset;
    auto header = read_at(header_pos, LOCAL_HEADER_SIZE);
    if (!header || get4(*header, 0) != LOCAL_HEADER_SIGNATURE) {
        COMEXE_LOG_WARN("archive", "bad local header for " << current_->info.name);
        return ArchiveStatus::Error;
    }

    auto& entry = open_.emplace();
    entry.data_offset = header_pos + LOCAL_HEADER_SIZE + get2(*header, 26) + get2(*header, 28);
    entry.compressed_left = current_->info.compressed_size;
    entry.crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));

    if (method == EntryMethod::Deflated) {
        // Raw deflate data: no zlib header.
        if (inflateInit2(&entry.zs, -MAX_WBITS) != Z_OK) {
            open_.reset();
            return ArchiveStatus::Error;
        }
        entry.inflating = true;
    }
    return ArchiveStatus::Ok;
}

auto ZipArchiveReader::read_current_entry(size_t max_bytes) -> Result<std::string, ArchiveError> {
    if (!open_) {
        return ArchiveError{"no entry is open"};
    }
    auto result = open_->inflating ? read_deflated(max_bytes) : read_stored(max_bytes);
    if (is_ok(result)) {
        const auto& bytes = unwrap(result);
        open_->produced += bytes.size();
        open_->crc = static_cast<uint32_t>(
            crc32(open_->crc, reinterpret_cast<const Bytef*>(bytes.data()),
                  static_cast<uInt>(bytes.size())));
    }
    return result;
}

auto ZipArchiveReader::read_stored(size_t max_bytes) -> Result<std::string, ArchiveError> {
    auto& entry = *open_;
    size_t n = static_cast<size_t>(std::min<uint64_t>(max_bytes, entry.compressed_left));
    auto bytes = read_at(entry.data_offset, n);
    if (!bytes) {
        return ArchiveError{"truncated entry: " + current_->info.name};
    }
    entry.data_offset += n;
    entry.compressed_left -= n;
    return std::move(*bytes);
}

auto ZipArchiveReader::read_deflated(size_t max_bytes) -> Result<std::string, ArchiveError> {
    auto& entry = *open_;
    std::string output(max_bytes, '\0');
    size_t produced = 0;

    while (produced < max_bytes && !entry.stream_end) {
        if (entry.zs.avail_in == 0 && entry.compressed_left > 0) {
            size_t n = static_cast<size_t>(std::min<uint64_t>(INPUT_CHUNK, entry.compressed_left));
            auto chunk = read_at(entry.data_offset, n);
            if (!chunk) {
                return ArchiveError{"truncated entry: " + current_->info.name};
            }
            entry.input = std::move(*chunk);
            entry.data_offset += n;
            entry.compressed_left -= n;
            entry.zs.next_in = reinterpret_cast<Bytef*>(entry.input.data());
            entry.zs.avail_in = static_cast<uInt>(n);
        }

        entry.zs.next_out = reinterpret_cast<Bytef*>(output.data() + produced);
        entry.zs.avail_out = static_cast<uInt>(max_bytes - produced);
        int rc = inflate(&entry.zs, Z_NO_FLUSH);
        produced = max_bytes - entry.zs.avail_out;

        if (rc == Z_STREAM_END) {
            entry.stream_end = true;
        } else if (rc == Z_BUF_ERROR && entry.zs.avail_in == 0 && entry.compressed_left == 0) {
            return ArchiveError{"truncated deflate stream: " + current_->info.name};
        } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
            return ArchiveError{"inflate failed (" + std::to_string(rc) + "): " + current_->info.name};
        }
    }

    output.resize(produced);
    return output;
}

auto ZipArchiveReader::close_current_entry() -> ArchiveStatus {
    if (!open_) {
        return ArchiveStatus::Error;
    }
    bool complete = open_->produced == current_->info.uncompressed_size;
    bool crc_ok = open_->crc == current_->crc;
    release_open_entry();
    if (complete && !crc_ok) {
        COMEXE_LOG_WARN("archive", "CRC mismatch for " << current_->info.name);
        return ArchiveStatus::Error;
    }
    return ArchiveStatus::Ok;
}

void ZipArchiveReader::release_open_entry() {
    if (open_ && open_->inflating) {
        inflateEnd(&open_->zs);
    }
    open_.reset();
}

} // namespace comexe::archive
