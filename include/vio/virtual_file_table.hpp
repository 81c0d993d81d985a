//! # Virtual File Table
//!
//! File-descriptor table serving the embedded compiler toolchain. Each
//! descriptor is backed either by an immutable archive entry held in
//! memory or by a native OS handle.
//!
//! ## Routing
//!
//! A read-only open of a path under `RUNTIME_PREFIX` is first looked up
//! in the archive under `ARCHIVE_ASSET_DIR`. Anything else, and any archive
//! miss, goes to the native filesystem.
//!
//! ## Results
//!
//! Every operation returns a signed result: a negative POSIX error code, or
//! a non-negative success value. Nothing throws.
//!
//! ## Descriptor ids
//!
//! Ids start at 1. A closed id goes on a free stack and is the next id
//! handed out.

#ifndef COMEXE_VIO_VIRTUAL_FILE_TABLE_HPP
#define COMEXE_VIO_VIRTUAL_FILE_TABLE_HPP

#include "archive/archive_reader.hpp"
#include "common.hpp"
#include "native/native_file_io.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace comexe::vio {

constexpr std::string_view RUNTIME_PREFIX = "COMRAD-RUNTIME-V2";
constexpr std::string_view ARCHIVE_ASSET_DIR = "comexe";

// ============================================================================
// Error Codes
// ============================================================================

enum class IoError : int {
    NoSuchFile = 2,         ///< ENOENT
    Io = 5,                 ///< EIO
    BadFileDescriptor = 9,  ///< EBADF
    PermissionDenied = 13,  ///< EACCES
    IllegalSeek = 29        ///< ESPIPE
};

constexpr auto error_code(IoError error) -> int64_t {
    return -static_cast<int64_t>(error);
}

auto error_name(IoError error) -> const char*;

/// "-2 (-ENOENT)" for errors, the plain number otherwise.
auto describe_result(int64_t result) -> std::string;

/// "O_RDONLY|O_CREAT" style rendering of open flags.
auto describe_flags(int flags) -> std::string;

enum class Whence : int { Set = 0, Current = 1, End = 2 };

// ============================================================================
// Descriptors
// ============================================================================

struct ArchiveFile {
    Rc<const std::string> bytes;
    size_t cursor = 0;
    int flags = 0;
    std::string path;
};

struct NativeFile {
    int handle = -1;
    int flags = 0;
    std::string path;
};

using Descriptor = std::variant<ArchiveFile, NativeFile>;

// ============================================================================
// Events
// ============================================================================

struct OpenEvent {
    std::string path;
    int flags = 0;
    int mode = 0;
};

struct ReadEvent {
    int fd;
    size_t count;
};

struct WriteEvent {
    int fd;
    std::string data;
};

struct SeekEvent {
    int fd;
    int64_t offset;
    int whence;
};

struct CloseEvent {
    int fd;
};

struct DupEvent {
    int fd;
};

using IoEvent = std::variant<OpenEvent, ReadEvent, WriteEvent, SeekEvent, CloseEvent, DupEvent>;

struct IoReply {
    /// Negative error code, or the event's success value (fd, byte count,
    /// position, 0).
    int64_t result = 0;
    /// Bytes returned by a read.
    std::string data;
};

// ============================================================================
// VirtualFileTable
// ============================================================================

class VirtualFileTable {
public:
    /// `archive` may be null; every open then goes native.
    VirtualFileTable(archive::ArchiveReader* archive, native::NativeFileIO& io);

    /// Returns the new id, or -ENOENT.
    auto open(std::string_view path, int flags, int mode) -> int64_t;

    /// Returns up to `n` bytes; an empty string at end of file.
    auto read(int fd, size_t n) -> Result<std::string, IoError>;

    /// Copies up to `n` bytes into `buffer`. Returns the count or a
    /// negative code.
    auto read_into(int fd, char* buffer, size_t n) -> int64_t;

    auto write(int fd, std::string_view data) -> int64_t;
    auto seek(int fd, int64_t offset, int whence) -> int64_t;
    auto close(int fd) -> int64_t;
    auto dup(int fd) -> int64_t;

    auto handle(const IoEvent& event) -> IoReply;

    [[nodiscard]] auto is_open(int fd) const -> bool;
    [[nodiscard]] auto open_count() const -> size_t;

private:
    auto lookup(int fd) -> Descriptor*;
    auto allocate(Descriptor descriptor) -> int;
    void release(int fd);
    auto try_archive(std::string_view path, int flags) -> std::optional<ArchiveFile>;

    archive::ArchiveReader* archive_;
    native::NativeFileIO& io_;
    std::vector<std::optional<Descriptor>> slots_;
    std::vector<int> free_ids_;
};

} // namespace comexe::vio

#endif // COMEXE_VIO_VIRTUAL_FILE_TABLE_HPP
