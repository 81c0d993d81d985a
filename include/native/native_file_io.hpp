//! # Native File I/O
//!
//! Thin boundary over the host's file-descriptor primitives. The loader
//! and the virtual file table only talk to the OS through `NativeFileIO`,
//! which lets tests substitute failing or recording implementations.
//!
//! Offsets of `-1` passed to `read`/`write` mean "at the current position".

#ifndef COMEXE_NATIVE_NATIVE_FILE_IO_HPP
#define COMEXE_NATIVE_NATIVE_FILE_IO_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace comexe::native {

/// Creation mode used when a caller passes mode 0.
constexpr int DEFAULT_CREATE_MODE = 0600;

constexpr int64_t CURRENT_POSITION = -1;

/// An OS failure: `code` is the errno value.
struct NativeError {
    int code = 0;
    std::string message;
};

class NativeFileIO {
public:
    virtual ~NativeFileIO() = default;

    virtual auto open(const std::string& path, int flags, int mode) -> Result<int, NativeError> = 0;
    virtual auto fstat_size(int fd) -> Result<uint64_t, NativeError> = 0;
    virtual auto read(int fd, size_t n, int64_t offset) -> Result<std::string, NativeError> = 0;
    virtual auto write(int fd, std::string_view data, int64_t offset)
        -> Result<size_t, NativeError> = 0;
    virtual auto lseek(int fd, int64_t offset, int whence) -> Result<int64_t, NativeError> = 0;
    virtual auto close(int fd) -> bool = 0;
    virtual auto dup(int fd) -> std::optional<int> = 0;

    /// True when `path` names an existing non-directory.
    virtual auto exists(const std::string& path) -> bool = 0;
    virtual auto current_directory() -> std::optional<std::string> = 0;
};

/// `NativeFileIO` over POSIX `open`/`pread`/`pwrite`/`lseek`/`dup`.
class PosixFileIO : public NativeFileIO {
public:
    auto open(const std::string& path, int flags, int mode) -> Result<int, NativeError> override;
    auto fstat_size(int fd) -> Result<uint64_t, NativeError> override;
    auto read(int fd, size_t n, int64_t offset) -> Result<std::string, NativeError> override;
    auto write(int fd, std::string_view data, int64_t offset)
        -> Result<size_t, NativeError> override;
    auto lseek(int fd, int64_t offset, int whence) -> Result<int64_t, NativeError> override;
    auto close(int fd) -> bool override;
    auto dup(int fd) -> std::optional<int> override;
    auto exists(const std::string& path) -> bool override;
    auto current_directory() -> std::optional<std::string> override;
};

// ============================================================================
// Whole-file helpers
// ============================================================================

/// Opens read-only, sizes with fstat and reads everything.
auto read_file(NativeFileIO& io, const std::string& path) -> Result<std::string, NativeError>;

/// Creates or truncates `path` (mode 0600) and writes `data`.
auto write_file(NativeFileIO& io, const std::string& path, std::string_view data)
    -> Result<size_t, NativeError>;

} // namespace comexe::native

#endif // COMEXE_NATIVE_NATIVE_FILE_IO_HPP
