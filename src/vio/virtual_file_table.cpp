//! # Virtual File Table Implementation
//!
//! Each operation traces its arguments and result under the "vio" module.

#include "vio/virtual_file_table.hpp"

#include "archive/archive_lookup.hpp"
#include "log/log.hpp"
#include "path/pathname.hpp"

#include <algorithm>
#include <cstring>

#include <fcntl.h>

namespace comexe::vio {

// ============================================================================
// Diagnostics
// ============================================================================

auto error_name(IoError error) -> const char* {
    switch (error) {
    case IoError::NoSuchFile:
        return "ENOENT";
    case IoError::Io:
        return "EIO";
    case IoError::BadFileDescriptor:
        return "EBADF";
    case IoError::PermissionDenied:
        return "EACCES";
    case IoError::IllegalSeek:
        return "ESPIPE";
    }
    return "E?";
}

auto describe_result(int64_t result) -> std::string {
    if (result >= 0) {
        return std::to_string(result);
    }
    for (auto error : {IoError::NoSuchFile, IoError::Io, IoError::BadFileDescriptor,
                       IoError::PermissionDenied, IoError::IllegalSeek}) {
        if (error_code(error) == result) {
            return std::to_string(result) + " (-" + error_name(error) + ")";
        }
    }
    return std::to_string(result);
}

auto describe_flags(int flags) -> std::string {
    std::string text;
    switch (flags & O_ACCMODE) {
    case O_WRONLY:
        text = "O_WRONLY";
        break;
    case O_RDWR:
        text = "O_RDWR";
        break;
    default:
        text = "O_RDONLY";
        break;
    }
    static constexpr std::pair<int, const char*> extras[] = {
        {O_CREAT, "O_CREAT"}, {O_EXCL, "O_EXCL"}, {O_TRUNC, "O_TRUNC"}, {O_APPEND, "O_APPEND"}};
    for (const auto& [bit, name] : extras) {
        if (flags & bit) {
            text += '|';
            text += name;
        }
    }
    return text;
}

// ============================================================================
// Slot table
// ============================================================================

VirtualFileTable::VirtualFileTable(archive::ArchiveReader* archive, native::NativeFileIO& io)
    : archive_(archive), io_(io) {}

auto VirtualFileTable::lookup(int fd) -> Descriptor* {
    if (fd < 1 || static_cast<size_t>(fd) > slots_.size()) {
        return nullptr;
    }
    auto& slot = slots_[static_cast<size_t>(fd) - 1];
    return slot ? &*slot : nullptr;
}

auto VirtualFileTable::allocate(Descriptor descriptor) -> int {
    if (!free_ids_.empty()) {
        int fd = free_ids_.back();
        free_ids_.pop_back();
        slots_[static_cast<size_t>(fd) - 1] = std::move(descriptor);
        return fd;
    }
    slots_.emplace_back(std::move(descriptor));
    return static_cast<int>(slots_.size());
}

void VirtualFileTable::release(int fd) {
    slots_[static_cast<size_t>(fd) - 1].reset();
    free_ids_.push_back(fd);
}

auto VirtualFileTable::is_open(int fd) const -> bool {
    return fd >= 1 && static_cast<size_t>(fd) <= slots_.size() &&
           slots_[static_cast<size_t>(fd) - 1].has_value();
}

auto VirtualFileTable::open_count() const -> size_t {
    return static_cast<size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const auto& s) { return s.has_value(); }));
}

// ============================================================================
// Operations
// ============================================================================

auto VirtualFileTable::try_archive(std::string_view path, int flags)
    -> std::optional<ArchiveFile> {
    if (!archive_ || (flags & O_ACCMODE) != O_RDONLY || !path.starts_with(RUNTIME_PREFIX)) {
        return std::nullopt;
    }
    auto rest = path.substr(RUNTIME_PREFIX.size());
    if (!rest.empty() && rest.front() != '/') {
        return std::nullopt;
    }

    // Mapped relative to the asset directory; ".." may not climb out of it.
    path::Pathname relative(rest.empty() ? rest : rest.substr(1), path::PathSyntax::Posix);
    if (relative.depth() == 0 || relative.is_absolute() ||
        std::get<std::string>(relative.segments().front()) == "..") {
        return std::nullopt;
    }
    auto entry = std::string(ARCHIVE_ASSET_DIR) + "/" + relative.convert(path::PathMode::Internal);

    auto content = archive::find_entry(*archive_, entry);
    if (!content) {
        COMEXE_LOG_TRACE("vio", "archive miss for " << entry);
        return std::nullopt;
    }
    return ArchiveFile{make_rc<const std::string>(std::move(*content)), 0, flags,
                       std::string(path)};
}

auto VirtualFileTable::open(std::string_view path, int flags, int mode) -> int64_t {
    if (mode == 0) {
        mode = native::DEFAULT_CREATE_MODE;
    }

    int64_t result;
    if (auto file = try_archive(path, flags)) {
        result = allocate(std::move(*file));
    } else {
        auto opened = io_.open(std::string(path), flags, mode);
        if (is_ok(opened)) {
            result = allocate(NativeFile{unwrap(opened), flags, std::string(path)});
        } else {
            COMEXE_LOG_DEBUG("vio", unwrap_err(opened).message);
            result = error_code(IoError::NoSuchFile);
        }
    }

    COMEXE_LOG_TRACE("vio", "OPEN " << path << " " << describe_flags(flags) << " 0" << std::oct
                                    << mode << std::dec << " -> " << describe_result(result)
                                    << (result >= 0 ? " (fd)" : ""));
    return result;
}

auto VirtualFileTable::read(int fd, size_t n) -> Result<std::string, IoError> {
    auto* descriptor = lookup(fd);
    if (!descriptor) {
        COMEXE_LOG_TRACE("vio", "READ fd=" << fd << " -> bad descriptor");
        return IoError::BadFileDescriptor;
    }

    if (auto* file = std::get_if<ArchiveFile>(descriptor)) {
        size_t remaining = file->bytes->size() - file->cursor;
        size_t take = std::min(n, remaining);
        std::string bytes = file->bytes->substr(file->cursor, take);
        file->cursor += take;
        COMEXE_LOG_TRACE("vio", "READ fd=" << fd << " n=" << n << " -> " << take << " (archive)");
        return bytes;
    }

    auto& file = std::get<NativeFile>(*descriptor);
    auto got = io_.read(file.handle, n, native::CURRENT_POSITION);
    if (is_err(got)) {
        COMEXE_LOG_TRACE("vio", "READ fd=" << fd << " -> " << unwrap_err(got).message);
        return IoError::Io;
    }
    COMEXE_LOG_TRACE("vio", "READ fd=" << fd << " n=" << n << " -> " << unwrap(got).size());
    return std::move(unwrap(got));
}

auto VirtualFileTable::read_into(int fd, char* buffer, size_t n) -> int64_t {
    auto got = read(fd, n);
    if (is_err(got)) {
        return error_code(unwrap_err(got));
    }
    const auto& bytes = unwrap(got);
    std::memcpy(buffer, bytes.data(), bytes.size());
    return static_cast<int64_t>(bytes.size());
}

auto VirtualFileTable::write(int fd, std::string_view data) -> int64_t {
    auto* descriptor = lookup(fd);
    int64_t result;
    if (!descriptor) {
        result = error_code(IoError::BadFileDescriptor);
    } else if (std::holds_alternative<ArchiveFile>(*descriptor)) {
        result = error_code(IoError::PermissionDenied);
    } else {
        auto put = io_.write(std::get<NativeFile>(*descriptor).handle, data,
                             native::CURRENT_POSITION);
        result = is_ok(put) ? static_cast<int64_t>(unwrap(put)) : error_code(IoError::Io);
    }
    COMEXE_LOG_TRACE("vio", "WRITE fd=" << fd << " n=" << data.size() << " -> "
                                        << describe_result(result));
    return result;
}

auto VirtualFileTable::seek(int fd, int64_t offset, int whence) -> int64_t {
    auto* descriptor = lookup(fd);
    int64_t result;
    if (!descriptor) {
        result = error_code(IoError::BadFileDescriptor);
    } else if (auto* file = std::get_if<ArchiveFile>(descriptor)) {
        auto length = static_cast<int64_t>(file->bytes->size());
        std::optional<int64_t> base;
        switch (static_cast<Whence>(whence)) {
        case Whence::Set:
            base = 0;
            break;
        case Whence::Current:
            base = static_cast<int64_t>(file->cursor);
            break;
        case Whence::End:
            base = length;
            break;
        }
        if (!base) {
            result = error_code(IoError::IllegalSeek);
        } else {
            // Saturate instead of adding: base + offset may overflow.
            if (offset > length - *base) {
                result = length;
            } else if (offset < -*base) {
                result = 0;
            } else {
                result = *base + offset;
            }
            file->cursor = static_cast<size_t>(result);
        }
    } else {
        auto pos = io_.lseek(std::get<NativeFile>(*descriptor).handle, offset, whence);
        result = is_ok(pos) ? unwrap(pos) : error_code(IoError::IllegalSeek);
    }
    COMEXE_LOG_TRACE("vio", "SEEK fd=" << fd << " offset=" << offset << " whence=" << whence
                                       << " -> " << describe_result(result));
    return result;
}

auto VirtualFileTable::close(int fd) -> int64_t {
    auto* descriptor = lookup(fd);
    int64_t result = 0;
    if (!descriptor) {
        result = error_code(IoError::BadFileDescriptor);
    } else {
        if (auto* file = std::get_if<NativeFile>(descriptor); file && !io_.close(file->handle)) {
            result = error_code(IoError::BadFileDescriptor);
        }
        release(fd);
    }
    COMEXE_LOG_TRACE("vio", "CLOSE fd=" << fd << " -> " << describe_result(result));
    return result;
}

auto VirtualFileTable::dup(int fd) -> int64_t {
    auto* descriptor = lookup(fd);
    int64_t result;
    if (!descriptor) {
        result = error_code(IoError::BadFileDescriptor);
    } else if (auto* file = std::get_if<ArchiveFile>(descriptor)) {
        result = allocate(ArchiveFile(*file));
    } else {
        const auto& native_file = std::get<NativeFile>(*descriptor);
        if (auto handle = io_.dup(native_file.handle)) {
            result = allocate(NativeFile{*handle, native_file.flags, native_file.path});
        } else {
            result = error_code(IoError::BadFileDescriptor);
        }
    }
    COMEXE_LOG_TRACE("vio", "DUP fd=" << fd << " -> " << describe_result(result));
    return result;
}

// ============================================================================
// Event dispatch
// ============================================================================

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

auto VirtualFileTable::handle(const IoEvent& event) -> IoReply {
    return std::visit(
        overloaded{
            [this](const OpenEvent& e) { return IoReply{open(e.path, e.flags, e.mode), {}}; },
            [this](const ReadEvent& e) {
                auto got = read(e.fd, e.count);
                if (is_err(got)) {
                    return IoReply{error_code(unwrap_err(got)), {}};
                }
                auto size = static_cast<int64_t>(unwrap(got).size());
                return IoReply{size, std::move(unwrap(got))};
            },
            [this](const WriteEvent& e) { return IoReply{write(e.fd, e.data), {}}; },
            [this](const SeekEvent& e) { return IoReply{seek(e.fd, e.offset, e.whence), {}}; },
            [this](const CloseEvent& e) { return IoReply{close(e.fd), {}}; },
            [this](const DupEvent& e) { return IoReply{dup(e.fd), {}}; },
        },
        event);
}

} // namespace comexe::vio
