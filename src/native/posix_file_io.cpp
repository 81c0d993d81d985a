//! # POSIX File I/O
//!
//! Every call retries on EINTR and converts failures into `NativeError`
//! carrying errno.

#include "native/native_file_io.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace comexe::native {

namespace {

auto last_error(std::string_view what) -> NativeError {
    int code = errno;
    return NativeError{code, std::string(what) + ": " + std::strerror(code)};
}

template <typename F> auto retry_on_eintr(F call) -> decltype(call()) {
    decltype(call()) rc;
    do {
        rc = call();
    } while (rc < 0 && errno == EINTR);
    return rc;
}

} // namespace

auto PosixFileIO::open(const std::string& path, int flags, int mode) -> Result<int, NativeError> {
    if (mode == 0) {
        mode = DEFAULT_CREATE_MODE;
    }
    int fd = retry_on_eintr([&] { return ::open(path.c_str(), flags, mode); });
    if (fd < 0) {
        return last_error("open " + path);
    }
    return fd;
}

auto PosixFileIO::fstat_size(int fd) -> Result<uint64_t, NativeError> {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        return last_error("fstat");
    }
    return static_cast<uint64_t>(st.st_size);
}

auto PosixFileIO::read(int fd, size_t n, int64_t offset) -> Result<std::string, NativeError> {
    std::string buffer(n, '\0');
    ssize_t got = retry_on_eintr([&] {
        return offset == CURRENT_POSITION ? ::read(fd, buffer.data(), n)
                                          : ::pread(fd, buffer.data(), n, offset);
    });
    if (got < 0) {
        return last_error("read");
    }
    buffer.resize(static_cast<size_t>(got));
    return buffer;
}

auto PosixFileIO::write(int fd, std::string_view data, int64_t offset)
    -> Result<size_t, NativeError> {
    ssize_t put = retry_on_eintr([&] {
        return offset == CURRENT_POSITION ? ::write(fd, data.data(), data.size())
                                          : ::pwrite(fd, data.data(), data.size(), offset);
    });
    if (put < 0) {
        return last_error("write");
    }
    return static_cast<size_t>(put);
}

auto PosixFileIO::lseek(int fd, int64_t offset, int whence) -> Result<int64_t, NativeError> {
    off_t pos = ::lseek(fd, static_cast<off_t>(offset), whence);
    if (pos < 0) {
        return last_error("lseek");
    }
    return static_cast<int64_t>(pos);
}

auto PosixFileIO::close(int fd) -> bool {
    return ::close(fd) == 0;
}

auto PosixFileIO::dup(int fd) -> std::optional<int> {
    int copy = ::dup(fd);
    if (copy < 0) {
        return std::nullopt;
    }
    return copy;
}

auto PosixFileIO::exists(const std::string& path) -> bool {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && !S_ISDIR(st.st_mode);
}

auto PosixFileIO::current_directory() -> std::optional<std::string> {
    std::vector<char> buffer(4096);
    while (::getcwd(buffer.data(), buffer.size()) == nullptr) {
        if (errno != ERANGE) {
            COMEXE_LOG_ERROR("native", "getcwd failed: " << std::strerror(errno));
            return std::nullopt;
        }
        buffer.resize(buffer.size() * 2);
    }
    return std::string(buffer.data());
}

} // namespace comexe::native
