#include "log/log.hpp"
#include "native/native_file_io.hpp"

#include <fcntl.h>

namespace comexe::native {

auto read_file(NativeFileIO& io, const std::string& path) -> Result<std::string, NativeError> {
    auto opened = io.open(path, O_RDONLY, 0);
    if (is_err(opened)) {
        return unwrap_err(opened);
    }
    int fd = unwrap(opened);

    auto size = io.fstat_size(fd);
    Result<std::string, NativeError> content = std::string();
    if (is_err(size)) {
        content = unwrap_err(size);
    } else {
        std::string data;
        data.reserve(static_cast<size_t>(unwrap(size)));
        // Keep reading until EOF: the size is only a hint for growing files.
        while (true) {
            auto chunk = io.read(fd, 64 * 1024, CURRENT_POSITION);
            if (is_err(chunk)) {
                content = unwrap_err(chunk);
                break;
            }
            if (unwrap(chunk).empty()) {
                content = std::move(data);
                break;
            }
            data += unwrap(chunk);
        }
    }

    if (!io.close(fd)) {
        COMEXE_LOG_WARN("native", "close failed after reading " << path);
    }
    return content;
}

auto write_file(NativeFileIO& io, const std::string& path, std::string_view data)
    -> Result<size_t, NativeError> {
    auto opened = io.open(path, O_WRONLY | O_CREAT | O_TRUNC, DEFAULT_CREATE_MODE);
    if (is_err(opened)) {
        return unwrap_err(opened);
    }
    int fd = unwrap(opened);

    size_t written = 0;
    while (written < data.size()) {
        auto put = io.write(fd, data.substr(written), CURRENT_POSITION);
        if (is_err(put) || unwrap(put) == 0) {
            NativeError error =
                is_err(put) ? unwrap_err(put) : NativeError{0, "short write to " + path};
            if (!io.close(fd)) {
                COMEXE_LOG_WARN("native", "close failed after write error on " << path);
            }
            return error;
        }
        written += unwrap(put);
    }

    if (!io.close(fd)) {
        return NativeError{0, "close failed for " + path};
    }
    return written;
}

} // namespace comexe::native
