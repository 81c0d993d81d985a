// Test support: PosixFileIO variants that record probes or inject failures.

#ifndef COMEXE_TESTS_FAKE_FILE_IO_HPP
#define COMEXE_TESTS_FAKE_FILE_IO_HPP

#include "native/native_file_io.hpp"

#include <cerrno>
#include <string>
#include <vector>

namespace comexe::test_support {

/// Real file access, with every `exists` probe recorded in order.
class RecordingFileIO : public native::PosixFileIO {
public:
    auto exists(const std::string& path) -> bool override {
        probes.push_back(path);
        return PosixFileIO::exists(path);
    }

    std::vector<std::string> probes;
};

/// Real file access, except for the operations switched off below.
class FaultyFileIO : public native::PosixFileIO {
public:
    auto dup(int fd) -> std::optional<int> override {
        if (fail_dup)
            return std::nullopt;
        return PosixFileIO::dup(fd);
    }

    auto close(int fd) -> bool override {
        bool closed = PosixFileIO::close(fd);
        return fail_close ? false : closed;
    }

    auto write(int fd, std::string_view data, int64_t offset)
        -> Result<size_t, native::NativeError> override {
        if (fail_write)
            return native::NativeError{EIO, "write: injected failure"};
        return PosixFileIO::write(fd, data, offset);
    }

    auto current_directory() -> std::optional<std::string> override {
        if (cwd)
            return cwd;
        return PosixFileIO::current_directory();
    }

    bool fail_dup = false;
    bool fail_close = false;
    bool fail_write = false;
    std::optional<std::string> cwd;
};

} // namespace comexe::test_support

#endif // COMEXE_TESTS_FAKE_FILE_IO_HPP
