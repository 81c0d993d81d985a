//! # Platform Constants
//!
//! Build-time facts about the host that the loader exposes to scripts and
//! bakes into module search candidates.

#ifndef COMEXE_RUNTIME_PLATFORM_HPP
#define COMEXE_RUNTIME_PLATFORM_HPP

#include <string>
#include <string_view>

namespace comexe::platform {

#ifdef _WIN32
constexpr std::string_view OS = "windows";
constexpr char NATIVE_DIR_SEP = '\\';
#else
constexpr std::string_view OS = "linux";
constexpr char NATIVE_DIR_SEP = '/';
#endif

constexpr std::string_view ARCH = "x86_64";
constexpr char INTERNAL_DIR_SEP = '/';

/// Suffix of precompiled modules, e.g. "-x86_64-linux.bin".
inline std::string binary_suffix() {
    return "-" + std::string(ARCH) + "-" + std::string(OS) + ".bin";
}

} // namespace comexe::platform

#endif // COMEXE_RUNTIME_PLATFORM_HPP
