//! # Application
//!
//! Process-wide facts established once at startup: run mode, root
//! directory, where the embedded archive lives, and the default searcher
//! configuration that every new execution thread starts from.
//!
//! ## Run Mode
//!
//! | Configured              | Mode        | "Auto" prefers |
//! |-------------------------|-------------|----------------|
//! | entry point set         | Embedded    | archive        |
//! | no entry point          | Interpreter | filesystem     |
//!
//! ## Root Directory
//!
//! In Interpreter mode with a script, the root is the script's directory
//! (absolute script), or `<cwd>/<script dir>` (relative script with a
//! directory part). Otherwise the root is the working directory.

#ifndef COMEXE_LOADER_APPLICATION_HPP
#define COMEXE_LOADER_APPLICATION_HPP

#include "common.hpp"
#include "native/native_file_io.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace comexe::loader {

enum class RunMode { Embedded, Interpreter };

auto run_mode_name(RunMode mode) -> const char*;

// ============================================================================
// Searcher Codes
// ============================================================================

/// Every code a searcher configuration may contain, in documentation order:
/// `1` preload, `2` source path, `3` native library, `4` all-in-one native
/// library, `R` archive runtime assets, `Z` archive application,
/// `F` filesystem.
constexpr std::string_view SEARCHER_CODES = "1234RZF";

constexpr size_t MAX_SEARCHER_CONFIG = 15;

constexpr const char* DEFAULT_SEARCHER_CONFIG = "1RZ";

/// Checks length and membership of every code.
auto validate_searcher_codes(std::string_view codes) -> Result<bool>;

/// Process-wide default searcher configuration, read when a thread starts.
class SearcherDefaults {
public:
    explicit SearcherDefaults(std::string codes) : codes_(std::move(codes)) {}

    auto get() const -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return codes_;
    }

    void set(std::string codes) {
        std::lock_guard<std::mutex> lock(mutex_);
        codes_ = std::move(codes);
    }

private:
    mutable std::mutex mutex_;
    std::string codes_;
};

// ============================================================================
// Application
// ============================================================================

struct ApplicationConfig {
    std::string executable;
    /// Defaults to `executable`: the distributable carries its own archive.
    std::optional<std::string> archive_path;
    /// Module run first in Embedded mode.
    std::optional<std::string> entry_point;
    /// Script given on the command line in Interpreter mode.
    std::optional<std::string> script;
    std::string searchers = DEFAULT_SEARCHER_CONFIG;
    /// Replaces the process working directory when set.
    std::optional<std::string> working_directory;
};

class Application {
public:
    static auto create(ApplicationConfig config, native::NativeFileIO& io)
        -> Result<Box<Application>>;

    [[nodiscard]] auto run_mode() const -> RunMode {
        return run_mode_;
    }
    [[nodiscard]] auto root_directory() const -> const std::string& {
        return root_directory_;
    }
    [[nodiscard]] auto archive_path() const -> const std::string& {
        return archive_path_;
    }
    [[nodiscard]] auto config() const -> const ApplicationConfig& {
        return config_;
    }

    auto searcher_defaults() -> SearcherDefaults& {
        return defaults_;
    }
    auto searcher_defaults() const -> const SearcherDefaults& {
        return defaults_;
    }

    /// Answers INTERNAL-DIR-SEP, NATIVE-DIR-SEP, ARCH, OS, RUN-MODE,
    /// ROOT-DIR, EXE, SCRIPT, ENTRY-POINT and LOADER-CONFIG.
    [[nodiscard]] auto parameter(std::string_view key) const -> std::optional<std::string>;

private:
    Application(ApplicationConfig config, RunMode mode, std::string root);

    ApplicationConfig config_;
    RunMode run_mode_;
    std::string root_directory_;
    std::string archive_path_;
    SearcherDefaults defaults_;
};

} // namespace comexe::loader

#endif // COMEXE_LOADER_APPLICATION_HPP
