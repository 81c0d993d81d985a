//! # Searchers
//!
//! The seven resolver strategies addressable from a searcher configuration.
//!
//! | Code | Strategy                 | Finds                                   |
//! |------|--------------------------|-----------------------------------------|
//! | `1`  | `PreloadSearcher`        | chunks registered in-process            |
//! | `2`  | `SourcePathSearcher`     | source files on a `;`-separated path    |
//! | `3`  | `NativeLibrarySearcher`  | native libraries exporting `luaopen_*`  |
//! | `4`  | `AllInOneSearcher`       | submodules inside the root's library    |
//! | `R`  | `ArchiveSearcher`        | runtime assets in the archive           |
//! | `Z`  | `ArchiveSearcher`        | application modules in the archive      |
//! | `F`  | `FilesystemSearcher`     | application modules under the root      |

#ifndef COMEXE_LOADER_SEARCHERS_HPP
#define COMEXE_LOADER_SEARCHERS_HPP

#include "loader/module_resolver.hpp"

#include <map>

namespace comexe::loader {

enum class ModuleKind {
    Chunk,        ///< Script or bytecode, compiled by the registry
    NativeLibrary ///< Shared library plus entry symbol, opened by the engine
};

/// What a searcher located, before compilation.
struct SearchHit {
    ModuleKind kind = ModuleKind::Chunk;
    /// Human-readable location, e.g. "archive:lua/app.lua" or a native path.
    std::string origin;
    std::string content;
    std::string entry_symbol;
};

class Searcher {
public:
    virtual ~Searcher() = default;

    [[nodiscard]] virtual auto code() const -> char = 0;
    [[nodiscard]] virtual auto description() const -> std::string = 0;

    /// Returns nullopt to defer to the next searcher.
    virtual auto search(std::string_view module) -> std::optional<SearchHit> = 0;
};

// ============================================================================
// Strategies
// ============================================================================

class PreloadSearcher : public Searcher {
public:
    void add(std::string module, std::string content);

    [[nodiscard]] auto code() const -> char override {
        return '1';
    }
    [[nodiscard]] auto description() const -> std::string override {
        return "preload";
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override;

private:
    std::map<std::string, std::string, std::less<>> chunks_;
};

class SourcePathSearcher : public Searcher {
public:
    SourcePathSearcher(std::string search_path, native::NativeFileIO& io);

    [[nodiscard]] auto code() const -> char override {
        return '2';
    }
    [[nodiscard]] auto description() const -> std::string override {
        return "source path";
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override;

private:
    std::string search_path_;
    native::NativeFileIO& io_;
};

/// "luaopen_" + module with dots replaced by underscores. A leading
/// "prefix-" (version tag) is dropped.
auto native_entry_symbol(std::string_view module) -> std::string;

/// Splits a ";"-separated template path.
auto split_search_path(std::string_view search_path) -> std::vector<std::string>;

class NativeLibrarySearcher : public Searcher {
public:
    NativeLibrarySearcher(std::string search_path, native::NativeFileIO& io);

    [[nodiscard]] auto code() const -> char override {
        return '3';
    }
    [[nodiscard]] auto description() const -> std::string override {
        return "native library";
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override;

protected:
    auto find_library(std::string_view module) -> std::optional<std::string>;

    std::string search_path_;
    native::NativeFileIO& io_;
};

/// Looks for "a.b.c" inside the library of its root module "a".
class AllInOneSearcher : public NativeLibrarySearcher {
public:
    using NativeLibrarySearcher::NativeLibrarySearcher;

    [[nodiscard]] auto code() const -> char override {
        return '4';
    }
    [[nodiscard]] auto description() const -> std::string override {
        return "all-in-one native library";
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override;
};

/// Archive-only lookup over a fixed candidate list.
class ArchiveSearcher : public Searcher {
public:
    ArchiveSearcher(char code, std::string description, CandidateList candidates,
                    ModuleResolver& resolver);

    [[nodiscard]] auto code() const -> char override {
        return code_;
    }
    [[nodiscard]] auto description() const -> std::string override {
        return description_;
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override;

private:
    char code_;
    std::string description_;
    CandidateList candidates_;
    ModuleResolver& resolver_;
};

class FilesystemSearcher : public Searcher {
public:
    explicit FilesystemSearcher(ModuleResolver& resolver) : resolver_(resolver) {}

    [[nodiscard]] auto code() const -> char override {
        return 'F';
    }
    [[nodiscard]] auto description() const -> std::string override {
        return "filesystem";
    }
    auto search(std::string_view module) -> std::optional<SearchHit> override;

private:
    ModuleResolver& resolver_;
};

} // namespace comexe::loader

#endif // COMEXE_LOADER_SEARCHERS_HPP
