//! # Loader Context
//!
//! Per-thread loader state. Each execution thread of the host engine
//! builds one context at startup: it opens its own archive handle, copies
//! the process-wide default searcher configuration and owns its own
//! virtual file table, so nothing here needs locking.

#ifndef COMEXE_LOADER_LOADER_CONTEXT_HPP
#define COMEXE_LOADER_LOADER_CONTEXT_HPP

#include "loader/searcher_registry.hpp"
#include "vio/virtual_file_table.hpp"

namespace comexe::loader {

struct LoaderOptions {
    /// Templates for searcher '2'.
    std::string source_path = "./?.lua;./?/init.lua";
    /// Templates for searchers '3' and '4'.
    std::string native_path = "./?.so";
    FatalHandler on_fatal = exit_with_diagnostic;
};

class LoaderContext {
public:
    static auto create(Application& app, native::NativeFileIO& io, ChunkCompiler& compiler,
                       LoaderOptions options = {}) -> Result<Box<LoaderContext>>;

    LoaderContext(const LoaderContext&) = delete;
    auto operator=(const LoaderContext&) -> LoaderContext& = delete;

    /// Replaces this thread's searchers and the process-wide default.
    auto set_searchers(std::string_view codes) -> Result<bool> {
        return registry_.set_configuration(codes);
    }

    auto require(std::string_view module) -> Result<LoadedModule> {
        return registry_.load(module);
    }

    /// Registers a chunk for the preload searcher.
    void preload(std::string module, std::string content);

    /// Application parameters, plus "SEARCHER_<code>" which reports whether
    /// that searcher is available.
    [[nodiscard]] auto parameter(std::string_view key) const -> std::optional<std::string>;

    [[nodiscard]] auto has_archive() const -> bool {
        return archive_ != nullptr;
    }

    /// The mounted archive, or null when none could be opened.
    auto archive() -> archive::ArchiveReader* {
        return archive_.get();
    }

    auto registry() -> SearcherRegistry& {
        return registry_;
    }
    auto resolver() -> ModuleResolver& {
        return resolver_;
    }
    auto files() -> vio::VirtualFileTable& {
        return files_;
    }

private:
    LoaderContext(Application& app, Box<archive::ArchiveReader> archive, native::NativeFileIO& io,
                  ChunkCompiler& compiler, LoaderOptions options);

    Application& app_;
    Box<archive::ArchiveReader> archive_;
    ModuleResolver resolver_;
    SearcherRegistry registry_;
    vio::VirtualFileTable files_;
    PreloadSearcher* preload_ = nullptr;
};

} // namespace comexe::loader

#endif // COMEXE_LOADER_LOADER_CONTEXT_HPP
