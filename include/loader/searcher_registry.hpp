//! # Searcher Registry
//!
//! Ordered, reconfigurable list of searchers consulted by `load()`.
//!
//! The active list is chosen by a configuration string of searcher codes
//! (see `SEARCHER_CODES`). A successful `set_configuration` replaces the
//! registry's own list and publishes the string as the process-wide
//! default for threads started later. A rejected string changes nothing.
//!
//! A module that is found but fails to compile is fatal: the failure is
//! logged and handed to the fatal handler, which by default exits the
//! process with status 1.

#ifndef COMEXE_LOADER_SEARCHER_REGISTRY_HPP
#define COMEXE_LOADER_SEARCHER_REGISTRY_HPP

#include "loader/application.hpp"
#include "loader/chunk_compiler.hpp"
#include "loader/searchers.hpp"

#include <functional>
#include <vector>

namespace comexe::loader {

struct LoadedModule {
    std::string name;
    char searcher;
    std::string origin;
    ModuleKind kind;
    /// Set for `ModuleKind::Chunk`.
    std::optional<CompiledChunk> chunk;
    /// Set for `ModuleKind::NativeLibrary`; `origin` holds the library path.
    std::string entry_symbol;
};

using FatalHandler = std::function<void(const std::string& diagnostic)>;

/// Flushes the logger and exits with status 1.
[[noreturn]] void exit_with_diagnostic(const std::string& diagnostic);

class SearcherRegistry {
public:
    /// `defaults` may be null when no process-wide default is shared.
    SearcherRegistry(ChunkCompiler& compiler, SearcherDefaults* defaults,
                     FatalHandler on_fatal = exit_with_diagnostic);

    /// Makes a searcher available to configurations. A searcher with the
    /// same code is replaced.
    void register_searcher(Box<Searcher> searcher);

    [[nodiscard]] auto find(char code) const -> Searcher*;

    auto set_configuration(std::string_view codes) -> Result<bool>;

    [[nodiscard]] auto configuration() const -> const std::string& {
        return configuration_;
    }

    [[nodiscard]] auto active() const -> const std::vector<Searcher*>& {
        return active_;
    }

    /// First hit across the active searchers, or a "module not found"
    /// error listing every searcher consulted.
    auto load(std::string_view module) -> Result<LoadedModule>;

private:
    auto compile_hit(std::string_view module, const Searcher& searcher, SearchHit hit)
        -> Result<LoadedModule>;

    ChunkCompiler& compiler_;
    SearcherDefaults* defaults_;
    FatalHandler on_fatal_;
    std::vector<Box<Searcher>> searchers_;
    std::vector<Searcher*> active_;
    std::string configuration_;
};

} // namespace comexe::loader

#endif // COMEXE_LOADER_SEARCHER_REGISTRY_HPP
