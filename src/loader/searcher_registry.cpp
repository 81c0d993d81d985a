#include "loader/searcher_registry.hpp"

#include "log/log.hpp"

#include <cstdlib>

namespace comexe::loader {

void exit_with_diagnostic(const std::string& diagnostic) {
    COMEXE_LOG_FATAL("searcher", diagnostic);
    log::Logger::instance().flush();
    std::exit(1);
}

SearcherRegistry::SearcherRegistry(ChunkCompiler& compiler, SearcherDefaults* defaults,
                                   FatalHandler on_fatal)
    : compiler_(compiler), defaults_(defaults), on_fatal_(std::move(on_fatal)) {}

void SearcherRegistry::register_searcher(Box<Searcher> searcher) {
    for (auto& existing : searchers_) {
        if (existing->code() == searcher->code()) {
            // Keep the active list pointing at live searchers.
            for (auto& active : active_) {
                if (active == existing.get())
                    active = searcher.get();
            }
            existing = std::move(searcher);
            return;
        }
    }
    searchers_.push_back(std::move(searcher));
}

auto SearcherRegistry::find(char code) const -> Searcher* {
    for (const auto& searcher : searchers_) {
        if (searcher->code() == code)
            return searcher.get();
    }
    return nullptr;
}

auto SearcherRegistry::set_configuration(std::string_view codes) -> Result<bool> {
    auto valid = validate_searcher_codes(codes);
    if (is_err(valid)) {
        COMEXE_LOG_WARN("searcher", unwrap_err(valid));
        return unwrap_err(valid);
    }

    std::vector<Searcher*> list;
    for (char code : codes) {
        auto* searcher = find(code);
        if (!searcher) {
            return "Searcher not available: " + std::string(1, code);
        }
        list.push_back(searcher);
    }

    active_ = std::move(list);
    configuration_ = std::string(codes);
    if (defaults_) {
        defaults_->set(configuration_);
    }
    COMEXE_LOG_INFO("searcher", "configuration set to \"" << configuration_ << "\"");
    return true;
}

auto SearcherRegistry::compile_hit(std::string_view module, const Searcher& searcher,
                                   SearchHit hit) -> Result<LoadedModule> {
    LoadedModule loaded{std::string(module), searcher.code(), std::move(hit.origin), hit.kind,
                        std::nullopt, std::move(hit.entry_symbol)};
    if (hit.kind == ModuleKind::NativeLibrary) {
        return std::move(loaded);
    }

    auto chunk = compiler_.compile(hit.content, loaded.origin);
    if (is_err(chunk)) {
        auto diagnostic = "error loading module '" + loaded.name + "' from " + loaded.origin +
                          " (" + searcher.description() + "):\n\t" + unwrap_err(chunk);
        on_fatal_(diagnostic);
        // Only reached when the handler returns, e.g. under test.
        return diagnostic;
    }
    loaded.chunk = std::move(unwrap(chunk));
    return std::move(loaded);
}

auto SearcherRegistry::load(std::string_view module) -> Result<LoadedModule> {
    std::string tried;
    for (auto* searcher : active_) {
        auto hit = searcher->search(module);
        if (!hit) {
            COMEXE_LOG_TRACE("searcher", searcher->code() << ": no match for " << module);
            tried += "\n\tno " + searcher->description() + " match";
            continue;
        }
        COMEXE_LOG_DEBUG("searcher", searcher->code() << ": " << module << " <- " << hit->origin);
        return compile_hit(module, *searcher, std::move(*hit));
    }
    return "module '" + std::string(module) + "' not found:" + tried;
}

} // namespace comexe::loader
