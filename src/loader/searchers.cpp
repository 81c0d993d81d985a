#include "loader/searchers.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace comexe::loader {

namespace {

auto hit_from(ResolvedModule resolved) -> SearchHit {
    SearchHit hit;
    hit.origin = std::string(backend_name(resolved.backend)) + ":" + resolved.location;
    hit.content = std::move(resolved.content);
    return hit;
}

} // namespace

// ============================================================================
// Preload ('1')
// ============================================================================

void PreloadSearcher::add(std::string module, std::string content) {
    chunks_[std::move(module)] = std::move(content);
}

auto PreloadSearcher::search(std::string_view module) -> std::optional<SearchHit> {
    auto it = chunks_.find(module);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return SearchHit{ModuleKind::Chunk, "preload:" + it->first, it->second, {}};
}

// ============================================================================
// Template paths ('2', '3', '4')
// ============================================================================

auto split_search_path(std::string_view search_path) -> std::vector<std::string> {
    std::vector<std::string> templates;
    size_t pos = 0;
    while (pos <= search_path.size()) {
        size_t semi = std::min(search_path.find(';', pos), search_path.size());
        auto item = search_path.substr(pos, semi - pos);
        if (!item.empty()) {
            templates.emplace_back(item);
        }
        pos = semi + 1;
    }
    return templates;
}

auto native_entry_symbol(std::string_view module) -> std::string {
    if (auto dash = module.find('-'); dash != std::string_view::npos) {
        module = module.substr(dash + 1);
    }
    std::string symbol = "luaopen_" + std::string(module);
    std::replace(symbol.begin(), symbol.end(), '.', '_');
    return symbol;
}

SourcePathSearcher::SourcePathSearcher(std::string search_path, native::NativeFileIO& io)
    : search_path_(std::move(search_path)), io_(io) {}

auto SourcePathSearcher::search(std::string_view module) -> std::optional<SearchHit> {
    auto path = module_path(module);
    for (const auto& pattern : split_search_path(search_path_)) {
        auto candidate = substitute(pattern, path);
        if (!io_.exists(candidate)) {
            continue;
        }
        auto content = native::read_file(io_, candidate);
        if (is_err(content)) {
            COMEXE_LOG_WARN("searcher", "cannot read " << candidate << ": "
                                                       << unwrap_err(content).message);
            continue;
        }
        return SearchHit{ModuleKind::Chunk, candidate, std::move(unwrap(content)), {}};
    }
    return std::nullopt;
}

NativeLibrarySearcher::NativeLibrarySearcher(std::string search_path, native::NativeFileIO& io)
    : search_path_(std::move(search_path)), io_(io) {}

auto NativeLibrarySearcher::find_library(std::string_view module) -> std::optional<std::string> {
    auto path = module_path(module);
    for (const auto& pattern : split_search_path(search_path_)) {
        auto candidate = substitute(pattern, path);
        if (io_.exists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto NativeLibrarySearcher::search(std::string_view module) -> std::optional<SearchHit> {
    auto library = find_library(module);
    if (!library) {
        return std::nullopt;
    }
    return SearchHit{ModuleKind::NativeLibrary, *library, {}, native_entry_symbol(module)};
}

auto AllInOneSearcher::search(std::string_view module) -> std::optional<SearchHit> {
    auto dot = module.find('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    auto library = find_library(module.substr(0, dot));
    if (!library) {
        return std::nullopt;
    }
    return SearchHit{ModuleKind::NativeLibrary, *library, {}, native_entry_symbol(module)};
}

// ============================================================================
// Archive ('R', 'Z') and filesystem ('F')
// ============================================================================

ArchiveSearcher::ArchiveSearcher(char code, std::string description, CandidateList candidates,
                                 ModuleResolver& resolver)
    : code_(code), description_(std::move(description)), candidates_(std::move(candidates)),
      resolver_(resolver) {}

auto ArchiveSearcher::search(std::string_view module) -> std::optional<SearchHit> {
    auto resolved = resolver_.resolve(module, candidates_, BackendPreference::ArchiveOnly);
    if (!resolved) {
        return std::nullopt;
    }
    return hit_from(std::move(*resolved));
}

auto FilesystemSearcher::search(std::string_view module) -> std::optional<SearchHit> {
    auto resolved =
        resolver_.resolve(module, application_candidates(), BackendPreference::FilesystemOnly);
    if (!resolved) {
        return std::nullopt;
    }
    return hit_from(std::move(*resolved));
}

} // namespace comexe::loader
