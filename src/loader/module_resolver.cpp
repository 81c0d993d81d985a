#include "loader/module_resolver.hpp"

#include "archive/archive_lookup.hpp"
#include "log/log.hpp"
#include "path/pathname.hpp"

namespace comexe::loader {

auto backend_name(Backend backend) -> const char* {
    switch (backend) {
    case Backend::Archive:
        return "archive";
    case Backend::Filesystem:
        return "filesystem";
    }
    return "???";
}

ModuleResolver::ModuleResolver(RunMode mode, std::string root_directory,
                               archive::ArchiveReader* archive, native::NativeFileIO& io)
    : mode_(mode), root_directory_(std::move(root_directory)), archive_(archive), io_(io) {}

auto ModuleResolver::search_order(BackendPreference preference) const -> std::vector<Backend> {
    Backend preferred = mode_ == RunMode::Embedded ? Backend::Archive : Backend::Filesystem;
    Backend other = preferred == Backend::Archive ? Backend::Filesystem : Backend::Archive;

    switch (preference) {
    case BackendPreference::ArchiveOnly:
        return {Backend::Archive};
    case BackendPreference::FilesystemOnly:
        return {Backend::Filesystem};
    case BackendPreference::Auto:
        return {preferred};
    case BackendPreference::AutoWithFallback:
        return {preferred, other};
    }
    return {};
}

auto ModuleResolver::relative_path(std::string_view relative) const -> std::string {
    return (path::Pathname(root_directory_) + path::Pathname(relative)).to_string();
}

auto ModuleResolver::probe(Backend backend, const std::string& candidate)
    -> std::optional<ResolvedModule> {
    if (backend == Backend::Archive) {
        if (!archive_) {
            return std::nullopt;
        }
        auto entry =
            path::Pathname(candidate, path::PathSyntax::Posix).convert(path::PathMode::Internal);
        COMEXE_LOG_TRACE("loader", "probe archive:" << entry);
        auto content = archive::find_entry(*archive_, entry);
        if (!content) {
            return std::nullopt;
        }
        return ResolvedModule{std::move(*content), entry, Backend::Archive};
    }

    auto native_path = relative_path(candidate);
    COMEXE_LOG_TRACE("loader", "probe " << native_path);
    if (!io_.exists(native_path)) {
        return std::nullopt;
    }
    auto content = native::read_file(io_, native_path);
    if (is_err(content)) {
        COMEXE_LOG_WARN("loader", "cannot read " << native_path << ": "
                                                 << unwrap_err(content).message);
        return std::nullopt;
    }
    return ResolvedModule{std::move(unwrap(content)), native_path, Backend::Filesystem};
}

auto ModuleResolver::load_resource(std::string_view name, BackendPreference preference)
    -> std::optional<ResolvedModule> {
    std::string candidate(name);
    for (auto backend : search_order(preference)) {
        if (auto hit = probe(backend, candidate)) {
            return hit;
        }
    }
    return std::nullopt;
}

auto ModuleResolver::resolve(std::string_view module, const CandidateList& candidates,
                             BackendPreference preference) -> std::optional<ResolvedModule> {
    auto path = module_path(module);
    for (auto backend : search_order(preference)) {
        for (const auto& pattern : candidates) {
            if (auto hit = probe(backend, substitute(pattern, path))) {
                COMEXE_LOG_DEBUG("loader", "resolved " << module << " -> "
                                                       << backend_name(hit->backend) << ":"
                                                       << hit->location);
                return hit;
            }
        }
    }
    return std::nullopt;
}

} // namespace comexe::loader
