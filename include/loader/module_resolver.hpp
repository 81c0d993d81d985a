//! # Module Resolver
//!
//! Turns a dotted module name into byte content by probing candidate
//! templates across the archive and filesystem backends.
//!
//! Backends form the outer loop and candidates the inner loop, so with
//! `AutoWithFallback` every candidate is tried in the preferred backend
//! before the other backend is consulted. The first hit wins. A miss is
//! `std::nullopt`, never an error.
//!
//! | Preference         | Embedded            | Interpreter         |
//! |--------------------|---------------------|---------------------|
//! | `ArchiveOnly`      | archive             | archive             |
//! | `FilesystemOnly`   | filesystem          | filesystem          |
//! | `Auto`             | archive             | filesystem          |
//! | `AutoWithFallback` | archive, filesystem | filesystem, archive |

#ifndef COMEXE_LOADER_MODULE_RESOLVER_HPP
#define COMEXE_LOADER_MODULE_RESOLVER_HPP

#include "archive/archive_reader.hpp"
#include "loader/application.hpp"
#include "loader/search_candidates.hpp"
#include "native/native_file_io.hpp"

namespace comexe::loader {

enum class Backend { Archive, Filesystem };

auto backend_name(Backend backend) -> const char*;

enum class BackendPreference { ArchiveOnly, FilesystemOnly, Auto, AutoWithFallback };

struct ResolvedModule {
    std::string content;
    /// Archive entry name or native path.
    std::string location;
    Backend backend;
};

class ModuleResolver {
public:
    /// `archive` may be null; archive lookups then always miss.
    ModuleResolver(RunMode mode, std::string root_directory, archive::ArchiveReader* archive,
                   native::NativeFileIO& io);

    [[nodiscard]] auto search_order(BackendPreference preference) const -> std::vector<Backend>;

    /// Looks up a single resource name, without templates.
    auto load_resource(std::string_view name, BackendPreference preference)
        -> std::optional<ResolvedModule>;

    auto resolve(std::string_view module, const CandidateList& candidates,
                 BackendPreference preference) -> std::optional<ResolvedModule>;

    /// Root directory joined with `relative`, in native form.
    [[nodiscard]] auto relative_path(std::string_view relative) const -> std::string;

    [[nodiscard]] auto root_directory() const -> const std::string& {
        return root_directory_;
    }

private:
    auto probe(Backend backend, const std::string& candidate) -> std::optional<ResolvedModule>;

    RunMode mode_;
    std::string root_directory_;
    archive::ArchiveReader* archive_;
    native::NativeFileIO& io_;
};

} // namespace comexe::loader

#endif // COMEXE_LOADER_MODULE_RESOLVER_HPP
