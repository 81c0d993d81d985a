//! # Search Candidates
//!
//! Ordered template lists probed when resolving a module. Each template
//! holds `?` where the module's slash-joined name goes. Order encodes
//! priority: the precompiled variant before the source variant, and the
//! `<name>.<ext>` form before the `<name>/init.<ext>` form.

#ifndef COMEXE_LOADER_SEARCH_CANDIDATES_HPP
#define COMEXE_LOADER_SEARCH_CANDIDATES_HPP

#include <string>
#include <string_view>
#include <vector>

namespace comexe::loader {

using CandidateList = std::vector<std::string>;

constexpr char PLACEHOLDER = '?';

/// Runtime assets shipped under `comexe/usr/share/lua/5.5/` in the archive.
auto runtime_candidates() -> const CandidateList&;

/// Application modules under `lua/`, the root, and `share/lua/5.5/`.
auto application_candidates() -> const CandidateList&;

/// "a.b.c" -> "a/b/c".
auto module_path(std::string_view module) -> std::string;

/// Replaces every placeholder in `pattern` with `path`.
auto substitute(std::string_view pattern, std::string_view path) -> std::string;

} // namespace comexe::loader

#endif // COMEXE_LOADER_SEARCH_CANDIDATES_HPP
