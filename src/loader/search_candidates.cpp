#include "loader/search_candidates.hpp"

#include "runtime/platform.hpp"

#include <algorithm>

namespace comexe::loader {

namespace {

/// The four templates tried under one directory prefix.
void append_variants(CandidateList& list, const std::string& prefix) {
    const std::string bin = platform::binary_suffix();
    list.push_back(prefix + "?" + bin);
    list.push_back(prefix + "?.lua");
    list.push_back(prefix + "?/init" + bin);
    list.push_back(prefix + "?/init.lua");
}

} // namespace

auto runtime_candidates() -> const CandidateList& {
    static const CandidateList list = [] {
        CandidateList l;
        append_variants(l, "comexe/usr/share/lua/5.5/");
        return l;
    }();
    return list;
}

auto application_candidates() -> const CandidateList& {
    static const CandidateList list = [] {
        CandidateList l;
        append_variants(l, "lua/");
        append_variants(l, "");
        append_variants(l, "share/lua/5.5/");
        return l;
    }();
    return list;
}

auto module_path(std::string_view module) -> std::string {
    std::string path(module);
    std::replace(path.begin(), path.end(), '.', platform::INTERNAL_DIR_SEP);
    return path;
}

auto substitute(std::string_view pattern, std::string_view path) -> std::string {
    std::string result;
    result.reserve(pattern.size() + path.size());
    for (char c : pattern) {
        if (c == PLACEHOLDER) {
            result += path;
        } else {
            result += c;
        }
    }
    return result;
}

} // namespace comexe::loader
