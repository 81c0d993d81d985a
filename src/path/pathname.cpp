//! # Pathname Implementation
//!
//! Parsing recognises, in order: a drive prefix `X:`, a UNC prefix
//! `//server/share` (Windows syntax only), a POSIX root. A UNC prefix
//! without a share degrades to a rooted path.

#include "path/pathname.hpp"

#include "log/log.hpp"
#include "runtime/platform.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace comexe::path {

namespace {

auto is_drive_letter(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

auto strip_leading_slashes(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of('/');
    return start == std::string_view::npos ? std::string_view{} : text.substr(start);
}

/// Matches "//+server/+share(rest)". Returns nullopt when either part is missing.
auto match_unc(std::string_view text) -> std::optional<std::pair<Unc, std::string_view>> {
    auto rest = strip_leading_slashes(text);
    size_t server_end = rest.find('/');
    if (rest.empty() || server_end == std::string_view::npos || server_end == 0) {
        return std::nullopt;
    }
    auto server = rest.substr(0, server_end);
    rest = strip_leading_slashes(rest.substr(server_end));
    size_t share_end = std::min(rest.find('/'), rest.size());
    if (share_end == 0) {
        return std::nullopt;
    }
    auto share = rest.substr(0, share_end);
    return std::make_pair(Unc{std::string(server), std::string(share)}, rest.substr(share_end));
}

auto is_parent_ref(const Segment& segment) -> bool {
    const auto* name = std::get_if<std::string>(&segment);
    return name && *name == "..";
}

} // namespace

Pathname::Pathname(std::string_view text, PathSyntax syntax)
    : segments_(resolve(parse(text, syntax).segments)) {}

// ============================================================================
// Parse / Resolve / Render
// ============================================================================

auto Pathname::parse(std::string_view text, PathSyntax syntax) -> ParsedPath {
    std::string normalized(text);
    if (syntax == PathSyntax::Windows) {
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
    }
    std::string_view rest = normalized;

    ParsedPath parsed;
    if (rest.size() >= 2 && is_drive_letter(rest[0]) && rest[1] == ':') {
        parsed.segments.emplace_back(Drive{rest[0]});
        rest = strip_leading_slashes(rest.substr(2));
    } else if (syntax == PathSyntax::Windows && rest.starts_with("//")) {
        if (auto unc = match_unc(rest)) {
            parsed.segments.emplace_back(std::move(unc->first));
            rest = strip_leading_slashes(unc->second);
        } else {
            COMEXE_LOG_DEBUG("path", "malformed UNC path '" << text << "' treated as rooted");
            parsed.segments.emplace_back(Root{});
            rest = strip_leading_slashes(rest);
        }
    } else if (rest.starts_with("/")) {
        parsed.segments.emplace_back(Root{});
        rest = strip_leading_slashes(rest);
    }
    parsed.absolute = !parsed.segments.empty();

    size_t pos = 0;
    while (pos <= rest.size()) {
        size_t slash = std::min(rest.find('/', pos), rest.size());
        auto part = rest.substr(pos, slash - pos);
        if (!part.empty() && part != ".") {
            parsed.segments.emplace_back(std::string(part));
        }
        pos = slash + 1;
    }
    return parsed;
}

auto Pathname::resolve(const std::vector<Segment>& segments) -> std::vector<Segment> {
    std::vector<Segment> out;
    out.reserve(segments.size());
    bool absolute = !segments.empty() && is_anchor(segments.front());

    for (const auto& segment : segments) {
        if (!is_parent_ref(segment)) {
            out.push_back(segment);
            continue;
        }
        if (!out.empty() && std::holds_alternative<std::string>(out.back()) &&
            !is_parent_ref(out.back())) {
            out.pop_back();
        } else if (!absolute) {
            out.push_back(segment);
        }
    }
    return out;
}

auto Pathname::render(const std::vector<Segment>& segments, PathMode mode) -> std::string {
    const char sep = mode == PathMode::Native ? platform::NATIVE_DIR_SEP
                                              : platform::INTERNAL_DIR_SEP;

    if (segments.size() == 1 && is_anchor(segments.front())) {
        const auto& anchor = segments.front();
        if (const auto* drive = std::get_if<Drive>(&anchor)) {
            return std::string{drive->letter, ':', sep};
        }
        if (const auto* unc = std::get_if<Unc>(&anchor)) {
            return std::string{sep, sep} + unc->server + sep + unc->share + sep;
        }
        return std::string(1, sep);
    }

    std::vector<std::string> parts;
    for (const auto& segment : segments) {
        std::visit(
            [&](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    parts.push_back(value);
                } else if constexpr (std::is_same_v<T, Root>) {
                    parts.emplace_back();
                } else if constexpr (std::is_same_v<T, Drive>) {
                    parts.push_back(std::string{value.letter, ':'});
                } else {
                    parts.emplace_back();
                    parts.emplace_back();
                    parts.push_back(value.server);
                    parts.push_back(value.share);
                }
            },
            segment);
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            result += sep;
        result += parts[i];
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

auto Pathname::directory(PathMode mode) const -> std::string {
    if (segments_.empty()) {
        return "";
    }
    if (segments_.size() == 1) {
        return is_anchor(segments_.front()) ? render(segments_, mode) : "";
    }
    return render(std::vector<Segment>(segments_.begin(), segments_.end() - 1), mode);
}

auto Pathname::getname() const -> NameParts {
    if (segments_.empty()) {
        return {};
    }
    const auto& last = segments_.back();
    if (const auto* drive = std::get_if<Drive>(&last)) {
        std::string letter(1, drive->letter);
        return {letter, letter, std::nullopt};
    }
    const auto* name = std::get_if<std::string>(&last);
    if (!name) {
        return {};
    }

    size_t dot = name->rfind('.');
    if (dot != std::string::npos && dot > 0 && dot + 1 < name->size()) {
        return {*name, name->substr(0, dot), name->substr(dot + 1)};
    }
    return {*name, *name, std::nullopt};
}

// ============================================================================
// Mutators
// ============================================================================

auto Pathname::parent() -> Pathname& {
    if (is_absolute()) {
        if (std::holds_alternative<std::string>(segments_.back())) {
            segments_.pop_back();
        }
        return *this;
    }
    if (segments_.empty() || is_parent_ref(segments_.back())) {
        segments_.emplace_back("..");
    } else {
        segments_.pop_back();
    }
    return *this;
}

auto Pathname::child(std::string_view name) -> Pathname& {
    if (name == "..") {
        return parent();
    }
    if (!name.empty() && name != ".") {
        segments_.emplace_back(std::string(name));
    }
    return *this;
}

auto Pathname::setname(std::string_view name) -> Pathname& {
    if (segments_.empty()) {
        segments_.emplace_back(std::string(name));
    } else {
        segments_.back() = std::string(name);
    }
    return *this;
}

auto Pathname::remove(size_t index) -> Pathname& {
    if (index < segments_.size()) {
        segments_.erase(segments_.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return *this;
}

auto Pathname::concat(const Pathname& a, const Pathname& b) -> Pathname {
    std::vector<Segment> joined = a.segments_;
    for (const auto& segment : b.segments_) {
        if (!is_anchor(segment)) {
            joined.push_back(segment);
        }
    }
    return Pathname(resolve(joined));
}

} // namespace comexe::path
