//! # Pathname Algebra
//!
//! Parses, normalizes and renders filesystem paths for both POSIX and
//! drive/UNC conventions. Pure data: nothing here touches the filesystem.
//!
//! A path is a list of segments. The first segment may be an anchor
//! (`Root`, `Drive`, `Unc`); every other segment is a plain name or `".."`.
//! After construction a path is always resolved:
//!
//! - no segment is `"."`
//! - an absolute path never holds a `".."` (climbing stops at the anchor)
//! - a relative path keeps leading `".."` segments it cannot cancel
//!
//! ## Example
//!
//! ```cpp
//! Pathname p("C:/a/../b/file.txt");
//! p.to_string();              // "C:/b/file.txt"
//! p.getname().extension;      // "txt"
//! p.parent().child("x.lua");  // "C:/b/x.lua"
//! ```

#ifndef COMEXE_PATH_PATHNAME_HPP
#define COMEXE_PATH_PATHNAME_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace comexe::path {

// ============================================================================
// Segments
// ============================================================================

/// POSIX root anchor ("/").
struct Root {
    auto operator==(const Root&) const -> bool = default;
};

/// Drive-letter anchor ("C:").
struct Drive {
    char letter;
    auto operator==(const Drive&) const -> bool = default;
};

/// UNC anchor ("//server/share").
struct Unc {
    std::string server;
    std::string share;
    auto operator==(const Unc&) const -> bool = default;
};

using Segment = std::variant<std::string, Root, Drive, Unc>;

[[nodiscard]] inline auto is_anchor(const Segment& segment) -> bool {
    return !std::holds_alternative<std::string>(segment);
}

/// Which separator `render` joins with.
enum class PathMode {
    Native,  ///< Host separator ("\\" on Windows, "/" elsewhere)
    Internal ///< Always "/", the form used inside archives
};

/// Which conventions `parse` recognises.
///
/// Drive letters are recognised under both. `Windows` additionally accepts
/// "\\" as a separator and "//server/share" as a UNC anchor.
enum class PathSyntax { Posix, Windows };

constexpr auto host_syntax() -> PathSyntax {
#ifdef _WIN32
    return PathSyntax::Windows;
#else
    return PathSyntax::Posix;
#endif
}

/// Result of `parse`: raw, unresolved segments.
struct ParsedPath {
    std::vector<Segment> segments;
    bool absolute = false;
};

/// `getname()` result. Unset fields mean "not applicable".
struct NameParts {
    std::optional<std::string> name;
    std::optional<std::string> basename;
    std::optional<std::string> extension;
};

// ============================================================================
// Pathname
// ============================================================================

class Pathname {
public:
    /// The empty relative path.
    Pathname() = default;

    /// Parses and resolves `text`. Never fails.
    explicit Pathname(std::string_view text, PathSyntax syntax = host_syntax());

    /// Splits `text` into segments without resolving "..".
    static auto parse(std::string_view text, PathSyntax syntax = host_syntax()) -> ParsedPath;

    /// Cancels ".." against preceding names. Unmatched ".." survive only
    /// in relative paths.
    static auto resolve(const std::vector<Segment>& segments) -> std::vector<Segment>;

    static auto render(const std::vector<Segment>& segments, PathMode mode) -> std::string;

    /// Joins B's plain segments after A's and resolves. The result is
    /// absolute exactly when A is.
    static auto concat(const Pathname& a, const Pathname& b) -> Pathname;

    [[nodiscard]] auto segments() const -> const std::vector<Segment>& {
        return segments_;
    }

    [[nodiscard]] auto convert(PathMode mode) const -> std::string {
        return render(segments_, mode);
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return render(segments_, PathMode::Native);
    }

    /// Every segment but the last; an anchor is always kept.
    [[nodiscard]] auto directory(PathMode mode = PathMode::Native) const -> std::string;

    [[nodiscard]] auto getname() const -> NameParts;

    [[nodiscard]] auto is_absolute() const -> bool {
        return !segments_.empty() && is_anchor(segments_.front());
    }
    [[nodiscard]] auto is_relative() const -> bool {
        return !is_absolute();
    }

    [[nodiscard]] auto depth() const -> size_t {
        return segments_.size();
    }

    [[nodiscard]] auto clone() const -> Pathname {
        return *this;
    }

    auto parent() -> Pathname&;
    auto child(std::string_view name) -> Pathname&;
    auto setname(std::string_view name) -> Pathname&;

    /// Drops the segment at zero-based `index`; out-of-range is ignored.
    auto remove(size_t index) -> Pathname&;

    auto operator==(const Pathname&) const -> bool = default;

private:
    explicit Pathname(std::vector<Segment> segments) : segments_(std::move(segments)) {}

    std::vector<Segment> segments_;
};

inline auto operator+(const Pathname& a, const Pathname& b) -> Pathname {
    return Pathname::concat(a, b);
}

} // namespace comexe::path

#endif // COMEXE_PATH_PATHNAME_HPP
