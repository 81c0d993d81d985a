//! # Common Definitions
//!
//! Types shared by every ComEXE loader component.
//!
//! ## Conventions
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`, an
//!   `std::optional` when absence is an ordinary outcome, or a negative
//!   POSIX-style code at the virtual file table boundary.
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared.

#ifndef COMEXE_COMMON_HPP
#define COMEXE_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace comexe {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "2.0.0";
constexpr int VERSION_MAJOR = 2;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto content = read_file(io, "init.lua");
/// if (is_err(content)) {
///     COMEXE_LOG_WARN("loader", unwrap_err(content));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on a success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace comexe

#endif // COMEXE_COMMON_HPP
