//! # Common Definitions
//!
//! Shared types used by every docforge component: version constants, source
//! locations, the `Result` error type and the owning pointer aliases.
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: errors cross module boundaries as `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef DOCFORGE_COMMON_HPP
#define DOCFORGE_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docforge {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in source text.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from the start of the text
struct SourceLocation {
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A half-open byte range `[start.offset, end.offset)` of source text.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Merges two spans into one that covers both.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }

    [[nodiscard]] auto length() const -> uint32_t {
        return end.offset - start.offset;
    }

    /// Returns true if `other` lies entirely inside this span.
    [[nodiscard]] auto contains(const SourceSpan& other) const -> bool {
        return start.offset <= other.start.offset && other.end.offset <= end.offset;
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = analysis::extract(source);
/// if (is_ok(result)) {
///     auto& elements = unwrap(result);
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

/// Extracts the success value. Throws `std::bad_variant_access` on error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
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

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace docforge

#endif // DOCFORGE_COMMON_HPP
