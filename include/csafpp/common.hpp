#pragma once

/**
 * @file common.hpp
 * @brief Result types and the error taxonomy shared by all csafpp modules
 */

#include "csafpp/require_cpp23.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <utility>

namespace csafpp {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

// ============================================================================
// Parse errors
// ============================================================================

/**
 * Kind of failure reported by the document parser.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class ParseErrorKind : std::uint8_t {
    kSyntax,          ///< Malformed JSON text
    kMissingField,    ///< Mandatory key absent
    kTypeMismatch,    ///< Key present with the wrong JSON type or an unreadable value
    kUnknownVariant,  ///< Enum text not recognized (strict mode only)
};

/**
 * @brief Parse failure with the offending location
 *
 * `path` is a JSON-pointer-like path ("/document/tracking/id"); the empty
 * string denotes the document root. `position` is only meaningful for
 * kSyntax and holds the byte offset reported by the JSON reader.
 */
struct ParseError
{
    ParseErrorKind kind = ParseErrorKind::kSyntax;
    std::string path;
    std::string expected;  ///< kTypeMismatch: expected type
    std::string found;     ///< kTypeMismatch: actual type; kUnknownVariant: the text
    std::size_t position = 0;
    std::string message;

    [[nodiscard]] static ParseError syntax(std::size_t position, std::string message)
    {
        return ParseError{.kind = ParseErrorKind::kSyntax,
                          .position = position,
                          .message = std::move(message)};
    }

    [[nodiscard]] static ParseError missing_field(std::string path)
    {
        std::string message = std::format("Missing mandatory field: {}", display_path(path));
        return ParseError{.kind = ParseErrorKind::kMissingField,
                          .path = std::move(path),
                          .message = std::move(message)};
    }

    [[nodiscard]] static ParseError type_mismatch(std::string path,
                                                  std::string expected,
                                                  std::string found)
    {
        std::string message =
            std::format("Type mismatch at {}: expected {}, found {}", display_path(path), expected, found);
        return ParseError{.kind = ParseErrorKind::kTypeMismatch,
                          .path = std::move(path),
                          .expected = std::move(expected),
                          .found = std::move(found),
                          .message = std::move(message)};
    }

    [[nodiscard]] static ParseError unknown_variant(std::string path,
                                                    std::string type_name,
                                                    std::string text)
    {
        std::string message =
            std::format("Unknown {} \"{}\" at {}", type_name, text, display_path(path));
        return ParseError{.kind = ParseErrorKind::kUnknownVariant,
                          .path = std::move(path),
                          .expected = std::move(type_name),
                          .found = std::move(text),
                          .message = std::move(message)};
    }

    [[nodiscard]] static std::string display_path(const std::string& path)
    {
        return path.empty() ? std::string("/") : path;
    }
};

template <typename T>
using ParseResult = std::expected<T, ParseError>;

// ============================================================================
// Interop errors
// ============================================================================

enum class InteropErrorKind : std::uint8_t {
    kMultipleVulnerabilities,
    kMissingRequiredField,
};

/**
 * @brief Failure of the Csaf -> MinimalAdvisory projection
 */
struct InteropError
{
    InteropErrorKind kind = InteropErrorKind::kMissingRequiredField;
    std::string path;     ///< Offending field path in the Csaf value
    std::size_t count = 0;  ///< kMultipleVulnerabilities: number found
    std::string message;

    [[nodiscard]] static InteropError multiple_vulnerabilities(std::size_t count)
    {
        return InteropError{.kind = InteropErrorKind::kMultipleVulnerabilities,
                            .path = "/vulnerabilities",
                            .count = count,
                            .message = std::format("Expected exactly one vulnerability, found {}",
                                                   count)};
    }

    [[nodiscard]] static InteropError missing_required_field(std::string path)
    {
        std::string message = std::format("Cannot recover required field: {}", path);
        return InteropError{.kind = InteropErrorKind::kMissingRequiredField,
                            .path = std::move(path),
                            .message = std::move(message)};
    }
};

template <typename T>
using InteropResult = std::expected<T, InteropError>;

}  // namespace csafpp
