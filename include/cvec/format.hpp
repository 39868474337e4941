#pragma once

/**
 * @file format.hpp
 * @brief Correlation vector string grammar: versions, lengths, terminator
 *
 * Wire form: <base>(.<extension>)+[!]
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

#include "cvec/common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cvec {

/**
 * Protocol version of a correlation vector. Fixed for the vector's lifetime.
 */
enum class Version : std::uint8_t {
    kV1 = 1,  ///< 16 character base, 63 character ceiling
    kV2 = 2   ///< 22 character base, 127 character ceiling
};

}  // namespace cvec

namespace cvec::format {

/// Base length of a freshly created V1 vector
constexpr std::size_t kBaseLengthV1 = 16;

/// Base length of a freshly created V2 vector
constexpr std::size_t kBaseLengthV2 = 22;

/// Maximum rendered length of a V1 vector
constexpr std::size_t kMaxLengthV1 = 63;

/// Maximum rendered length of a V2 vector
constexpr std::size_t kMaxLengthV2 = 127;

/// Separates base and extensions
constexpr char kSeparator = '.';

/// Appended once a vector becomes immutable. Never valid inside a field.
constexpr char kTerminator = '!';

/**
 * Version inferred from an incoming string.
 * When error is set, version holds the V1 fallback.
 */
struct InferredVersion
{
    Version version = Version::kV1;
    std::optional<Error> error;
};

/**
 * @return true for V1 and V2
 */
[[nodiscard]] constexpr bool is_supported(Version version) noexcept
{
    return version == Version::kV1 || version == Version::kV2;
}

/**
 * Base length of a freshly created vector
 * @return Length or InvalidVersion
 */
[[nodiscard]] cvec::Result<std::size_t> base_length(Version version);

/**
 * Maximum rendered length (terminator excluded)
 * @return Length or InvalidVersion
 */
[[nodiscard]] cvec::Result<std::size_t> max_length(Version version);

/**
 * Number of decimal digits of a non-negative value; 0 has one digit.
 */
[[nodiscard]] constexpr std::size_t decimal_digit_count(std::uint64_t value) noexcept
{
    std::size_t digits = 1;
    while (value >= 10U) {
        value /= 10U;
        ++digits;
    }
    return digits;
}

/**
 * Infer the version from the offset of the first separator.
 * Offset 16 gives V1, offset 22 gives V2. Anything else gives V1 with an
 * InvalidFormat error, which callers treat as non-fatal.
 */
[[nodiscard]] InferredVersion infer_version(std::string_view correlation_vector);

/**
 * Check whether base + "." + extension exceeds the version's ceiling.
 * An empty base is never oversized.
 */
[[nodiscard]] bool is_oversized(std::string_view base, std::int32_t extension, Version version);

/**
 * @return true iff the string is non-empty and ends with the terminator
 */
[[nodiscard]] constexpr bool is_immutable_terminated(std::string_view correlation_vector) noexcept
{
    return !correlation_vector.empty() && correlation_vector.back() == kTerminator;
}

/**
 * Strict grammar check of an incoming string.
 *
 * - non-empty and within the version's ceiling
 * - at least two dot-separated parts, the first of the version's base length
 * - every later part a non-negative decimal integer
 *
 * @return Empty on success, InvalidFormat (or InvalidVersion) on failure
 */
[[nodiscard]] cvec::VoidResult validate(std::string_view correlation_vector, Version version);

}  // namespace cvec::format
