#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error types, base64 text encoding, random bytes
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cvec {

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

/// Error codes (kPascalCase constants, PascalCase values)
namespace errc {
constexpr std::string_view kInvalidVersion = "InvalidVersion";
constexpr std::string_view kInvalidFormat = "InvalidFormat";
constexpr std::string_view kInvalidExtension = "InvalidExtension";
constexpr std::string_view kInvalidConfig = "InvalidConfig";
}  // namespace errc

}  // namespace cvec

namespace cvec::common {

// ============================================================================
// Base64 Text Encoding
// ============================================================================

/**
 * Encode bytes with the standard base64 alphabet (RFC 4648, '=' padded)
 * @param data Input bytes
 * @return Encoded text, 4 * ceil(n / 3) characters
 */
[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> data);

// ============================================================================
// Random Bytes
// ============================================================================

/**
 * Draw random bytes from a per-thread engine seeded by std::random_device
 * @param count Number of bytes
 */
[[nodiscard]] std::vector<std::uint8_t> random_bytes(std::size_t count);

/**
 * Draw a single random 64-bit value from the per-thread engine
 */
[[nodiscard]] std::uint64_t random_u64();

}  // namespace cvec::common
