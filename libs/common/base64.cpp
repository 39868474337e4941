/**
 * @file base64.cpp
 * @brief Base64 encoding (standalone, no external dependency)
 *
 * C++23 modernization:
 * - Alphabet lookup is constexpr
 * - Using std::span for input bytes
 * - Using size_t literal suffix (uz)
 */

#include "cvec/common.hpp"

#include <array>
#include <cstddef>
#include <span>

namespace cvec::common {

namespace {

constexpr std::array<char, 64> kAlphabet = {{
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
    'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
    'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
    'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'
}};

constexpr char kPad = '=';

[[nodiscard]] constexpr char sextet(std::uint32_t group, unsigned shift) noexcept {
    return kAlphabet[(group >> shift) & 0x3FU];
}

} // namespace

std::string base64_encode(std::span<const std::uint8_t> data) {
    std::string result;
    result.reserve(((data.size() + 2uz) / 3uz) * 4uz);

    std::size_t i = 0;
    for (; i + 3uz <= data.size(); i += 3uz) {
        const std::uint32_t group = (static_cast<std::uint32_t>(data[i]) << 16U) |
                                    (static_cast<std::uint32_t>(data[i + 1uz]) << 8U) |
                                    static_cast<std::uint32_t>(data[i + 2uz]);
        result += sextet(group, 18U);
        result += sextet(group, 12U);
        result += sextet(group, 6U);
        result += sextet(group, 0U);
    }

    // Tail: 1 or 2 leftover bytes
    const std::size_t rest = data.size() - i;
    if (rest == 1uz) {
        const std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16U;
        result += sextet(group, 18U);
        result += sextet(group, 12U);
        result += kPad;
        result += kPad;
    } else if (rest == 2uz) {
        const std::uint32_t group = (static_cast<std::uint32_t>(data[i]) << 16U) |
                                    (static_cast<std::uint32_t>(data[i + 1uz]) << 8U);
        result += sextet(group, 18U);
        result += sextet(group, 12U);
        result += sextet(group, 6U);
        result += kPad;
    }
    return result;
}

} // namespace cvec::common
