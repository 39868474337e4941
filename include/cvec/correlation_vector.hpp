#pragma once

/**
 * @file correlation_vector.hpp
 * @brief Correlation vector entity: base, extension counter, immutability
 *
 * C++23 modernization:
 * - Using std::expected for error handling
 * - Using [[nodiscard]] consistently
 */

#include "cvec/common.hpp"
#include "cvec/format.hpp"
#include "cvec/options.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace cvec {

struct Parsed;

/**
 * A correlation vector for one hop.
 *
 * The base and version are fixed at construction. The extension counter and
 * the immutability flag are atomics, so increment() may be called from any
 * number of threads on a shared instance.
 */
class CorrelationVector
{
public:
    /**
     * @brief Create a vector with a random base and extension 0
     * @return New vector or InvalidVersion
     */
    [[nodiscard]] static cvec::Result<CorrelationVector> create(Version version = Version::kV1);

    /**
     * @brief Extend an incoming value by one level (extension 0)
     *
     * A terminated input is parsed and reused unchanged. An input that
     * cannot take another level becomes immutable right away.
     *
     * @return Vector plus optional non-fatal error, or strict validation error
     */
    [[nodiscard]] static cvec::Result<Parsed> extend(std::string_view correlation_vector,
                                                     const Options& options = {});

    /**
     * @brief Rebuild a vector from its rendered value
     * @return Vector plus optional non-fatal error, or InvalidFormat/InvalidExtension
     */
    [[nodiscard]] static cvec::Result<Parsed> parse(std::string_view correlation_vector);

    CorrelationVector(const CorrelationVector& other);
    CorrelationVector& operator=(const CorrelationVector& other);
    CorrelationVector(CorrelationVector&& other) noexcept;
    CorrelationVector& operator=(CorrelationVector&& other) noexcept;
    ~CorrelationVector() = default;

    /**
     * @brief Advance the extension by one and render the result
     *
     * Lock-free. Returns the current value unchanged once immutable or at
     * the 32-bit limit; freezes the vector when the next value would not fit.
     */
    std::string increment();

    /**
     * @brief Render base.extension, with the terminator when immutable
     */
    [[nodiscard]] std::string value() const;

    [[nodiscard]] Version version() const noexcept { return m_version; }
    [[nodiscard]] const std::string& base() const noexcept { return m_base; }
    [[nodiscard]] std::int32_t extension() const noexcept
    {
        return m_extension.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_immutable() const noexcept
    {
        return m_immutable.load(std::memory_order_acquire);
    }

    friend bool operator==(const CorrelationVector& lhs, const CorrelationVector& rhs);

private:
    CorrelationVector(std::string base, std::int32_t extension, Version version, bool immutable);

    std::string m_base;
    std::atomic<std::int32_t> m_extension;
    Version m_version;
    std::atomic<bool> m_immutable;
};

/**
 * Vector built from an incoming string. error carries a recoverable
 * InvalidFormat (version inference fell back to V1).
 */
struct Parsed
{
    CorrelationVector vector;
    std::optional<Error> error;
};

}  // namespace cvec

template <>
struct std::formatter<cvec::Version> : std::formatter<std::string_view>
{
    auto format(cvec::Version version, std::format_context& ctx) const
    {
        std::string_view name = "V?";
        switch (version) {
            case cvec::Version::kV1:
                name = "V1";
                break;
            case cvec::Version::kV2:
                name = "V2";
                break;
        }
        return std::formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct std::formatter<cvec::CorrelationVector> : std::formatter<std::string>
{
    auto format(const cvec::CorrelationVector& vector, std::format_context& ctx) const
    {
        return std::formatter<std::string>::format(vector.value(), ctx);
    }
};
