/**
 * @file format.cpp
 * @brief Version inference and length arithmetic
 */

#include "cvec/format.hpp"

#include <format>
#include <utility>

namespace cvec::format {

namespace {

[[nodiscard]] Error unsupported_version(Version version)
{
    return Error::make(std::string(errc::kInvalidVersion),
                       std::format("Unsupported correlation vector version: {}",
                                   std::to_underlying(version)));
}

}  // namespace

cvec::Result<std::size_t> base_length(Version version)
{
    if (!is_supported(version)) {
        return std::unexpected(unsupported_version(version));
    }
    return version == Version::kV1 ? kBaseLengthV1 : kBaseLengthV2;
}

cvec::Result<std::size_t> max_length(Version version)
{
    if (!is_supported(version)) {
        return std::unexpected(unsupported_version(version));
    }
    return version == Version::kV1 ? kMaxLengthV1 : kMaxLengthV2;
}

InferredVersion infer_version(std::string_view correlation_vector)
{
    const auto index = correlation_vector.find(kSeparator);
    if (index == kBaseLengthV1) {
        return InferredVersion{.version = Version::kV1, .error = std::nullopt};
    }
    if (index == kBaseLengthV2) {
        return InferredVersion{.version = Version::kV2, .error = std::nullopt};
    }

    // Default to V1
    return InferredVersion{
        .version = Version::kV1,
        .error = Error::make(std::string(errc::kInvalidFormat),
                             std::format("Invalid correlation vector string '{}': first separator "
                                         "must be at offset {} or {}",
                                         correlation_vector,
                                         kBaseLengthV1,
                                         kBaseLengthV2))};
}

bool is_oversized(std::string_view base, std::int32_t extension, Version version)
{
    if (base.empty()) {
        return false;
    }
    auto limit = max_length(version);
    if (!limit) {
        return false;
    }
    const auto digits = decimal_digit_count(static_cast<std::uint64_t>(extension < 0 ? 0 : extension));
    return base.size() + 1 + digits > *limit;
}

}  // namespace cvec::format
