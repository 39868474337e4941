/**
 * @file validate.cpp
 * @brief Strict grammar check for incoming correlation vector strings
 *
 * C++23 modernization:
 * - Using std::views::split / std::views::enumerate
 * - Using std::from_chars for integer parsing
 */

#include "cvec/format.hpp"

#include <charconv>
#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace cvec::format {

namespace {

[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view correlation_vector)
{
    std::vector<std::string_view> fields;
    for (auto part : correlation_vector | std::views::split(kSeparator)) {
        fields.emplace_back(part.begin(), part.end());
    }
    return fields;
}

[[nodiscard]] bool is_extension_literal(std::string_view field)
{
    if (field.empty()) {
        return false;
    }
    std::int64_t parsed = 0;
    const auto* first = field.data();
    const auto* last = field.data() + field.size();
    // from_chars accepts a leading '-'; extensions are unsigned literals
    if (*first == '-') {
        return false;
    }
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    return ec == std::errc{} && ptr == last && parsed >= 0;
}

[[nodiscard]] Error invalid_format(std::string message)
{
    return Error::make(std::string(errc::kInvalidFormat), std::move(message));
}

}  // namespace

cvec::VoidResult validate(std::string_view correlation_vector, Version version)
{
    auto limit = max_length(version);
    if (!limit) {
        return std::unexpected(limit.error());
    }
    auto expected_base = base_length(version);
    if (!expected_base) {
        return std::unexpected(expected_base.error());
    }

    if (correlation_vector.empty() || correlation_vector.size() > *limit) {
        return std::unexpected(invalid_format(
            std::format("The V{} correlation vector cannot be empty or bigger than {} characters",
                        std::to_underlying(version),
                        *limit)));
    }

    const auto fields = split_fields(correlation_vector);
    if (fields.size() < 2 || fields.front().size() != *expected_base) {
        return std::unexpected(
            invalid_format(std::format("Invalid correlation vector {}. Invalid base value {}",
                                       correlation_vector,
                                       fields.empty() ? std::string_view{} : fields.front())));
    }

    for (auto [i, field] : std::views::enumerate(fields)) {
        if (i == 0) {
            continue;
        }
        if (!is_extension_literal(field)) {
            return std::unexpected(
                invalid_format(std::format("Invalid correlation vector {}. Invalid extension value {}",
                                           correlation_vector,
                                           field)));
        }
    }
    return {};
}

}  // namespace cvec::format
