/**
 * @file correlation_vector.cpp
 * @brief Correlation vector construction, rendering and increment
 *
 * C++23 modernization:
 * - Using std::expected for error handling
 * - Using std::format for rendering
 */

#include "cvec/correlation_vector.hpp"

#include "cvec/require_cpp23.hpp"

#include <charconv>
#include <limits>
#include <utility>

namespace cvec {

namespace {

constexpr std::size_t kRandomBytesV1 = 12;
constexpr std::size_t kRandomBytesV2 = 16;

[[nodiscard]] std::string render(std::string_view base, std::int32_t extension, bool immutable)
{
    if (immutable) {
        return std::format("{}{}{}{}", base, format::kSeparator, extension, format::kTerminator);
    }
    return std::format("{}{}{}", base, format::kSeparator, extension);
}

[[nodiscard]] cvec::Result<std::string> unique_base(Version version)
{
    auto length = format::base_length(version);
    if (!length) {
        return std::unexpected(length.error());
    }
    const auto bytes =
        common::random_bytes(version == Version::kV1 ? kRandomBytesV1 : kRandomBytesV2);
    auto encoded = common::base64_encode(bytes);
    encoded.resize(*length);
    return encoded;
}

[[nodiscard]] cvec::Result<std::int32_t> parse_extension(std::string_view text)
{
    std::int32_t extension = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    if (text.empty() || *first == '-') {
        return std::unexpected(Error::make(std::string(errc::kInvalidExtension),
                                           std::format("Invalid extension '{}'", text)));
    }
    auto [ptr, ec] = std::from_chars(first, last, extension);
    if (ec != std::errc{} || ptr != last || extension < 0) {
        return std::unexpected(Error::make(std::string(errc::kInvalidExtension),
                                           std::format("Invalid extension '{}'", text)));
    }
    return extension;
}

}  // namespace

CorrelationVector::CorrelationVector(std::string base,
                                     std::int32_t extension,
                                     Version version,
                                     bool immutable)
    : m_base(std::move(base))
    , m_extension(extension)
    , m_version(version)
    , m_immutable(immutable || format::is_oversized(m_base, extension, version))
{}

CorrelationVector::CorrelationVector(const CorrelationVector& other)
    : m_base(other.m_base)
    , m_extension(other.extension())
    , m_version(other.m_version)
    , m_immutable(other.is_immutable())
{}

CorrelationVector& CorrelationVector::operator=(const CorrelationVector& other)
{
    if (this != &other) {
        m_base = other.m_base;
        m_extension.store(other.extension(), std::memory_order_release);
        m_version = other.m_version;
        m_immutable.store(other.is_immutable(), std::memory_order_release);
    }
    return *this;
}

CorrelationVector::CorrelationVector(CorrelationVector&& other) noexcept
    : m_base(std::move(other.m_base))
    , m_extension(other.extension())
    , m_version(other.m_version)
    , m_immutable(other.is_immutable())
{}

CorrelationVector& CorrelationVector::operator=(CorrelationVector&& other) noexcept
{
    if (this != &other) {
        m_base = std::move(other.m_base);
        m_extension.store(other.extension(), std::memory_order_release);
        m_version = other.m_version;
        m_immutable.store(other.is_immutable(), std::memory_order_release);
    }
    return *this;
}

cvec::Result<CorrelationVector> CorrelationVector::create(Version version)
{
    auto base = unique_base(version);
    if (!base) {
        return std::unexpected(base.error());
    }
    return CorrelationVector(std::move(*base), 0, version, false);
}

cvec::Result<Parsed> CorrelationVector::extend(std::string_view correlation_vector,
                                               const Options& options)
{
    if (format::is_immutable_terminated(correlation_vector)) {
        return parse(correlation_vector);
    }

    auto inferred = format::infer_version(correlation_vector);

    if (options.validate_during_creation) {
        if (auto result = format::validate(correlation_vector, inferred.version); !result) {
            return std::unexpected(result.error());
        }
    }

    if (format::is_oversized(correlation_vector, 0, inferred.version)) {
        return parse(std::string(correlation_vector) + format::kTerminator);
    }

    return Parsed{
        .vector = CorrelationVector(std::string(correlation_vector), 0, inferred.version, false),
        .error = std::move(inferred.error)};
}

cvec::Result<Parsed> CorrelationVector::parse(std::string_view correlation_vector)
{
    auto inferred = format::infer_version(correlation_vector);
    const bool immutable = format::is_immutable_terminated(correlation_vector);

    const auto separator = correlation_vector.rfind(format::kSeparator);
    if (separator == std::string_view::npos || separator == 0) {
        return std::unexpected(Error::make(
            std::string(errc::kInvalidFormat),
            std::format("Invalid correlation vector string '{}': no extension", correlation_vector)));
    }

    auto tail = correlation_vector.substr(separator + 1);
    if (immutable) {
        tail.remove_suffix(1);
    }
    auto extension = parse_extension(tail);
    if (!extension) {
        return std::unexpected(extension.error());
    }

    return Parsed{.vector = CorrelationVector(std::string(correlation_vector.substr(0, separator)),
                                              *extension,
                                              inferred.version,
                                              immutable),
                  .error = std::move(inferred.error)};
}

std::string CorrelationVector::increment()
{
    if (is_immutable()) {
        return value();
    }

    auto snapshot = m_extension.load(std::memory_order_acquire);
    for (;;) {
        if (snapshot == std::numeric_limits<std::int32_t>::max()) {
            return value();
        }
        const std::int32_t next = snapshot + 1;

        // Oversize is monotonic in the extension, so the first caller to see it
        // freezes the vector for everyone.
        if (format::is_oversized(m_base, next, m_version)) {
            m_immutable.store(true, std::memory_order_release);
            return value();
        }
        if (m_extension.compare_exchange_weak(snapshot,
                                              next,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            return render(m_base, next, false);
        }
    }
}

std::string CorrelationVector::value() const
{
    return render(m_base, extension(), is_immutable());
}

bool operator==(const CorrelationVector& lhs, const CorrelationVector& rhs)
{
    return lhs.m_version == rhs.m_version && lhs.value() == rhs.value();
}

}  // namespace cvec
