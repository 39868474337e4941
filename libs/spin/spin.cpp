/**
 * @file spin.cpp
 * @brief Spin clock sampling and spin level construction
 */

#include "cvec/spin.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <format>
#include <ratio>

namespace cvec {

namespace {

using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

// interval 16/20/24, periodicity 0/16/24/32, entropy 0..4
constexpr std::size_t kIntervalSlots = 3;
constexpr std::size_t kPeriodicitySlots = 5;
constexpr std::size_t kEntropySlots = 5;

[[nodiscard]] std::size_t clock_slot(const SpinParameters& parameters) noexcept
{
    const auto interval = static_cast<std::size_t>(parameters.interval);
    const std::size_t i = std::min<std::size_t>(interval < 16 ? 0 : (interval - 16) / 4,
                                                 kIntervalSlots - 1);
    const std::size_t p = std::min<std::size_t>(static_cast<std::size_t>(parameters.periodicity) / 8,
                                                kPeriodicitySlots - 1);
    const std::size_t e = std::min<std::size_t>(static_cast<std::size_t>(parameters.entropy),
                                                kEntropySlots - 1);
    return (i * kPeriodicitySlots + p) * kEntropySlots + e;
}

}  // namespace

std::uint64_t SpinClock::advance(std::uint64_t sample, const SpinParameters& parameters) noexcept
{
    const unsigned bits = parameters.total_bits();
    if (bits == 0) {
        return 0;
    }
    const std::uint64_t mask = bits >= 64 ? ~std::uint64_t{0} : (std::uint64_t{1} << bits) - 1U;
    const std::uint64_t half = (mask >> 1) + 1U;
    sample &= mask;

    std::uint64_t state = m_state.load(std::memory_order_relaxed);
    while (true) {
        std::uint64_t next = sample;
        if (state != 0) {
            const std::uint64_t last = state - 1U;
            if (((last - sample) & mask) < half) {
                next = (last + 1U) & mask;
            }
        }
        // On failure state holds the latest published value; retry
        if (m_state.compare_exchange_weak(state, next + 1U,
                                          std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            return next;
        }
    }
}

SpinClock& shared_spin_clock(const SpinParameters& parameters) noexcept
{
    static std::array<SpinClock, kIntervalSlots * kPeriodicitySlots * kEntropySlots> clocks;
    return clocks[clock_slot(parameters)];
}

std::uint64_t spin_ticks()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<Ticks>(now).count());
}

std::uint64_t next_spin_value(const SpinParameters& parameters)
{
    const std::uint64_t random =
        parameters.entropy == SpinEntropy::kNone ? 0U : common::random_u64();
    return shared_spin_clock(parameters).advance(encode_spin(spin_ticks(), random, parameters),
                                                 parameters);
}

cvec::Result<Parsed> spin(std::string_view correlation_vector,
                          const SpinParameters& parameters,
                          const Options& options)
{
    if (format::is_immutable_terminated(correlation_vector)) {
        return CorrelationVector::parse(correlation_vector);
    }

    const auto inferred = format::infer_version(correlation_vector);

    if (options.validate_during_creation) {
        if (auto result = format::validate(correlation_vector, inferred.version); !result) {
            return std::unexpected(result.error());
        }
    }

    auto spun = std::format("{}{}{}", correlation_vector, format::kSeparator, next_spin_value(parameters));
    if (format::is_oversized(spun, 0, inferred.version)) {
        return CorrelationVector::parse(std::string(correlation_vector) + format::kTerminator);
    }

    // The spun string keeps the input's first separator, so extend() infers
    // the same version and carries the same recoverable error.
    return CorrelationVector::extend(spun);
}

cvec::Result<Parsed> spin(std::string_view correlation_vector, const Options& options)
{
    return spin(correlation_vector, options.spin, options);
}

}  // namespace cvec
