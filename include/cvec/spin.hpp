#pragma once

/**
 * @file spin.hpp
 * @brief Spin: a time-ordered, low-collision extra extension level
 *
 * Spinning "<cv>" yields "<cv>.<spin>.0". The spin value packs a monotonic
 * clock counter above a few random bytes:
 *
 *   spin = ((ticks >> interval) << (8 * entropy)) | random
 *
 * truncated to periodicity + 8 * entropy bits. A shared SpinClock per
 * parameter set turns these samples into a strictly increasing sequence that
 * only wraps with the clock counter.
 */

#include "cvec/correlation_vector.hpp"
#include "cvec/options.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>

namespace cvec {

/**
 * Pack a tick reading and random bits into a spin value.
 * @param ticks Clock reading in 100ns units
 * @param random Random bits; only the low 8 * entropy bits are used
 */
[[nodiscard]] constexpr std::uint64_t encode_spin(std::uint64_t ticks,
                                                  std::uint64_t random,
                                                  const SpinParameters& parameters) noexcept
{
    const unsigned entropy_bits = static_cast<unsigned>(parameters.entropy) * 8U;
    const unsigned total_bits = parameters.total_bits();

    std::uint64_t value = ticks >> static_cast<unsigned>(parameters.interval);
    if (entropy_bits > 0) {
        const std::uint64_t entropy_mask = (std::uint64_t{1} << entropy_bits) - 1U;
        value = (value << entropy_bits) | (random & entropy_mask);
    }
    if (total_bits == 0) {
        return 0;
    }
    if (total_bits < 64) {
        value &= (std::uint64_t{1} << total_bits) - 1U;
    }
    return value;
}

/**
 * @brief Monotonic publisher of spin values
 *
 * Each advance() returns a value strictly greater than the previous one
 * (modulo 2^total_bits). A sample at or slightly behind the last value steps
 * to last + 1; a sample more than half the range behind is taken as a clock
 * wrap and accepted as is. Lock-free; safe to share between threads.
 */
class SpinClock
{
public:
    SpinClock() = default;
    SpinClock(const SpinClock&) = delete;
    SpinClock& operator=(const SpinClock&) = delete;

    /**
     * Publish the next spin value for an encoded sample.
     * @param sample Output of encode_spin() for the same parameters
     */
    [[nodiscard]] std::uint64_t advance(std::uint64_t sample,
                                        const SpinParameters& parameters) noexcept;

private:
    // Last emitted value plus one; zero until the first advance()
    std::atomic<std::uint64_t> m_state{0};
};

/**
 * Process-wide clock for a parameter set.
 */
[[nodiscard]] SpinClock& shared_spin_clock(const SpinParameters& parameters) noexcept;

/**
 * Current monotonic clock reading in 100ns ticks.
 */
[[nodiscard]] std::uint64_t spin_ticks();

/**
 * Draw a spin value from the clock and the per-thread random source, then
 * publish it through the shared clock for these parameters.
 */
[[nodiscard]] std::uint64_t next_spin_value(const SpinParameters& parameters);

/**
 * @brief Add a spin level to an incoming value
 *
 * A terminated input is parsed and reused unchanged. If the spin level does
 * not fit, the input is frozen instead.
 *
 * @return Vector plus optional non-fatal error, or strict validation error
 */
[[nodiscard]] cvec::Result<Parsed> spin(std::string_view correlation_vector,
                                        const SpinParameters& parameters,
                                        const Options& options = {});

/**
 * @brief Spin with the parameters carried by options
 */
[[nodiscard]] cvec::Result<Parsed> spin(std::string_view correlation_vector,
                                        const Options& options = {});

}  // namespace cvec
