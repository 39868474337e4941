#pragma once

/**
 * @file options.hpp
 * @brief Construction options and spin parameters
 *
 * Options travel with each construction call. There is no process-wide
 * switch; changing an Options value only affects later calls that use it.
 */

#include <cstdint>

namespace cvec {

/**
 * Spin clock resolution: low-order bits dropped from a 100ns tick reading.
 */
enum class SpinInterval : std::uint8_t {
    kCoarse = 24,  ///< ~1.68 s per step
    kMedium = 20,  ///< ~105 ms per step
    kFine = 16     ///< ~6.55 ms per step
};

/**
 * Number of clock bits kept as the spin counter before it wraps.
 */
enum class SpinPeriodicity : std::uint8_t {
    kNone = 0,
    kShort = 16,
    kMedium = 24,
    kLong = 32
};

/**
 * Number of random bytes mixed in below the spin counter.
 */
enum class SpinEntropy : std::uint8_t {
    kNone = 0,
    kOne = 1,
    kTwo = 2,
    kThree = 3,
    kFour = 4
};

struct SpinParameters
{
    SpinInterval interval = SpinInterval::kFine;
    SpinPeriodicity periodicity = SpinPeriodicity::kShort;
    SpinEntropy entropy = SpinEntropy::kTwo;

    /// Bits in the rendered spin value (counter bits + entropy bits)
    [[nodiscard]] constexpr unsigned total_bits() const noexcept
    {
        return static_cast<unsigned>(periodicity) + static_cast<unsigned>(entropy) * 8U;
    }

    friend constexpr bool operator==(const SpinParameters&, const SpinParameters&) = default;
};

struct Options
{
    /// Run the strict grammar check on every construction from a string
    bool validate_during_creation = false;

    /// Parameters used by spin() when none are given explicitly
    SpinParameters spin{};

    friend constexpr bool operator==(const Options&, const Options&) = default;
};

}  // namespace cvec
