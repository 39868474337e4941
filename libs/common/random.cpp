/**
 * @file random.cpp
 * @brief Per-thread random source for base identifiers and spin entropy
 */

#include "cvec/common.hpp"

#include <random>

namespace cvec::common {

namespace {

[[nodiscard]] std::mt19937_64& engine()
{
    thread_local std::mt19937_64 instance = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    return instance;
}

}  // namespace

std::vector<std::uint8_t> random_bytes(std::size_t count)
{
    std::vector<std::uint8_t> bytes;
    bytes.reserve(count);
    auto& gen = engine();
    while (bytes.size() < count) {
        std::uint64_t word = gen();
        for (int i = 0; i < 8 && bytes.size() < count; ++i) {
            bytes.push_back(static_cast<std::uint8_t>(word & 0xFFU));
            word >>= 8U;
        }
    }
    return bytes;
}

std::uint64_t random_u64()
{
    return engine()();
}

}  // namespace cvec::common
