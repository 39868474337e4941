/**
 * @file test_concurrent_increment.cpp
 * @brief Increment from many threads on one shared vector
 */

#include "cvec/correlation_vector.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using cvec::CorrelationVector;

namespace {

constexpr int kThreads = 1000;

}  // namespace

TEST(ConcurrentIncrement, UniqueAcrossThreads)
{
    auto root = CorrelationVector::create();
    ASSERT_TRUE(root);
    auto extended = CorrelationVector::extend(root->value());
    ASSERT_TRUE(extended);
    auto& vector = extended->vector;

    std::vector<std::string> results(kThreads);
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            results[static_cast<std::size_t>(i)] = vector.increment();
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> unique(results.begin(), results.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(vector.extension(), kThreads);
}

TEST(ConcurrentIncrement, EachThreadSeesIncreasingValues)
{
    auto extended = CorrelationVector::extend("tul4NUsfs9Cl7mOf.1");
    ASSERT_TRUE(extended);
    auto& vector = extended->vector;
    const auto prefix = vector.base() + ".";

    constexpr int kWorkers = 8;
    constexpr int kPerWorker = 500;
    std::vector<std::vector<int>> seen(kWorkers);
    std::vector<std::thread> threads;
    for (int w = 0; w < kWorkers; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < kPerWorker; ++i) {
                auto value = vector.increment();
                seen[static_cast<std::size_t>(w)].push_back(std::stoi(value.substr(prefix.size())));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<int> all;
    for (const auto& values : seen) {
        // Strictly increasing per caller
        EXPECT_TRUE(std::ranges::adjacent_find(values, std::ranges::greater_equal{}) == values.end());
        all.insert(values.begin(), values.end());
    }
    EXPECT_EQ(all.size(), static_cast<std::size_t>(kWorkers * kPerWorker));
    EXPECT_EQ(*all.begin(), 1);
    EXPECT_EQ(*all.rbegin(), kWorkers * kPerWorker);
}

TEST(ConcurrentIncrement, FreezesOnceUnderContention)
{
    // 61 characters: extensions 1..9 fit, 10 does not
    auto extended =
        CorrelationVector::extend("tul4NUsfs9Cl7mOf.2147483647.2147483647.2147483647.21474836479");
    ASSERT_TRUE(extended);
    auto& vector = extended->vector;

    constexpr int kWorkers = 16;
    std::vector<std::vector<std::string>> seen(kWorkers);
    std::vector<std::thread> threads;
    for (int w = 0; w < kWorkers; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < 10; ++i) {
                seen[static_cast<std::size_t>(w)].push_back(vector.increment());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const std::string frozen = vector.base() + ".9!";
    EXPECT_EQ(vector.value(), frozen);

    std::set<std::string> unfrozen;
    for (const auto& values : seen) {
        for (const auto& value : values) {
            if (value.back() != '!') {
                EXPECT_TRUE(unfrozen.insert(value).second) << "duplicate " << value;
            } else {
                EXPECT_EQ(value, frozen);
            }
        }
    }
    EXPECT_EQ(unfrozen.size(), 9u);
}
