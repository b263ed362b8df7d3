/**
 * @file PaddedCellTest.cpp
 * @brief Unit tests for PaddedAtomic and PaddedValue.
 *
 * Covers the cache-line layout of the padded specializations and the
 * read / write / compare-and-swap semantics shared by both layouts.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <thread>
#include <vector>
#include <barrier>
#include <PaddedAtomic.hpp>
#include <PaddedValue.hpp>

using cell::PaddedAtomic;
using cell::PaddedValue;

// Helper to check alignment
static bool is_aligned(const void* ptr, size_t alignment) {
    return reinterpret_cast<uintptr_t>(ptr) % alignment == 0;
}

// ------------------------------------------------
// Layout
// ------------------------------------------------

TEST(PaddedCellLayout, PaddedAtomicOwnsItsLine) {
    EXPECT_EQ(alignof(PaddedAtomic<int64_t>), CACHE_LINE);
    EXPECT_EQ(sizeof(PaddedAtomic<int64_t>), 2 * CACHE_LINE);
}

TEST(PaddedCellLayout, PaddedValueOwnsItsLine) {
    EXPECT_EQ(alignof(PaddedValue<int64_t>), CACHE_LINE);
    EXPECT_EQ(sizeof(PaddedValue<int64_t>), 2 * CACHE_LINE);
}

TEST(PaddedCellLayout, CompactIsBare) {
    EXPECT_EQ(sizeof(PaddedAtomic<int64_t, false>), sizeof(std::atomic<int64_t>));
    EXPECT_EQ(sizeof(PaddedValue<int64_t, false>), sizeof(std::atomic<int64_t>));
}

TEST(PaddedCellLayout, NeighboursLandOnDistinctLines) {
    struct Pair {
        PaddedAtomic<int64_t> a;
        PaddedValue<int64_t>  b;
    } pair;

    EXPECT_TRUE(is_aligned(&pair.a, CACHE_LINE));
    EXPECT_TRUE(is_aligned(&pair.b, CACHE_LINE));
    EXPECT_GE(reinterpret_cast<uintptr_t>(&pair.b) - reinterpret_cast<uintptr_t>(&pair.a),
              2 * CACHE_LINE);
}

TEST(PaddedCellLayout, HeapArrayStaysAligned) {
    auto* cells = new PaddedAtomic<int64_t>[4];
    for(size_t i = 0; i < 4; i++) {
        EXPECT_TRUE(is_aligned(&cells[i], CACHE_LINE));
    }
    delete[] cells;
}

// ------------------------------------------------
// Semantics (both layouts)
// ------------------------------------------------

template <typename P>
class PaddedAtomicTest : public ::testing::Test {};

typedef ::testing::Types<
    PaddedAtomic<int64_t, true>,
    PaddedAtomic<int64_t, false>
> AtomicTypes;
TYPED_TEST_SUITE(PaddedAtomicTest, AtomicTypes);

TYPED_TEST(PaddedAtomicTest, DefaultsToZero) {
    TypeParam a;
    EXPECT_EQ(a.get(), 0);
}

TYPED_TEST(PaddedAtomicTest, InitialValue) {
    TypeParam a{-17};
    EXPECT_EQ(a.get(), -17);
}

TYPED_TEST(PaddedAtomicTest, SetAndLazySetAreVisibleToWriter) {
    TypeParam a;
    a.set(5);
    EXPECT_EQ(a.get(), 5);
    a.lazySet(9);
    EXPECT_EQ(a.get(), 9);
}

TYPED_TEST(PaddedAtomicTest, CompareAndSetMatches) {
    TypeParam a{3};
    EXPECT_TRUE(a.compareAndSet(3, 4));
    EXPECT_EQ(a.get(), 4);
}

TYPED_TEST(PaddedAtomicTest, CompareAndSetMismatchLeavesValue) {
    TypeParam a{3};
    EXPECT_FALSE(a.compareAndSet(2, 10));
    EXPECT_EQ(a.get(), 3);
}

/**
 * @test Concurrent CAS increments never lose an update.
 */
TYPED_TEST(PaddedAtomicTest, ConcurrentIncrements) {
    constexpr int kThreads = 8;
    constexpr int kIters   = 20000;

    TypeParam a;
    std::barrier<> start(kThreads);
    std::vector<std::thread> threads;

    for(int i = 0; i < kThreads; i++) {
        threads.emplace_back([&]{
            start.arrive_and_wait();
            for(int j = 0; j < kIters; j++) {
                int64_t cur;
                do {
                    cur = a.get();
                } while(!a.compareAndSet(cur, cur + 1));
            }
        });
    }
    for(auto& t : threads) t.join();

    EXPECT_EQ(a.get(), int64_t{kThreads} * kIters);
}

template <typename P>
class PaddedValueTest : public ::testing::Test {};

typedef ::testing::Types<
    PaddedValue<int64_t, true>,
    PaddedValue<int64_t, false>
> ValueTypes;
TYPED_TEST_SUITE(PaddedValueTest, ValueTypes);

TYPED_TEST(PaddedValueTest, GetSet) {
    TypeParam v;
    EXPECT_EQ(v.get(), 0);
    v.set(123);
    EXPECT_EQ(v.get(), 123);
    v.set(-1);
    EXPECT_EQ(v.get(), -1);
}

/**
 * @test Racing writers leave one of the written values, never a torn one.
 */
TYPED_TEST(PaddedValueTest, RacingWritersKeepAWrittenValue) {
    constexpr int64_t kA = 0x0101010101010101;
    constexpr int64_t kB = 0x7e7e7e7e7e7e7e7e;

    TypeParam v{kA};
    std::thread w1([&]{ for(int i = 0; i < 10000; i++) v.set(kA); });
    std::thread w2([&]{ for(int i = 0; i < 10000; i++) v.set(kB); });
    for(int i = 0; i < 10000; i++) {
        int64_t seen = v.get();
        EXPECT_TRUE(seen == kA || seen == kB);
    }
    w1.join();
    w2.join();
}
