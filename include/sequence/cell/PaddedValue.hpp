#pragma once

#include <atomic>
#include <cstddef>
#include <specs.hpp>  // defines CACHE_LINE


namespace cell {
/**
 * @brief A best-effort scalar isolated on its own cache line.
 *
 * Meant for a value written by whichever thread last observed a fresh copy of
 * some shared state and read by anyone as a hint. Accesses carry no ordering:
 * they are relaxed atomics, which compile to ordinary loads and stores but
 * keep concurrent reads and writes well defined.
 *
 * Readers must tolerate a stale value.
 *
 * @tparam T                 Type of the stored value.
 * @tparam PadToCacheLine    If true, the value never shares a line with neighbours.
 */
template <typename T, bool PadToCacheLine = true>
struct PaddedValue;

template <typename T>
struct ALIGNED_CACHE PaddedValue<T, true> {
    static_assert(detail::atomic_compatible_v<T>, "PaddedValue: T is not lock free");

    constexpr PaddedValue() noexcept : val_{T{}} {}
    constexpr explicit PaddedValue(T initial) noexcept : val_{initial} {}

    PaddedValue(const PaddedValue&) = delete;
    PaddedValue& operator=(const PaddedValue&) = delete;

    inline T get() const noexcept {
        return val_.load(std::memory_order_relaxed);
    }

    inline void set(T value) noexcept {
        val_.store(value, std::memory_order_relaxed);
    }

private:
    CACHE_PAD_LINE;
    std::atomic<T> val_;
    CACHE_PAD_TYPES(std::atomic<T>);
};

template <typename T>
struct PaddedValue<T, false> {
    static_assert(detail::atomic_compatible_v<T>, "PaddedValue: T is not lock free");

    constexpr PaddedValue() noexcept : val_{T{}} {}
    constexpr explicit PaddedValue(T initial) noexcept : val_{initial} {}

    PaddedValue(const PaddedValue&) = delete;
    PaddedValue& operator=(const PaddedValue&) = delete;

    inline T get() const noexcept {
        return val_.load(std::memory_order_relaxed);
    }

    inline void set(T value) noexcept {
        val_.store(value, std::memory_order_relaxed);
    }

private:
    std::atomic<T> val_;
};

}   //namespace cell
