#pragma once

#include <atomic>
#include <cstddef>
#include <specs.hpp>  // defines CACHE_LINE


namespace cell {
/**
 * @brief An atomic scalar isolated on its own cache line.
 *
 * Holds one lock-free atomic with the three access paths a sequence
 * counter needs:
 *  - a fenced (acquire) read
 *  - a strong compare-and-swap
 *  - a lazy (release) write, visible to other cores eventually
 *
 * Padding behavior is controlled by the template parameter `PadToCacheLine`.
 *
 * @tparam T                 Type of the stored value.
 * @tparam PadToCacheLine    If true, the value never shares a line with neighbours.
 */
template <typename T, bool PadToCacheLine = true>
struct PaddedAtomic;

// -----------------------------------------------------------------------------
// Specialization: cache-line padded
// -----------------------------------------------------------------------------

/**
 * @brief A cache-line isolated atomic.
 *
 * One full filler line precedes the value and the remainder of the value's
 * line is filled behind it, so neither the previous field of the enclosing
 * object nor the next one can land on the line holding the value.
 *
 * @tparam T Type of the stored value.
 */
template <typename T>
struct ALIGNED_CACHE PaddedAtomic<T, true> {
    static_assert(detail::atomic_compatible_v<T>, "PaddedAtomic: T is not lock free");

    constexpr PaddedAtomic() noexcept : val_{T{}} {}
    constexpr explicit PaddedAtomic(T initial) noexcept : val_{initial} {}

    PaddedAtomic(const PaddedAtomic&) = delete;
    PaddedAtomic& operator=(const PaddedAtomic&) = delete;

    /**
     * @brief Fenced read of the current value.
     */
    inline T get() const noexcept {
        return val_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sequentially consistent write.
     */
    inline void set(T value) noexcept {
        val_.store(value, std::memory_order_seq_cst);
    }

    /**
     * @brief Ordered but not immediately visible write.
     *
     * Writes before this call are visible to any thread that later reads
     * this value with get(). Other cores may keep observing the old value
     * for a short while.
     */
    inline void lazySet(T value) noexcept {
        val_.store(value, std::memory_order_release);
    }

    /**
     * @brief Sets the value to `desired` iff it currently equals `expected`.
     *
     * @return true if the swap took place.
     */
    inline bool compareAndSet(T expected, T desired) noexcept {
        return val_.compare_exchange_strong(
            expected, desired,
            std::memory_order_acq_rel,
            std::memory_order_acquire);
    }

private:
    CACHE_PAD_LINE;                 ///< Keeps the previous field off this line.
    std::atomic<T> val_;            ///< Stored value.
    CACHE_PAD_TYPES(std::atomic<T>);///< Fills the rest of the value's line.
};

// -----------------------------------------------------------------------------
// Specialization: compact (no padding)
// -----------------------------------------------------------------------------

/**
 * @brief A compact atomic with natural alignment.
 *
 * Same interface, no padding. Neighbouring fields share its cache line;
 * used to measure what the padded layout saves.
 *
 * @tparam T Type of the stored value.
 */
template <typename T>
struct PaddedAtomic<T, false> {
    static_assert(detail::atomic_compatible_v<T>, "PaddedAtomic: T is not lock free");

    constexpr PaddedAtomic() noexcept : val_{T{}} {}
    constexpr explicit PaddedAtomic(T initial) noexcept : val_{initial} {}

    PaddedAtomic(const PaddedAtomic&) = delete;
    PaddedAtomic& operator=(const PaddedAtomic&) = delete;

    inline T get() const noexcept {
        return val_.load(std::memory_order_acquire);
    }

    inline void set(T value) noexcept {
        val_.store(value, std::memory_order_seq_cst);
    }

    inline void lazySet(T value) noexcept {
        val_.store(value, std::memory_order_release);
    }

    inline bool compareAndSet(T expected, T desired) noexcept {
        return val_.compare_exchange_strong(
            expected, desired,
            std::memory_order_acq_rel,
            std::memory_order_acquire);
    }

private:
    std::atomic<T> val_;
};

}   //namespace cell
