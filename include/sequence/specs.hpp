#pragma once

#include <type_traits>
#include <cstddef>
#include <atomic>

// Cache line width used for every padded layout in the library.
// 64 bytes matches most x86_64 and aarch64 parts; override with
// -DCACHE_LINE=128 where adjacent-line prefetching pairs lines.
#ifndef CACHE_LINE
#define CACHE_LINE 64ul
#endif

namespace align {

    // Compute padding needed to align size to cache line
    constexpr std::size_t padding_for(std::size_t size) {
        return (CACHE_LINE - (size % CACHE_LINE)) % CACHE_LINE;
    }

    // Type-based padding: fills the rest of the line after Ts...
    template <typename... Ts>
    constexpr std::size_t padding_for_types() {
        constexpr std::size_t size = (sizeof(Ts) + ... + 0);
        static_assert(size <= CACHE_LINE, "Total type size exceeds cache line size");
        return padding_for(size);
    }

} // namespace align

// Macro to generate a unique padding name using __COUNTER__ for safety
#define CONCAT_IMPL(x, y) x##y
#define CONCAT(x, y) CONCAT_IMPL(x, y)
#define UNIQUE_NAME(base) CONCAT(base, __COUNTER__)

// Macro: a whole line of filler
#define CACHE_PAD_LINE \
    char UNIQUE_NAME(_pad)[CACHE_LINE]

// Macro: Add padding using types
#define CACHE_PAD_TYPES(...) \
    char UNIQUE_NAME(_pad)[align::padding_for_types<__VA_ARGS__>()]

// Optional: shorthand for aligning a struct
#define ALIGNED_CACHE alignas(CACHE_LINE)

namespace detail {

template <typename T, bool IsTC>
struct is_lock_free_impl {
    static constexpr bool value = false;
};

template <typename T>
struct is_lock_free_impl<T, true> {
    static constexpr bool value = std::atomic<T>::is_always_lock_free;
};

template <typename T>
static constexpr bool atomic_compatible_v =
    std::is_trivially_copyable_v<T> &&
    is_lock_free_impl<T, std::is_trivially_copyable_v<T>>::value;

} // namespace detail
