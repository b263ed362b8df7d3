#pragma once
#include <cstdint>
#include <type_traits>
#include <limits>

namespace wrapping {

    // === Type Traits / Helpers ===

    /**
     * @brief Helper to ensure T is a signed integer.
     * Sequence numbers are signed so that a relative distance is a plain
     * value of the same type.
     */
    template <typename T>
    static constexpr bool is_signed_int_v = std::is_integral_v<T> && std::is_signed_v<T>;

    // === Modular Arithmetic ===
    //
    // Signed overflow is undefined behaviour, so every operation is carried
    // out on the unsigned counterpart and converted back. Since C++20 the
    // unsigned -> signed conversion is defined as modular.

    /**
     * @brief Returns s + n, wrapping through the signed range.
     */
    template <typename T>
    [[nodiscard]] static constexpr T add(T s, T n) noexcept {
        static_assert(is_signed_int_v<T>, "T must be a signed integer");
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(static_cast<U>(s) + static_cast<U>(n));
    }

    /**
     * @brief Returns the sequence number following s.
     * next(max) == min.
     */
    template <typename T>
    [[nodiscard]] static constexpr T next(T s) noexcept {
        return add<T>(s, T(1));
    }

    /**
     * @brief Relative distance a - b.
     *
     * The result is > 0 if a is logically after b, < 0 if a precedes b and
     * 0 if they are equal. Correct as long as the two values are less than
     * half the range of T apart; use this instead of a < b on sequences.
     */
    template <typename T>
    [[nodiscard]] static constexpr T difference(T a, T b) noexcept {
        static_assert(is_signed_int_v<T>, "T must be a signed integer");
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(static_cast<U>(a) - static_cast<U>(b));
    }

    /**
     * @brief True if a is logically after b.
     */
    template <typename T>
    [[nodiscard]] static constexpr bool follows(T a, T b) noexcept {
        return difference<T>(a, b) > 0;
    }

    /**
     * @brief True if a is logically before b.
     */
    template <typename T>
    [[nodiscard]] static constexpr bool precedes(T a, T b) noexcept {
        return difference<T>(a, b) < 0;
    }

    static_assert(next(std::numeric_limits<int64_t>::max()) == std::numeric_limits<int64_t>::min());
    static_assert(follows(std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max()));

} // namespace wrapping
