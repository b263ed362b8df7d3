#pragma once
#include <cstddef>
#include <random>

namespace timing {

static inline std::minstd_rand& random_engine() {
    static thread_local std::minstd_rand engine{std::random_device{}()};
    return engine;
}

/**
 * Random number between 0 and 1
 */
static inline double next_double() {
    static thread_local std::uniform_real_distribution<double> random_01_distribution{};
    return random_01_distribution(random_engine());
}

/**
 * @brief loop function that should not be optimized out
 */
inline void loop(size_t stop) {
    for(size_t i = 0; i < stop; i++) {
        __asm__ __volatile__ ("nop");
    }
}

/**
 * @brief random integer in [center - amplitude, center + amplitude)
 *
 * amplitude is clamped to center to avoid underflow
 */
inline size_t randint(size_t center, size_t amplitude) {
    if(amplitude > center)
        amplitude = center;

    double rand01 = next_double();
    return static_cast<size_t>(static_cast<double>(center - amplitude) + rand01 * (2 * amplitude));
}

/**
 * @brief Random work function
 *
 * @param center (size_t) center of the distribution
 * @param amplitude (size_t) amplitude of the distribution
 *
 * spins for a random number of iterations between center - amplitude and center + amplitude
 */
inline void random_work(size_t center, size_t amplitude) {
    if(center == 0)
        return;
    loop(randint(center,amplitude));
}

}   //namespace timing
