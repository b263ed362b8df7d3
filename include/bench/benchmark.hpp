#pragma once
#include <atomic>
#include <chrono>
#include <barrier>
#include <thread>
#include <vector>
#include <iostream>
#include <cstdint>
#include <cctype>
#include <string>
#include <stdexcept>
#include <AtomicSequence.hpp>
#include <ThreadPinner.hpp>
#include <AdditionalWork.hpp>

//Assumes that CORE_TOPOLOGY is defined if pinning is active

namespace bench {

static constexpr size_t NSEC_IN_SEC = 1'000'000'000ull;

enum class delay {
    NO_DELAY,
    IN_CLAIM_DELAY,     ///< work while holding the claim
    OUT_CLAIM_DELAY,    ///< work between two claims
    BOTH_DELAY
};

/**
 * @brief Parses a non-negative decimal count from a command line argument.
 *
 * std::stoull accepts a leading '-' and wraps the value, so a sign is
 * rejected before parsing. Trailing characters are rejected as well.
 *
 * @return false if `arg` is not a plain unsigned number in range
 */
inline bool parse_count(const char* arg, size_t& out) {
    if(arg == nullptr)
        return false;

    const char* p = arg;
    while(std::isspace(static_cast<unsigned char>(*p)))
        p++;
    if(*p == '\0' || *p == '-' || *p == '+')
        return false;

    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(p, &pos);
        if(p[pos] != '\0')
            return false;
        out = static_cast<size_t>(value);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

/// Outcome of one run
struct Result {
    std::chrono::nanoseconds elapsed{0};
    size_t committed{0};                ///< claims executed inside the critical section
    sequence::sequence_t published{0};  ///< published sequence after the run
    uint64_t retries{0};                ///< failed update() calls, over all threads

    long double opsPerSec() const {
        if(elapsed.count() == 0)
            return 0;
        return static_cast<long double>(committed) * NSEC_IN_SEC / elapsed.count();
    }
};

/**
 * @brief runs `iterations` claim/commit rounds spread over `threads` workers
 *
 * Every worker runs the canonical loop: read a candidate with get(), claim it
 * with update(), do its work, commit(). The work is a relaxed increment of a
 * shared counter; at the end the counter must equal `iterations` and the
 * published sequence must be `start + iterations`.
 *
 * @return false on invalid arguments, pinning failure or a count mismatch
 */
template<typename Seq, delay do_delay, bool pin_threads>
bool run(
    size_t threads,
    size_t iterations,
    size_t delay_center,
    size_t delay_amplitude,
    Result& result,
    sequence::sequence_t start = 0) {

    using namespace std::chrono;
    using sequence::sequence_t;

    if(threads == 0 || iterations == 0)
        return false;

    Seq seq{start};

    //balance work for workers
    size_t iter_per_thread = iterations / threads;
    size_t remaining_per_thread = iterations % threads;

    std::vector<std::thread> workers;
    std::barrier<> threadBarrier(threads + 1);
    std::atomic_bool stop{false};
    std::atomic<size_t> committed{0};
    std::atomic<uint64_t> retries{0};

    for(size_t i = 0; i < threads; i++) {
        workers.emplace_back([&,i]{
            size_t iterations = iter_per_thread + (i < remaining_per_thread? 1 : 0);
            uint64_t local_retries = 0;
            threadBarrier.arrive_and_wait();    //threads wait for main thread to signal

            for(size_t j = 0; j < iterations && (!stop.load(std::memory_order_relaxed)); j++) {
                if constexpr ((do_delay == delay::OUT_CLAIM_DELAY) || (do_delay == delay::BOTH_DELAY)) {
                    timing::random_work(delay_center,delay_amplitude);
                }

                for(;;) {
                    sequence_t lock = seq.get();
                    if(seq.update(lock)) {
                        if constexpr ((do_delay == delay::IN_CLAIM_DELAY) || (do_delay == delay::BOTH_DELAY)) {
                            timing::random_work(delay_center,delay_amplitude);
                        }
                        committed.fetch_add(1, std::memory_order_relaxed);
                        seq.commit();
                        break;
                    }
                    local_retries++;
                }
            }

            retries.fetch_add(local_retries, std::memory_order_relaxed);
            threadBarrier.arrive_and_wait();
        });
    }

    if constexpr(pin_threads) {
        util::threading::ThreadPinner pinner;
        if(!pinner.pin_threads(workers)) {
            //threads coudn't be pinned
            std::cerr << "[bench] failed to pin threads using topology " << CORE_TOPOLOGY << "\n";
            stop.store(true,std::memory_order_release);
            threadBarrier.arrive_and_wait();
            threadBarrier.arrive_and_wait();
            for(auto& w : workers) w.join();
            return false;
        }
    }

    threadBarrier.arrive_and_wait();    //starts thread iteration
    auto begin = steady_clock::now();
    threadBarrier.arrive_and_wait();    //wait for all threads to be done
    auto end = steady_clock::now();

    for(auto& w : workers) {
        w.join();
    }

    result.elapsed   = duration_cast<nanoseconds>(end - begin);
    result.committed = committed.load(std::memory_order_relaxed);
    result.published = seq.getAtomic();
    result.retries   = retries.load(std::memory_order_relaxed);

    if(result.committed != iterations) {
        std::cerr << "[bench] committed " << result.committed << " claims, expected " << iterations << "\n";
        return false;
    }

    sequence_t expected = wrapping::add<sequence_t>(start, static_cast<sequence_t>(iterations));
    if(result.published != expected) {
        std::cerr << "[bench] published sequence " << result.published << ", expected " << expected << "\n";
        return false;
    }

    return true;
}

/**
 * @brief runs a throughput benchmark and prints the claims per second
 */
template<typename Seq, delay do_delay, bool pin_threads>
bool benchmark(
    size_t threads,
    size_t iterations,
    size_t delay_center,
    size_t delay_amplitude) {

    Result result;
    if(!run<Seq,do_delay,pin_threads>(threads,iterations,delay_center,delay_amplitude,result))
        return false;

    std::cout << result.opsPerSec() << "\n";
    return true;
}

}   //bench namespace
