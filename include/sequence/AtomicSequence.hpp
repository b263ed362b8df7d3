#pragma once
#include <cstdint>
#include <utility>
#include <specs.hpp>            //  padding and compatibility def
#include <PaddedAtomic.hpp>     //  cursor and published counters
#include <PaddedValue.hpp>      //  cached published value
#include <wrapping.hpp>         //  modular sequence arithmetic
#include <OptionsPack.hpp>      //  options

namespace sequence {

/// Sequence numbers are signed and allowed to wrap; compare them with
/// wrapping::difference, never with < or >.
using sequence_t = std::int64_t;

/// Options for the sequence
struct SequenceOption {
    struct DisablePadding{};
};

/**
 * @brief Lock-free claim/commit coordinator over a monotonic sequence.
 *
 * Each sequence number entitles exactly one thread to perform one atomic
 * change. A thread reads a candidate number, claims it with update() and,
 * once its change is done, publishes it with commit(). Threads that lose the
 * claim get a refreshed view and retry with a new candidate:
 *
 * @code
 * for(;;) {
 *     sequence_t lock = seq.get();
 *     // preliminary checks (capacity, ...) go here
 *     if(seq.update(lock)) {
 *         // change something atomically here
 *         seq.commit();
 *         return;
 *     }
 * }
 * @endcode
 *
 * Two counters are kept:
 *  - the cursor, the next number that may be claimed, advanced by CAS
 *  - the published sequence, the last number whose change was committed
 * plus a cached copy of the published sequence, so get() never issues a
 * fenced read.
 *
 * Claims of lower numbers are always resolved before higher ones. No fence is
 * provided for the caller's own data: state changed under a claim must be
 * published through the caller's own atomics.
 *
 * @warning a thread that wins update() and never calls commit() blocks every
 * other claimant forever. Calling commit() without a won claim, or twice for
 * one claim, publishes a number nobody owns. Neither is checked.
 *
 * @tparam Opt OptionsPack<> of SequenceOption tags
 */
template<typename Opt = meta::EmptyOptions>
class AtomicSequence {
    static constexpr bool PAD = !Opt::template has<SequenceOption::DisablePadding>;

    using Counter = cell::PaddedAtomic<sequence_t,PAD>;
    using Cache   = cell::PaddedValue<sequence_t,PAD>;

public:
    class ClaimPermit;

    /**
     * @brief Constructs a sequence with every counter at `start`.
     *
     * @param start first number to be claimed (defaults to 0).
     */
    explicit AtomicSequence(sequence_t start = 0) noexcept:
        cursor_{start},
        sequence_{start},
        sequenceCache_{start}
    {}

    AtomicSequence(const AtomicSequence&) = delete;
    AtomicSequence& operator=(const AtomicSequence&) = delete;
    AtomicSequence(AtomicSequence&&) = delete;
    AtomicSequence& operator=(AtomicSequence&&) = delete;

    /**
     * @brief Returns the cached published sequence.
     *
     * No fence. The value may be older than the published sequence; a
     * candidate taken from a stale value simply fails to claim.
     */
    sequence_t get() const noexcept {
        return sequenceCache_.get();
    }

    /**
     * @brief Fenced read of the published sequence, refreshing the cache.
     *
     * Only needed when the cached value is known to be out of date.
     */
    sequence_t getAtomic() noexcept {
        sequence_t seq = sequence_.get();
        sequenceCache_.set(seq);
        return seq;
    }

    /**
     * @brief Attempts to claim sequence number `candidate`.
     *
     * Moves the cursor from `candidate` to its successor. On failure the cache
     * is reloaded from the published sequence, so the next get() yields a
     * fresh candidate.
     *
     * @param candidate number to claim
     * @return true if the calling thread now owns `candidate` and must commit().
     */
    bool update(sequence_t candidate) noexcept {
        if(cursor_.compareAndSet(candidate, wrapping::next(candidate))) {
            return true;
        }

        // another thread moved the cursor: the cache is stale
        sequenceCache_.set(sequence_.get());
        return false;
    }

    /**
     * @brief Publishes the claim held by the calling thread.
     *
     * Lazily writes the cursor into the published sequence and reads it back,
     * so the committing thread's next get() already returns the new value.
     *
     * @pre the calling thread won update() and has not committed that claim yet.
     */
    void commit() noexcept {
        sequence_.lazySet(cursor_.get());
        sequenceCache_.set(sequence_.get());
    }

    /**
     * @brief Fenced read of the cursor: the next number that can be claimed.
     *
     * Runs ahead of the published sequence while a claim is outstanding.
     */
    sequence_t cursor() const noexcept {
        return cursor_.get();
    }

    /**
     * @brief Claims `candidate`, returning a permit that commits on scope exit.
     *
     * The returned permit is engaged iff update(candidate) succeeded.
     */
    ClaimPermit claim(sequence_t candidate) noexcept {
        if(update(candidate)) {
            return ClaimPermit(this, candidate);
        }
        return ClaimPermit();
    }

private:
    Counter cursor_;        ///< Next number to hand out.
    Counter sequence_;      ///< Last committed number.
    Cache sequenceCache_;   ///< Last observed value of sequence_.
};

/**
 * @brief Move-only ownership of a single won claim.
 *
 * An engaged permit commits exactly once: through commit() or, failing
 * that, from its destructor, so a claim cannot be committed twice. Moving
 * transfers the obligation to commit, also to another thread: whoever holds
 * the permit last publishes the claim.
 */
template<typename Opt>
class AtomicSequence<Opt>::ClaimPermit {
    friend class AtomicSequence<Opt>;

    ClaimPermit(AtomicSequence* owner, sequence_t seq) noexcept:
        owner_(owner), seq_(seq) {}

public:
    /// @brief A permit holding no claim.
    ClaimPermit() noexcept = default;

    ClaimPermit(const ClaimPermit&) = delete;
    ClaimPermit& operator=(const ClaimPermit&) = delete;

    ClaimPermit(ClaimPermit&& other) noexcept:
        owner_(std::exchange(other.owner_, nullptr)),
        seq_(other.seq_) {}

    ClaimPermit& operator=(ClaimPermit&& other) noexcept {
        if(this != &other) {
            if(owner_ != nullptr) {
                owner_->commit();
            }
            owner_ = std::exchange(other.owner_, nullptr);
            seq_   = other.seq_;
        }
        return *this;
    }

    ~ClaimPermit() {
        if(owner_ != nullptr) {
            owner_->commit();
        }
    }

    /**
     * @brief Publishes the claim and disengages the permit.
     *
     * @return false if the permit held no claim (lost, moved-from or
     * already committed); nothing is published in that case.
     */
    bool commit() noexcept {
        if(owner_ == nullptr) {
            return false;
        }
        owner_->commit();
        owner_ = nullptr;
        return true;
    }

    bool owns() const noexcept {
        return owner_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return owns();
    }

    /// @brief The claimed number. Meaningless on a permit that never owned one.
    sequence_t sequence() const noexcept {
        return seq_;
    }

private:
    AtomicSequence* owner_{nullptr};
    sequence_t seq_{0};
};

using PaddedSequence  = AtomicSequence<>;
using CompactSequence = AtomicSequence<meta::EmptyOptions::add<SequenceOption::DisablePadding>>;

// cursor, published and cache each own a filler line plus a value line
static_assert(sizeof(PaddedSequence) == 6 * CACHE_LINE, "PaddedSequence: unexpected layout");
static_assert(alignof(PaddedSequence) == CACHE_LINE, "PaddedSequence must be cache-line aligned");
static_assert(sizeof(CompactSequence) == 3 * sizeof(sequence_t), "CompactSequence: unexpected layout");

}   //namespace sequence
