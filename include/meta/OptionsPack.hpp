#pragma once
#include <type_traits>

namespace meta {

    /**
     * @brief A compile-time immutable container for option tags.
     *
     * Components are configured with empty tag structs instead of runtime
     * flags, so a disabled feature costs nothing at runtime:
     *
     * @code
     * struct SequenceOption {
     *     struct DisablePadding {};
     * };
     *
     * using Compact = meta::EmptyOptions::add<SequenceOption::DisablePadding>;
     *
     * template <typename Opt>
     * class Component {
     *     static constexpr bool PAD = !Opt::template has<SequenceOption::DisablePadding>;
     * };
     * @endcode
     *
     * @tparam Options The tags contained in this pack.
     */
    template <typename... Options>
    struct OptionsPack {

        /**
         * @brief True if QueryOpt is one of the tags in the pack.
         */
        template <typename QueryOpt>
        static constexpr bool has = ((std::is_same_v<QueryOpt, Options>) || ...);

        /// Number of tags in the pack.
        static constexpr auto size = sizeof...(Options);

        /**
         * @brief The pack with NewOpt appended.
         */
        template <typename NewOpt>
        using add = OptionsPack<Options..., NewOpt>;

        /**
         * @brief The pack with NewOpt appended iff Condition holds.
         *
         * Lets a build flag select a layout:
         * @code
         * using Opt = meta::EmptyOptions::add_if<kMeasureSharing, SequenceOption::DisablePadding>;
         * @endcode
         */
        template <bool Condition, typename NewOpt>
        using add_if = std::conditional_t<
            Condition,
            OptionsPack<Options..., NewOpt>,
            OptionsPack<Options...>
        >;
    };

    /// Starting point for an option chain; selects every default.
    using EmptyOptions = OptionsPack<>;

} // namespace meta
