#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace wlgen {
    /**
     * Input iterator over fixed-length combinations. Works like an odometer: one cursor
     * per position indexes into the alphabet, the rightmost cursor turns fastest and
     * carries propagate to the left. The iterator is exhausted when the leftmost cursor
     * overflows or when its element budget runs out.
     *
     * Compares equal to std::default_sentinel when exhausted.
     */
    class combination_iterator {
    public:
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        combination_iterator() = default;

        /**
         * @param alphabet symbols in enumeration order, must not be empty
         * @param length number of positions
         * @param first rank of the first combination to produce
         * @param limit maximum number of combinations to produce
         */
        combination_iterator(
            std::shared_ptr<std::string const> alphabet,
            std::size_t length,
            std::uint64_t first,
            std::uint64_t limit
        );

        auto operator*() const -> std::string const & { return current_; }
        auto operator->() const -> std::string const * { return &current_; }

        auto operator++() -> combination_iterator &;
        auto operator++(int) -> void { ++*this; }

        /**
         * @return rank of the current combination
         */
        [[nodiscard]] auto rank() const noexcept { return rank_; }

        friend auto operator==(combination_iterator const &it, std::default_sentinel_t) noexcept -> bool {
            return it.exhausted_;
        }

    private:
        auto advance_odometer() -> void;

        std::shared_ptr<std::string const> alphabet_;
        std::vector<std::size_t> cursors_;
        std::string current_;
        std::uint64_t rank_ = 0;
        std::uint64_t remaining_ = 0;
        bool exhausted_ = true;
    };

    /**
     * Lazy sequence of all combinations of a given length over an alphabet, restricted
     * to a window [first, first + limit) of ranks. Nothing is materialized; every call
     * to begin() starts a fresh pass over the window.
     */
    class combination_range: public std::ranges::view_interface<combination_range> {
    public:
        static constexpr auto unbounded = std::numeric_limits<std::uint64_t>::max();

        combination_range() = default;
        combination_range(std::string alphabet, std::size_t length);

        [[nodiscard]] auto begin() const -> combination_iterator;
        [[nodiscard]] auto end() const noexcept { return std::default_sentinel; }

        [[nodiscard]] auto alphabet() const -> std::string_view;
        [[nodiscard]] auto length() const noexcept { return length_; }
        [[nodiscard]] auto first_rank() const noexcept { return first_; }
        [[nodiscard]] auto limit() const noexcept { return limit_; }

        /**
         * @return number of combinations a pass over this range yields, saturated at
         *         the largest 64-bit value when the domain is larger than that
         */
        [[nodiscard]] auto size_hint() const -> std::uint64_t;

        /**
         * @return the same sequence without its first n elements. A start rank beyond
         *         the 64-bit range yields an empty sequence.
         */
        [[nodiscard]] auto skipped(std::uint64_t n) const -> combination_range;

        /**
         * @return the same sequence cut off after at most n elements
         */
        [[nodiscard]] auto taken(std::uint64_t n) const -> combination_range;

    private:
        std::shared_ptr<std::string const> alphabet_;
        std::size_t length_ = 0;
        std::uint64_t first_ = 0;
        std::uint64_t limit_ = unbounded;
    };

    /**
     * base^exponent, or nullopt if the result does not fit into 64 bits.
     */
    auto checked_power(std::uint64_t base, std::size_t exponent) noexcept -> std::optional<std::uint64_t>;

    /**
     * Number of combinations of the given length over the alphabet.
     *
     * @throw wlgen_exception invalid_argument for an empty alphabet or negative length,
     *        out_of_range if the count exceeds 64 bits
     */
    auto total(std::string_view alphabet, std::int64_t length) -> std::uint64_t;

    auto produce(std::string_view alphabet, std::int64_t length) -> combination_range;
    auto skip(combination_range const &sequence, std::int64_t n) -> combination_range;
    auto take(combination_range const &sequence, std::int64_t n) -> combination_range;

    /**
     * Combination with the given rank: rank written in base |alphabet|, zero-padded to
     * length digits, digits mapped through the alphabet.
     */
    auto combination_at(std::string_view alphabet, std::int64_t length, std::uint64_t rank) -> std::string;
}

template<>
inline constexpr bool std::ranges::enable_borrowed_range<wlgen::combination_range> = true;
