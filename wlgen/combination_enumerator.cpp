#include "combination_enumerator.hpp"
#include "error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace wlgen {
    namespace {
        auto validated_length(std::string_view alphabet, std::int64_t length) -> std::size_t {
            enforce(!alphabet.empty(), errc::invalid_argument, "alphabet must not be empty");
            enforce(length >= 0, errc::invalid_argument, fmt::format("combination length must not be negative, got {}", length));

            return static_cast<std::size_t>(length);
        }

        auto validated_count(std::int64_t n, char const *what) -> std::uint64_t {
            enforce(n >= 0, errc::invalid_argument, fmt::format("{} count must not be negative, got {}", what, n));

            return static_cast<std::uint64_t>(n);
        }
    }

    combination_iterator::combination_iterator(
        std::shared_ptr<std::string const> alphabet,
        std::size_t length,
        std::uint64_t first,
        std::uint64_t limit
    ):
        alphabet_ { std::move(alphabet) },
        cursors_(length, 0),
        current_(length, alphabet_->front()),
        rank_ { first },
        remaining_ { limit },
        exhausted_ { limit == 0 }
    {
        auto const base = alphabet_->size();

        // decode the start rank straight into the cursors, least significant position last
        for(auto pos = length; pos-- > 0 && first != 0; ) {
            cursors_[pos] = first % base;
            current_[pos] = (*alphabet_)[cursors_[pos]];
            first /= base;
        }

        if(first != 0) {
            exhausted_ = true;
        }
    }

    auto combination_iterator::operator++() -> combination_iterator & {
        if(exhausted_) {
            return *this;
        }

        if(--remaining_ == 0) {
            exhausted_ = true;
            return *this;
        }

        advance_odometer();
        return *this;
    }

    auto combination_iterator::advance_odometer() -> void {
        auto const base = alphabet_->size();

        for(auto pos = cursors_.size(); pos-- > 0; ) {
            if(++cursors_[pos] < base) {
                current_[pos] = (*alphabet_)[cursors_[pos]];
                ++rank_;
                return;
            }

            cursors_[pos] = 0;
            current_[pos] = alphabet_->front();
        }

        // leftmost cursor overflowed
        exhausted_ = true;
    }

    combination_range::combination_range(std::string alphabet, std::size_t length):
        alphabet_ { std::make_shared<std::string const>(std::move(alphabet)) },
        length_ { length }
    {}

    auto combination_range::begin() const -> combination_iterator {
        if(alphabet_ == nullptr) {
            return combination_iterator{};
        }

        return combination_iterator { alphabet_, length_, first_, limit_ };
    }

    auto combination_range::alphabet() const -> std::string_view {
        return alphabet_ ? std::string_view { *alphabet_ } : std::string_view {};
    }

    auto combination_range::size_hint() const -> std::uint64_t {
        if(alphabet_ == nullptr) {
            return 0;
        }

        auto domain = checked_power(alphabet_->size(), length_);

        if(!domain) {
            // every 64-bit start rank lies inside the domain
            return limit_;
        }

        auto available = first_ >= *domain ? 0 : *domain - first_;
        return std::min(available, limit_);
    }

    auto combination_range::skipped(std::uint64_t n) const -> combination_range {
        auto result = *this;

        if(n > unbounded - first_) {
            // no 64-bit rank is left to start from, the sequence is used up
            result.first_ = unbounded;
            result.limit_ = 0;
            return result;
        }

        result.first_ += n;

        if(limit_ != unbounded) {
            result.limit_ -= std::min(n, limit_);
        }

        return result;
    }

    auto combination_range::taken(std::uint64_t n) const -> combination_range {
        auto result = *this;
        result.limit_ = std::min(limit_, n);
        return result;
    }

    auto checked_power(std::uint64_t base, std::size_t exponent) noexcept -> std::optional<std::uint64_t> {
        if(base <= 1 || exponent == 0) {
            return exponent == 0 ? 1 : base;
        }

        auto result = std::uint64_t { 1 };

        for(std::size_t i = 0; i < exponent; ++i) {
            if(result > std::numeric_limits<std::uint64_t>::max() / base) {
                return std::nullopt;
            }

            result *= base;
        }

        return result;
    }

    auto total(std::string_view alphabet, std::int64_t length) -> std::uint64_t {
        auto len = validated_length(alphabet, length);
        auto result = checked_power(alphabet.size(), len);

        enforce(result.has_value(), errc::out_of_range, fmt::format("{}^{} combinations exceed 64 bits", alphabet.size(), len));

        return *result;
    }

    auto produce(std::string_view alphabet, std::int64_t length) -> combination_range {
        auto len = validated_length(alphabet, length);

        return combination_range { std::string { alphabet }, len };
    }

    auto skip(combination_range const &sequence, std::int64_t n) -> combination_range {
        return sequence.skipped(validated_count(n, "skip"));
    }

    auto take(combination_range const &sequence, std::int64_t n) -> combination_range {
        return sequence.taken(validated_count(n, "take"));
    }

    auto combination_at(std::string_view alphabet, std::int64_t length, std::uint64_t rank) -> std::string {
        auto len = validated_length(alphabet, length);
        auto domain = checked_power(alphabet.size(), len);

        if(domain && rank >= *domain) {
            throw wlgen_exception(errc::out_of_range, fmt::format("rank {} is outside of {} combinations", rank, *domain));
        }

        auto result = std::string(len, alphabet.front());

        for(auto pos = len; pos-- > 0 && rank != 0; ) {
            result[pos] = alphabet[rank % alphabet.size()];
            rank /= alphabet.size();
        }

        return result;
    }
}
