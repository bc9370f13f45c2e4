#pragma once

#include <algorithm>
#include <concepts>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>

#include "../bound.hpp"
#include "../error/context.hpp"
#include "../error/external.hpp"
#include "../error/invalid_value.hpp"
#include "../error/length_shortfall.hpp"
#include "../error/value_mismatch.hpp"
#include "../expected.hpp"
#include "../maybe_string.hpp"
#include "../pattern.hpp"
#include "../prefix.hpp"
#include "../span.hpp"

namespace wary::detail {

template <typename F, typename Token, typename E>
concept FallibleTokenPredicate = std::same_as<std::invoke_result_t<F&, Token>, expected<bool, E>>;

/**
 * Base class of the Bytes and String inputs
 *
 * Holds the viewed bytes and the bound, and implements every splitting
 * primitive in terms of two operations the derived class provides:
 *
 *   static std::pair<Token, size_t> decode_token(std::span<const uint8_t>)
 *       first token of non-empty input and its width in bytes
 *   std::optional<size_t> token_byte_index(size_t tokens) const
 *       byte offset after `tokens` tokens, nullopt if there are fewer
 *
 * Heads split off at a known offset get a closed end; tails keep the parent's
 * bound. A scan that runs off the end returns the whole input and its end()
 * so the caller can see the scan could have continued.
 *
 * This is an implementation detail - use wary::Bytes or wary::String.
 */
template <typename Derived, typename TokenT>
class InputBase {
public:
    using Token = TokenT;

    static constexpr bool is_text = std::same_as<TokenT, char32_t>;

    /// Length in bytes.
    [[nodiscard]] size_t byte_len() const noexcept { return bytes_.size(); }

    [[nodiscard]] bool is_empty() const noexcept { return bytes_.empty(); }

    [[nodiscard]] Bound bound() const noexcept { return bound_; }

    /// True if errors over this input can never be retried.
    [[nodiscard]] bool is_bound() const noexcept { return bound_ == Bound::both; }

    [[nodiscard]] Span span() const noexcept { return Span::of(bytes_); }

    /**
     * @brief The raw bytes
     *
     * This is where untrusted data leaves wary's control; everything derived
     * from it is the caller's responsibility.
     */
    [[nodiscard]] std::span<const uint8_t> as_bytes() const noexcept { return bytes_; }

    /// Mark the input as complete: errors over it become fatal.
    [[nodiscard]] Derived into_bound() const noexcept { return make(bytes_, Bound::both); }

    [[nodiscard]] Derived into_unbound_end() const noexcept {
        return make(bytes_, open_end(bound_));
    }

    [[nodiscard]] MaybeString into_maybe_string() const noexcept {
        return MaybeString(bytes_, bound_, is_text);
    }

    /// Empty input positioned at the end of this one.
    [[nodiscard]] Derived end() const noexcept {
        return make(bytes_.subspan(bytes_.size()), for_end(bound_));
    }

    /// Check whether @p other views a region inside this input.
    template <typename Other>
    [[nodiscard]] bool contains(const Other& other) const noexcept {
        return other.span().is_within(span());
    }

    /**
     * @brief Split at a byte offset known to be on a token boundary
     */
    [[nodiscard]] std::pair<Derived, Derived> split_at_byte_unchecked(size_t mid) const noexcept {
        return {make(bytes_.first(mid), close_end(bound_)), make(bytes_.subspan(mid), bound_)};
    }

    /**
     * @brief Split after @p mid tokens, or nullopt if there are fewer
     */
    [[nodiscard]] std::optional<std::pair<Derived, Derived>> split_at_opt(size_t mid) const {
        auto index = self().token_byte_index(mid);
        if (!index) {
            return std::nullopt;
        }
        return split_at_byte_unchecked(*index);
    }

    /**
     * @brief Split after @p mid tokens
     *
     * On failure the LengthShortfall covers the whole input. Its min is in
     * bytes: @p mid for byte input, and for text the current byte length plus
     * one byte per missing char.
     */
    template <typename E>
        requires std::constructible_from<E, LengthShortfall>
    [[nodiscard]] expected<std::pair<Derived, Derived>, E>
    split_at(size_t mid, Operation operation = Operation::take) const {
        if (auto parts = split_at_opt(mid)) {
            return *std::move(parts);
        }
        size_t min = mid;
        if constexpr (std::same_as<Token, char32_t>) {
            min = bytes_.size() + (mid - self().char_len());
        }
        return unexpected(E(LengthShortfall{
            .min = min,
            .context = Context::from(operation, span(), "enough input"),
            .input = into_maybe_string(),
        }));
    }

    /**
     * @brief Split at a byte offset supplied by foreign code
     *
     * The offset is checked against the length and the token boundaries
     * rather than trusted.
     */
    template <typename E>
        requires std::constructible_from<E, LengthShortfall> &&
                 std::constructible_from<E, InvalidValue>
    [[nodiscard]] expected<std::pair<Derived, Derived>, E>
    split_at_byte(size_t mid, Operation operation) const {
        if (mid > bytes_.size()) {
            return unexpected(E(LengthShortfall{
                .min = mid,
                .context = Context::from(operation, span(), "enough input"),
                .input = into_maybe_string(),
            }));
        }
        if constexpr (is_text) {
            if (!is_char_boundary(bytes_, mid)) {
                return unexpected(E(InvalidValue{
                    .context = Context::from(operation, span(), "token boundary"),
                    .input = into_maybe_string(),
                }));
            }
        }
        return split_at_byte_unchecked(mid);
    }

    /**
     * @brief Split off the longest prefix accepted by @p pattern
     */
    template <typename P>
        requires Pattern<P, Token>
    [[nodiscard]] std::pair<Derived, Derived> split_while(const P& pattern) const {
        auto reject = PatternTraits<std::decay_t<P>, Token>::find_reject(pattern, bytes_);
        if (!reject) {
            return {self(), end()};
        }
        return split_at_byte_unchecked(*reject);
    }

    /**
     * @brief Split off the longest prefix accepted by a fallible predicate
     *
     * Stops at the first token the predicate rejects and returns the first
     * error the predicate raises.
     */
    template <typename E, typename F>
        requires FallibleTokenPredicate<F, Token, E>
    [[nodiscard]] expected<std::pair<Derived, Derived>, E> try_split_while(F&& pred) const {
        size_t i = 0;
        while (i < bytes_.size()) {
            auto [token, width] = Derived::decode_token(bytes_.subspan(i));
            expected<bool, E> keep = pred(token);
            if (!keep) {
                return unexpected(std::move(keep.error()));
            }
            if (!*keep) {
                return split_at_byte_unchecked(i);
            }
            i += width;
        }
        return std::pair<Derived, Derived>{self(), end()};
    }

    /// Split before the first match of @p pattern.
    template <typename P>
        requires Pattern<P, Token>
    [[nodiscard]] std::optional<std::pair<Derived, Derived>> split_until_opt(const P& pattern) const {
        auto found = PatternTraits<std::decay_t<P>, Token>::find_match(pattern, bytes_);
        if (!found) {
            return std::nullopt;
        }
        return split_at_byte_unchecked(found->index);
    }

    /// Split before the first match of @p pattern and drop the match.
    template <typename P>
        requires Pattern<P, Token>
    [[nodiscard]] std::optional<std::pair<Derived, Derived>>
    split_until_consume_opt(const P& pattern) const {
        auto found = PatternTraits<std::decay_t<P>, Token>::find_match(pattern, bytes_);
        if (!found) {
            return std::nullopt;
        }
        auto [head, rest] = split_at_byte_unchecked(found->index);
        return std::pair<Derived, Derived>{head, rest.split_at_byte_unchecked(found->len).second};
    }

    /**
     * @brief Split before the first match of @p pattern
     *
     * A missing match is a ValueMismatch whose found region is the longest
     * suffix of the input that could still be the start of the pattern, so
     * the error is retryable while the input may grow.
     */
    template <typename E, typename P>
        requires ValuePattern<P, Token> && std::constructible_from<E, ValueMismatch>
    [[nodiscard]] expected<std::pair<Derived, Derived>, E>
    split_until(const P& pattern, Operation operation = Operation::take_until) const {
        if (auto parts = split_until_opt(pattern)) {
            return *std::move(parts);
        }
        return unexpected(E(missing_pattern(to_value<P, Token>(pattern), operation)));
    }

    template <typename E, typename P>
        requires ValuePattern<P, Token> && std::constructible_from<E, ValueMismatch>
    [[nodiscard]] expected<std::pair<Derived, Derived>, E>
    split_until_consume(const P& pattern,
                        Operation operation = Operation::take_until_consume) const {
        if (auto parts = split_until_consume_opt(pattern)) {
            return *std::move(parts);
        }
        return unexpected(E(missing_pattern(to_value<P, Token>(pattern), operation)));
    }

    /// Check whether the input starts with @p prefix.
    template <typename P>
        requires Prefix<P, Token>
    [[nodiscard]] bool has_prefix(const P& prefix) const noexcept {
        Value value = to_value<P, Token>(prefix);
        auto want = value.as_bytes();
        return bytes_.size() >= want.size() && std::equal(want.begin(), want.end(), bytes_.begin());
    }

    template <typename P>
        requires Prefix<P, Token>
    [[nodiscard]] std::optional<std::pair<Derived, Derived>> split_prefix_opt(const P& prefix) const {
        if (!has_prefix(prefix)) {
            return std::nullopt;
        }
        return split_at_byte_unchecked(to_value<P, Token>(prefix).len());
    }

    /**
     * @brief Split off @p prefix, which must be at the start of the input
     *
     * The ValueMismatch raised on failure covers at most the expected length,
     * so an input that is a strict prefix of the expected value yields a
     * retryable error and anything else a fatal one.
     */
    template <typename E, typename P>
        requires Prefix<P, Token> && std::constructible_from<E, ValueMismatch>
    [[nodiscard]] expected<std::pair<Derived, Derived>, E>
    split_prefix(const P& prefix, Operation operation = Operation::consume) const {
        Value value = to_value<P, Token>(prefix);
        if (has_prefix(prefix)) {
            return split_at_byte_unchecked(value.len());
        }
        auto found = bytes_.first(std::min(bytes_.size(), value.len()));
        return unexpected(E(ValueMismatch{
            .expected = value,
            .context = Context::from(operation, Span::of(found), "exact value"),
            .input = into_maybe_string(),
        }));
    }

    /// Split off the first token.
    [[nodiscard]] std::optional<std::pair<Token, Derived>> split_token_opt() const noexcept {
        if (bytes_.empty()) {
            return std::nullopt;
        }
        auto [token, width] = Derived::decode_token(bytes_);
        return std::pair<Token, Derived>{token, split_at_byte_unchecked(width).second};
    }

    template <typename E>
        requires std::constructible_from<E, LengthShortfall>
    [[nodiscard]] expected<std::pair<Token, Derived>, E> split_token(Operation operation) const {
        if (auto parts = split_token_opt()) {
            return *parts;
        }
        return unexpected(E(LengthShortfall{
            .min = 1,
            .context = Context::from(operation, span(), "enough input"),
            .input = into_maybe_string(),
        }));
    }

    /// The input itself, or LengthShortfall{min = 1} if it is empty.
    template <typename E>
        requires std::constructible_from<E, LengthShortfall>
    [[nodiscard]] expected<Derived, E> to_non_empty() const {
        if (bytes_.empty()) {
            return unexpected(E(LengthShortfall{
                .min = 1,
                .context = Context::from(Operation::into_non_empty, span(), "non-empty input"),
                .input = into_maybe_string(),
            }));
        }
        return self();
    }

    /**
     * @brief Convert the whole input with a foreign parser
     *
     * @p f receives the input and returns expected<T, Ex> where Ex derives
     * from External. The caller is responsible for all input being handled;
     * use Reader::try_external when only part of it may be consumed.
     */
    template <typename E, typename F>
        requires std::constructible_from<E, InvalidValue> && WithContext<E>
    [[nodiscard]] auto into_external(std::string_view expected_desc, F&& f) const
        -> expected<typename std::invoke_result_t<F&, Derived>::value_type, E> {
        auto result = f(self());
        if (!result) {
            return unexpected(
                external_error<E>(result.error(), expected_desc, Operation::into_external));
        }
        return *std::move(result);
    }

    /**
     * @brief Turn a foreign error into an InvalidValue carrying its details
     *
     * The foreign error's contexts are pushed as children of the new error's
     * root frame.
     */
    template <typename E, typename Ex>
        requires std::derived_from<Ex, External> && std::constructible_from<E, InvalidValue> &&
                 WithContext<E>
    [[nodiscard]] E external_error(const Ex& external, std::string_view expected_desc,
                                   Operation operation) const {
        E err(InvalidValue{
            .retry = external.retry_requirement(),
            .context = Context::from(operation, external.span().value_or(span()), expected_desc),
            .input = into_maybe_string(),
        });
        ChildContextSink<E> sink(err);
        external.push_backtrace(sink);
        return err;
    }

protected:
    InputBase(std::span<const uint8_t> bytes, Bound bound) noexcept : bytes_(bytes), bound_(bound) {}

    [[nodiscard]] static Derived make(std::span<const uint8_t> bytes, Bound bound) noexcept {
        return Derived(bytes, bound);
    }

    [[nodiscard]] const Derived& self() const noexcept { return static_cast<const Derived&>(*this); }

    std::span<const uint8_t> bytes_;
    Bound bound_;

private:
    ValueMismatch missing_pattern(const Value& value, Operation operation) const noexcept {
        auto want = value.as_bytes();
        auto found = bytes_.last(0);
        if (!want.empty()) {
            for (size_t k = std::min(want.size() - 1, bytes_.size()); k > 0; --k) {
                auto tail = bytes_.last(k);
                if (std::equal(tail.begin(), tail.end(), want.begin())) {
                    found = tail;
                    break;
                }
            }
        }
        return ValueMismatch{
            .expected = value,
            .context = Context::from(operation, Span::of(found), "pattern match"),
            .input = into_maybe_string(),
        };
    }
};

} // namespace wary::detail
