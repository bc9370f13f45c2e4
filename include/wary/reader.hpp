#pragma once

#include <array>
#include <bit>
#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>

#include "detail/endian.hpp"
#include "error/context.hpp"
#include "error/external.hpp"
#include "error/traits.hpp"
#include "expected.hpp"
#include "input.hpp"

namespace wary {

namespace detail {

template <typename T>
struct is_expected : std::false_type {};

template <typename T, typename E>
struct is_expected<expected<T, E>> : std::true_type {};

template <typename R, typename E>
concept ExpectedOf = is_expected<R>::value && std::same_as<typename R::error_type, E>;

} // namespace detail

/**
 * @brief Cursor over untrusted input
 *
 * The reader owns nothing but a view of the input that remains. Every
 * successful operation moves the cursor forward; a failing operation leaves
 * it where it was. Parse functions take the reader by reference and are
 * generic over the error type so the same code runs with Fatal, Invalid or
 * VerboseError:
 *
 * @code
 *   template <typename E>
 *   wary::expected<Message, E> read_message(wary::BytesReader<E>& r) {
 *       return r.context("message", [](auto& r) -> wary::expected<Message, E> {
 *           auto version = r.read_u8();
 *           if (!version) {
 *               return wary::unexpected(std::move(version.error()));
 *           }
 *           ...
 *       });
 *   }
 * @endcode
 *
 * @tparam E Error type raised by failing operations
 * @tparam I Input type: Bytes or String
 */
template <typename E, typename I>
class Reader {
public:
    using Error = E;
    using Input = I;
    using Token = typename I::Token;

    explicit Reader(I input) noexcept : input_(std::move(input)) {}

    [[nodiscard]] bool at_end() const noexcept { return input_.is_empty(); }

    /// Bytes left to read.
    [[nodiscard]] size_t remaining() const noexcept { return input_.byte_len(); }

    /// The remaining input, without consuming it.
    [[nodiscard]] const I& peek_remaining() const noexcept { return input_; }

    I take_remaining() noexcept {
        I rest = input_;
        input_ = input_.end();
        return rest;
    }

    void skip_remaining() noexcept { input_ = input_.end(); }

    // ------------------------------------------------------------------
    // Context
    // ------------------------------------------------------------------

    /**
     * @brief Run @p f and attach @p operation to any error it raises
     *
     * Nested calls accumulate: the innermost context is pushed first.
     */
    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E> && WithContext<E>
    auto context(std::string_view operation, F&& f) {
        return context(Context{.operation = operation}, f);
    }

    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E> && WithContext<E>
    auto context(Context ctx, F&& f) {
        const I checkpoint = input_;
        if (!ctx.span) {
            ctx.span = checkpoint.span();
        }
        auto result = f(*this);
        if (!result) {
            add_context(result.error(), checkpoint.into_maybe_string(), ctx);
        }
        return result;
    }

    /// As context() for functions that only look at the reader.
    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, const Reader&>, E> &&
                 WithContext<E>
    auto peek_context(std::string_view operation, F&& f) const {
        auto result = f(*this);
        if (!result) {
            add_context(result.error(), input_.into_maybe_string(),
                        Context{.operation = operation, .span = input_.span()});
        }
        return result;
    }

    // ------------------------------------------------------------------
    // Length based
    // ------------------------------------------------------------------

    /**
     * @brief Read exactly @p len tokens
     * @return LengthShortfall if fewer remain; the cursor does not move
     */
    [[nodiscard]] expected<I, E> take(size_t len) {
        return try_advance(input_.template split_at<E>(len, Operation::take));
    }

    [[nodiscard]] std::optional<I> take_opt(size_t len) noexcept {
        auto parts = input_.split_at_opt(len);
        if (!parts) {
            return std::nullopt;
        }
        input_ = parts->second;
        return parts->first;
    }

    [[nodiscard]] expected<void, E> skip(size_t len) {
        return discard(input_.template split_at<E>(len, Operation::skip));
    }

    /// Look at the next @p len tokens without consuming them.
    [[nodiscard]] expected<I, E> peek(size_t len) const {
        auto parts = input_.template split_at<E>(len, Operation::peek);
        if (!parts) {
            return unexpected(std::move(parts.error()));
        }
        return parts->first;
    }

    [[nodiscard]] std::optional<I> peek_opt(size_t len) const noexcept {
        auto parts = input_.split_at_opt(len);
        if (!parts) {
            return std::nullopt;
        }
        return parts->first;
    }

    /// Check whether the input starts with @p prefix without consuming it.
    template <typename P>
        requires Prefix<P, Token>
    [[nodiscard]] bool peek_eq(const P& prefix) const noexcept {
        return input_.has_prefix(prefix);
    }

    // ------------------------------------------------------------------
    // Pattern based
    // ------------------------------------------------------------------

    /// Read the longest prefix accepted by @p pattern; never fails.
    template <typename P>
        requires Pattern<P, Token>
    I take_while(const P& pattern) {
        auto [head, tail] = input_.split_while(pattern);
        input_ = tail;
        return head;
    }

    template <typename P>
        requires Pattern<P, Token>
    void skip_while(const P& pattern) {
        input_ = input_.split_while(pattern).second;
    }

    /**
     * @brief Read while a fallible predicate accepts
     *
     * @p pred returns expected<bool, E>; the first error it raises is
     * returned with a "try take while" context and the cursor does not move.
     */
    template <typename F>
        requires detail::FallibleTokenPredicate<F, Token, E> && WithContext<E>
    [[nodiscard]] expected<I, E> try_take_while(F&& pred) {
        return try_advance(with_operation(input_.template try_split_while<E>(pred),
                                          Operation::try_take_while));
    }

    template <typename F>
        requires detail::FallibleTokenPredicate<F, Token, E> && WithContext<E>
    [[nodiscard]] expected<void, E> try_skip_while(F&& pred) {
        return discard(with_operation(input_.template try_split_while<E>(pred),
                                      Operation::try_skip_while));
    }

    /// Read up to (not including) the first match of @p pattern.
    template <typename P>
        requires ValuePattern<P, Token>
    [[nodiscard]] expected<I, E> take_until(const P& pattern) {
        return try_advance(input_.template split_until<E>(pattern, Operation::take_until));
    }

    template <typename P>
        requires Pattern<P, Token>
    [[nodiscard]] std::optional<I> take_until_opt(const P& pattern) {
        return advance_opt(input_.split_until_opt(pattern));
    }

    /// Read up to the first match of @p pattern and skip the match.
    template <typename P>
        requires ValuePattern<P, Token>
    [[nodiscard]] expected<I, E> take_until_consume(const P& pattern) {
        return try_advance(
            input_.template split_until_consume<E>(pattern, Operation::take_until_consume));
    }

    template <typename P>
        requires Pattern<P, Token>
    [[nodiscard]] std::optional<I> take_until_consume_opt(const P& pattern) {
        return advance_opt(input_.split_until_consume_opt(pattern));
    }

    template <typename P>
        requires ValuePattern<P, Token>
    [[nodiscard]] expected<void, E> skip_until(const P& pattern) {
        return discard(input_.template split_until<E>(pattern, Operation::skip_until));
    }

    template <typename P>
        requires ValuePattern<P, Token>
    [[nodiscard]] expected<void, E> skip_until_consume(const P& pattern) {
        return discard(
            input_.template split_until_consume<E>(pattern, Operation::skip_until_consume));
    }

    // ------------------------------------------------------------------
    // Exact values
    // ------------------------------------------------------------------

    /**
     * @brief Consume @p prefix, which must come next
     *
     * Fails with ValueMismatch and leaves the cursor in place otherwise.
     */
    template <typename P>
        requires Prefix<P, Token>
    [[nodiscard]] expected<void, E> consume(const P& prefix) {
        return discard(input_.template split_prefix<E>(prefix, Operation::consume));
    }

    /// Consume @p prefix if it comes next.
    template <typename P>
        requires Prefix<P, Token>
    bool consume_opt(const P& prefix) noexcept {
        auto parts = input_.split_prefix_opt(prefix);
        if (!parts) {
            return false;
        }
        input_ = parts->second;
        return true;
    }

    // ------------------------------------------------------------------
    // Sub-parses
    // ------------------------------------------------------------------

    /**
     * @brief Run @p f and also return the input it consumed
     *
     * Returns the consumed input, paired with f's result when it has one.
     * If f stopped inside a scan that ran off the end of an open input, the
     * consumed input's end is left open as well.
     */
    template <typename F>
        requires std::invocable<F&, Reader&>
    auto take_consumed(F&& f) {
        const I start = input_;
        if constexpr (std::is_void_v<std::invoke_result_t<F&, Reader&>>) {
            f(*this);
            return consumed_since(start);
        } else {
            auto value = f(*this);
            return std::pair{std::move(value), consumed_since(start)};
        }
    }

    /// As take_consumed() for fallible @p f; the cursor is restored on failure.
    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E> && WithContext<E>
    auto try_take_consumed(F&& f) {
        using Value = typename std::invoke_result_t<F&, Reader&>::value_type;
        using Result = std::conditional_t<std::is_void_v<Value>, expected<I, E>,
                                          expected<std::pair<Value, I>, E>>;
        const I start = input_;
        auto value =
            context(Context::from(Operation::try_take_consumed, start.span()), std::forward<F>(f));
        if (!value) {
            input_ = start;
            return Result(unexpect, std::move(value.error()));
        }
        if constexpr (std::is_void_v<Value>) {
            return Result(consumed_since(start));
        } else {
            return Result(std::pair<Value, I>{std::move(*value), consumed_since(start)});
        }
    }

    /**
     * @brief Run a check that consumes input
     * @return InvalidValue naming @p expected_desc if @p f returns false
     */
    template <typename F>
        requires std::predicate<F&, Reader&> && std::constructible_from<E, InvalidValue>
    [[nodiscard]] expected<void, E> verify(std::string_view expected_desc, F&& f) {
        Reader sub(input_);
        if (!f(sub)) {
            return unexpected(E(invalid_over(sub, expected_desc, Operation::verify)));
        }
        input_ = sub.input_;
        return {};
    }

    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E> &&
                 std::constructible_from<E, InvalidValue> && WithContext<E>
    [[nodiscard]] expected<void, E> try_verify(std::string_view expected_desc, F&& f) {
        Reader sub(input_);
        expected<bool, E> ok = f(sub);
        if (!ok) {
            add_context(ok.error(), input_.into_maybe_string(),
                        Context::from(Operation::try_verify, input_.span(), expected_desc));
            return unexpected(std::move(ok.error()));
        }
        if (!*ok) {
            return unexpected(E(invalid_over(sub, expected_desc, Operation::try_verify)));
        }
        input_ = sub.input_;
        return {};
    }

    /**
     * @brief Read a value that @p f may decline to produce
     *
     * @p f returns std::optional<T>; nullopt is reported as InvalidValue over
     * the input f consumed before giving up.
     */
    template <typename F>
        requires std::constructible_from<E, InvalidValue>
    [[nodiscard]] auto expect(std::string_view expected_desc, F&& f)
        -> expected<typename std::invoke_result_t<F&, Reader&>::value_type, E> {
        Reader sub(input_);
        auto value = f(sub);
        if (!value) {
            return unexpected(E(invalid_over(sub, expected_desc, Operation::expect)));
        }
        input_ = sub.input_;
        return *std::move(value);
    }

    /// As expect() for @p f returning expected<std::optional<T>, E>.
    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E> &&
                 std::constructible_from<E, InvalidValue> && WithContext<E>
    [[nodiscard]] auto try_expect(std::string_view expected_desc, F&& f)
        -> expected<typename std::invoke_result_t<F&, Reader&>::value_type::value_type, E> {
        Reader sub(input_);
        auto value = f(sub);
        if (!value) {
            add_context(value.error(), input_.into_maybe_string(),
                        Context::from(Operation::try_expect, input_.span(), expected_desc));
            return unexpected(std::move(value.error()));
        }
        if (!*value) {
            return unexpected(E(invalid_over(sub, expected_desc, Operation::try_expect)));
        }
        input_ = sub.input_;
        return std::move(**value);
    }

    /**
     * @brief Read with @p f, keeping only the retry requirement of its error
     *
     * Useful for values parsed with a cheaper error type such as Invalid;
     * the failure is reported as InvalidValue naming @p expected_desc.
     */
    template <typename F>
        requires std::constructible_from<E, InvalidValue> &&
                 ToRetryRequirement<typename std::invoke_result_t<F&, Reader&>::error_type>
    [[nodiscard]] auto try_expect_erased(std::string_view expected_desc, F&& f)
        -> expected<typename std::invoke_result_t<F&, Reader&>::value_type, E> {
        Reader sub(input_);
        auto value = f(sub);
        if (!value) {
            InvalidValue err = invalid_over(sub, expected_desc, Operation::try_expect_erased);
            err.retry = value.error().retry_requirement();
            return unexpected(E(std::move(err)));
        }
        input_ = sub.input_;
        return *std::move(value);
    }

    /**
     * @brief Read with a foreign parser
     *
     * @p f receives the remaining input and returns
     * expected<std::pair<size_t, T>, Ex>: the number of bytes it read and the
     * value. Ex must derive from External. The byte count is checked before
     * the cursor moves.
     */
    template <typename F>
        requires std::constructible_from<E, InvalidValue> &&
                 std::constructible_from<E, LengthShortfall> && WithContext<E>
    [[nodiscard]] auto try_external(std::string_view expected_desc, F&& f)
        -> expected<typename std::invoke_result_t<F&, I>::value_type::second_type, E> {
        auto result = f(input_);
        if (!result) {
            return unexpected(
                input_.template external_error<E>(result.error(), expected_desc, Operation::external));
        }
        auto parts = input_.template split_at_byte<E>(result->first, Operation::external);
        if (!parts) {
            return unexpected(std::move(parts.error()));
        }
        input_ = parts->second;
        return std::move(result->second);
    }

    // ------------------------------------------------------------------
    // Recovery
    // ------------------------------------------------------------------

    /**
     * @brief Run @p f, rewinding and returning nullopt if it fails
     */
    template <typename F>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E>
    auto recover(F&& f) {
        using Value = typename std::invoke_result_t<F&, Reader&>::value_type;
        using Result = std::conditional_t<std::is_void_v<Value>, bool, std::optional<Value>>;
        const I checkpoint = input_;
        auto value = f(*this);
        if (!value) {
            input_ = checkpoint;
            return Result{};
        }
        if constexpr (std::is_void_v<Value>) {
            return true;
        } else {
            return Result(std::move(*value));
        }
    }

    /**
     * @brief Run @p f, rewinding on failures @p pred accepts
     *
     * A recovered failure returns nullopt, or false when @p f returns
     * expected<void, E>. Any other failure is returned with a "recover if"
     * context over the input at the checkpoint.
     */
    template <typename F, typename R>
        requires detail::ExpectedOf<std::invoke_result_t<F&, Reader&>, E> &&
                 std::predicate<R&, const E&> && WithContext<E>
    [[nodiscard]] auto recover_if(F&& f, R&& pred) {
        using Value = typename std::invoke_result_t<F&, Reader&>::value_type;
        using Result = std::conditional_t<std::is_void_v<Value>, bool, std::optional<Value>>;
        const I checkpoint = input_;
        auto value = f(*this);
        if (value) {
            if constexpr (std::is_void_v<Value>) {
                return expected<Result, E>(true);
            } else {
                return expected<Result, E>(Result(std::move(*value)));
            }
        }
        if (pred(value.error())) {
            input_ = checkpoint;
            return expected<Result, E>(Result{});
        }
        add_context(value.error(), checkpoint.into_maybe_string(),
                    Context::from(Operation::recover_if, checkpoint.span()));
        return expected<Result, E>(unexpected(std::move(value.error())));
    }

    /**
     * @brief Run @p f on a reader with a different error type
     *
     * Lets a caller try alternatives with a cheap error type and convert only
     * the chosen result. The cursor moves as far as the sub-reader did.
     */
    template <typename S, typename F>
        requires std::invocable<F&, Reader<S, I>&>
    auto error(F&& f) {
        Reader<S, I> sub(input_);
        if constexpr (std::is_void_v<std::invoke_result_t<F&, Reader<S, I>&>>) {
            f(sub);
            input_ = sub.peek_remaining();
        } else {
            auto value = f(sub);
            input_ = sub.peek_remaining();
            return value;
        }
    }

    // ------------------------------------------------------------------
    // Bytes
    // ------------------------------------------------------------------

    [[nodiscard]] expected<uint8_t, E> read_u8()
        requires std::same_as<I, Bytes>
    {
        return try_advance(input_.template split_token<E>(Operation::read_u8));
    }

    [[nodiscard]] expected<uint8_t, E> peek_u8() const
        requires std::same_as<I, Bytes>
    {
        auto parts = input_.template split_token<E>(Operation::peek_u8);
        if (!parts) {
            return unexpected(std::move(parts.error()));
        }
        return parts->first;
    }

    [[nodiscard]] std::optional<uint8_t> peek_u8_opt() const noexcept
        requires std::same_as<I, Bytes>
    {
        auto parts = input_.split_token_opt();
        if (!parts) {
            return std::nullopt;
        }
        return parts->first;
    }

    template <size_t N>
    [[nodiscard]] expected<std::array<uint8_t, N>, E> take_array()
        requires std::same_as<I, Bytes>
    {
        return try_advance(input_.template split_array<N, E>(Operation::take_array));
    }

    /**
     * @brief Read a fixed width number in the given byte order
     */
    template <detail::FixedWidthNumber T, std::endian Order>
    [[nodiscard]] expected<T, E> read()
        requires std::same_as<I, Bytes>
    {
        auto bytes = try_advance(input_.template split_array<sizeof(T), E>(Operation::read_number));
        if (!bytes) {
            return unexpected(std::move(bytes.error()));
        }
        return detail::from_bytes<T, Order>(*bytes);
    }

    // clang-format off
    [[nodiscard]] expected<int8_t, E> read_i8() requires std::same_as<I, Bytes> { return read<int8_t, std::endian::little>(); }
    [[nodiscard]] expected<uint16_t, E> read_u16_le() requires std::same_as<I, Bytes> { return read<uint16_t, std::endian::little>(); }
    [[nodiscard]] expected<uint16_t, E> read_u16_be() requires std::same_as<I, Bytes> { return read<uint16_t, std::endian::big>(); }
    [[nodiscard]] expected<int16_t, E> read_i16_le() requires std::same_as<I, Bytes> { return read<int16_t, std::endian::little>(); }
    [[nodiscard]] expected<int16_t, E> read_i16_be() requires std::same_as<I, Bytes> { return read<int16_t, std::endian::big>(); }
    [[nodiscard]] expected<uint32_t, E> read_u32_le() requires std::same_as<I, Bytes> { return read<uint32_t, std::endian::little>(); }
    [[nodiscard]] expected<uint32_t, E> read_u32_be() requires std::same_as<I, Bytes> { return read<uint32_t, std::endian::big>(); }
    [[nodiscard]] expected<int32_t, E> read_i32_le() requires std::same_as<I, Bytes> { return read<int32_t, std::endian::little>(); }
    [[nodiscard]] expected<int32_t, E> read_i32_be() requires std::same_as<I, Bytes> { return read<int32_t, std::endian::big>(); }
    [[nodiscard]] expected<uint64_t, E> read_u64_le() requires std::same_as<I, Bytes> { return read<uint64_t, std::endian::little>(); }
    [[nodiscard]] expected<uint64_t, E> read_u64_be() requires std::same_as<I, Bytes> { return read<uint64_t, std::endian::big>(); }
    [[nodiscard]] expected<int64_t, E> read_i64_le() requires std::same_as<I, Bytes> { return read<int64_t, std::endian::little>(); }
    [[nodiscard]] expected<int64_t, E> read_i64_be() requires std::same_as<I, Bytes> { return read<int64_t, std::endian::big>(); }
    [[nodiscard]] expected<float, E> read_f32_le() requires std::same_as<I, Bytes> { return read<float, std::endian::little>(); }
    [[nodiscard]] expected<float, E> read_f32_be() requires std::same_as<I, Bytes> { return read<float, std::endian::big>(); }
    [[nodiscard]] expected<double, E> read_f64_le() requires std::same_as<I, Bytes> { return read<double, std::endian::little>(); }
    [[nodiscard]] expected<double, E> read_f64_be() requires std::same_as<I, Bytes> { return read<double, std::endian::big>(); }
    // clang-format on

    /// Read everything that remains as UTF-8 text.
    [[nodiscard]] expected<String, E> take_remaining_str()
        requires std::same_as<I, Bytes>
    {
        auto text = input_.template to_string<E>();
        if (!text) {
            return unexpected(std::move(text.error()));
        }
        input_ = input_.end();
        return *std::move(text);
    }

    /// Read the longest UTF-8 prefix whose chars @p pred accepts.
    template <typename F>
        requires std::predicate<F&, char32_t>
    [[nodiscard]] expected<String, E> take_str_while(F&& pred)
        requires std::same_as<I, Bytes>
    {
        return try_advance(input_.template split_str_while<E>(pred, Operation::take_str_while));
    }

    template <typename F>
        requires detail::FallibleTokenPredicate<F, char32_t, E>
    [[nodiscard]] expected<String, E> try_take_str_while(F&& pred)
        requires std::same_as<I, Bytes>
    {
        return try_advance(
            input_.template try_split_str_while<E>(pred, Operation::try_take_str_while));
    }

    template <typename F>
        requires std::predicate<F&, char32_t>
    [[nodiscard]] expected<void, E> skip_str_while(F&& pred)
        requires std::same_as<I, Bytes>
    {
        return discard(input_.template split_str_while<E>(pred, Operation::skip_str_while));
    }

    // ------------------------------------------------------------------
    // Text
    // ------------------------------------------------------------------

    [[nodiscard]] expected<char32_t, E> read_char()
        requires std::same_as<I, String>
    {
        return try_advance(input_.template split_token<E>(Operation::read_char));
    }

    [[nodiscard]] expected<char32_t, E> peek_char() const
        requires std::same_as<I, String>
    {
        auto parts = input_.template split_token<E>(Operation::peek_char);
        if (!parts) {
            return unexpected(std::move(parts.error()));
        }
        return parts->first;
    }

    [[nodiscard]] std::optional<char32_t> peek_char_opt() const noexcept
        requires std::same_as<I, String>
    {
        auto parts = input_.split_token_opt();
        if (!parts) {
            return std::nullopt;
        }
        return parts->first;
    }

private:
    template <typename O, typename In>
    expected<O, E> try_advance(expected<std::pair<O, In>, E> split) {
        if (!split) {
            return unexpected(std::move(split.error()));
        }
        input_ = std::move(split->second);
        return std::move(split->first);
    }

    template <typename O, typename In>
    expected<void, E> discard(expected<std::pair<O, In>, E> split) {
        if (!split) {
            return unexpected(std::move(split.error()));
        }
        input_ = std::move(split->second);
        return {};
    }

    template <typename O, typename In>
    std::optional<O> advance_opt(std::optional<std::pair<O, In>> split) noexcept {
        if (!split) {
            return std::nullopt;
        }
        input_ = std::move(split->second);
        return std::move(split->first);
    }

    template <typename T>
    T with_operation(T result, Operation operation) const {
        if (!result) {
            add_context(result.error(), input_.into_maybe_string(),
                        Context::from(operation, input_.span()));
        }
        return result;
    }

    // Input consumed from start up to the current cursor.
    [[nodiscard]] I consumed_since(const I& start) const noexcept {
        size_t mid = start.byte_len() - input_.byte_len();
        I head = start.split_at_byte_unchecked(mid).first;
        if (input_.bound() == Bound::none) {
            return head.into_unbound_end();
        }
        return head;
    }

    // InvalidValue over what the sub-reader consumed before failing.
    [[nodiscard]] InvalidValue invalid_over(const Reader& sub, std::string_view expected_desc,
                                            Operation operation) const noexcept {
        size_t consumed = input_.byte_len() - sub.remaining();
        return InvalidValue{
            .context = Context::from(operation, Span::of(input_.as_bytes().first(consumed)),
                                     expected_desc),
            .input = input_.into_maybe_string(),
        };
    }

    I input_;
};

template <typename E>
using BytesReader = Reader<E, Bytes>;

template <typename E>
using StringReader = Reader<E, String>;

} // namespace wary
