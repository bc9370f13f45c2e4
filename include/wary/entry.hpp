#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

#include "error/fatal.hpp"
#include "error/traits.hpp"
#include "expected.hpp"
#include "input.hpp"
#include "reader.hpp"

namespace wary {

/**
 * @brief Parse the whole of @p input with @p f
 *
 * Runs f on a fresh reader under a "read all" context. Input left over after
 * f succeeds is reported as a LengthShortfall requiring exactly zero more
 * bytes, which no retry can satisfy.
 *
 * Usage:
 * @code
 *   auto result = wary::read_all<wary::VerboseError<>>(
 *       wary::input(buffer), [](auto& r) { return r.consume("hello"); });
 *   if (!result) {
 *       std::cerr << result.error() << "\n";
 *   }
 * @endcode
 *
 * @tparam E Error type
 * @param input Input to parse
 * @param f Parse function taking Reader<E, I>& and returning expected<T, E>
 */
template <typename E, typename I, typename F>
    requires detail::ExpectedOf<std::invoke_result_t<F&, Reader<E, I>&>, E> &&
             std::constructible_from<E, LengthShortfall> && WithContext<E>
[[nodiscard]] auto read_all(const I& input, F&& f) {
    Reader<E, I> r(input);
    auto result = r.context(Context::from(Operation::read_all, input.span()), f);
    if (result && !r.at_end()) {
        I rest = r.take_remaining();
        return decltype(result)(unexpect, E(LengthShortfall{
                                              .min = 0,
                                              .max = 0,
                                              .context = Context::from(Operation::read_all,
                                                                       rest.span(),
                                                                       "no trailing input"),
                                              .input = input.into_maybe_string(),
                                          }));
    }
    return result;
}

/**
 * @brief Parse a prefix of @p input with @p f
 *
 * @return The value f produced and the input it left unread (just the input
 *         when f returns expected<void, E>)
 */
template <typename E, typename I, typename F>
    requires detail::ExpectedOf<std::invoke_result_t<F&, Reader<E, I>&>, E> && WithContext<E>
[[nodiscard]] auto read_partial(const I& input, F&& f) {
    using Value = typename std::invoke_result_t<F&, Reader<E, I>&>::value_type;
    using Result = std::conditional_t<std::is_void_v<Value>, expected<I, E>,
                                      expected<std::pair<Value, I>, E>>;
    Reader<E, I> r(input);
    auto result = r.context(Context::from(Operation::read_partial, input.span()), f);
    if (!result) {
        return Result(unexpect, std::move(result.error()));
    }
    if constexpr (std::is_void_v<Value>) {
        return Result(r.take_remaining());
    } else {
        return Result(std::pair<Value, I>{std::move(*result), r.take_remaining()});
    }
}

/**
 * @brief Parse a prefix of @p input with a function that cannot fail
 *
 * @p f takes Reader<Infallible, I>& so only operations that never fail are
 * available to it.
 *
 * @return The value f produced and the input it left unread
 */
template <typename I, typename F>
    requires std::invocable<F&, Reader<Infallible, I>&>
[[nodiscard]] auto read_infallible(const I& input, F&& f) {
    Reader<Infallible, I> r(input);
    if constexpr (std::is_void_v<std::invoke_result_t<F&, Reader<Infallible, I>&>>) {
        f(r);
        return r.take_remaining();
    } else {
        auto value = f(r);
        return std::pair{std::move(value), r.take_remaining()};
    }
}

} // namespace wary
