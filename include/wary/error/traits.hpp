#pragma once

#include <concepts>
#include <optional>

#include "../maybe_string.hpp"
#include "context.hpp"
#include "invalid_value.hpp"
#include "length_shortfall.hpp"
#include "retry.hpp"
#include "value_mismatch.hpp"

namespace wary {

/**
 * @brief Errors that can be enriched while they propagate
 *
 * push_context records an enclosing scope. attach_input offers the wider
 * input of that scope; implementations keep it only if it still contains the
 * error's span. Both may be no-ops for errors that keep no details.
 */
template <typename E>
concept WithContext = requires(E& err, const MaybeString& input, const Context& context) {
    { err.push_context(context) } -> std::same_as<void>;
    { err.attach_input(input) } -> std::same_as<void>;
};

/**
 * @brief Errors usable by generic parse functions
 *
 * The same parse function runs under Fatal, Invalid or VerboseError because
 * all of them are built from the three primitive error kinds.
 */
template <typename E>
concept ErrorType = WithContext<E> && std::move_constructible<E> &&
                    std::constructible_from<E, ValueMismatch> &&
                    std::constructible_from<E, LengthShortfall> &&
                    std::constructible_from<E, InvalidValue>;

/**
 * @brief Errors that can say how much more input is needed
 */
template <typename E>
concept ToRetryRequirement = requires(const E& err) {
    { err.retry_requirement() } -> std::same_as<std::optional<RetryRequirement>>;
    { err.is_fatal() } -> std::same_as<bool>;
};

/**
 * @brief Offer @p input and push @p context onto @p err
 */
template <WithContext E>
inline void add_context(E& err, const MaybeString& input, const Context& context) {
    err.attach_input(input);
    err.push_context(context);
}

} // namespace wary
