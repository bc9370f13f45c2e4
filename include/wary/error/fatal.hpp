#pragma once

#include <optional>
#include <ostream>

#include "traits.hpp"

namespace wary {

/**
 * @brief Error that keeps no information at all
 *
 * Suitable when the whole input is always available: every failure is final
 * and nothing about it is reported beyond the fact that it happened.
 */
struct Fatal {
    Fatal() noexcept = default;

    template <ToRetryRequirement E>
        requires(!std::same_as<E, Fatal>)
    Fatal(const E&) noexcept {}

    [[nodiscard]] bool is_fatal() const noexcept { return true; }

    [[nodiscard]] std::optional<RetryRequirement> retry_requirement() const noexcept {
        return std::nullopt;
    }

    void push_context(const Context&) noexcept {}
    void attach_input(const MaybeString&) noexcept {}

    [[nodiscard]] const char* message() const noexcept { return "invalid input"; }

    [[nodiscard]] bool operator==(const Fatal&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const Fatal& err) {
    return os << err.message();
}

/**
 * @brief Error type that can never be constructed
 *
 * Parse functions run with this error type can only use operations that do
 * not fail. read_infallible uses it.
 */
struct Infallible {
    Infallible() = delete;
};

static_assert(ErrorType<Fatal>);

} // namespace wary
