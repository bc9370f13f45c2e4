#pragma once

#include <optional>
#include <ostream>

#include "../maybe_string.hpp"
#include "context.hpp"
#include "retry.hpp"

namespace wary {

/**
 * @brief Input was present but not valid for what was expected
 *
 * The producer decides retryability: it supplies a retry requirement only if
 * more input could make the value valid. Invalid UTF-8 never supplies one.
 */
struct InvalidValue {
    std::optional<RetryRequirement> retry{}; ///< Set by the producer if more input may help
    Context context;                         ///< Failing operation; expected is the description
    MaybeString input;                       ///< Input the operation ran over

    [[nodiscard]] Span span() const noexcept { return context.span.value_or(input.span()); }

    [[nodiscard]] bool is_fatal() const noexcept { return input.is_bound() || !retry.has_value(); }

    [[nodiscard]] std::optional<RetryRequirement> retry_requirement() const noexcept {
        if (is_fatal()) {
            return std::nullopt;
        }
        return retry;
    }

    [[nodiscard]] const char* message() const noexcept { return "invalid value"; }

    void describe(std::ostream& os) const {
        os << "expected " << (context.has_expected() ? context.expected : "valid input");
    }
};

inline std::ostream& operator<<(std::ostream& os, const InvalidValue& err) {
    os << "error attempting to " << err.context.operation << ": ";
    err.describe(os);
    return os;
}

} // namespace wary
