#pragma once

#include <optional>
#include <ostream>

#include <cstddef>

#include "../maybe_string.hpp"
#include "context.hpp"
#include "retry.hpp"

namespace wary {

/**
 * @brief Not enough input for an operation that needs a length
 *
 * With no max the operation needs at least min bytes and more input may fix
 * it. A max pins the length (an exact requirement such as "no trailing
 * input"), which extra bytes can never satisfy.
 */
struct LengthShortfall {
    size_t min;                  ///< Minimum length required
    std::optional<size_t> max{}; ///< Maximum length allowed, if limited
    Context context;             ///< Failing operation; span is the input available
    MaybeString input;           ///< Input the operation ran over

    [[nodiscard]] Span span() const noexcept { return context.span.value_or(input.span()); }

    /// Number of bytes that were available when the operation failed.
    [[nodiscard]] size_t found() const noexcept { return span().len(); }

    [[nodiscard]] bool is_exact() const noexcept { return max && *max == min; }

    [[nodiscard]] bool is_fatal() const noexcept { return input.is_bound() || max.has_value(); }

    [[nodiscard]] std::optional<RetryRequirement> retry_requirement() const noexcept {
        if (is_fatal()) {
            return std::nullopt;
        }
        return RetryRequirement::from_had_and_needed(found(), min);
    }

    [[nodiscard]] const char* message() const noexcept { return "length shortfall"; }

    void describe(std::ostream& os) const {
        os << "found " << found() << " bytes when ";
        if (is_exact()) {
            os << "exactly " << min;
        } else if (max) {
            os << "between " << min << " and " << *max;
        } else {
            os << "at least " << min;
        }
        os << " bytes was expected";
    }
};

inline std::ostream& operator<<(std::ostream& os, const LengthShortfall& err) {
    os << "error attempting to " << err.context.operation << ": ";
    err.describe(os);
    return os;
}

} // namespace wary
