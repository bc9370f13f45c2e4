#pragma once

#include <algorithm>
#include <optional>
#include <ostream>
#include <span>

#include "../maybe_string.hpp"
#include "context.hpp"
#include "retry.hpp"
#include "value.hpp"

namespace wary {

/**
 * @brief An exact value was expected but something else was found
 *
 * context.span is the region compared against the expected value (at most
 * the expected length). If that region is a strict prefix of the expected
 * value the input simply ended too early, and unless the input is fully
 * bounded the remaining expected length is the retry requirement.
 */
struct ValueMismatch {
    Value expected;    ///< The exact value that was expected
    Context context;   ///< Failing operation; span is the value found
    MaybeString input; ///< Input the comparison ran over

    [[nodiscard]] Span span() const noexcept { return context.span.value_or(input.span()); }

    [[nodiscard]] std::span<const uint8_t> found() const noexcept {
        Span s = span();
        return {s.start(), s.len()};
    }

    [[nodiscard]] bool is_fatal() const noexcept {
        if (input.is_bound()) {
            return true;
        }
        auto want = expected.as_bytes();
        auto got = found();
        return got.size() >= want.size() || !std::equal(got.begin(), got.end(), want.begin());
    }

    [[nodiscard]] std::optional<RetryRequirement> retry_requirement() const noexcept {
        if (is_fatal()) {
            return std::nullopt;
        }
        return RetryRequirement::from_had_and_needed(found().size(), expected.len());
    }

    [[nodiscard]] const char* message() const noexcept { return "value mismatch"; }

    void describe(std::ostream& os) const {
        if (is_fatal()) {
            os << "found a different value to the exact expected";
        } else {
            os << "not enough input to match expected value";
        }
    }
};

inline std::ostream& operator<<(std::ostream& os, const ValueMismatch& err) {
    os << "error attempting to " << err.context.operation << ": ";
    err.describe(os);
    return os;
}

} // namespace wary
