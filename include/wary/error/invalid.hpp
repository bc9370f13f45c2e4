#pragma once

#include <optional>
#include <ostream>

#include "retry.hpp"
#include "traits.hpp"

namespace wary {

/**
 * @brief Minimal error keeping only the retry requirement
 *
 * The fast error form for streaming protocols: it drops spans, contexts and
 * descriptions but still tells the caller whether to wait for more input.
 */
class Invalid {
public:
    /// An error no amount of additional input will fix.
    [[nodiscard]] static Invalid fatal() noexcept { return Invalid(std::nullopt); }

    /// An error that may be fixed after @p count more bytes (fatal if zero).
    [[nodiscard]] static Invalid retry_after(size_t count) noexcept {
        return Invalid(RetryRequirement::create(count));
    }

    explicit Invalid(std::optional<RetryRequirement> retry) noexcept : retry_(retry) {}

    Invalid(const ValueMismatch& err) noexcept : retry_(err.retry_requirement()) {}
    Invalid(const LengthShortfall& err) noexcept : retry_(err.retry_requirement()) {}
    Invalid(const InvalidValue& err) noexcept : retry_(err.retry_requirement()) {}

    /// Derive from any richer error that knows its retry requirement.
    template <ToRetryRequirement E>
        requires(!std::same_as<E, Invalid>)
    explicit Invalid(const E& err) noexcept : retry_(err.retry_requirement()) {}

    [[nodiscard]] bool is_fatal() const noexcept { return !retry_.has_value(); }

    [[nodiscard]] std::optional<RetryRequirement> retry_requirement() const noexcept {
        return retry_;
    }

    void push_context(const Context&) noexcept {}
    void attach_input(const MaybeString&) noexcept {}

    [[nodiscard]] const char* message() const noexcept { return "invalid input"; }

    [[nodiscard]] bool operator==(const Invalid&) const noexcept = default;

private:
    std::optional<RetryRequirement> retry_;
};

inline std::ostream& operator<<(std::ostream& os, const Invalid& err) {
    os << err.message();
    if (auto retry = err.retry_requirement()) {
        os << ": needs " << retry->continue_after() << " byte"
           << (retry->continue_after() == 1 ? "" : "s") << " more to continue processing";
    }
    return os;
}

static_assert(ErrorType<Invalid>);

} // namespace wary
