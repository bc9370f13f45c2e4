#pragma once

#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

#include "backtrace.hpp"
#include "details.hpp"
#include "traits.hpp"

namespace wary {

/**
 * @brief Catch-all error keeping every detail of a failure
 *
 * Wraps one of the three primitive error kinds together with the widest input
 * known to contain it and a backtrace of the scopes it propagated through.
 * The backtrace strategy is chosen at compile time:
 *
 * @code
 *   using Quick = wary::VerboseError<wary::RootBacktrace>; // root frame only
 *   using Full = wary::VerboseError<>;                     // every frame
 * @endcode
 *
 * @tparam Trace Backtrace strategy
 */
template <Backtrace Trace = FullBacktrace>
class VerboseError final : public Details {
public:
    using Kind = std::variant<ValueMismatch, LengthShortfall, InvalidValue>;

    VerboseError(ValueMismatch err) : VerboseError(Kind(std::move(err))) {}
    VerboseError(LengthShortfall err) : VerboseError(Kind(std::move(err))) {}
    VerboseError(InvalidValue err) : VerboseError(Kind(std::move(err))) {}

    [[nodiscard]] const Kind& kind() const noexcept { return kind_; }

    [[nodiscard]] const Trace& backtrace() const noexcept { return trace_; }

    void push_context(const Context& context) { trace_.push(context); }

    void attach_input(const MaybeString& input) noexcept {
        if (input_.span().is_within(input.span())) {
            input_ = input;
        }
    }

    [[nodiscard]] bool is_fatal() const noexcept {
        return std::visit([](const auto& err) { return err.is_fatal(); }, kind_);
    }

    [[nodiscard]] std::optional<RetryRequirement> retry_requirement() const noexcept {
        return std::visit([](const auto& err) { return err.retry_requirement(); }, kind_);
    }

    [[nodiscard]] const char* message() const noexcept {
        return std::visit([](const auto& err) { return err.message(); }, kind_);
    }

    [[nodiscard]] MaybeString input() const override { return input_; }

    [[nodiscard]] Span span() const override {
        return std::visit([](const auto& err) { return err.span(); }, kind_);
    }

    [[nodiscard]] std::optional<Value> expected() const override {
        if (auto* mismatch = std::get_if<ValueMismatch>(&kind_)) {
            return mismatch->expected;
        }
        return std::nullopt;
    }

    void description(std::ostream& os) const override {
        std::visit([&os](const auto& err) { err.describe(os); }, kind_);
    }

    [[nodiscard]] const Context& root_context() const override { return trace_.root(); }

    [[nodiscard]] size_t backtrace_count() const override { return trace_.count(); }

    bool walk_backtrace(const Walker& walker) const override { return trace_.walk(walker); }

private:
    explicit VerboseError(Kind kind)
        : input_(std::visit([](const auto& err) { return err.input; }, kind)),
          trace_(Trace::from_root(std::visit([](const auto& err) { return err.context; }, kind))),
          kind_(std::move(kind)) {}

    MaybeString input_;
    Trace trace_;
    Kind kind_;
};

/**
 * @brief Check if the error is a value mismatch
 */
template <typename Trace>
[[nodiscard]] inline bool is_value_mismatch(const VerboseError<Trace>& e) noexcept {
    return std::holds_alternative<ValueMismatch>(e.kind());
}

/**
 * @brief Check if the error is a length shortfall
 */
template <typename Trace>
[[nodiscard]] inline bool is_length_shortfall(const VerboseError<Trace>& e) noexcept {
    return std::holds_alternative<LengthShortfall>(e.kind());
}

/**
 * @brief Check if the error is an invalid value
 */
template <typename Trace>
[[nodiscard]] inline bool is_invalid_value(const VerboseError<Trace>& e) noexcept {
    return std::holds_alternative<InvalidValue>(e.kind());
}

template <typename Trace>
inline std::ostream& operator<<(std::ostream& os, const VerboseError<Trace>& err) {
    os << "error attempting to " << err.root_context().operation << ": ";
    err.description(os);
    return os;
}

static_assert(ErrorType<VerboseError<RootBacktrace>>);
static_assert(ErrorType<VerboseError<FullBacktrace>>);

} // namespace wary
