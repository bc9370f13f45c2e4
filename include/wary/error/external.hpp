#pragma once

#include <optional>

#include "context.hpp"
#include "retry.hpp"
#include "traits.hpp"

namespace wary {

/**
 * @brief Receives the contexts an external error contributes
 */
class ContextSink {
public:
    virtual ~ContextSink() = default;

    virtual void push(const Context& context) = 0;
};

/**
 * @brief Adapter for errors raised by code outside wary
 *
 * A foreign parser invoked through Reader::try_external can report failures
 * by deriving its error type from this class. Every member has a default so an
 * adapter only overrides what the foreign error actually knows.
 *
 * @code
 *   struct IntError : wary::External {
 *       wary::Span where;
 *       std::optional<wary::Span> span() const override { return where; }
 *       void push_backtrace(wary::ContextSink& sink) const override {
 *           sink.push(wary::Context{.operation = "parse integer", .expected = "digit"});
 *       }
 *   };
 * @endcode
 */
class External {
public:
    virtual ~External() = default;

    /// Region of the input the failure concerns, if known.
    [[nodiscard]] virtual std::optional<Span> span() const { return std::nullopt; }

    /// Additional bytes needed before retrying, if more input could help.
    [[nodiscard]] virtual std::optional<RetryRequirement> retry_requirement() const {
        return std::nullopt;
    }

    /// Fold the foreign error's own backtrace into ours.
    virtual void push_backtrace(ContextSink&) const {}
};

namespace detail {

// Marks every pushed context as a child of the frame it was raised under.
template <WithContext E>
class ChildContextSink final : public ContextSink {
public:
    explicit ChildContextSink(E& err) noexcept : err_(err) {}

    void push(const Context& context) override { err_.push_context(context.as_child()); }

private:
    E& err_;
};

} // namespace detail

} // namespace wary
