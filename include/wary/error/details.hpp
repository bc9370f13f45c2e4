#pragma once

#include <functional>
#include <optional>
#include <ostream>

#include <cstddef>

#include "../maybe_string.hpp"
#include "../span.hpp"
#include "context.hpp"
#include "value.hpp"

namespace wary {

/**
 * @brief What a diagnostic renderer needs from an error
 *
 * VerboseError implements this. A custom error type that wants the same
 * rendering implements it too; nothing checks that span() really lies in
 * input(), the renderer reports it when it does not.
 */
class Details {
public:
    using Walker = std::function<bool(size_t, const Context&)>;

    virtual ~Details() = default;

    /// The widest input known to contain the error.
    [[nodiscard]] virtual MaybeString input() const = 0;

    /// The exact region the error concerns.
    [[nodiscard]] virtual Span span() const = 0;

    /// The exact value expected, if the error is a value mismatch.
    [[nodiscard]] virtual std::optional<Value> expected() const = 0;

    virtual void description(std::ostream& os) const = 0;

    /// Context of the failing primitive.
    [[nodiscard]] virtual const Context& root_context() const = 0;

    [[nodiscard]] virtual size_t backtrace_count() const = 0;

    /// Visit the backtrace from outermost to root; returns false if stopped.
    virtual bool walk_backtrace(const Walker& walker) const = 0;

protected:
    Details() = default;
    Details(const Details&) = default;
    Details(Details&&) = default;
    Details& operator=(const Details&) = default;
    Details& operator=(Details&&) = default;
};

} // namespace wary
