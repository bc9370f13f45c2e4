#pragma once

#include <optional>
#include <ostream>
#include <string_view>

#include <cstdint>

#include "../span.hpp"

namespace wary {

/**
 * @brief Operations performed by wary itself
 *
 * Failing primitives record one of these in the root context of the error
 * they raise. User code names its own operations with plain strings.
 */
enum class Operation : uint8_t {
    read_all,
    read_partial,
    context,
    into_string,
    into_non_empty,
    into_external,
    take,
    take_opt,
    take_while,
    try_take_while,
    take_until,
    take_until_consume,
    take_consumed,
    try_take_consumed,
    take_array,
    take_remaining_str,
    take_str_while,
    try_take_str_while,
    skip,
    skip_while,
    try_skip_while,
    skip_until,
    skip_until_consume,
    skip_str_while,
    peek,
    peek_u8,
    peek_char,
    consume,
    read_u8,
    read_char,
    read_number,
    verify,
    try_verify,
    expect,
    try_expect,
    try_expect_erased,
    external,
    recover_if
};

constexpr const char* operation_string(Operation op) noexcept {
    switch (op) {
        case Operation::read_all:
            return "read all";
        case Operation::read_partial:
            return "read partial";
        case Operation::context:
            return "read";
        case Operation::into_string:
            return "convert input into string";
        case Operation::into_non_empty:
            return "convert input into non-empty input";
        case Operation::into_external:
            return "convert input into external type";
        case Operation::take:
            return "take";
        case Operation::take_opt:
            return "take optional";
        case Operation::take_while:
            return "take while";
        case Operation::try_take_while:
            return "try take while";
        case Operation::take_until:
            return "take until";
        case Operation::take_until_consume:
            return "take until consume";
        case Operation::take_consumed:
            return "take consumed";
        case Operation::try_take_consumed:
            return "try take consumed";
        case Operation::take_array:
            return "take array";
        case Operation::take_remaining_str:
            return "take remaining string";
        case Operation::take_str_while:
            return "take string while";
        case Operation::try_take_str_while:
            return "try take string while";
        case Operation::skip:
            return "skip";
        case Operation::skip_while:
            return "skip while";
        case Operation::try_skip_while:
            return "try skip while";
        case Operation::skip_until:
            return "skip until";
        case Operation::skip_until_consume:
            return "skip until consume";
        case Operation::skip_str_while:
            return "skip string while";
        case Operation::peek:
            return "peek";
        case Operation::peek_u8:
            return "peek u8";
        case Operation::peek_char:
            return "peek char";
        case Operation::consume:
            return "consume";
        case Operation::read_u8:
            return "read u8";
        case Operation::read_char:
            return "read char";
        case Operation::read_number:
            return "read number";
        case Operation::verify:
            return "verify";
        case Operation::try_verify:
            return "try verify";
        case Operation::expect:
            return "expect";
        case Operation::try_expect:
            return "try expect";
        case Operation::try_expect_erased:
            return "try expect erased";
        case Operation::external:
            return "read external";
        case Operation::recover_if:
            return "recover if";
        default:
            return "unknown operation";
    }
}

/**
 * @brief One frame of "what was being attempted" attached to an error
 *
 * Contexts hold non-owning strings. Both operation and expected must outlive
 * any error the context is pushed onto; string literals are the normal case.
 *
 * A child context was contributed by an external error while it folded its
 * own backtrace into ours. Walks report it beside its parent frame rather
 * than as a new nesting level.
 */
struct Context {
    std::string_view operation;       ///< What was attempted, e.g. "decode header"
    std::string_view expected{};      ///< What was expected, empty if not stated
    std::optional<Span> span{};       ///< Region the operation ran over, if known
    bool child = false;               ///< Contributed by an external error

    [[nodiscard]] static Context from(Operation op, std::optional<Span> span = std::nullopt,
                                      std::string_view expected = {}) noexcept {
        return Context{.operation = operation_string(op), .expected = expected, .span = span};
    }

    [[nodiscard]] bool has_expected() const noexcept { return !expected.empty(); }

    [[nodiscard]] Context as_child() const noexcept {
        Context copy = *this;
        copy.child = true;
        return copy;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Context& context) {
    os << context.operation;
    if (context.has_expected()) {
        os << " (expected " << context.expected << ')';
    }
    return os;
}

} // namespace wary
