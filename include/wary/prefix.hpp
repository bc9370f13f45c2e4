#pragma once

#include <concepts>
#include <span>
#include <string_view>
#include <type_traits>

#include <cstdint>

#include "error/value.hpp"
#include "pattern.hpp"

namespace wary {

/**
 * @brief Customisation point for exact values an input may start with
 *
 * Specialisations provide static Value to_value(const P&). The Value is what
 * split_prefix compares against and what a ValueMismatch reports, so literal
 * prefixes are referenced rather than copied and must outlive any error.
 */
template <typename P, typename Token>
struct PrefixTraits;

template <typename P, typename Token>
concept Prefix = requires(const std::decay_t<P>& prefix) {
    { PrefixTraits<std::decay_t<P>, Token>::to_value(prefix) } -> std::same_as<Value>;
};

/// A pattern that is also an exact value, so a missing match can report it.
template <typename P, typename Token>
concept ValuePattern = Pattern<P, Token> && Prefix<P, Token>;

template <typename P, typename Token>
[[nodiscard]] inline Value to_value(const P& prefix) noexcept {
    return PrefixTraits<std::decay_t<P>, Token>::to_value(prefix);
}

template <>
struct PrefixTraits<uint8_t, uint8_t> {
    static Value to_value(uint8_t b) noexcept { return Value::byte(b); }
};

template <>
struct PrefixTraits<char, uint8_t> {
    static Value to_value(char c) noexcept { return Value::byte(static_cast<uint8_t>(c)); }
};

template <>
struct PrefixTraits<char, char32_t> {
    static Value to_value(char c) noexcept {
        return Value::character(static_cast<unsigned char>(c));
    }
};

template <typename Token>
struct PrefixTraits<char32_t, Token> {
    static Value to_value(char32_t c) noexcept { return Value::character(c); }
};

template <>
struct PrefixTraits<std::span<const uint8_t>, uint8_t> {
    static Value to_value(std::span<const uint8_t> bytes) noexcept { return Value::bytes(bytes); }
};

template <typename Token>
struct PrefixTraits<std::string_view, Token> {
    static Value to_value(std::string_view text) noexcept { return Value::string(text); }
};

template <typename Token>
struct PrefixTraits<const char*, Token> {
    static Value to_value(const char* text) noexcept { return Value::string(text); }
};

template <typename Token>
struct PrefixTraits<char*, Token> : PrefixTraits<const char*, Token> {};

} // namespace wary
