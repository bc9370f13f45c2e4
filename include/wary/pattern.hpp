#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "detail/utf8.hpp"

namespace wary {

/**
 * @brief Result of a pattern match: byte index and byte length
 */
struct Match {
    size_t index;
    size_t len;

    [[nodiscard]] bool operator==(const Match&) const noexcept = default;
};

/**
 * @brief Customisation point describing how to search for P
 *
 * Specialisations provide, for inputs whose tokens are Token (uint8_t for
 * Bytes, char32_t for String):
 *
 *   static std::optional<Match> find_match(const P&, std::span<const uint8_t>);
 *   static std::optional<size_t> find_reject(const P&, std::span<const uint8_t>);
 *
 * find_match returns the first match. find_reject returns the index of the
 * first token the pattern does not accept, or nullopt if it accepts the whole
 * input. All offsets are in bytes and must lie on token boundaries: for text
 * that means UTF-8 char boundaries. Returning any other offset is a bug in
 * the pattern.
 */
template <typename P, typename Token>
struct PatternTraits;

template <typename P, typename Token>
concept Pattern = requires(const std::decay_t<P>& pattern, std::span<const uint8_t> bytes) {
    {
        PatternTraits<std::decay_t<P>, Token>::find_match(pattern, bytes)
    } -> std::same_as<std::optional<Match>>;
    {
        PatternTraits<std::decay_t<P>, Token>::find_reject(pattern, bytes)
    } -> std::same_as<std::optional<size_t>>;
};

/**
 * @brief Runtime polymorphic pattern source
 *
 * For matchers chosen at runtime. The same contract on token boundaries
 * applies; is_text tells the implementation which token type it is scanning.
 */
class DynPattern {
public:
    virtual ~DynPattern() = default;

    [[nodiscard]] virtual std::optional<Match> find_match(std::span<const uint8_t> bytes,
                                                          bool is_text) const = 0;

    [[nodiscard]] virtual std::optional<size_t> find_reject(std::span<const uint8_t> bytes,
                                                            bool is_text) const = 0;
};

namespace detail {

[[nodiscard]] inline std::span<const uint8_t> text_bytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

[[nodiscard]] inline std::optional<Match> find_slice(std::span<const uint8_t> haystack,
                                                     std::span<const uint8_t> needle) noexcept {
    if (needle.empty() || needle.size() > haystack.size()) {
        return std::nullopt;
    }
    if (needle.size() == 1) {
        const void* hit = std::memchr(haystack.data(), needle[0], haystack.size());
        if (hit == nullptr) {
            return std::nullopt;
        }
        return Match{static_cast<size_t>(static_cast<const uint8_t*>(hit) - haystack.data()), 1};
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end());
    if (it == haystack.end()) {
        return std::nullopt;
    }
    return Match{static_cast<size_t>(it - haystack.begin()), needle.size()};
}

// Index of the first position that does not start another whole copy of
// needle; an empty needle rejects immediately.
[[nodiscard]] inline std::optional<size_t> reject_slice(std::span<const uint8_t> haystack,
                                                        std::span<const uint8_t> needle) noexcept {
    if (needle.empty()) {
        return 0;
    }
    size_t i = 0;
    while (haystack.size() - i >= needle.size() &&
           std::equal(needle.begin(), needle.end(), haystack.begin() + static_cast<ptrdiff_t>(i))) {
        i += needle.size();
    }
    if (i == haystack.size()) {
        return std::nullopt;
    }
    return i;
}

template <typename F>
[[nodiscard]] std::optional<Match> find_char_if(std::span<const uint8_t> text, F&& accept) {
    size_t i = 0;
    while (i < text.size()) {
        auto [c, width] = decode_utf8_first(text.subspan(i));
        if (accept(c)) {
            return Match{i, width};
        }
        i += width;
    }
    return std::nullopt;
}

} // namespace detail

// Predicates over bytes

template <typename P>
    requires(std::predicate<const P&, uint8_t> && !std::is_arithmetic_v<P>)
struct PatternTraits<P, uint8_t> {
    static std::optional<Match> find_match(const P& pred, std::span<const uint8_t> bytes) {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (pred(bytes[i])) {
                return Match{i, 1};
            }
        }
        return std::nullopt;
    }

    static std::optional<size_t> find_reject(const P& pred, std::span<const uint8_t> bytes) {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (!pred(bytes[i])) {
                return i;
            }
        }
        return std::nullopt;
    }
};

// Predicates over chars

template <typename P>
    requires(std::predicate<const P&, char32_t> && !std::is_arithmetic_v<P>)
struct PatternTraits<P, char32_t> {
    static std::optional<Match> find_match(const P& pred, std::span<const uint8_t> text) {
        return detail::find_char_if(text, [&pred](char32_t c) { return pred(c); });
    }

    static std::optional<size_t> find_reject(const P& pred, std::span<const uint8_t> text) {
        auto hit = detail::find_char_if(text, [&pred](char32_t c) { return !pred(c); });
        if (!hit) {
            return std::nullopt;
        }
        return hit->index;
    }
};

// Single byte

template <>
struct PatternTraits<uint8_t, uint8_t> {
    static std::optional<Match> find_match(uint8_t b, std::span<const uint8_t> bytes) noexcept {
        return detail::find_slice(bytes, std::span<const uint8_t>(&b, 1));
    }

    static std::optional<size_t> find_reject(uint8_t b, std::span<const uint8_t> bytes) noexcept {
        auto it = std::find_if(bytes.begin(), bytes.end(), [b](uint8_t x) { return x != b; });
        if (it == bytes.end()) {
            return std::nullopt;
        }
        return static_cast<size_t>(it - bytes.begin());
    }
};

// A plain char searched in bytes is the byte with the same value.
template <>
struct PatternTraits<char, uint8_t> {
    static std::optional<Match> find_match(char c, std::span<const uint8_t> bytes) noexcept {
        return PatternTraits<uint8_t, uint8_t>::find_match(static_cast<uint8_t>(c), bytes);
    }

    static std::optional<size_t> find_reject(char c, std::span<const uint8_t> bytes) noexcept {
        return PatternTraits<uint8_t, uint8_t>::find_reject(static_cast<uint8_t>(c), bytes);
    }
};

// Single char in text

template <>
struct PatternTraits<char32_t, char32_t> {
    static std::optional<Match> find_match(char32_t c, std::span<const uint8_t> text) noexcept {
        std::array<uint8_t, 4> encoded{};
        size_t width = detail::encode_utf8(c, encoded);
        if (width == 0) {
            return std::nullopt;
        }
        return detail::find_slice(text, std::span<const uint8_t>(encoded.data(), width));
    }

    static std::optional<size_t> find_reject(char32_t c, std::span<const uint8_t> text) noexcept {
        auto hit = detail::find_char_if(text, [c](char32_t x) { return x != c; });
        if (!hit) {
            return std::nullopt;
        }
        return hit->index;
    }
};

template <>
struct PatternTraits<char, char32_t> {
    static std::optional<Match> find_match(char c, std::span<const uint8_t> text) noexcept {
        return PatternTraits<char32_t, char32_t>::find_match(static_cast<unsigned char>(c), text);
    }

    static std::optional<size_t> find_reject(char c, std::span<const uint8_t> text) noexcept {
        return PatternTraits<char32_t, char32_t>::find_reject(static_cast<unsigned char>(c), text);
    }
};

// Byte literals

template <typename Token>
struct PatternTraits<std::span<const uint8_t>, Token> {
    static std::optional<Match> find_match(std::span<const uint8_t> lit,
                                           std::span<const uint8_t> bytes) noexcept {
        return detail::find_slice(bytes, lit);
    }

    static std::optional<size_t> find_reject(std::span<const uint8_t> lit,
                                             std::span<const uint8_t> bytes) noexcept {
        return detail::reject_slice(bytes, lit);
    }
};

template <size_t N, typename Token>
struct PatternTraits<std::array<uint8_t, N>, Token> {
    static std::optional<Match> find_match(const std::array<uint8_t, N>& lit,
                                           std::span<const uint8_t> bytes) noexcept {
        return detail::find_slice(bytes, lit);
    }

    static std::optional<size_t> find_reject(const std::array<uint8_t, N>& lit,
                                             std::span<const uint8_t> bytes) noexcept {
        return detail::reject_slice(bytes, lit);
    }
};

// Text literals

template <typename Token>
struct PatternTraits<std::string_view, Token> {
    static std::optional<Match> find_match(std::string_view lit,
                                           std::span<const uint8_t> bytes) noexcept {
        return detail::find_slice(bytes, detail::text_bytes(lit));
    }

    static std::optional<size_t> find_reject(std::string_view lit,
                                             std::span<const uint8_t> bytes) noexcept {
        return detail::reject_slice(bytes, detail::text_bytes(lit));
    }
};

template <typename Token>
struct PatternTraits<const char*, Token> : PatternTraits<std::string_view, Token> {};

// String literals deduce as char[N] and decay to char*
template <typename Token>
struct PatternTraits<char*, Token> : PatternTraits<std::string_view, Token> {};

// Runtime pattern sources

template <typename P, typename Token>
    requires std::derived_from<P, DynPattern>
struct PatternTraits<P, Token> {
    static std::optional<Match> find_match(const DynPattern& pattern,
                                           std::span<const uint8_t> bytes) {
        return pattern.find_match(bytes, std::same_as<Token, char32_t>);
    }

    static std::optional<size_t> find_reject(const DynPattern& pattern,
                                             std::span<const uint8_t> bytes) {
        return pattern.find_reject(bytes, std::same_as<Token, char32_t>);
    }
};

template <typename P, typename Token>
    requires std::derived_from<P, DynPattern>
struct PatternTraits<std::reference_wrapper<P>, Token> {
    static std::optional<Match> find_match(std::reference_wrapper<P> pattern,
                                           std::span<const uint8_t> bytes) {
        return PatternTraits<P, Token>::find_match(pattern.get(), bytes);
    }

    static std::optional<size_t> find_reject(std::reference_wrapper<P> pattern,
                                             std::span<const uint8_t> bytes) {
        return PatternTraits<P, Token>::find_reject(pattern.get(), bytes);
    }
};

} // namespace wary
