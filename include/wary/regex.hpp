#pragma once

// Optional Pattern sources backed by Boost.Regex. Not included by wary.hpp;
// include it explicitly and link Boost::regex and ICU.

#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

#include "pattern.hpp"

namespace wary {

/**
 * @brief Search byte input with a compiled boost::regex
 *
 * find_match is the leftmost match. find_reject accepts the longest run of
 * back-to-back matches anchored at the start of the input; an empty match
 * ends the run. The regex must outlive the pattern.
 *
 * Only usable with Bytes: a byte regex can stop inside a UTF-8 sequence, so
 * text input takes a TextRegexPattern instead.
 *
 * @code
 *   static const boost::regex digits("[0-9]+");
 *   auto number = r.take_while(wary::RegexPattern{digits});
 * @endcode
 */
struct RegexPattern {
    const boost::regex& regex;
};

/**
 * @brief Search text input with a Unicode-aware boost::u32regex
 *
 * The regex runs over code points decoded from the UTF-8 input, so every
 * match starts and ends on a char boundary. Build it with
 * boost::make_u32regex from a UTF-8 pattern.
 */
struct TextRegexPattern {
    const boost::u32regex& regex;
};

namespace detail {

[[nodiscard]] inline std::optional<Match> regex_find(const boost::regex& regex,
                                                     std::span<const uint8_t> bytes, size_t from,
                                                     bool anchored) {
    const char* begin = reinterpret_cast<const char*>(bytes.data());
    const char* end = begin + bytes.size();
    boost::match_flag_type flags = boost::match_default;
    if (anchored) {
        flags |= boost::match_continuous;
    }
    if (from > 0) {
        flags |= boost::match_prev_avail;
    }
    boost::match_results<const char*> m;
    if (!boost::regex_search(begin + from, end, m, regex, flags)) {
        return std::nullopt;
    }
    return Match{static_cast<size_t>(m[0].first - begin), static_cast<size_t>(m[0].length())};
}

// The UTF-8 adaptor is bounded to [begin + from, end), so the search cannot
// look behind the run position.
[[nodiscard]] inline std::optional<Match> u32regex_find(const boost::u32regex& regex,
                                                        std::span<const uint8_t> text, size_t from,
                                                        bool anchored) {
    const char* begin = reinterpret_cast<const char*>(text.data());
    const char* end = begin + text.size();
    boost::match_flag_type flags = boost::match_default;
    if (anchored) {
        flags |= boost::match_continuous;
    }
    boost::match_results<const char*> m;
    if (!boost::u32regex_search(begin + from, end, m, regex, flags)) {
        return std::nullopt;
    }
    return Match{static_cast<size_t>(m[0].first - begin),
                 static_cast<size_t>(m[0].second - m[0].first)};
}

template <typename Find>
[[nodiscard]] std::optional<size_t> regex_reject(std::span<const uint8_t> bytes, Find&& find) {
    size_t at = 0;
    while (at < bytes.size()) {
        auto m = find(at);
        if (!m || m->len == 0) {
            return at;
        }
        at = m->index + m->len;
    }
    return std::nullopt;
}

} // namespace detail

template <>
struct PatternTraits<RegexPattern, uint8_t> {
    static std::optional<Match> find_match(const RegexPattern& pattern,
                                           std::span<const uint8_t> bytes) {
        return detail::regex_find(pattern.regex, bytes, 0, false);
    }

    static std::optional<size_t> find_reject(const RegexPattern& pattern,
                                             std::span<const uint8_t> bytes) {
        return detail::regex_reject(bytes, [&](size_t at) {
            return detail::regex_find(pattern.regex, bytes, at, true);
        });
    }
};

template <>
struct PatternTraits<TextRegexPattern, char32_t> {
    static std::optional<Match> find_match(const TextRegexPattern& pattern,
                                           std::span<const uint8_t> text) {
        return detail::u32regex_find(pattern.regex, text, 0, false);
    }

    static std::optional<size_t> find_reject(const TextRegexPattern& pattern,
                                             std::span<const uint8_t> text) {
        return detail::regex_reject(text, [&](size_t at) {
            return detail::u32regex_find(pattern.regex, text, at, true);
        });
    }
};

} // namespace wary
