#pragma once

#include <array>
#include <optional>
#include <span>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace wary::detail {

// Encoded length of a UTF-8 sequence by its first byte (RFC 3629).
// Zero marks bytes that can never start a sequence.
inline constexpr std::array<uint8_t, 256> utf8_char_length = [] {
    std::array<uint8_t, 256> table{};
    for (size_t b = 0; b < 256; ++b) {
        if (b < 0x80) {
            table[b] = 1;
        } else if (b < 0xC2) {
            table[b] = 0;
        } else if (b < 0xE0) {
            table[b] = 2;
        } else if (b < 0xF0) {
            table[b] = 3;
        } else if (b < 0xF5) {
            table[b] = 4;
        } else {
            table[b] = 0;
        }
    }
    return table;
}();

[[nodiscard]] constexpr size_t utf8_char_len(uint8_t first) noexcept {
    return utf8_char_length[first];
}

[[nodiscard]] constexpr bool is_utf8_continuation(uint8_t byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

/**
 * @brief Where and how UTF-8 validation failed
 *
 * error_len is the length of the invalid sequence starting at valid_up_to.
 * It is empty when the bytes from valid_up_to are a valid but unfinished
 * sequence cut off by the end of the input.
 */
struct Utf8Error {
    size_t valid_up_to;
    std::optional<size_t> error_len;
};

/**
 * @brief Validate UTF-8, reporting the first failure
 * @return nullopt if every byte is part of a well formed code point
 */
[[nodiscard]] constexpr std::optional<Utf8Error>
validate_utf8(std::span<const uint8_t> bytes) noexcept {
    const size_t len = bytes.size();
    size_t i = 0;
    while (i < len) {
        const size_t start = i;
        const uint8_t first = bytes[i];
        if (first < 0x80) {
            ++i;
            continue;
        }
        const size_t width = utf8_char_len(first);
        if (width == 0) {
            return Utf8Error{start, 1};
        }
        if (i + 1 >= len) {
            return Utf8Error{start, std::nullopt};
        }
        const uint8_t second = bytes[i + 1];
        bool second_ok = false;
        if (width == 2) {
            second_ok = is_utf8_continuation(second);
        } else if (width == 3) {
            if (first == 0xE0) {
                second_ok = second >= 0xA0 && second <= 0xBF;
            } else if (first == 0xED) {
                second_ok = second >= 0x80 && second <= 0x9F;
            } else {
                second_ok = is_utf8_continuation(second);
            }
        } else {
            if (first == 0xF0) {
                second_ok = second >= 0x90 && second <= 0xBF;
            } else if (first == 0xF4) {
                second_ok = second >= 0x80 && second <= 0x8F;
            } else {
                second_ok = is_utf8_continuation(second);
            }
        }
        if (!second_ok) {
            return Utf8Error{start, 1};
        }
        for (size_t k = 2; k < width; ++k) {
            if (i + k >= len) {
                return Utf8Error{start, std::nullopt};
            }
            if (!is_utf8_continuation(bytes[i + k])) {
                return Utf8Error{start, k};
            }
        }
        i += width;
    }
    return std::nullopt;
}

/**
 * @brief Decode the first code point of already validated UTF-8
 * @return The code point and its encoded length; {0, 0} for empty input
 */
[[nodiscard]] constexpr std::pair<char32_t, size_t>
decode_utf8_first(std::span<const uint8_t> bytes) noexcept {
    if (bytes.empty()) {
        return {0, 0};
    }
    const uint8_t first = bytes[0];
    const size_t width = utf8_char_len(first);
    if (width <= 1 || width > bytes.size()) {
        return {first, 1};
    }
    char32_t cp = first & (0x7F >> width);
    for (size_t k = 1; k < width; ++k) {
        cp = (cp << 6) | (bytes[k] & 0x3F);
    }
    return {cp, width};
}

/**
 * @brief Encode a code point into @p out
 * @return Number of bytes written, 0 for surrogates and values past U+10FFFF
 */
[[nodiscard]] constexpr size_t encode_utf8(char32_t cp, std::array<uint8_t, 4>& out) noexcept {
    if (cp < 0x80) {
        out[0] = static_cast<uint8_t>(cp);
        return 1;
    }
    if (cp < 0x800) {
        out[0] = static_cast<uint8_t>(0xC0 | (cp >> 6));
        out[1] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) {
        return 0;
    }
    if (cp < 0x10000) {
        out[0] = static_cast<uint8_t>(0xE0 | (cp >> 12));
        out[1] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
        out[2] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        out[0] = static_cast<uint8_t>(0xF0 | (cp >> 18));
        out[1] = static_cast<uint8_t>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<uint8_t>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<uint8_t>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

[[nodiscard]] constexpr bool is_char_boundary(std::span<const uint8_t> bytes,
                                              size_t index) noexcept {
    if (index == 0 || index == bytes.size()) {
        return true;
    }
    return index < bytes.size() && !is_utf8_continuation(bytes[index]);
}

} // namespace wary::detail
