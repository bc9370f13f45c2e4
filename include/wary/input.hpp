#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>
#include <utility>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "detail/input_base.hpp"
#include "detail/utf8.hpp"

namespace wary {

class Bytes;

/**
 * @brief Untrusted UTF-8 text
 *
 * A view that is always valid UTF-8. Tokens are chars: split_at and
 * token_byte_index count chars, patterns report byte offsets on char
 * boundaries. Obtained from Bytes::to_string or input_str.
 */
class String : public detail::InputBase<String, char32_t> {
public:
    [[nodiscard]] std::string_view as_str() const noexcept {
        return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
    }

    /// Number of chars; linear in the byte length.
    [[nodiscard]] size_t char_len() const noexcept {
        return static_cast<size_t>(std::count_if(bytes_.begin(), bytes_.end(), [](uint8_t b) {
            return !detail::is_utf8_continuation(b);
        }));
    }

    [[nodiscard]] Bytes into_bytes() const noexcept;

    [[nodiscard]] static std::pair<char32_t, size_t>
    decode_token(std::span<const uint8_t> bytes) noexcept {
        return detail::decode_utf8_first(bytes);
    }

    [[nodiscard]] std::optional<size_t> token_byte_index(size_t chars) const noexcept {
        size_t i = 0;
        for (size_t n = 0; n < chars; ++n) {
            if (i >= bytes_.size()) {
                return std::nullopt;
            }
            i += detail::decode_utf8_first(bytes_.subspan(i)).second;
        }
        return i;
    }

    [[nodiscard]] bool operator==(std::string_view text) const noexcept { return as_str() == text; }

private:
    friend class detail::InputBase<String, char32_t>;
    friend class Bytes;

    String(std::span<const uint8_t> utf8, Bound bound) noexcept : InputBase(utf8, bound) {}
};

/**
 * @brief Untrusted bytes
 *
 * Tokens are single bytes. Every view of a buffer is a Bytes until it has
 * been validated as text.
 */
class Bytes : public detail::InputBase<Bytes, uint8_t> {
public:
    /// Alias of byte_len().
    [[nodiscard]] size_t len() const noexcept { return bytes_.size(); }

    [[nodiscard]] static std::pair<uint8_t, size_t>
    decode_token(std::span<const uint8_t> bytes) noexcept {
        return {bytes[0], 1};
    }

    [[nodiscard]] std::optional<size_t> token_byte_index(size_t count) const noexcept {
        if (count > bytes_.size()) {
            return std::nullopt;
        }
        return count;
    }

    /**
     * @brief Validate the bytes as UTF-8 text
     *
     * A sequence that can never be valid is an InvalidValue over the
     * offending bytes. A valid lead byte cut off by the end of the input is a
     * LengthShortfall asking for the full encoded length of that char, so a
     * streaming caller can tell "broken" from "needs more bytes".
     */
    template <typename E>
        requires std::constructible_from<E, LengthShortfall> &&
                 std::constructible_from<E, InvalidValue>
    [[nodiscard]] expected<String, E> to_string() const {
        if (auto err = detail::validate_utf8(bytes_)) {
            return unexpected(utf8_error<E>(*err, Operation::into_string));
        }
        return String(bytes_, bound_);
    }

    /**
     * @brief Split off the longest valid UTF-8 prefix whose chars @p pred accepts
     *
     * Invalid or truncated UTF-8 reached before the predicate rejects is
     * reported the same way as to_string().
     */
    template <typename E, typename F>
        requires std::predicate<F&, char32_t> && std::constructible_from<E, LengthShortfall> &&
                 std::constructible_from<E, InvalidValue>
    [[nodiscard]] expected<std::pair<String, Bytes>, E>
    split_str_while(F&& pred, Operation operation = Operation::take_str_while) const {
        return try_split_str_while<E>(
            [&pred](char32_t c) -> expected<bool, E> { return static_cast<bool>(pred(c)); },
            operation);
    }

    template <typename E, typename F>
        requires detail::FallibleTokenPredicate<F, char32_t, E> &&
                 std::constructible_from<E, LengthShortfall> &&
                 std::constructible_from<E, InvalidValue>
    [[nodiscard]] expected<std::pair<String, Bytes>, E>
    try_split_str_while(F&& pred, Operation operation = Operation::try_take_str_while) const {
        size_t i = 0;
        while (i < bytes_.size()) {
            auto rest = bytes_.subspan(i);
            size_t width = std::max<size_t>(detail::utf8_char_len(rest[0]), 1);
            if (auto err = detail::validate_utf8(rest.first(std::min(width, rest.size())))) {
                err->valid_up_to += i;
                return unexpected(utf8_error<E>(*err, operation));
            }
            auto [c, char_width] = detail::decode_utf8_first(rest);
            expected<bool, E> keep = pred(c);
            if (!keep) {
                return unexpected(std::move(keep.error()));
            }
            if (!*keep) {
                auto [head, tail] = split_at_byte_unchecked(i);
                return std::pair<String, Bytes>{String(head.bytes_, head.bound_), tail};
            }
            i += char_width;
        }
        return std::pair<String, Bytes>{String(bytes_, bound_), end()};
    }

    /// Copy out the first N bytes.
    template <size_t N>
    [[nodiscard]] std::optional<std::pair<std::array<uint8_t, N>, Bytes>> split_array_opt() const {
        if (bytes_.size() < N) {
            return std::nullopt;
        }
        std::array<uint8_t, N> out{};
        std::memcpy(out.data(), bytes_.data(), N);
        return std::pair<std::array<uint8_t, N>, Bytes>{out, split_at_byte_unchecked(N).second};
    }

    template <size_t N, typename E>
        requires std::constructible_from<E, LengthShortfall>
    [[nodiscard]] expected<std::pair<std::array<uint8_t, N>, Bytes>, E>
    split_array(Operation operation = Operation::take_array) const {
        if (auto parts = split_array_opt<N>()) {
            return *std::move(parts);
        }
        return unexpected(E(LengthShortfall{
            .min = N,
            .context = Context::from(operation, span(), "enough input"),
            .input = into_maybe_string(),
        }));
    }

    [[nodiscard]] bool operator==(std::span<const uint8_t> other) const noexcept {
        return std::equal(bytes_.begin(), bytes_.end(), other.begin(), other.end());
    }

private:
    friend class detail::InputBase<Bytes, uint8_t>;
    friend class String;
    template <typename E>
    friend expected<String, E> input_str(std::string_view text);
    friend Bytes input(std::span<const uint8_t> bytes) noexcept;

    Bytes(std::span<const uint8_t> bytes, Bound bound) noexcept : InputBase(bytes, bound) {}

    template <typename E>
    [[nodiscard]] E utf8_error(const detail::Utf8Error& err, Operation operation) const {
        auto rest = bytes_.subspan(err.valid_up_to);
        if (err.error_len) {
            return E(InvalidValue{
                .context = Context::from(operation, Span::of(rest.first(*err.error_len)),
                                         "utf-8 code point"),
                .input = into_maybe_string(),
            });
        }
        return E(LengthShortfall{
            .min = detail::utf8_char_len(rest[0]),
            .context = Context::from(operation, Span::of(rest), "complete utf-8 code point"),
            .input = into_maybe_string(),
        });
    }
};

inline Bytes String::into_bytes() const noexcept {
    return Bytes(bytes_, bound_);
}

/**
 * @brief View a caller-owned buffer as untrusted input
 *
 * The buffer must outlive the returned input and everything derived from it,
 * errors included. The start is bounded; the end may grow if the caller
 * retries with more data.
 */
[[nodiscard]] inline Bytes input(std::span<const uint8_t> bytes) noexcept {
    return Bytes(bytes, Bound::start);
}

/**
 * @brief View caller-owned text as untrusted UTF-8 input
 *
 * C++ strings carry no encoding guarantee, so the text is validated here and
 * the result reports failures like Bytes::to_string().
 */
template <typename E>
[[nodiscard]] expected<String, E> input_str(std::string_view text) {
    return Bytes(detail::text_bytes(text), Bound::start).to_string<E>();
}

/// Bytes of @p text, for feeding text literals to input().
[[nodiscard]] inline std::span<const uint8_t> bytes_of(std::string_view text) noexcept {
    return detail::text_bytes(text);
}

inline std::ostream& operator<<(std::ostream& os, const String& text) {
    return os << '"' << text.as_str() << '"';
}

} // namespace wary
