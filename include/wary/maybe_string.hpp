#pragma once

#include <span>
#include <string_view>

#include <cstdint>

#include "bound.hpp"
#include "span.hpp"

namespace wary {

/**
 * @brief Ambient input recorded by an error
 *
 * Either a Bytes or a String input with the type erased down to its bytes,
 * its bound and whether it was text. Errors keep this so the caller can see
 * the surrounding input and so retryability can consult the bound.
 */
class MaybeString {
public:
    constexpr MaybeString() noexcept = default;

    constexpr MaybeString(std::span<const uint8_t> bytes, Bound bound, bool is_string) noexcept
        : bytes_(bytes), bound_(bound), is_string_(is_string) {}

    [[nodiscard]] constexpr std::span<const uint8_t> as_bytes() const noexcept { return bytes_; }

    /// Only meaningful when is_string() is true.
    [[nodiscard]] std::string_view as_str() const noexcept {
        return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
    }

    [[nodiscard]] constexpr Bound bound() const noexcept { return bound_; }
    [[nodiscard]] constexpr bool is_bound() const noexcept { return bound_ == Bound::both; }
    [[nodiscard]] constexpr bool is_string() const noexcept { return is_string_; }
    [[nodiscard]] constexpr size_t len() const noexcept { return bytes_.size(); }

    [[nodiscard]] Span span() const noexcept { return Span::of(bytes_); }

private:
    std::span<const uint8_t> bytes_{};
    Bound bound_ = Bound::none;
    bool is_string_ = false;
};

} // namespace wary
