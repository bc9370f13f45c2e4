#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace wary {

/**
 * @brief Location of a byte region, independent of its content
 *
 * A span keeps only the start and end addresses so an error can point back at
 * a region after the reader has moved on. All comparisons go through
 * std::less so spans of unrelated buffers can be compared without undefined
 * behaviour; they are simply never "within" each other.
 */
class Span {
public:
    constexpr Span() noexcept = default;

    constexpr Span(const uint8_t* start, const uint8_t* end) noexcept : start_(start), end_(end) {}

    [[nodiscard]] static Span of(std::span<const uint8_t> bytes) noexcept {
        return Span(bytes.data(), bytes.data() + bytes.size());
    }

    [[nodiscard]] static Span of(std::string_view text) noexcept {
        auto* start = reinterpret_cast<const uint8_t*>(text.data());
        return Span(start, start + text.size());
    }

    [[nodiscard]] constexpr const uint8_t* start() const noexcept { return start_; }
    [[nodiscard]] constexpr const uint8_t* end() const noexcept { return end_; }

    [[nodiscard]] constexpr size_t len() const noexcept {
        return static_cast<size_t>(end_ - start_);
    }

    [[nodiscard]] constexpr bool is_empty() const noexcept { return start_ == end_; }

    /**
     * @brief Check whether this span lies entirely inside @p parent
     */
    [[nodiscard]] bool is_within(Span parent) const noexcept {
        std::less_equal<const uint8_t*> le;
        return le(parent.start_, start_) && le(end_, parent.end_);
    }

    /**
     * @brief Byte offsets [start, end) of this span inside @p parent
     * @return nullopt if the span is not within the parent
     */
    [[nodiscard]] std::optional<std::pair<size_t, size_t>> offset_within(Span parent) const noexcept {
        if (!is_within(parent)) {
            return std::nullopt;
        }
        auto start = static_cast<size_t>(start_ - parent.start_);
        return std::make_pair(start, start + len());
    }

    /**
     * @brief Sub-view of @p parent covered by this span
     */
    [[nodiscard]] std::optional<std::span<const uint8_t>>
    of_parent(std::span<const uint8_t> parent) const noexcept {
        auto range = offset_within(Span::of(parent));
        if (!range) {
            return std::nullopt;
        }
        return parent.subspan(range->first, range->second - range->first);
    }

    [[nodiscard]] constexpr bool operator==(const Span& other) const noexcept = default;

private:
    const uint8_t* start_ = nullptr;
    const uint8_t* end_ = nullptr;
};

} // namespace wary
