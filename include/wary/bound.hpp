#pragma once

#include <cstdint>

namespace wary {

/**
 * @brief Whether the ends of an input may still move on a future read
 *
 * A streaming caller that receives more bytes re-runs the parse over a longer
 * buffer. The bound records which side of an input could have been different
 * in that retry and therefore decides whether an error is retryable.
 */
enum class Bound : uint8_t {
    none,  ///< Neither the start nor the end is fixed
    start, ///< The start is fixed, the end may grow
    both   ///< Neither end will change; errors are never retryable
};

/**
 * @brief Bound of the head after splitting off a known length
 */
[[nodiscard]] constexpr Bound close_end(Bound) noexcept {
    return Bound::both;
}

/**
 * @brief Bound after the end has been made open again
 */
[[nodiscard]] constexpr Bound open_end(Bound bound) noexcept {
    switch (bound) {
        case Bound::both:
        case Bound::start:
            return Bound::start;
        case Bound::none:
            return Bound::none;
    }
    return Bound::none;
}

/**
 * @brief Bound of the empty input sitting at the end of an input
 *
 * Only a fully bound input keeps its bound; otherwise the end is where more
 * data would appear and nothing can be said about it.
 */
[[nodiscard]] constexpr Bound for_end(Bound bound) noexcept {
    return bound == Bound::both ? Bound::both : Bound::none;
}

constexpr const char* bound_string(Bound bound) noexcept {
    switch (bound) {
        case Bound::none:
            return "unbounded";
        case Bound::start:
            return "start bounded";
        case Bound::both:
            return "fully bounded";
        default:
            return "unknown bound";
    }
}

} // namespace wary
