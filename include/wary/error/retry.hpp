#pragma once

#include <optional>

#include <cstddef>

namespace wary {

/**
 * @brief Minimum number of extra bytes needed before a parse may succeed
 *
 * Always strictly positive. A requirement of zero is not representable; the
 * absence of a requirement (std::nullopt) means the error is fatal and no
 * amount of extra input will change the result.
 *
 * Usage:
 * @code
 *   auto result = wary::read_all<wary::Invalid>(wary::input(buffer), decode);
 *   if (!result) {
 *       if (auto retry = result.error().retry_requirement()) {
 *           wait_for(retry->continue_after());
 *       }
 *   }
 * @endcode
 */
class RetryRequirement {
public:
    /**
     * @brief Create a requirement of @p count bytes
     * @return nullopt when count is zero
     */
    [[nodiscard]] static constexpr std::optional<RetryRequirement> create(size_t count) noexcept {
        if (count == 0) {
            return std::nullopt;
        }
        return RetryRequirement(count);
    }

    /**
     * @brief Requirement for having @p had bytes when @p needed were needed
     */
    [[nodiscard]] static constexpr std::optional<RetryRequirement>
    from_had_and_needed(size_t had, size_t needed) noexcept {
        return create(needed > had ? needed - had : 0);
    }

    [[nodiscard]] constexpr size_t count() const noexcept { return count_; }

    /// Number of additional bytes to wait for before retrying.
    [[nodiscard]] constexpr size_t continue_after() const noexcept { return count_; }

    /// Whether @p count additional bytes satisfy this requirement.
    [[nodiscard]] constexpr bool met_by(size_t count) const noexcept { return count >= count_; }

    [[nodiscard]] constexpr bool operator==(const RetryRequirement&) const noexcept = default;

private:
    explicit constexpr RetryRequirement(size_t count) noexcept : count_(count) {}

    size_t count_;
};

} // namespace wary
