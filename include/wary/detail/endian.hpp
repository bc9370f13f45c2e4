#pragma once

#include <array>
#include <bit>
#include <concepts>
#include <type_traits>

#include <cstdint>
#include <cstring>

namespace wary::detail {

template <typename T>
concept FixedWidthNumber =
    (std::integral<T> || std::floating_point<T>) && !std::same_as<T, bool> &&
    (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

template <size_t N>
struct UnsignedOfSize;
template <>
struct UnsignedOfSize<1> {
    using type = uint8_t;
};
template <>
struct UnsignedOfSize<2> {
    using type = uint16_t;
};
template <>
struct UnsignedOfSize<4> {
    using type = uint32_t;
};
template <>
struct UnsignedOfSize<8> {
    using type = uint64_t;
};

template <std::unsigned_integral U>
[[nodiscard]] constexpr U byteswap(U value) noexcept {
    if constexpr (sizeof(U) == 1) {
        return value;
    } else {
        U result = 0;
        for (size_t i = 0; i < sizeof(U); ++i) {
            result = static_cast<U>((result << 8) | (value & 0xFF));
            value = static_cast<U>(value >> 8);
        }
        return result;
    }
}

/**
 * @brief Reinterpret a fixed array of bytes as a number in the given order
 *
 * One helper serves every width: the bytes are loaded into the unsigned type
 * of the same size, swapped when the wire order differs from the host, and
 * then bit cast to T.
 */
template <FixedWidthNumber T, std::endian Order>
[[nodiscard]] inline T from_bytes(const std::array<uint8_t, sizeof(T)>& bytes) noexcept {
    using Raw = typename UnsignedOfSize<sizeof(T)>::type;
    Raw raw;
    std::memcpy(&raw, bytes.data(), sizeof(Raw));
    if constexpr (Order != std::endian::native) {
        raw = byteswap(raw);
    }
    return std::bit_cast<T>(raw);
}

} // namespace wary::detail
