#pragma once

#include <array>
#include <ios>
#include <iomanip>
#include <ostream>
#include <span>
#include <string_view>

#include <cstdint>

#include "../detail/utf8.hpp"

namespace wary {

/**
 * @brief An exact value that was expected in the input
 *
 * Recorded by ValueMismatch. Single bytes and chars are stored inline;
 * literals are referenced and must outlive the error.
 */
class Value {
public:
    enum class Kind : uint8_t { byte, character, bytes, string };

    [[nodiscard]] static Value byte(uint8_t b) noexcept {
        Value v(Kind::byte);
        v.inline_[0] = b;
        v.inline_len_ = 1;
        return v;
    }

    [[nodiscard]] static Value character(char32_t c) noexcept {
        Value v(Kind::character);
        v.inline_len_ = static_cast<uint8_t>(detail::encode_utf8(c, v.inline_));
        return v;
    }

    [[nodiscard]] static Value bytes(std::span<const uint8_t> bytes) noexcept {
        Value v(Kind::bytes);
        v.external_ = bytes;
        return v;
    }

    [[nodiscard]] static Value string(std::string_view text) noexcept {
        Value v(Kind::string);
        v.external_ = {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        return v;
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    [[nodiscard]] bool is_text() const noexcept {
        return kind_ == Kind::character || kind_ == Kind::string;
    }

    /// The expected value as raw bytes (UTF-8 for text values).
    [[nodiscard]] std::span<const uint8_t> as_bytes() const noexcept {
        if (kind_ == Kind::byte || kind_ == Kind::character) {
            return {inline_.data(), inline_len_};
        }
        return external_;
    }

    [[nodiscard]] size_t len() const noexcept { return as_bytes().size(); }

private:
    explicit Value(Kind kind) noexcept : kind_(kind) {}

    Kind kind_;
    std::array<uint8_t, 4> inline_{};
    uint8_t inline_len_ = 0;
    std::span<const uint8_t> external_{};
};

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    auto bytes = value.as_bytes();
    if (value.is_text()) {
        char quote = value.kind() == Value::Kind::character ? '\'' : '"';
        os << quote;
        os.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
        return os << quote;
    }
    auto flags = os.flags();
    auto fill = os.fill('0');
    if (value.kind() == Value::Kind::byte) {
        os << "0x" << std::hex << std::setw(2) << static_cast<unsigned>(bytes[0]);
    } else {
        os << '[';
        for (size_t i = 0; i < bytes.size(); ++i) {
            os << (i == 0 ? "" : " ") << std::hex << std::setw(2)
               << static_cast<unsigned>(bytes[i]);
        }
        os << ']';
    }
    os.fill(fill);
    os.flags(flags);
    return os;
}

} // namespace wary
