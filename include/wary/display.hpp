#pragma once

#include <algorithm>
#include <ios>
#include <iomanip>
#include <ostream>
#include <span>
#include <sstream>
#include <string>

#include <cstddef>
#include <cstdint>

#include "detail/utf8.hpp"
#include "error/details.hpp"

namespace wary {

/**
 * @brief Multi-line human readable rendering of an error
 *
 * Output layout:
 * @code
 *   error attempting to consume: not enough input to match expected value
 *   > [68 65 6c 6c]
 *      ^^^^^^^^^^^
 *   expected: "hello"
 *   backtrace:
 *     1. `read all`
 *     2. `consume` (expected exact value)
 * @endcode
 *
 * Text input is shown quoted instead of as hex pairs. Inputs longer than
 * max_width tokens are cut to a window of max_width tokens starting at the
 * error span (moved back so the window stays inside the input), with ".."
 * marking each side that was cut.
 *
 * A Details implementation whose span is not inside its input gets a note
 * instead of the annotated input.
 */
class ErrorDisplay {
public:
    static constexpr size_t default_max_width = 32;

    explicit ErrorDisplay(const Details& details) noexcept : details_(details) {}

    /// Maximum number of input tokens shown.
    ErrorDisplay& max_width(size_t width) noexcept {
        max_width_ = std::max<size_t>(width, 1);
        return *this;
    }

    /// Print only the summary line.
    ErrorDisplay& single_line(bool enabled = true) noexcept {
        single_line_ = enabled;
        return *this;
    }

    void write(std::ostream& os) const {
        os << "error attempting to " << details_.root_context().operation << ": ";
        details_.description(os);
        if (single_line_) {
            return;
        }
        os << '\n';
        write_input(os);
        if (auto value = details_.expected()) {
            os << "expected: " << *value << '\n';
        }
        os << "backtrace:\n";
        details_.walk_backtrace([&os](size_t depth, const Context& context) {
            if (context.child) {
                os << "     - `" << context.operation << '`';
            } else {
                os << "  " << depth << ". `" << context.operation << '`';
            }
            if (context.has_expected()) {
                os << " (expected " << context.expected << ')';
            }
            os << '\n';
            return true;
        });
    }

    [[nodiscard]] std::string to_string() const {
        std::ostringstream os;
        write(os);
        return os.str();
    }

private:
    void write_input(std::ostream& os) const {
        MaybeString input = details_.input();
        auto range = details_.span().offset_within(input.span());
        if (!range) {
            os << "note: error span is not within the error input indicating the concrete "
                  "error being used has a bug\n";
            return;
        }
        auto bytes = input.as_bytes();

        // Window of at most max_width_ bytes starting at the span.
        size_t start = range->first;
        if (bytes.size() - start < max_width_) {
            start = bytes.size() > max_width_ ? bytes.size() - max_width_ : 0;
        }
        size_t end = std::min(bytes.size(), start + max_width_);
        if (input.is_string()) {
            while (start > 0 && !detail::is_char_boundary(bytes, start)) {
                --start;
            }
            while (end < bytes.size() && !detail::is_char_boundary(bytes, end)) {
                ++end;
            }
        }
        const bool cut_head = start > 0;
        const bool cut_tail = end < bytes.size();
        auto shown = bytes.subspan(start, end - start);
        size_t span_first = range->first - start;
        size_t span_last = std::min(range->second, end) - start;

        std::string line = "> ";
        std::string marks(line.size(), ' ');
        if (cut_head) {
            line += "..";
            marks += "  ";
        }
        if (input.is_string()) {
            line += '"';
            marks += ' ';
            size_t i = 0;
            while (i <= shown.size()) {
                const bool in_span = (i >= span_first && i < span_last) ||
                                     (span_first == span_last && i == span_first);
                if (i == shown.size()) {
                    if (in_span) {
                        marks += '^';
                    }
                    break;
                }
                size_t width = std::max<size_t>(detail::utf8_char_len(shown[i]), 1);
                width = std::min(width, shown.size() - i);
                line.append(reinterpret_cast<const char*>(shown.data() + i), width);
                marks += in_span ? '^' : ' ';
                i += width;
            }
            line += '"';
        } else {
            line += '[';
            marks += ' ';
            for (size_t i = 0; i <= shown.size(); ++i) {
                const bool in_span = (i >= span_first && i < span_last) ||
                                     (span_first == span_last && i == span_first);
                if (i == shown.size()) {
                    if (in_span) {
                        marks += '^';
                    }
                    break;
                }
                if (i > 0) {
                    line += ' ';
                    marks += (in_span && i > span_first) ? '^' : ' ';
                }
                std::ostringstream hex;
                hex << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<unsigned>(shown[i]);
                line += hex.str();
                marks += in_span ? "^^" : "  ";
            }
            line += ']';
        }
        if (cut_tail) {
            line += "..";
        }
        while (!marks.empty() && marks.back() == ' ') {
            marks.pop_back();
        }
        os << line << '\n' << marks << '\n';
    }

    const Details& details_;
    size_t max_width_ = default_max_width;
    bool single_line_ = false;
};

inline std::ostream& operator<<(std::ostream& os, const ErrorDisplay& display) {
    display.write(os);
    return os;
}

} // namespace wary
