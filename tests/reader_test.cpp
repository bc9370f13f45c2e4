#include <array>
#include <bit>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include <wary.hpp>

using Error = wary::VerboseError<>;
using Reader = wary::BytesReader<Error>;

// Test fixture for the reader cursor
// Successful operations advance; failing operations leave the cursor in place
class ReaderTest : public ::testing::Test {
protected:
    static wary::Bytes bytes(std::string_view text) { return wary::input(wary::bytes_of(text)); }

    static std::string_view str(const wary::Bytes& in) {
        auto b = in.as_bytes();
        return {reinterpret_cast<const char*>(b.data()), b.size()};
    }

    static std::vector<std::string_view> operations(const Error& err) {
        std::vector<std::string_view> out;
        err.walk_backtrace([&out](size_t, const wary::Context& context) {
            out.push_back(context.operation);
            return true;
        });
        return out;
    }
};

// Test 1: Peeking never moves the cursor
TEST_F(ReaderTest, PeekIsIdempotent) {
    Reader r(bytes("abcdef"));

    auto first = r.peek(3);
    auto second = r.peek(3);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(str(*first), "abc");
    EXPECT_EQ(first->span(), second->span());
    EXPECT_EQ(r.remaining(), 6u);

    auto taken = r.take(3);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(str(*taken), "abc");
    EXPECT_EQ(r.remaining(), 3u);

    EXPECT_TRUE(r.peek_eq("def"));
    EXPECT_FALSE(r.peek_opt(4).has_value());
}

// Test 2: Consumption is monotonic and failures do not move the cursor
TEST_F(ReaderTest, FailuresLeaveCursor) {
    Reader r(bytes("abcdef"));

    ASSERT_TRUE(r.skip(2).has_value());
    EXPECT_EQ(r.remaining(), 4u);

    auto too_far = r.take(10);
    ASSERT_FALSE(too_far.has_value());
    EXPECT_TRUE(wary::is_length_shortfall(too_far.error()));
    EXPECT_EQ(r.remaining(), 4u);

    auto wrong = r.consume("xy");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_TRUE(wary::is_value_mismatch(wrong.error()));
    EXPECT_EQ(r.remaining(), 4u);

    EXPECT_FALSE(r.consume_opt('z'));
    EXPECT_TRUE(r.consume_opt('c'));
    EXPECT_EQ(r.remaining(), 3u);

    EXPECT_FALSE(r.take_opt(4).has_value());
    auto rest = r.take_remaining();
    EXPECT_EQ(str(rest), "def");
    EXPECT_TRUE(r.at_end());
}

// Test 3: Scans until a delimiter
TEST_F(ReaderTest, UntilDelimiter) {
    Reader r(bytes("name: value\n"));

    auto key = r.take_until_consume(": ");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(str(*key), "name");

    auto missing = r.take_until(';');
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(r.remaining(), 6u);

    ASSERT_TRUE(r.skip_until('\n').has_value());
    EXPECT_EQ(r.remaining(), 1u);
    ASSERT_TRUE(r.skip_until_consume('\n').has_value());
    EXPECT_TRUE(r.at_end());
}

// Test 4: Fallible predicates propagate their own errors
TEST_F(ReaderTest, TryTakeWhile) {
    Reader r(bytes("12a"));
    auto digits = r.try_take_while([](uint8_t b) -> wary::expected<bool, Error> {
        return b >= '0' && b <= '9';
    });
    ASSERT_TRUE(digits.has_value());
    EXPECT_EQ(str(*digits), "12");

    Reader failing(bytes("12a"));
    auto result = failing.try_take_while([&failing](uint8_t b) -> wary::expected<bool, Error> {
        if (b == 'a') {
            return wary::unexpected(Error(wary::InvalidValue{
                .context = wary::Context{.operation = "check byte"},
                .input = failing.peek_remaining().into_maybe_string(),
            }));
        }
        return true;
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(failing.remaining(), 3u);
    EXPECT_EQ(operations(result.error()).front(), "try take while");
}

// Test 5: recover rewinds on failure
TEST_F(ReaderTest, Recover) {
    Reader r(bytes("abc"));

    bool matched = r.recover([](Reader& r) -> wary::expected<void, Error> {
        auto skipped = r.skip(1);
        if (!skipped) {
            return skipped;
        }
        return r.consume('x');
    });
    EXPECT_FALSE(matched);
    EXPECT_EQ(r.remaining(), 3u);

    auto value = r.recover([](Reader& r) { return r.read_u8(); });
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 'a');
    EXPECT_EQ(r.remaining(), 2u);
}

// Test 6: recover_if only rewinds the failures it accepts
TEST_F(ReaderTest, RecoverIf) {
    Reader r(bytes("abc"));
    auto fail = [](Reader& r) -> wary::expected<uint8_t, Error> {
        auto skipped = r.skip(1);
        if (!skipped) {
            return wary::unexpected(std::move(skipped.error()));
        }
        auto x = r.consume('x');
        if (!x) {
            return wary::unexpected(std::move(x.error()));
        }
        return uint8_t{'x'};
    };

    auto recovered = r.recover_if(fail, [](const Error& err) { return err.is_fatal(); });
    ASSERT_TRUE(recovered.has_value());
    EXPECT_FALSE(recovered->has_value());
    EXPECT_EQ(r.remaining(), 3u);

    auto rejected = r.recover_if(fail, [](const Error&) { return false; });
    ASSERT_FALSE(rejected.has_value());
    auto ops = operations(rejected.error());
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0], "recover if");
    EXPECT_EQ(ops[1], "consume");
}

// Test 7: take_consumed returns what the sub-parse read
TEST_F(ReaderTest, TakeConsumed) {
    auto lower = [](uint8_t b) { return b >= 'a' && b <= 'z'; };

    Reader r(bytes("abc123"));
    auto [count, consumed] = r.take_consumed([&lower](Reader& r) {
        return r.take_while(lower).len();
    });
    EXPECT_EQ(count, 3u);
    EXPECT_EQ(str(consumed), "abc");
    EXPECT_EQ(consumed.bound(), wary::Bound::both);

    // A scan that ran off the end leaves the consumed input open
    Reader all(bytes("abc"));
    auto open = all.take_consumed([&lower](Reader& r) { r.skip_while(lower); });
    EXPECT_EQ(str(open), "abc");
    EXPECT_EQ(open.bound(), wary::Bound::start);
}

// Test 8: try_take_consumed restores the cursor on failure
TEST_F(ReaderTest, TryTakeConsumed) {
    Reader r(bytes("ab"));
    auto ok = r.try_take_consumed([](Reader& r) { return r.consume('a'); });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(str(*ok), "a");

    auto failed = r.try_take_consumed([](Reader& r) -> wary::expected<void, Error> {
        auto b = r.consume('b');
        if (!b) {
            return b;
        }
        return r.consume('c');
    });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(r.remaining(), 1u);
    EXPECT_EQ(operations(failed.error()).front(), "try take consumed");
}

// Test 9: verify and expect report InvalidValue with the caller's description
TEST_F(ReaderTest, VerifyAndExpect) {
    Reader r(bytes("a7"));

    ASSERT_TRUE(r.verify("letter a", [](Reader& r) { return r.consume_opt('a'); }).has_value());
    EXPECT_EQ(r.remaining(), 1u);

    auto not_z = r.verify("letter z", [](Reader& r) { return r.consume_opt('z'); });
    ASSERT_FALSE(not_z.has_value());
    ASSERT_TRUE(wary::is_invalid_value(not_z.error()));
    EXPECT_EQ(not_z.error().root_context().expected, "letter z");
    EXPECT_EQ(r.remaining(), 1u);

    auto digit = r.expect("digit", [](Reader& r) -> std::optional<int> {
        auto b = r.peek_u8_opt();
        if (!b || *b < '0' || *b > '9') {
            return std::nullopt;
        }
        (void)r.read_u8();
        return *b - '0';
    });
    ASSERT_TRUE(digit.has_value());
    EXPECT_EQ(*digit, 7);
    EXPECT_TRUE(r.at_end());
}

// Test 10: try_verify and try_expect pass errors of the sub-parse through
TEST_F(ReaderTest, TryVerifyAndTryExpect) {
    Reader r(bytes("ok"));
    auto verified = r.try_verify("ok", [](Reader& r) -> wary::expected<bool, Error> {
        auto taken = r.take(2);
        if (!taken) {
            return wary::unexpected(std::move(taken.error()));
        }
        return *taken == wary::bytes_of("ok");
    });
    ASSERT_TRUE(verified.has_value());
    EXPECT_TRUE(r.at_end());

    Reader empty(bytes(""));
    auto value = empty.try_expect("byte", [](Reader& r) -> wary::expected<std::optional<uint8_t>, Error> {
        auto b = r.read_u8();
        if (!b) {
            return wary::unexpected(std::move(b.error()));
        }
        return std::optional<uint8_t>(*b);
    });
    ASSERT_FALSE(value.has_value());
    EXPECT_TRUE(wary::is_length_shortfall(value.error()));
    EXPECT_EQ(operations(value.error()).front(), "try expect");
}

// Test 11: Erased errors keep only their retry requirement
TEST_F(ReaderTest, TryExpectErased) {
    Reader r(bytes("abc"));
    auto value = r.try_expect_erased("frame", [](Reader&) -> wary::expected<int, wary::Invalid> {
        return wary::unexpected(wary::Invalid::retry_after(3));
    });
    ASSERT_FALSE(value.has_value());
    ASSERT_TRUE(wary::is_invalid_value(value.error()));
    EXPECT_EQ(value.error().retry_requirement()->count(), 3u);
    EXPECT_EQ(r.remaining(), 3u);
}

// Test 12: Numbers in both byte orders
TEST_F(ReaderTest, Numbers) {
    const std::array<uint8_t, 27> buffer{
        0x01, 0x02,                                     // u16 be
        0x03, 0x04,                                     // u16 le
        0xDE, 0xAD, 0xBE, 0xEF,                         // u32 be
        0xFF, 0xFE,                                     // i16 be
        0x3F, 0x80, 0x00, 0x00,                         // f32 be
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F, // f64 le
        0x80,                                           // i8
        0xAA, 0xBB, 0xCC,                               // array
        0x42,
    };
    wary::BytesReader<Error> r(wary::input(buffer));

    EXPECT_EQ(*r.read_u16_be(), 0x0102u);
    EXPECT_EQ(*r.read_u16_le(), 0x0403u);
    EXPECT_EQ(*r.read_u32_be(), 0xDEADBEEFu);
    EXPECT_EQ(*r.read_i16_be(), -2);
    EXPECT_FLOAT_EQ(*r.read_f32_be(), 1.0f);
    EXPECT_DOUBLE_EQ(*r.read_f64_le(), 1.0);
    EXPECT_EQ(*r.read_i8(), -128);

    auto arr = r.take_array<3>();
    ASSERT_TRUE(arr.has_value());
    EXPECT_EQ((*arr)[0], 0xAA);
    EXPECT_EQ((*arr)[2], 0xCC);

    EXPECT_EQ(*r.peek_u8(), 0x42);
    EXPECT_EQ(*r.read_u8(), 0x42);

    auto end = r.read_u8();
    ASSERT_FALSE(end.has_value());
    EXPECT_EQ(end.error().retry_requirement()->count(), 1u);
}

// Test 13: A short number asks for the missing bytes
TEST_F(ReaderTest, ShortNumber) {
    const std::array<uint8_t, 2> buffer{0x01, 0x02};
    wary::BytesReader<Error> r(wary::input(buffer));

    auto value = r.read_u32_le();
    ASSERT_FALSE(value.has_value());
    ASSERT_TRUE(wary::is_length_shortfall(value.error()));
    EXPECT_EQ(std::get<wary::LengthShortfall>(value.error().kind()).min, 4u);
    EXPECT_EQ(value.error().retry_requirement()->count(), 2u);
    EXPECT_EQ(r.remaining(), 2u);
}

// Test 14: UTF-8 reads out of bytes
TEST_F(ReaderTest, StringReads) {
    Reader r(bytes("h\xC3\xA9llo world"));
    auto word = r.take_str_while([](char32_t c) { return c != U' '; });
    ASSERT_TRUE(word.has_value());
    EXPECT_EQ(word->as_str(), "h\xC3\xA9llo");
    EXPECT_EQ(word->char_len(), 5u);

    ASSERT_TRUE(r.skip_str_while([](char32_t c) { return c == U' '; }).has_value());
    auto rest = r.take_remaining_str();
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(rest->as_str(), "world");

    const std::array<uint8_t, 2> cut{0x61, 0xC3};
    wary::BytesReader<Error> truncated(wary::input(cut));
    auto partial = truncated.take_str_while([](char32_t) { return true; });
    ASSERT_FALSE(partial.has_value());
    ASSERT_TRUE(wary::is_length_shortfall(partial.error()));
    EXPECT_EQ(std::get<wary::LengthShortfall>(partial.error().kind()).min, 2u);
    EXPECT_EQ(truncated.remaining(), 2u);
}

// Test 15: Char reads over text
TEST_F(ReaderTest, CharReads) {
    auto text = wary::input_str<Error>("\xC3\xA9!");
    ASSERT_TRUE(text.has_value());
    wary::StringReader<Error> r(*text);

    EXPECT_EQ(*r.peek_char(), U'\u00E9');
    EXPECT_EQ(*r.read_char(), U'\u00E9');
    EXPECT_EQ(r.peek_char_opt(), U'!');
    ASSERT_TRUE(r.consume('!').has_value());
    EXPECT_FALSE(r.peek_char_opt().has_value());
    EXPECT_FALSE(r.read_char().has_value());
}

// Test 16: Sub-parses with a different error type
TEST_F(ReaderTest, ErrorScope) {
    Reader r(bytes("ab"));
    auto first = r.error<wary::Fatal>([](wary::BytesReader<wary::Fatal>& sub) {
        return sub.read_u8();
    });
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 'a');
    EXPECT_EQ(r.remaining(), 1u);

    auto mismatch = r.error<wary::Invalid>([](wary::BytesReader<wary::Invalid>& sub) {
        return sub.consume("bc");
    });
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().retry_requirement()->count(), 1u);
    EXPECT_EQ(r.remaining(), 1u);
}

// Foreign parser reading a decimal number
struct DecimalError : wary::External {
    std::optional<wary::RetryRequirement> retry_requirement() const override {
        return wary::RetryRequirement::create(1);
    }
};

wary::expected<std::pair<size_t, int>, DecimalError> parse_decimal(const wary::Bytes& in) {
    size_t used = 0;
    int value = 0;
    for (uint8_t b : in.as_bytes()) {
        if (b < '0' || b > '9') {
            break;
        }
        value = value * 10 + (b - '0');
        ++used;
    }
    if (used == 0) {
        return wary::unexpected(DecimalError{});
    }
    return std::pair<size_t, int>{used, value};
}

// Test 17: Foreign parsers advance by the count they report
TEST_F(ReaderTest, TryExternal) {
    Reader r(bytes("42,x"));
    auto number = r.try_external("decimal", parse_decimal);
    ASSERT_TRUE(number.has_value());
    EXPECT_EQ(*number, 42);
    EXPECT_EQ(r.remaining(), 2u);

    ASSERT_TRUE(r.consume(',').has_value());
    auto bad = r.try_external("decimal", parse_decimal);
    ASSERT_FALSE(bad.has_value());
    ASSERT_TRUE(wary::is_invalid_value(bad.error()));
    EXPECT_EQ(bad.error().retry_requirement()->count(), 1u);
    EXPECT_EQ(r.remaining(), 1u);

    Reader lying(bytes("1"));
    auto overrun = lying.try_external("decimal", [](const wary::Bytes&) {
        return wary::expected<std::pair<size_t, int>, DecimalError>(std::pair<size_t, int>{5, 0});
    });
    ASSERT_FALSE(overrun.has_value());
    EXPECT_TRUE(wary::is_length_shortfall(overrun.error()));
    EXPECT_EQ(lying.remaining(), 1u);
}

// Test 18: Contexts attach to errors raised inside them
TEST_F(ReaderTest, Context) {
    Reader r(bytes("ab"));
    auto result = r.context("header", [](Reader& r) { return r.take(5); });
    ASSERT_FALSE(result.has_value());
    auto ops = operations(result.error());
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0], "header");
    EXPECT_EQ(ops[1], "take");

    auto peeked = r.peek_context("lookahead", [](const Reader& r) { return r.peek(3); });
    ASSERT_FALSE(peeked.has_value());
    EXPECT_EQ(operations(peeked.error()).front(), "lookahead");
    EXPECT_EQ(r.remaining(), 2u);
}

// Test 19: recover_if over a parse with no value reports whether it matched
TEST_F(ReaderTest, RecoverIfVoid) {
    Reader r(bytes("-12"));
    auto sign = [](Reader& r) { return r.consume('-'); };
    auto retryable = [](const Error& err) { return !err.is_fatal(); };

    auto negative = r.recover_if(sign, [](const Error&) { return true; });
    ASSERT_TRUE(negative.has_value());
    EXPECT_TRUE(*negative);
    EXPECT_EQ(r.remaining(), 2u);

    auto again = r.recover_if(sign, [](const Error& err) { return err.is_fatal(); });
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(*again);
    EXPECT_EQ(r.remaining(), 2u);

    auto rejected = r.recover_if(sign, retryable);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(operations(rejected.error()).front(), "recover if");
    EXPECT_EQ(r.remaining(), 2u);
}
