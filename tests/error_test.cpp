#include <array>
#include <sstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>
#include <wary.hpp>

using Error = wary::VerboseError<>;

namespace {

template <typename T>
std::string render(const T& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

} // namespace

// Test 1: A zero requirement is not representable
TEST(RetryRequirementTest, Create) {
    EXPECT_FALSE(wary::RetryRequirement::create(0).has_value());
    auto three = wary::RetryRequirement::create(3);
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(three->count(), 3u);
    EXPECT_EQ(three->continue_after(), 3u);
}

// Test 2: Requirement from what was available versus what was needed
TEST(RetryRequirementTest, FromHadAndNeeded) {
    EXPECT_EQ(wary::RetryRequirement::from_had_and_needed(3, 5)->count(), 2u);
    EXPECT_FALSE(wary::RetryRequirement::from_had_and_needed(5, 5).has_value());
    EXPECT_FALSE(wary::RetryRequirement::from_had_and_needed(7, 5).has_value());
}

TEST(RetryRequirementTest, MetBy) {
    auto req = *wary::RetryRequirement::create(4);
    EXPECT_FALSE(req.met_by(3));
    EXPECT_TRUE(req.met_by(4));
    EXPECT_TRUE(req.met_by(10));
}

// Test fixture building primitive errors over a fixed buffer
class ErrorKindTest : public ::testing::Test {
protected:
    std::string_view text_ = "hello world";

    wary::MaybeString input(wary::Bound bound) const {
        return wary::MaybeString(wary::bytes_of(text_), bound, false);
    }

    wary::Span sub(size_t offset, size_t len) const {
        return wary::Span::of(text_.substr(offset, len));
    }
};

// Test 3: A max pins the length and makes a shortfall fatal
TEST_F(ErrorKindTest, LengthShortfallWithMaxIsFatal) {
    wary::LengthShortfall open{
        .min = 8,
        .context = wary::Context::from(wary::Operation::take, sub(0, 5)),
        .input = input(wary::Bound::start),
    };
    EXPECT_FALSE(open.is_fatal());
    EXPECT_EQ(open.retry_requirement()->count(), 3u);
    EXPECT_EQ(render(open),
              "error attempting to take: found 5 bytes when at least 8 bytes was expected");

    wary::LengthShortfall exact{
        .min = 0,
        .max = 0,
        .context = wary::Context::from(wary::Operation::read_all, sub(5, 6)),
        .input = input(wary::Bound::start),
    };
    EXPECT_TRUE(exact.is_exact());
    EXPECT_TRUE(exact.is_fatal());
    EXPECT_FALSE(exact.retry_requirement().has_value());
    EXPECT_EQ(render(exact),
              "error attempting to read all: found 6 bytes when exactly 0 bytes was expected");

    wary::LengthShortfall range{
        .min = 2,
        .max = 4,
        .context = wary::Context::from(wary::Operation::take, sub(0, 1)),
        .input = input(wary::Bound::start),
    };
    EXPECT_EQ(render(range),
              "error attempting to take: found 1 bytes when between 2 and 4 bytes was expected");
}

// Test 4: Invalid values are retryable only if the producer said so
TEST_F(ErrorKindTest, InvalidValueRetry) {
    wary::InvalidValue fatal{
        .context = wary::Context::from(wary::Operation::verify, sub(0, 1), "a digit"),
        .input = input(wary::Bound::start),
    };
    EXPECT_TRUE(fatal.is_fatal());
    EXPECT_EQ(render(fatal), "error attempting to verify: expected a digit");

    wary::InvalidValue retry{
        .retry = wary::RetryRequirement::create(2),
        .context = wary::Context::from(wary::Operation::verify, sub(0, 1), "a digit"),
        .input = input(wary::Bound::start),
    };
    EXPECT_FALSE(retry.is_fatal());
    EXPECT_EQ(retry.retry_requirement()->count(), 2u);

    retry.input = input(wary::Bound::both);
    EXPECT_TRUE(retry.is_fatal());
}

// Test 5: The minimal error keeps only the retry requirement
TEST(InvalidTest, Messages) {
    EXPECT_EQ(render(wary::Invalid::fatal()), "invalid input");
    EXPECT_EQ(render(wary::Invalid::retry_after(1)),
              "invalid input: needs 1 byte more to continue processing");
    EXPECT_EQ(render(wary::Invalid::retry_after(3)),
              "invalid input: needs 3 bytes more to continue processing");
    EXPECT_TRUE(wary::Invalid::retry_after(0).is_fatal());
    EXPECT_EQ(wary::Invalid::retry_after(2), wary::Invalid::retry_after(2));
}

// Test 6: Converting a verbose error keeps its retry requirement
TEST(InvalidTest, FromVerboseError) {
    auto in = wary::input(wary::bytes_of("hel"));
    auto parts = in.split_prefix<Error>("hello");
    ASSERT_FALSE(parts.has_value());

    wary::Invalid minimal(parts.error());
    EXPECT_FALSE(minimal.is_fatal());
    EXPECT_EQ(minimal.retry_requirement()->count(), 2u);
}

TEST(FatalTest, NeverRetryable) {
    wary::Fatal err;
    EXPECT_TRUE(err.is_fatal());
    EXPECT_FALSE(err.retry_requirement().has_value());
    EXPECT_EQ(render(err), "invalid input");
}

// Test 7: The wider input replaces the error's input only if it contains it
TEST(VerboseErrorTest, AttachInput) {
    std::string_view text = "abcdef";
    std::string_view other = "zzzzzz";
    auto whole = wary::input(wary::bytes_of(text));
    auto parts = whole.split_at<Error>(3);
    ASSERT_TRUE(parts.has_value());

    auto failed = parts->second.split_at<Error>(5);
    ASSERT_FALSE(failed.has_value());
    Error err = failed.error();
    EXPECT_EQ(err.input().len(), 3u);

    err.attach_input(wary::input(wary::bytes_of(other)).into_maybe_string());
    EXPECT_EQ(err.input().len(), 3u);

    err.attach_input(whole.into_maybe_string());
    EXPECT_EQ(err.input().len(), 6u);
    EXPECT_TRUE(err.span().is_within(err.input().span()));
}

// Test 8: Descriptions follow the primitive error kind
TEST(VerboseErrorTest, Descriptions) {
    auto mismatch = wary::input(wary::bytes_of("help")).split_prefix<Error>("hello");
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_STREQ(mismatch.error().message(), "value mismatch");
    EXPECT_EQ(render(mismatch.error()),
              "error attempting to consume: found a different value to the exact expected");
    ASSERT_TRUE(mismatch.error().expected().has_value());
    EXPECT_EQ(render(*mismatch.error().expected()), "\"hello\"");

    auto short_input = wary::input(wary::bytes_of("he")).split_prefix<Error>("hello");
    ASSERT_FALSE(short_input.has_value());
    EXPECT_EQ(render(short_input.error()),
              "error attempting to consume: not enough input to match expected value");
}

// Test 9: Expected values render by kind
TEST(ValueTest, Rendering) {
    const std::array<uint8_t, 2> magic{0xCA, 0xFE};
    EXPECT_EQ(render(wary::Value::byte(0x41)), "0x41");
    EXPECT_EQ(render(wary::Value::character(U'c')), "'c'");
    EXPECT_EQ(render(wary::Value::bytes(magic)), "[ca fe]");
    EXPECT_EQ(render(wary::Value::string("text")), "\"text\"");
    EXPECT_EQ(wary::Value::character(U'\u00E9').len(), 2u);
}

// Test 10: Contexts print their expectation if they have one
TEST(ContextTest, Rendering) {
    EXPECT_EQ(render(wary::Context{.operation = "decode header"}), "decode header");
    EXPECT_EQ(render(wary::Context::from(wary::Operation::consume, std::nullopt, "exact value")),
              "consume (expected exact value)");
    EXPECT_TRUE(wary::Context{.operation = "x"}.as_child().child);
    EXPECT_STREQ(wary::operation_string(wary::Operation::read_number), "read number");
}
