#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <wary.hpp>

using FullError = wary::VerboseError<wary::FullBacktrace>;
using RootError = wary::VerboseError<wary::RootBacktrace>;

namespace {

struct Frame {
    size_t depth;
    std::string operation;
    bool child;

    bool operator==(const Frame&) const = default;
};

std::vector<Frame> frames(const wary::Details& err) {
    std::vector<Frame> out;
    err.walk_backtrace([&out](size_t depth, const wary::Context& context) {
        out.push_back(Frame{depth, std::string(context.operation), context.child});
        return true;
    });
    return out;
}

// Parses "x" nested two scopes deep
template <typename E>
wary::expected<void, E> nested(wary::BytesReader<E>& r) {
    return r.context("A", [](wary::BytesReader<E>& r) {
        return r.context("B", [](wary::BytesReader<E>& r) { return r.consume('x'); });
    });
}

// Foreign parser failing with a backtrace of its own
struct NumberError : wary::External {
    void push_backtrace(wary::ContextSink& sink) const override {
        sink.push(wary::Context{.operation = "parse number", .expected = "digit"});
    }
};

wary::expected<std::pair<size_t, int>, NumberError> parse_number(const wary::Bytes&) {
    return wary::unexpected(NumberError{});
}

} // namespace

// Test 1: The full strategy records every scope, outermost first
TEST(BacktraceTest, FullOrdering) {
    auto result = wary::read_all<FullError>(wary::input(wary::bytes_of("y")), nested<FullError>);
    ASSERT_FALSE(result.has_value());

    const auto& err = result.error();
    EXPECT_EQ(err.backtrace_count(), 4u);
    EXPECT_EQ(err.root_context().operation, "consume");

    std::vector<Frame> expected{
        {1, "read all", false},
        {2, "A", false},
        {3, "B", false},
        {4, "consume", false},
    };
    EXPECT_EQ(frames(err), expected);
}

// Test 2: The root strategy keeps only the failing primitive
TEST(BacktraceTest, RootOnly) {
    auto result = wary::read_all<RootError>(wary::input(wary::bytes_of("y")), nested<RootError>);
    ASSERT_FALSE(result.has_value());

    const auto& err = result.error();
    EXPECT_EQ(err.backtrace_count(), 1u);
    std::vector<Frame> expected{{1, "consume", false}};
    EXPECT_EQ(frames(err), expected);
}

// Test 3: Both strategies agree on everything but the backtrace
TEST(BacktraceTest, StrategiesAgree) {
    auto in = wary::input(wary::bytes_of("y"));
    auto full = wary::read_all<FullError>(in, nested<FullError>);
    auto root = wary::read_all<RootError>(in, nested<RootError>);
    ASSERT_FALSE(full.has_value());
    ASSERT_FALSE(root.has_value());

    EXPECT_EQ(full.error().span(), root.error().span());
    EXPECT_EQ(full.error().input().span(), root.error().input().span());
    EXPECT_EQ(full.error().retry_requirement(), root.error().retry_requirement());
}

// Test 4: A walker returning false stops the walk
TEST(BacktraceTest, WalkStops) {
    auto result = wary::read_all<FullError>(wary::input(wary::bytes_of("y")), nested<FullError>);
    ASSERT_FALSE(result.has_value());

    size_t visited = 0;
    bool completed = result.error().walk_backtrace([&visited](size_t, const wary::Context&) {
        ++visited;
        return visited < 2;
    });
    EXPECT_FALSE(completed);
    EXPECT_EQ(visited, 2u);
}

// Test 5: Contexts from an external error follow their parent frame
TEST(BacktraceTest, ExternalChildren) {
    auto result = wary::read_all<FullError>(
        wary::input(wary::bytes_of("12")), [](wary::BytesReader<FullError>& r) {
            return r.context("outer", [](wary::BytesReader<FullError>& r) {
                return r.try_external("number", parse_number);
            });
        });
    ASSERT_FALSE(result.has_value());

    std::vector<Frame> expected{
        {1, "read all", false},
        {2, "outer", false},
        {3, "read external", false},
        {3, "parse number", true},
    };
    EXPECT_EQ(frames(result.error()), expected);
}

// Test 6: Pushing onto the strategies directly
TEST(BacktraceTest, DirectPush) {
    auto root = wary::Context{.operation = "root"};
    auto full = wary::FullBacktrace::from_root(root);
    full.push(wary::Context{.operation = "outer"});
    EXPECT_EQ(full.count(), 2u);
    ASSERT_EQ(full.stack().size(), 1u);
    EXPECT_EQ(full.stack()[0].operation, "outer");

    auto only_root = wary::RootBacktrace::from_root(root);
    only_root.push(wary::Context{.operation = "outer"});
    EXPECT_EQ(only_root.count(), 1u);
    EXPECT_EQ(only_root.root().operation, "root");
}
