#pragma once

#include <concepts>
#include <vector>

#include <cstddef>

#include "context.hpp"

namespace wary {

/**
 * @brief Interface shared by the backtrace strategies
 *
 * A backtrace is created from the root context of the failing primitive and
 * receives a push for every enclosing scope the error propagates through,
 * innermost first. walk() visits frames from the outermost scope down to the
 * root; the visitor returns false to stop.
 */
template <typename T>
concept Backtrace = requires(T& mut, const T& trace, const Context& ctx,
                             bool (*walker)(size_t, const Context&)) {
    { T::from_root(ctx) } -> std::same_as<T>;
    { mut.push(ctx) } -> std::same_as<void>;
    { trace.root() } -> std::convertible_to<const Context&>;
    { trace.count() } -> std::same_as<size_t>;
    { trace.walk(walker) } -> std::same_as<bool>;
};

/**
 * @brief Backtrace that keeps only the root context
 *
 * Pushes are discarded so propagating an error through any number of scopes
 * costs nothing.
 */
class RootBacktrace {
public:
    static constexpr bool passthrough = true;

    [[nodiscard]] static RootBacktrace from_root(const Context& root) noexcept {
        return RootBacktrace(root);
    }

    void push(const Context&) noexcept {}

    [[nodiscard]] const Context& root() const noexcept { return root_; }

    [[nodiscard]] size_t count() const noexcept { return 1; }

    template <typename F>
    bool walk(F&& f) const {
        return f(size_t{1}, root_);
    }

private:
    explicit RootBacktrace(const Context& root) noexcept : root_(root) {}

    Context root_;
};

/**
 * @brief Backtrace that keeps every pushed context
 *
 * Frames are stored flat in push order. Child frames contributed by an
 * external error are reported at the depth of the next non-child frame below
 * them (its parent), directly after the parent.
 */
class FullBacktrace {
public:
    static constexpr bool passthrough = false;

    [[nodiscard]] static FullBacktrace from_root(const Context& root) {
        return FullBacktrace(root);
    }

    void push(const Context& context) { stack_.push_back(context); }

    [[nodiscard]] const Context& root() const noexcept { return root_; }

    [[nodiscard]] size_t count() const noexcept { return stack_.size() + 1; }

    [[nodiscard]] const std::vector<Context>& stack() const noexcept { return stack_; }

    template <typename F>
    bool walk(F&& f) const {
        // Outermost first: reverse push order, root last.
        std::vector<const Context*> items;
        items.reserve(stack_.size() + 1);
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            items.push_back(&*it);
        }
        items.push_back(&root_);

        std::vector<const Context*> children;
        for (const Context* item : items) {
            if (item->child) {
                children.push_back(item);
            }
        }

        size_t depth = 0;
        size_t next_child = 0;
        size_t children_skipped = 0;
        for (const Context* item : items) {
            if (item->child) {
                ++children_skipped;
                continue;
            }
            ++depth;
            if (!f(depth, *item)) {
                return false;
            }
            for (; children_skipped > 0; --children_skipped) {
                if (!f(depth, *children[next_child++])) {
                    return false;
                }
            }
        }
        return true;
    }

private:
    explicit FullBacktrace(const Context& root) : root_(root) {}

    Context root_;
    std::vector<Context> stack_;
};

static_assert(Backtrace<RootBacktrace>);
static_assert(Backtrace<FullBacktrace>);

} // namespace wary
