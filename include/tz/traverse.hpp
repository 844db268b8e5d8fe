// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_TRAVERSE_HPP
#define TZ_TRAVERSE_HPP

// Higher-order traversal drivers over tz::cursor.
//
// All drivers walk in depth-first pre-order using cursor::next() and accept:
// - a root cursor: the whole tree is walked and the result is the end cursor
//   (top of the rebuilt tree, is_end() == true);
// - an end cursor: the walk restarts from the top;
// - an inner cursor: only its subtree is walked, and the rebuilt subtree is
//   put back with one replace() at the original position.
//
// The visitor receives each cursor by const reference and returns the cursor
// to continue from, so it may edit the current node (update, replace,
// append_child, ...) before the walk moves on.
//
// Example usage:
//   auto doubled = tz::map(c, [](const node& n) { return twice(n); });
//   auto [done, count] = tz::traverse(c, 0, [](const auto& z, int n) {
//       return std::pair{z, n + 1};
//   });
//   auto until = tz::traverse_while(c, [](const auto& z) {
//       return stop_here(z) ? tz::halt(z) : tz::cont(z);
//   });

#include "tz/config.hpp"
#include "tz/cursor.hpp"
#include "tz/profiling.hpp"

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace tz {

// What traverse_while does after a visit.
enum class step_action : std::uint8_t {
    cont,  // Continue with next(): descend, then siblings, then ancestors.
    skip,  // Continue without descending into the current node.
    halt   // Stop the entire walk; the result is the end cursor at the top.
};

// Visitor result for traverse_while.  Build it with tz::cont, tz::skip or
// tz::halt.
template <typename Cursor, typename Acc = void>
struct step {
    step_action action;
    Cursor cursor;
    Acc acc;
};

template <typename Cursor>
struct step<Cursor, void> {
    step_action action;
    Cursor cursor;
};

template <typename Node, typename Cap>
[[nodiscard]] step<cursor<Node, Cap>> cont(cursor<Node, Cap> c) {
    return {step_action::cont, std::move(c)};
}

template <typename Node, typename Cap>
[[nodiscard]] step<cursor<Node, Cap>> skip(cursor<Node, Cap> c) {
    return {step_action::skip, std::move(c)};
}

template <typename Node, typename Cap>
[[nodiscard]] step<cursor<Node, Cap>> halt(cursor<Node, Cap> c) {
    return {step_action::halt, std::move(c)};
}

template <typename Node, typename Cap, typename Acc>
[[nodiscard]] step<cursor<Node, Cap>, std::decay_t<Acc>> cont(cursor<Node, Cap> c, Acc&& acc) {
    return {step_action::cont, std::move(c), std::forward<Acc>(acc)};
}

template <typename Node, typename Cap, typename Acc>
[[nodiscard]] step<cursor<Node, Cap>, std::decay_t<Acc>> skip(cursor<Node, Cap> c, Acc&& acc) {
    return {step_action::skip, std::move(c), std::forward<Acc>(acc)};
}

template <typename Node, typename Cap, typename Acc>
[[nodiscard]] step<cursor<Node, Cap>, std::decay_t<Acc>> halt(cursor<Node, Cap> c, Acc&& acc) {
    return {step_action::halt, std::move(c), std::forward<Acc>(acc)};
}

namespace detail {

    template <typename Cursor, typename F>
    Cursor walk(Cursor z, F& f, profiler& prof) {
        while (!z.is_end()) {
            prof.visit();
            Cursor visited = std::invoke(f, std::as_const(z));
            z = visited.next();
        }
        return z;
    }

    template <typename Cursor, typename Acc, typename F>
    std::pair<Cursor, Acc> walk(Cursor z, Acc acc, F& f, profiler& prof) {
        while (!z.is_end()) {
            prof.visit();
            std::pair<Cursor, Acc> visited = std::invoke(f, std::as_const(z), std::move(acc));
            acc = std::move(visited.second);
            z = visited.first.next();
        }
        return {std::move(z), std::move(acc)};
    }

    template <typename Cursor>
    struct bounded_walk {
        Cursor cursor;
        bool halted;
    };

    template <typename Cursor, typename F>
    bounded_walk<Cursor> walk_while(Cursor z, F& f, profiler& prof) {
        while (!z.is_end()) {
            prof.visit();
            step<Cursor> s = std::invoke(f, std::as_const(z));
            switch (s.action) {
                case step_action::cont:
                    z = s.cursor.next();
                    break;
                case step_action::skip:
                    z = s.cursor.skip_subtree();
                    break;
                case step_action::halt:
                    return {s.cursor.to_end(), true};
            }
        }
        return {std::move(z), false};
    }

    template <typename Cursor, typename Acc, typename F>
    std::pair<bounded_walk<Cursor>, Acc> walk_while(Cursor z, Acc acc, F& f, profiler& prof) {
        while (!z.is_end()) {
            prof.visit();
            step<Cursor, Acc> s = std::invoke(f, std::as_const(z), std::move(acc));
            acc = std::move(s.acc);
            switch (s.action) {
                case step_action::cont:
                    z = s.cursor.next();
                    break;
                case step_action::skip:
                    z = s.cursor.skip_subtree();
                    break;
                case step_action::halt:
                    return {bounded_walk<Cursor>{s.cursor.to_end(), true}, std::move(acc)};
            }
        }
        return {bounded_walk<Cursor>{std::move(z), false}, std::move(acc)};
    }

    // Puts the result of a bounded walk back into the enclosing tree.  A halt
    // ends the whole walk, not just the subtree.
    template <typename Cursor>
    Cursor splice(const Cursor& origin, const bounded_walk<Cursor>& result) {
        Cursor spliced = origin.replace(result.cursor.node());
        if (result.halted) return spliced.to_end();
        return spliced;
    }

    template <typename Cursor, typename F>
    Cursor traverse(const Cursor& c, F& f, const char* label) {
        profiler prof(label);
        if (c.is_top()) return walk(c.subtree(), f, prof);
        Cursor done = walk(c.subtree(), f, prof);
        return c.replace(done.node());
    }

}  // namespace detail

// Visits every node of the tree (or subtree) in pre-order.
// f: (const cursor&) -> cursor
template <typename Node, typename Cap, typename F>
    requires std::convertible_to<std::invoke_result_t<F&, const cursor<Node, Cap>&>, cursor<Node, Cap>>
[[nodiscard]] cursor<Node, Cap> traverse(const cursor<Node, Cap>& c, F&& f) {
    return detail::traverse(c, f, "tz::traverse");
}

// Visits every node in pre-order threading an accumulator.
// f: (const cursor&, Acc) -> std::pair<cursor, Acc>
template <typename Node, typename Cap, typename Acc, typename F>
    requires std::convertible_to<std::invoke_result_t<F&, const cursor<Node, Cap>&, Acc>,
                                 std::pair<cursor<Node, Cap>, Acc>>
[[nodiscard]] std::pair<cursor<Node, Cap>, Acc> traverse(const cursor<Node, Cap>& c, Acc acc, F&& f) {
    using C = cursor<Node, Cap>;
    profiler prof("tz::traverse");
    if (c.is_top()) return detail::walk(c.subtree(), std::move(acc), f, prof);
    auto [done, out] = detail::walk(c.subtree(), std::move(acc), f, prof);
    return std::pair<C, Acc>(c.replace(done.node()), std::move(out));
}

// Replaces every node by f(node).
// f: (const Node&) -> Node
template <typename Node, typename Cap, typename F>
    requires std::convertible_to<std::invoke_result_t<F&, const Node&>, Node>
[[nodiscard]] cursor<Node, Cap> map(const cursor<Node, Cap>& c, F&& f) {
    auto visit = [&f](const cursor<Node, Cap>& z) { return z.update(f); };
    return detail::traverse(c, visit, "tz::map");
}

// Pre-order walk with early exit.
// f: (const cursor&) -> tz::step<cursor>
//
// cont advances with next(), skip leaves the current node's children
// unvisited, and halt stops immediately.  A halt ends the entire walk even
// when only a subtree was being traversed: the result is then the end cursor
// at the top of the whole rebuilt tree.
template <typename Node, typename Cap, typename F>
    requires std::convertible_to<std::invoke_result_t<F&, const cursor<Node, Cap>&>, step<cursor<Node, Cap>>>
[[nodiscard]] cursor<Node, Cap> traverse_while(const cursor<Node, Cap>& c, F&& f) {
    profiler prof("tz::traverse_while");
    if (c.is_top()) return detail::walk_while(c.subtree(), f, prof).cursor;
    return detail::splice(c, detail::walk_while(c.subtree(), f, prof));
}

// Pre-order walk with early exit, threading an accumulator.
// f: (const cursor&, Acc) -> tz::step<cursor, Acc>
template <typename Node, typename Cap, typename Acc, typename F>
    requires std::convertible_to<std::invoke_result_t<F&, const cursor<Node, Cap>&, Acc>,
                                 step<cursor<Node, Cap>, Acc>>
[[nodiscard]] std::pair<cursor<Node, Cap>, Acc> traverse_while(const cursor<Node, Cap>& c, Acc acc, F&& f) {
    using C = cursor<Node, Cap>;
    profiler prof("tz::traverse_while");
    auto [result, out] = detail::walk_while(c.subtree(), std::move(acc), f, prof);
    if (c.is_top()) return std::pair<C, Acc>(std::move(result.cursor), std::move(out));
    return std::pair<C, Acc>(detail::splice(c, result), std::move(out));
}

// First cursor at or after c, in pre-order, for which pred holds.  Empty once
// the walk reaches the end state.
template <typename Node, typename Cap, typename Pred>
    requires std::predicate<Pred&, const cursor<Node, Cap>&>
[[nodiscard]] std::optional<cursor<Node, Cap>> find(const cursor<Node, Cap>& c, Pred&& pred) {
    profiler prof("tz::find");
    cursor<Node, Cap> z = c;
    while (!z.is_end()) {
        prof.visit();
        if (std::invoke(pred, std::as_const(z))) return z;
        z = z.next();
    }
    return std::nullopt;
}

}  // namespace tz

#endif  // TZ_TRAVERSE_HPP
