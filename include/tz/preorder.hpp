// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_PREORDER_HPP
#define TZ_PREORDER_HPP

// Pre-order sequence view over a cursor.
//
// tz::preorder(c) yields the focused node of c, then of c.next(), and so on
// until the end state.  From a root cursor this is every node of the tree;
// from an inner cursor it is the rest of the tree in pre-order, not just the
// subtree.  The view is a single-pass input range and works with range-for
// and the <algorithm> ranges overloads:
//
//   for (const auto& n : tz::preorder(c)) { ... }
//   auto count = std::ranges::distance(tz::preorder(c));
//   bool has = std::ranges::find(tz::preorder(c), x) != std::default_sentinel;

#include "tz/config.hpp"
#include "tz/cursor.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace tz {

template <typename Cursor>
class preorder_view {
public:
    using node_type = typename Cursor::node_type;

    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type = node_type;
        using difference_type = std::ptrdiff_t;
        using reference = const node_type&;

        iterator() = default;
        explicit iterator(Cursor c) : _cur(std::move(c)) {}

        reference operator*() const noexcept { return _cur->node(); }

        iterator& operator++() {
            _cur = _cur->next();
            return *this;
        }
        void operator++(int) { ++*this; }

        // The cursor the iterator currently stands on.
        [[nodiscard]] const Cursor& position() const noexcept { return *_cur; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return !it._cur || it._cur->is_end();
        }

    private:
        std::optional<Cursor> _cur;
    };

    explicit preorder_view(Cursor start) : _start(std::move(start)) {}

    [[nodiscard]] iterator begin() const { return iterator(_start); }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

private:
    Cursor _start;
};

template <typename Node, typename Cap>
[[nodiscard]] preorder_view<cursor<Node, Cap>> preorder(cursor<Node, Cap> c) {
    return preorder_view<cursor<Node, Cap>>(std::move(c));
}

}  // namespace tz

#endif  // TZ_PREORDER_HPP
