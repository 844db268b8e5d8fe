// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_CURSOR_HPP
#define TZ_CURSOR_HPP

// Immutable tree cursor (Huet's zipper).

#include "tz/config.hpp"
#include "tz/alloc_hooks.hpp"
#include "tz/capability.hpp"
#include "tz/persistent_list.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tz {

// Where a cursor sits relative to the rest of the tree.
enum class path_state : std::uint8_t {
    root,    // No parent context.
    parent,  // Holds the breadcrumb of its parent.
    end      // Depth-first traversal has completed; root-level.
};

// A position inside an immutable tree.
//
// A cursor holds the focused node, its siblings, and a breadcrumb: the
// parent's own cursor, as it was when this cursor descended from it.  The
// parent node is only rebuilt, through Capability::make_node, when the cursor
// moves back up, so a chain of edits deep in the tree costs nothing until the
// root is requested.
//
// Layout:
//
//   _loc    -- focused node.
//   _left   -- siblings before _loc, nearest first.
//   _right  -- siblings after _loc, in tree order.
//   _path   -- parent breadcrumb (set iff _state == path_state::parent).
//   _state  -- root / parent / end.
//   _cap    -- capability in effect, fixed at creation.
//
// Invariant: reverse(_left) ++ [_loc] ++ _right is the child sequence of the
// parent node, and up() rebuilds the parent as
// make_node(parent.location, reverse(_left) ++ [_loc] ++ _right).
//
// Cursors are values.  Every move or edit returns a new cursor and never
// touches the one it was called on; sibling lists and breadcrumbs are
// immutable and shared between the cursors derived from them.
//
// Failure reporting:
// - moves without a target (up at the root, left/right past an edge, down on
//   a leaf) return an empty std::optional.
// - edits that have no meaning at the root (remove, insert_left,
//   insert_right) throw std::invalid_argument.
//
// Example usage:
//   tz::cursor<my_node, my_capability> c(tree);
//   auto child = c.down();                       // std::optional<cursor>
//   if (child) tree = child->replace(x).root();  // rebuilt tree
template <typename Node, typename Capability = zipable_capability<Node>>
    requires std::copyable<Node> && tree_capability<Capability, Node>
class cursor {
public:
    using node_type = Node;
    using capability_type = Capability;
    using sibling_list = persistent_list<Node>;
    using size_type = std::size_t;

    // ========== Constructors ==========

    // Wraps a tree value: depth 0, no siblings, path_state::root.
    explicit cursor(Node tree, Capability cap = Capability())
        : _loc(std::move(tree)), _cap(std::move(cap)) {}

    cursor(const cursor&) = default;
    cursor(cursor&&) noexcept = default;
    cursor& operator=(const cursor&) = default;
    cursor& operator=(cursor&&) noexcept = default;

    ~cursor() { _release_path(); }

    // ========== Observers ==========

    [[nodiscard]] const Node& node() const noexcept { return _loc; }
    [[nodiscard]] path_state state() const noexcept { return _state; }
    [[nodiscard]] bool is_root() const noexcept { return _state == path_state::root; }
    [[nodiscard]] bool is_end() const noexcept { return _state == path_state::end; }

    // True for root and end cursors, i.e. when there is nothing above.
    [[nodiscard]] bool is_top() const noexcept { return _state != path_state::parent; }

    [[nodiscard]] const sibling_list& left_siblings() const noexcept { return _left; }
    [[nodiscard]] const sibling_list& right_siblings() const noexcept { return _right; }

    // Breadcrumb of the parent, or nullptr at the top.
    [[nodiscard]] const cursor* parent() const noexcept { return _path.get(); }

    [[nodiscard]] const Capability& capability() const noexcept { return _cap; }

    // Number of breadcrumbs between this cursor and the top.
    [[nodiscard]] size_type depth() const noexcept {
        size_type d = 0;
        for (const cursor* p = _path.get(); p; p = p->_path.get()) ++d;
        return d;
    }

    [[nodiscard]] bool is_branch() const { return _cap.is_branch(_loc); }
    [[nodiscard]] std::vector<Node> children() const { return _cap.children(_loc); }
    [[nodiscard]] Node make_node(std::vector<Node> kids) const {
        return _cap.make_node(_loc, std::move(kids));
    }

    // The current node as a fresh root: siblings and path dropped.  Used to
    // run a bounded traversal over one subtree.
    [[nodiscard]] cursor subtree() const {
        return cursor(_loc, _cap);
    }

    // Climbs to the top, rebuilding every ancestor.  Root and end cursors are
    // returned unchanged.
    [[nodiscard]] cursor top() const {
        cursor c = *this;
        while (c._state == path_state::parent) {
            c = c._ascend();
        }
        return c;
    }

    // The fully rebuilt tree.
    [[nodiscard]] Node root() const {
        if (_state != path_state::parent) return _loc;
        return top()._loc;
    }

    // ========== Navigation ==========

    // First child.  Empty if the node is not a branch or has no children.
    [[nodiscard]] std::optional<cursor> down() const {
        if (!_cap.is_branch(_loc)) return std::nullopt;
        std::vector<Node> kids = _cap.children(_loc);
        if (kids.empty()) return std::nullopt;

        cursor child(std::move(kids.front()), _cap);
        kids.erase(kids.begin());
        child._right = sibling_list::from_vector(std::move(kids));
        child._path = _make_breadcrumb();
        child._state = path_state::parent;
        return child;
    }

    // Parent, rebuilt from the current sibling context.  Empty at the top.
    [[nodiscard]] std::optional<cursor> up() const {
        if (_state != path_state::parent) return std::nullopt;
        return _ascend();
    }

    [[nodiscard]] std::optional<cursor> left() const {
        if (_left.empty()) return std::nullopt;
        cursor c = *this;
        c._loc = _left.front();
        c._left = _left.pop_front();
        c._right = _right.push_front(_loc);
        return c;
    }

    [[nodiscard]] std::optional<cursor> right() const {
        if (_right.empty()) return std::nullopt;
        cursor c = *this;
        c._loc = _right.front();
        c._right = _right.pop_front();
        c._left = _left.push_front(_loc);
        return c;
    }

    // First sibling; *this when already there.
    [[nodiscard]] cursor leftmost() const {
        if (_left.empty()) return *this;
        // _left is [l1, ..., lk] nearest first; lk becomes the focus and
        // l(k-1) ... l1, _loc are pushed onto the right list in that order.
        sibling_list right = _right.push_front(_loc);
        auto it = _left.begin();
        for (size_type i = 1; i < _left.size(); ++i, ++it) {
            right = right.push_front(*it);
        }
        cursor c = *this;
        c._loc = *it;
        c._left = sibling_list();
        c._right = std::move(right);
        return c;
    }

    // Last sibling; *this when already there.
    [[nodiscard]] cursor rightmost() const {
        if (_right.empty()) return *this;
        sibling_list left = _left.push_front(_loc);
        auto it = _right.begin();
        for (size_type i = 1; i < _right.size(); ++i, ++it) {
            left = left.push_front(*it);
        }
        cursor c = *this;
        c._loc = *it;
        c._right = sibling_list();
        c._left = std::move(left);
        return c;
    }

    // ========== Depth-first linearisation ==========

    // Next node in pre-order.  After the last node the cursor returns to the
    // top with path_state::end; next() on an end cursor returns it unchanged.
    [[nodiscard]] cursor next() const {
        if (_state == path_state::end) return *this;
        if (auto child = down()) return std::move(*child);
        return skip_subtree();
    }

    // Like next(), but never descends into the current node: moves to the
    // right sibling, or to the right sibling of the nearest ancestor that has
    // one, or to the end state.
    [[nodiscard]] cursor skip_subtree() const {
        if (_state == path_state::end) return *this;
        cursor c = *this;
        for (;;) {
            if (auto r = c.right()) return std::move(*r);
            if (c._state != path_state::parent) {
                c._state = path_state::end;
                return c;
            }
            c = c._ascend();
        }
    }

    // Previous node in pre-order.  From the end state this is the last node
    // of the tree; at the root there is none.
    [[nodiscard]] std::optional<cursor> prev() const {
        if (_state == path_state::end) {
            cursor c = *this;
            c._state = path_state::root;
            return c._descend_last();
        }
        if (auto l = left()) return l->_descend_last();
        return up();
    }

    // The top of the tree, marked as end of traversal.
    [[nodiscard]] cursor to_end() const {
        cursor c = top();
        c._state = path_state::end;
        return c;
    }

    // ========== Structural edits ==========

    [[nodiscard]] cursor replace(Node node) const {
        cursor c = *this;
        c._loc = std::move(node);
        return c;
    }

    template <typename F>
        requires std::invocable<F&, const Node&>
    [[nodiscard]] cursor update(F&& f) const {
        return replace(std::invoke(f, _loc));
    }

    // Removes the current node.  The new focus is the node that preceded it
    // in pre-order: the rightmost leaf under the left sibling, or the parent
    // (rebuilt without the node) when there is no left sibling.
    [[nodiscard]] cursor remove() const {
        if (TZ_UNLIKELY(_state != path_state::parent)) {
            throw std::invalid_argument("tz::cursor::remove: cannot remove the root node");
        }
        if (_left.empty()) {
            cursor p = *_path;
            p._loc = _cap.make_node(_path->_loc, _right.to_vector());
            return p;
        }
        cursor c = *this;
        c._loc = _left.front();
        c._left = _left.pop_front();
        return c._descend_last();
    }

    [[nodiscard]] cursor insert_left(Node node) const {
        if (TZ_UNLIKELY(_state != path_state::parent)) {
            throw std::invalid_argument("tz::cursor::insert_left: cannot insert a sibling at the root");
        }
        cursor c = *this;
        c._left = _left.push_front(std::move(node));
        return c;
    }

    [[nodiscard]] cursor insert_right(Node node) const {
        if (TZ_UNLIKELY(_state != path_state::parent)) {
            throw std::invalid_argument("tz::cursor::insert_right: cannot insert a sibling at the root");
        }
        cursor c = *this;
        c._right = _right.push_front(std::move(node));
        return c;
    }

    // Adds a last child.  A node without children is rebuilt as
    // make_node(node, {child}).
    [[nodiscard]] cursor append_child(Node child) const {
        if (auto first = down()) {
            cursor c = std::move(*first);
            c._right = c._right.push_back(std::move(child));
            return c._ascend();
        }
        return replace(_promote(std::move(child)));
    }

    // Adds a first child.  A node without children is rebuilt as
    // make_node(node, {child}).
    [[nodiscard]] cursor insert_child(Node child) const {
        if (auto first = down()) {
            cursor c = std::move(*first);
            c._left = c._left.push_front(std::move(child));
            return c._ascend();
        }
        return replace(_promote(std::move(child)));
    }

    // ========== Comparison ==========

    // Same node, same siblings, same path.  Capabilities are not compared.
    friend bool operator==(const cursor& a, const cursor& b)
        requires std::equality_comparable<Node>
    {
        const cursor* x = &a;
        const cursor* y = &b;
        while (x != y) {
            if (x->_state != y->_state) return false;
            if (!(x->_loc == y->_loc)) return false;
            if (!(x->_left == y->_left) || !(x->_right == y->_right)) return false;
            if (x->_state != path_state::parent) return true;
            x = x->_path.get();
            y = y->_path.get();
        }
        return true;
    }

private:
    using breadcrumb = std::shared_ptr<const cursor>;

    [[nodiscard]] breadcrumb _make_breadcrumb() const {
        return std::allocate_shared<cursor>(pool_alloc<cursor>{}, *this);
    }

    // reverse(_left) ++ [_loc] ++ _right
    [[nodiscard]] std::vector<Node> _sibling_sequence() const {
        std::vector<Node> kids = _left.to_vector();
        std::reverse(kids.begin(), kids.end());
        kids.reserve(kids.size() + 1 + _right.size());
        kids.push_back(_loc);
        for (const Node& n : _right) kids.push_back(n);
        return kids;
    }

    // Precondition: _state == path_state::parent.
    [[nodiscard]] cursor _ascend() const {
        cursor p = *_path;
        p._loc = _cap.make_node(_path->_loc, _sibling_sequence());
        return p;
    }

    // Last node in pre-order of the current subtree.
    [[nodiscard]] cursor _descend_last() const {
        cursor c = *this;
        while (auto child = c.down()) {
            c = child->rightmost();
        }
        return c;
    }

    [[nodiscard]] Node _promote(Node child) const {
        std::vector<Node> kids;
        kids.push_back(std::move(child));
        return _cap.make_node(_loc, std::move(kids));
    }

    // Drops uniquely owned breadcrumbs one at a time so that discarding a
    // very deep cursor does not recurse once per level.
    void _release_path() noexcept {
        breadcrumb p = std::move(_path);
        while (p && p.use_count() == 1) {
            breadcrumb next = std::move(const_cast<cursor&>(*p)._path);
            p = std::move(next);
        }
    }

    Node _loc;
    sibling_list _left{};
    sibling_list _right{};
    breadcrumb _path{};
    path_state _state = path_state::root;
    [[no_unique_address]] Capability _cap;
};

}  // namespace tz

#endif  // TZ_CURSOR_HPP
