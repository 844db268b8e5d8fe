#include <tz/cursor.hpp>
#include "support/tree_node.hpp"
#include "support/tuple_tree.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

using support::from_term;
using support::node;
using support::term;
using support::zip;

namespace {

// Message of the std::invalid_argument thrown by fn, or "" if none was thrown.
template <typename Fn>
std::string invalid_argument_message(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
    return "";
}

}  // namespace

int main() {
    // replace / update
    {
        term tree = node(1, {11, node(12, {21, 22}), 13});
        auto c = zip(tree).down()->right().value();
        TEST(c.replace(node(98, {99})).root() == node(1, {11, node(98, {99}), 13}), "replace: subtree swapped");
        TEST(c.replace(7).node() == term(7), "replace: focus updated");
        TEST(c.replace(7).right_siblings().front() == term(13), "replace: siblings kept");

        auto bumped = c.update([](const term& t) { return term(t.value() + 1, t.children()); });
        TEST(bumped.root() == node(1, {11, node(13, {21, 22}), 13}), "update: applies function");
        TEST(c.node() == node(12, {21, 22}), "update: source unchanged");
    }

    // remove
    {
        term tree = node(1, {2, node(3, {4, 5})});
        auto c = zip(tree).down()->right().value();
        TEST(c.node() == node(3, {4, 5}), "remove scenario: focus");
        auto removed = c.remove();
        TEST(removed.root() == node(1, {2}), "remove scenario: subtree gone");
        TEST(removed.node() == term(2), "remove scenario: focus moves to predecessor");
    }
    {
        term tree = node(1, {11, node(12, {21, 22}), 13});
        auto middle = zip(tree).down()->right().value();
        TEST(middle.remove().top().node() == node(1, {11, 13}), "remove: middle child");

        auto last = middle.right().value();
        TEST(last.remove().node() == last.prev()->node(), "remove: selects the pre-order predecessor");
        TEST(last.remove().node() == term(22), "remove: predecessor is the rightmost leaf");
        TEST(last.remove().root() == node(1, {11, node(12, {21, 22})}), "remove: last child");

        auto first = zip(tree).down().value();
        auto up = first.remove();
        TEST(up.node() == node(1, {node(12, {21, 22}), 13}), "remove: without left sibling goes up");
        TEST(up.is_root(), "remove: parent is current");
    }
    {
        auto only = zip(node(1, {2})).down().value();
        auto parent = only.remove();
        TEST(parent.node() == node(1, {}), "remove: only child leaves an empty pair");
        TEST(!parent.down().has_value(), "remove: empty pair has no children");
    }
    {
        term tree = node(1, {11, node(12, {21, 22}), 13});
        auto root = zip(tree);
        std::string msg = invalid_argument_message([&] { (void)root.remove(); });
        TEST(msg == "tz::cursor::remove: cannot remove the root node", "remove: throws at the root");
        msg = invalid_argument_message([&] { (void)root.to_end().remove(); });
        TEST(!msg.empty(), "remove: throws at the end");
        TEST(root.node() == tree, "remove: failed call leaves cursor untouched");
    }

    // insert_left / insert_right
    {
        TEST(zip(node(1, {2})).down()->insert_right(3).top().node() == node(1, {2, 3}),
             "insert_right: after focus");
        TEST(zip(node(1, {10, 11, 13})).down()->right()->insert_right(12).top().node() ==
                 node(1, {10, 11, 12, 13}),
             "insert_right: before other right siblings");
        TEST(zip(node(1, {2})).down()->insert_left(3).top().node() == node(1, {3, 2}),
             "insert_left: before focus");
        TEST(zip(node(1, {10, 11, 13})).down()->right()->right()->insert_left(12).top().node() ==
                 node(1, {10, 11, 12, 13}),
             "insert_left: after other left siblings");

        auto c = zip(node(1, {2})).down()->insert_left(0);
        TEST(c.node() == term(2), "insert_left: focus unchanged");

        auto root = zip(node(1, {}));
        TEST(invalid_argument_message([&] { (void)root.insert_left(5); }) ==
                 "tz::cursor::insert_left: cannot insert a sibling at the root",
             "insert_left: throws at the root");
        TEST(invalid_argument_message([&] { (void)root.insert_right(5); }) ==
                 "tz::cursor::insert_right: cannot insert a sibling at the root",
             "insert_right: throws at the root");
    }

    // append_child / insert_child
    {
        auto root = zip(node(1, {2}));
        TEST(root.append_child(3).node() == node(1, {2, 3}), "append_child: last child");
        TEST(root.insert_child(3).node() == node(1, {3, 2}), "insert_child: first child");
        TEST(root.append_child(3).is_root(), "append_child: focus stays");

        TEST(root.down()->append_child(3).top().node() == node(1, {node(2, {3})}), "append_child: leaf promoted");
        TEST(root.down()->insert_child(3).top().node() == node(1, {node(2, {3})}), "insert_child: leaf promoted");

        TEST(zip(node(1, {})).append_child(3).node() == node(1, {3}), "append_child: empty pair");

        auto ended = root.to_end().append_child(3);
        TEST(ended.is_end(), "append_child: end state kept");
        TEST(ended.node() == node(1, {2, 3}), "append_child: on the end cursor");

        auto inner = zip(node(1, {node(2, {3}), 4})).down()->append_child(5);
        TEST(inner.node() == node(2, {3, 5}), "append_child: inner branch");
        TEST(inner.right_siblings().front() == term(4), "append_child: siblings kept");
    }

    // Edits through the zipable trait
    {
        using support::tree_node;
        tz::cursor<tree_node> c(from_term(node(1, {2})));
        TEST(c.append_child(tree_node{3, {}}).node() == from_term(node(1, {2, 3})), "zipable: append_child");
        TEST(c.insert_child(tree_node{3, {}}).node() == from_term(node(1, {3, 2})), "zipable: insert_child");
        TEST(c.down()->append_child(tree_node{3, {}}).top().node() == from_term(node(1, {node(2, {3})})),
             "zipable: append_child to a leaf");
        TEST(c.down()->insert_left(tree_node{3, {}}).top().node() == from_term(node(1, {3, 2})),
             "zipable: insert_left");
        TEST(c.down()->insert_right(tree_node{3, {}}).top().node() == from_term(node(1, {2, 3})),
             "zipable: insert_right");
    }

    std::cout << "\nAll edit tests passed!\n";
    return 0;
}
