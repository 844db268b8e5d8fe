#ifndef TZ_TESTS_SUPPORT_TREE_NODE_HPP
#define TZ_TESTS_SUPPORT_TREE_NODE_HPP

// A plain struct tree that opts into tz::cursor through tz::zipable.  A node
// is a branch while it has children; rebuilding keeps the value.

#include "tuple_tree.hpp"

#include <tz/capability.hpp>

#include <utility>
#include <vector>

namespace support {

struct tree_node {
    int value = 0;
    std::vector<tree_node> children;

    bool operator==(const tree_node&) const = default;
};

// Converts a tuple tree: {1, [2, 3]} becomes tree_node{1, {{2}, {3}}}.
inline tree_node from_term(const term& t) {
    tree_node n{t.value(), {}};
    for (const term& c : t.children()) n.children.push_back(from_term(c));
    return n;
}

}  // namespace support

template <>
struct tz::zipable<support::tree_node> {
    static bool is_branch(const support::tree_node& n) noexcept { return !n.children.empty(); }
    static std::vector<support::tree_node> children(const support::tree_node& n) { return n.children; }
    static support::tree_node make_node(const support::tree_node& n, std::vector<support::tree_node> kids) {
        return support::tree_node{n.value, std::move(kids)};
    }
};

#endif  // TZ_TESTS_SUPPORT_TREE_NODE_HPP
