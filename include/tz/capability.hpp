// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_CAPABILITY_HPP
#define TZ_CAPABILITY_HPP

// The capability contract between tz::cursor and a concrete tree shape.
//
// The cursor never inspects a node.  Everything it knows about the tree comes
// from three operations supplied by the caller:
//
//   is_branch(node)            -> bool
//   children(node)             -> std::vector<Node>   (only for branches)
//   make_node(node, children)  -> Node                (same kind as node)
//
// A capability is chosen once, when the cursor is created, and travels with
// it.  There are three ways to supply one:
//
// 1. A stateless struct with the three member functions, named explicitly:
//
//      struct my_capability {
//          bool is_branch(const my_node& n) const;
//          std::vector<my_node> children(const my_node& n) const;
//          my_node make_node(const my_node& n, std::vector<my_node> kids) const;
//      };
//      tz::cursor<my_node, my_capability> c(tree);
//
// 2. A specialisation of tz::zipable<Node> next to the node type.  The default
//    capability of tz::cursor<Node> forwards to it:
//
//      template <> struct tz::zipable<my_node> {
//          static bool is_branch(const my_node& n);
//          static std::vector<my_node> children(const my_node& n);
//          static my_node make_node(const my_node& n, std::vector<my_node> kids);
//      };
//      tz::cursor<my_node> c(tree);
//
// 3. A runtime-polymorphic implementation of tz::basic_capability<Node>,
//    wrapped in tz::dynamic_capability<Node>.

#include "tz/config.hpp"

#include <concepts>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tz {

template <typename C, typename Node>
concept tree_capability =
    std::copy_constructible<C> &&
    requires(const C& cap, const Node& node, std::vector<Node> kids) {
        { cap.is_branch(node) } -> std::convertible_to<bool>;
        { cap.children(node) } -> std::convertible_to<std::vector<Node>>;
        { cap.make_node(node, std::move(kids)) } -> std::convertible_to<Node>;
    };

// Trait resolved from the node type.  Left undefined: a node type
// opts in by specialising it.
template <typename Node>
struct zipable;

template <typename Node>
concept zipable_node = requires(const Node& node, std::vector<Node> kids) {
    { zipable<Node>::is_branch(node) } -> std::convertible_to<bool>;
    { zipable<Node>::children(node) } -> std::convertible_to<std::vector<Node>>;
    { zipable<Node>::make_node(node, std::move(kids)) } -> std::convertible_to<Node>;
};

// Default capability of tz::cursor<Node>: forwards to tz::zipable<Node>.
template <typename Node>
struct zipable_capability {
    [[nodiscard]] bool is_branch(const Node& node) const
        requires zipable_node<Node>
    {
        return zipable<Node>::is_branch(node);
    }

    [[nodiscard]] std::vector<Node> children(const Node& node) const
        requires zipable_node<Node>
    {
        return zipable<Node>::children(node);
    }

    [[nodiscard]] Node make_node(const Node& node, std::vector<Node> kids) const
        requires zipable_node<Node>
    {
        return zipable<Node>::make_node(node, std::move(kids));
    }
};

// Runtime-polymorphic capability interface.
template <typename Node>
class basic_capability {
public:
    virtual ~basic_capability() = default;

    [[nodiscard]] virtual bool is_branch(const Node& node) const = 0;
    [[nodiscard]] virtual std::vector<Node> children(const Node& node) const = 0;
    [[nodiscard]] virtual Node make_node(const Node& node, std::vector<Node> kids) const = 0;
};

// Value wrapper that lets a cursor carry a shared basic_capability
// implementation.  Copies share the implementation.
template <typename Node>
class dynamic_capability {
public:
    explicit dynamic_capability(std::shared_ptr<const basic_capability<Node>> impl)
        : _impl(std::move(impl)) {
        if (!_impl) {
            throw std::invalid_argument("tz::dynamic_capability: null capability implementation");
        }
    }

    [[nodiscard]] bool is_branch(const Node& node) const { return _impl->is_branch(node); }
    [[nodiscard]] std::vector<Node> children(const Node& node) const { return _impl->children(node); }
    [[nodiscard]] Node make_node(const Node& node, std::vector<Node> kids) const {
        return _impl->make_node(node, std::move(kids));
    }

    [[nodiscard]] const basic_capability<Node>& implementation() const noexcept { return *_impl; }

private:
    std::shared_ptr<const basic_capability<Node>> _impl;
};

// Convenience factory: tz::make_dynamic_capability<node, my_impl>(args...).
template <typename Node, typename Impl, typename... Args>
    requires std::derived_from<Impl, basic_capability<Node>>
[[nodiscard]] dynamic_capability<Node> make_dynamic_capability(Args&&... args) {
    return dynamic_capability<Node>(std::make_shared<Impl>(std::forward<Args>(args)...));
}

}  // namespace tz

#endif  // TZ_CAPABILITY_HPP
