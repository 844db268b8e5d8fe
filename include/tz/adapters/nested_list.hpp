// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_ADAPTERS_NESTED_LIST_HPP
#define TZ_ADAPTERS_NESTED_LIST_HPP

// Nested-list trees: [11, [21, 22, {a: 23}, [31, 32], 24]].
//
// A tz::list_node<T> is one of
//   scalar -- a leaf holding a T;
//   list   -- a branch whose children are its elements;
//   keyed  -- an association list of (std::string, T) pairs, kept as a leaf.
//
// The kind is fixed when the node is built, so the capability never has to
// guess whether a list is a plain sequence or a set of key/value pairs.
// Rebuilding a branch always yields a list.  Elements live behind a
// shared_ptr<const vector>, so copying a node is O(1) and untouched subtrees
// are shared between the original and the rebuilt tree.
//
// Example usage:
//   using node = tz::list_node<int>;
//   tz::cursor<node> c(node::list({11, node::list({21, 22})}));

#include "tz/capability.hpp"
#include "tz/config.hpp"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tz {

template <typename T>
class list_node {
public:
    enum class kind : std::uint8_t { scalar, list, keyed };

    using value_type = T;
    using items_type = std::vector<list_node>;
    using entry_type = std::pair<std::string, T>;
    using entries_type = std::vector<entry_type>;

    // Scalar leaf.
    list_node(T value) : _data(std::move(value)) {}

    [[nodiscard]] static list_node list(items_type items) {
        return list_node(std::make_shared<items_type>(std::move(items)));
    }
    [[nodiscard]] static list_node list(std::initializer_list<list_node> items) {
        return list(items_type(items));
    }

    [[nodiscard]] static list_node keyed(entries_type entries) {
        return list_node(std::make_shared<entries_type>(std::move(entries)));
    }

    [[nodiscard]] kind type() const noexcept { return static_cast<kind>(_data.index()); }
    [[nodiscard]] bool is_scalar() const noexcept { return _data.index() == 0; }
    [[nodiscard]] bool is_list() const noexcept { return _data.index() == 1; }
    [[nodiscard]] bool is_keyed() const noexcept { return _data.index() == 2; }

    // Throws std::bad_variant_access when the node is of another kind.
    [[nodiscard]] const T& value() const { return std::get<0>(_data); }
    [[nodiscard]] const items_type& items() const { return *std::get<1>(_data); }
    [[nodiscard]] const entries_type& entries() const { return *std::get<2>(_data); }

    friend bool operator==(const list_node& a, const list_node& b)
        requires std::equality_comparable<T>
    {
        if (a._data.index() != b._data.index()) return false;
        switch (a.type()) {
            case kind::scalar:
                return a.value() == b.value();
            case kind::list:
                return std::get<1>(a._data) == std::get<1>(b._data) || a.items() == b.items();
            case kind::keyed:
                return std::get<2>(a._data) == std::get<2>(b._data) || a.entries() == b.entries();
        }
        return false;
    }

private:
    explicit list_node(std::shared_ptr<const items_type> items) : _data(std::move(items)) {}
    explicit list_node(std::shared_ptr<const entries_type> entries) : _data(std::move(entries)) {}

    std::variant<T, std::shared_ptr<const items_type>, std::shared_ptr<const entries_type>> _data;
};

template <typename T>
struct zipable<list_node<T>> {
    static bool is_branch(const list_node<T>& node) noexcept { return node.is_list(); }

    static std::vector<list_node<T>> children(const list_node<T>& node) { return node.items(); }

    static list_node<T> make_node(const list_node<T>&, std::vector<list_node<T>> kids) {
        return list_node<T>::list(std::move(kids));
    }
};

}  // namespace tz

#endif  // TZ_ADAPTERS_NESTED_LIST_HPP
