// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_ADAPTERS_KEYED_MAP_HPP
#define TZ_ADAPTERS_KEYED_MAP_HPP

// Keyed-map trees: {"a": 1, "b": {"x": 2}}.
//
// A tz::map_node<K, V> is either
//   a map   -- a branch whose children are its entries, ordered by key;
//   an entry {key, value} where value is
//     a V          -- a leaf, or
//     a nested map -- a branch whose children are the nested entries.
//
// Rebuilding a map sorts the new children by key and lets a later entry
// replace an earlier one with the same key, so a visitor that renames keys
// (or maps two keys onto one) still yields a well-formed map.  Rebuilding an
// entry keeps its key and wraps the new children in a map.
//
// Example usage:
//   using node = tz::map_node<std::string, int>;
//   node tree = node::map({node::entry("a", 1),
//                          node::entry("b", node::map({node::entry("x", 2)}))});
//   tz::cursor<node> c(tree);

#include "tz/capability.hpp"
#include "tz/config.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace tz {

template <typename K, typename V>
    requires std::totally_ordered<K>
class map_node {
public:
    using key_type = K;
    using mapped_type = V;
    using entries_type = std::vector<map_node>;

    // A map built from entries.  Throws std::invalid_argument if one of them
    // is a bare map rather than a {key, value} entry.
    [[nodiscard]] static map_node map(entries_type entries) {
        for (const map_node& e : entries) {
            if (!e.is_entry()) {
                throw std::invalid_argument("tz::map_node: map children must be key/value entries");
            }
        }
        std::stable_sort(entries.begin(), entries.end(),
                         [](const map_node& a, const map_node& b) { return *a._key < *b._key; });

        // Keep the last entry of every run of equal keys.
        entries_type unique;
        unique.reserve(entries.size());
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (i + 1 < entries.size() && !(*entries[i]._key < *entries[i + 1]._key)) continue;
            unique.push_back(std::move(entries[i]));
        }
        return map_node(std::nullopt, std::make_shared<entries_type>(std::move(unique)));
    }

    [[nodiscard]] static map_node map(std::initializer_list<map_node> entries) {
        return map(entries_type(entries));
    }

    [[nodiscard]] static map_node entry(K key, V value) {
        return map_node(std::move(key), std::move(value));
    }

    // An entry whose value is a nested map.  Throws std::invalid_argument if
    // `nested` is itself an entry.
    [[nodiscard]] static map_node entry(K key, const map_node& nested) {
        if (nested.is_entry()) {
            throw std::invalid_argument("tz::map_node: nested value must be a map, not an entry");
        }
        return map_node(std::move(key), std::get<1>(nested._value));
    }

    [[nodiscard]] bool is_map() const noexcept { return !_key.has_value(); }
    [[nodiscard]] bool is_entry() const noexcept { return _key.has_value(); }

    // True for maps and for entries whose value is a nested map.
    [[nodiscard]] bool holds_map() const noexcept { return _value.index() == 1; }

    // Throws std::bad_optional_access on a map.
    [[nodiscard]] const K& key() const { return _key.value(); }

    // Throws std::bad_variant_access unless the node is an entry holding a V.
    [[nodiscard]] const V& value() const { return std::get<0>(_value); }

    // Entries of a map, or of the nested map of an entry.
    [[nodiscard]] const entries_type& entries() const { return *std::get<1>(_value); }

    // Entry lookup in a map (or nested map); empty when the key is absent.
    [[nodiscard]] const map_node* find(const K& key) const {
        const entries_type& es = entries();
        auto it = std::lower_bound(es.begin(), es.end(), key,
                                   [](const map_node& e, const K& k) { return *e._key < k; });
        if (it == es.end() || key < *it->_key) return nullptr;
        return &*it;
    }

    // Same value under another key.  Throws std::invalid_argument on a map.
    [[nodiscard]] map_node with_key(K key) const {
        if (!is_entry()) {
            throw std::invalid_argument("tz::map_node::with_key: a map has no key");
        }
        map_node out = *this;
        out._key = std::move(key);
        return out;
    }

    friend bool operator==(const map_node& a, const map_node& b)
        requires std::equality_comparable<V>
    {
        if (a._key != b._key || a._value.index() != b._value.index()) return false;
        if (a.holds_map()) {
            return std::get<1>(a._value) == std::get<1>(b._value) || a.entries() == b.entries();
        }
        return a.value() == b.value();
    }

private:
    using entries_ptr = std::shared_ptr<const entries_type>;

    map_node(std::optional<K> key, V value) : _key(std::move(key)), _value(std::move(value)) {}
    map_node(std::optional<K> key, entries_ptr entries) : _key(std::move(key)), _value(std::move(entries)) {}

    std::optional<K> _key;
    std::variant<V, entries_ptr> _value;
};

template <typename K, typename V>
    requires std::totally_ordered<K>
struct zipable<map_node<K, V>> {
    static bool is_branch(const map_node<K, V>& node) noexcept { return node.holds_map(); }

    static std::vector<map_node<K, V>> children(const map_node<K, V>& node) { return node.entries(); }

    static map_node<K, V> make_node(const map_node<K, V>& node, std::vector<map_node<K, V>> kids) {
        map_node<K, V> rebuilt = map_node<K, V>::map(std::move(kids));
        if (node.is_map()) return rebuilt;
        return map_node<K, V>::entry(node.key(), rebuilt);
    }
};

}  // namespace tz

#endif  // TZ_ADAPTERS_KEYED_MAP_HPP
