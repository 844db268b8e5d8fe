#include <cctype>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "../include/tz.hpp"

using item = tz::list_node<int>;
using dict = tz::map_node<std::string, int>;

static void print(const item& n) {
    if (n.is_scalar()) {
        std::cout << n.value();
    } else if (n.is_keyed()) {
        std::cout << "[";
        const char* sep = "";
        for (const auto& [k, v] : n.entries()) {
            std::cout << sep << k << ": " << v;
            sep = ", ";
        }
        std::cout << "]";
    } else {
        std::cout << "[";
        const char* sep = "";
        for (const item& k : n.items()) {
            std::cout << sep;
            print(k);
            sep = ", ";
        }
        std::cout << "]";
    }
}

static void print(const dict& n) {
    if (n.is_entry()) {
        std::cout << '"' << n.key() << "\": ";
        if (!n.holds_map()) {
            std::cout << n.value();
            return;
        }
    }
    std::cout << "{";
    const char* sep = "";
    for (const dict& e : n.entries()) {
        std::cout << sep;
        print(e);
        sep = ", ";
    }
    std::cout << "}";
}

// Capability chosen at runtime: unlike the default one it also opens keyed
// lists, whose children are their values.
class keyed_branches : public tz::basic_capability<item> {
public:
    bool is_branch(const item& n) const override { return !n.is_scalar(); }

    std::vector<item> children(const item& n) const override {
        if (n.is_list()) return n.items();
        std::vector<item> values;
        for (const auto& kv : n.entries()) values.push_back(kv.second);
        return values;
    }

    item make_node(const item& n, std::vector<item> kids) const override {
        if (!n.is_keyed()) return item::list(std::move(kids));
        item::entries_type entries = n.entries();
        for (std::size_t i = 0; i < entries.size() && i < kids.size(); ++i) {
            if (kids[i].is_scalar()) entries[i].second = kids[i].value();
        }
        return item::keyed(std::move(entries));
    }
};

/// Adapter examples
int main() {
    std::cout << "=== tz adapters ===" << std::endl << std::endl;

    // Example 1: nested lists
    {
        std::cout << "1. Nested lists:" << std::endl;
        item tree = item::list({11, item::list({21, 22, item::keyed({{"a", 23}}), item::list({31, 32}), 24})});
        std::cout << "  Before: ";
        print(tree);
        std::cout << std::endl;

        auto bumped = tz::map(tz::cursor<item>(tree), [](const item& n) {
            return n.is_scalar() ? item(n.value() + 100) : n;
        });
        std::cout << "  After:  ";
        print(bumped.node());
        std::cout << std::endl << std::endl;
    }

    // Example 2: keyed maps
    {
        std::cout << "2. Keyed maps:" << std::endl;
        dict tree = dict::map({dict::entry("b", dict::map({dict::entry("x", 2)})), dict::entry("a", 1)});
        std::cout << "  Before: ";
        print(tree);
        std::cout << std::endl;

        auto upper = tz::map(tz::cursor<dict>(tree), [](const dict& n) {
            if (n.is_map()) return n;
            std::string key = n.key();
            for (char& ch : key) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            if (n.holds_map()) return n.with_key(key);
            return dict::entry(key, n.value() + 10);
        });
        std::cout << "  After:  ";
        print(upper.node());
        std::cout << std::endl << std::endl;
    }

    // Example 3: a capability picked at runtime
    {
        std::cout << "3. Runtime capability:" << std::endl;
        item tree = item::list({1, item::keyed({{"a", 2}, {"b", 3}}), 4});
        tz::cursor<item, tz::dynamic_capability<item>> c(tree, tz::make_dynamic_capability<item, keyed_branches>());
        std::cout << "  Visited:";
        for (const item& n : tz::preorder(c)) {
            std::cout << " ";
            print(n);
        }
        std::cout << std::endl;

        auto doubled = tz::map(c, [](const item& n) { return n.is_scalar() ? item(n.value() * 2) : n; });
        std::cout << "  Doubled: ";
        print(doubled.node());
        std::cout << std::endl;
    }

    return 0;
}
