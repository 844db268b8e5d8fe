#include <tz/adapters/keyed_map.hpp>
#include <tz/adapters/nested_list.hpp>
#include <tz/traverse.hpp>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

using item = tz::list_node<int>;
using dict = tz::map_node<std::string, int>;

namespace {

std::string upcase(std::string s) {
    for (char& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

}  // namespace

int main() {
    // list_node kinds
    {
        item scalar = 5;
        item list = item::list({1, 2});
        item keyed = item::keyed({{"a", 23}});
        TEST(scalar.is_scalar() && scalar.value() == 5, "list_node: scalar");
        TEST(list.is_list() && list.items().size() == 2, "list_node: list");
        TEST(keyed.is_keyed() && keyed.entries().front().first == "a", "list_node: keyed");
        TEST(keyed.type() == item::kind::keyed, "list_node: kind tag");
        TEST(list == item::list({1, 2}), "list_node: structural equality");
        TEST(!(list == item::list({1, 2, 3})), "list_node: different lists");
        TEST(!(item::list({}) == item::keyed({})), "list_node: empty list is not an empty keyed list");

        bool threw = false;
        try {
            (void)list.value();
        } catch (const std::bad_variant_access&) {
            threw = true;
        }
        TEST(threw, "list_node: value() of a list throws");
    }

    // Nested-list cursor
    {
        item tree = item::list({1, 2});
        tz::cursor<item> c(tree);
        TEST(c.node() == tree && c.is_root(), "list cursor: new");
        TEST(c.is_branch(), "list cursor: list is a branch");
        TEST(!c.down()->is_branch(), "list cursor: scalar is a leaf");
        TEST(!tz::cursor<item>(item::keyed({{"a", 1}})).is_branch(), "list cursor: keyed list is a leaf");
        TEST(!tz::cursor<item>(item::list({})).down().has_value(), "list cursor: empty list has no children");
        TEST(tz::cursor<item>(item::list({})).append_child(7).node() == item::list({7}),
             "list cursor: append to an empty list");
    }
    {
        item tree = item::list({11, item::list({21, 22, item::keyed({{"a", 23}}), item::list({31, 32}), 24})});
        auto updated = tz::traverse(tz::cursor<item>(tree), [](const tz::cursor<item>& z) {
            return z.update([](const item& n) { return n.is_scalar() ? item(n.value() + 100) : n; });
        });
        TEST(updated.node() ==
                 item::list({111, item::list({121, 122, item::keyed({{"a", 23}}), item::list({131, 132}), 124})}),
             "list cursor: traverse updates numbers only");
    }
    {
        item tree = item::list({1, item::list({2, item::list({3, 4}), 5}), item::list({6, 7})});
        std::vector<item> expected = {
            tree, 1, item::list({2, item::list({3, 4}), 5}), 2, item::list({3, 4}), 3, 4, 5, item::list({6, 7}), 6, 7,
        };
        auto collect = [](const tz::cursor<item>& z, std::vector<item> acc) {
            acc.push_back(z.node());
            return std::pair{z, std::move(acc)};
        };
        auto [done, nodes] = tz::traverse(tz::cursor<item>(tree), std::vector<item>{}, collect);
        TEST(nodes == expected, "list cursor: pre-order nodes");
        auto [again, restarted] = tz::traverse(done, std::vector<item>{}, collect);
        TEST(restarted == expected, "list cursor: end cursor restarts");
    }

    // map_node construction
    {
        dict m = dict::map({dict::entry("b", 1), dict::entry("a", 2), dict::entry("b", 3)});
        TEST(m.is_map() && m.holds_map(), "map_node: map");
        TEST(m.entries().size() == 2, "map_node: duplicate keys collapse");
        TEST(m.entries()[0].key() == "a" && m.entries()[1].key() == "b", "map_node: sorted by key");
        TEST(m.entries()[1].value() == 3, "map_node: later duplicate wins");
        TEST(m.find("a") != nullptr && m.find("a")->value() == 2, "map_node: find");
        TEST(m.find("z") == nullptr, "map_node: find missing");

        dict nested = dict::entry("x", dict::map({dict::entry("y", 1)}));
        TEST(nested.is_entry() && nested.holds_map(), "map_node: entry with nested map");
        TEST(nested.entries().front().key() == "y", "map_node: nested entries");
        TEST(dict::entry("k", 1).with_key("j").key() == "j", "map_node: with_key");

        bool threw = false;
        try {
            (void)dict::map({dict::map({})});
        } catch (const std::invalid_argument& e) {
            threw = std::string(e.what()) == "tz::map_node: map children must be key/value entries";
        }
        TEST(threw, "map_node: map children must be entries");

        threw = false;
        try {
            (void)dict::entry("x", dict::entry("y", 1));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        TEST(threw, "map_node: nested value must be a map");

        threw = false;
        try {
            (void)m.with_key("q");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        TEST(threw, "map_node: a map has no key");
    }

    // Keyed-map cursor
    {
        dict tree = dict::map({dict::entry("a", 1), dict::entry("b", dict::map({dict::entry("x", 2)}))});
        tz::cursor<dict> c(tree);
        TEST(c.node() == tree && c.is_root(), "map cursor: new");
        TEST(c.down()->node() == dict::entry("a", 1), "map cursor: first entry");
        TEST(c.down()->right()->is_branch(), "map cursor: nested map entry is a branch");
        TEST(c.down()->right()->down()->node() == dict::entry("x", 2), "map cursor: nested entry");

        auto mapped = tz::map(c, [](const dict& n) {
            if (n.is_map()) return n;
            if (n.holds_map()) return n.with_key(upcase(n.key()));
            return dict::entry(upcase(n.key()), n.value() + 10);
        });
        TEST(mapped.node() ==
                 dict::map({dict::entry("A", 11), dict::entry("B", dict::map({dict::entry("X", 12)}))}),
             "map cursor: keys and values mapped");
    }
    {
        dict tree = dict::map({dict::entry("a", 1), dict::entry("b", 2)});
        auto renamed = tz::map(tz::cursor<dict>(tree), [](const dict& n) {
            return n.is_entry() ? n.with_key("k") : n;
        });
        TEST(renamed.node().entries().size() == 1, "map cursor: renamed keys collapse");
        TEST(renamed.node().find("k")->value() == 2, "map cursor: last renamed entry wins");
    }

    std::cout << "\nAll adapter tests passed!\n";
    return 0;
}
