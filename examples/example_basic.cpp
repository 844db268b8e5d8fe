#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../include/tz.hpp"

// A small org chart: every employee has a name and a list of reports.
struct employee {
    std::string name;
    std::vector<employee> reports;
};

template <>
struct tz::zipable<employee> {
    static bool is_branch(const employee& e) { return !e.reports.empty(); }
    static std::vector<employee> children(const employee& e) { return e.reports; }
    static employee make_node(const employee& e, std::vector<employee> reports) {
        return employee{e.name, std::move(reports)};
    }
};

static void print(const employee& e, int indent = 2) {
    std::cout << std::string(static_cast<std::size_t>(indent), ' ') << e.name << "\n";
    for (const employee& r : e.reports) print(r, indent + 2);
}

/// Basic tz::cursor usage examples
int main() {
    std::cout << "=== tz library version " << tz::version() << " ===" << std::endl << std::endl;

    employee org{"Ada", {{"Grace", {{"Linus", {}}, {"Ken", {}}}}, {"Barbara", {}}}};

    // Example 1: Moving around
    {
        std::cout << "1. Navigation:" << std::endl;

        tz::cursor<employee> c(org);
        std::cout << "  Root: " << c.node().name << ", depth " << c.depth() << std::endl;

        auto grace = c.down();
        std::cout << "  down():  " << grace->node().name << std::endl;

        auto barbara = grace->right();
        std::cout << "  right(): " << barbara->node().name << std::endl;
        std::cout << "  right() again has a value: " << std::boolalpha << barbara->right().has_value() << std::endl;

        auto ken = grace->down()->rightmost();
        std::cout << "  down(), rightmost(): " << ken.node().name << ", depth " << ken.depth() << std::endl;
        std::cout << "  up(): " << ken.up()->node().name << std::endl << std::endl;
    }

    // Example 2: Editing without touching the original
    {
        std::cout << "2. Edits:" << std::endl;

        tz::cursor<employee> c(org);
        auto linus = c.down()->down().value();

        auto renamed = linus.update([](const employee& e) { return employee{e.name + " (lead)", e.reports}; });
        auto hired = renamed.insert_right(employee{"Dennis", {}});
        auto promoted = hired.append_child(employee{"Guido", {}});

        std::cout << "  Rebuilt tree:" << std::endl;
        print(promoted.root(), 4);
        std::cout << "  Original tree is unchanged:" << std::endl;
        print(org, 4);
        std::cout << std::endl;
    }

    // Example 3: Removing a node
    {
        std::cout << "3. Remove:" << std::endl;

        tz::cursor<employee> c(org);
        auto barbara = c.down()->right().value();
        auto after = barbara.remove();
        std::cout << "  Focus after removing " << barbara.node().name << ": " << after.node().name << std::endl;
        print(after.root(), 4);

        try {
            (void)c.remove();
        } catch (const std::invalid_argument& e) {
            std::cout << "  Removing the root fails: " << e.what() << std::endl;
        }
        std::cout << std::endl;
    }

    // Example 4: Walking in pre-order
    {
        std::cout << "4. Pre-order with next():" << std::endl;
        std::cout << "  ";
        for (tz::cursor<employee> z(org); !z.is_end(); z = z.next()) {
            std::cout << z.node().name << " ";
        }
        std::cout << std::endl;
    }

    return 0;
}
