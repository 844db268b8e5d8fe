#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>
#include "../include/tz.hpp"

// A directory tree where files carry a size and directories carry nothing.
struct entry {
    std::string name;
    long size = 0;
    std::vector<entry> children;
    bool is_dir = false;
};

struct directory_capability {
    bool is_branch(const entry& e) const { return e.is_dir; }
    std::vector<entry> children(const entry& e) const { return e.children; }
    entry make_node(const entry& e, std::vector<entry> kids) const {
        entry out = e;
        out.children = std::move(kids);
        out.is_dir = true;
        return out;
    }
};

using fs_cursor = tz::cursor<entry, directory_capability>;

static entry file(std::string name, long size) { return entry{std::move(name), size, {}, false}; }
static entry dir(std::string name, std::vector<entry> kids) { return entry{std::move(name), 0, std::move(kids), true}; }

static std::string path_of(const fs_cursor& z) {
    std::string path = z.node().name;
    for (const fs_cursor* p = z.parent(); p; p = p->parent()) path = p->node().name + "/" + path;
    return path;
}

/// Traversal driver examples
int main() {
    std::cout << "=== tz traversal drivers ===" << std::endl << std::endl;

    entry root = dir("src", {
        dir("core", {file("cursor.hpp", 14000), file("traverse.hpp", 9000)}),
        dir("build", {file("cache.bin", 900000), dir("tmp", {file("a.o", 120000)})}),
        file("README.md", 2000),
    });
    fs_cursor c(root);

    // Example 1: fold with an accumulator
    {
        std::cout << "1. traverse with an accumulator:" << std::endl;
        auto [done, total] = tz::traverse(c, 0L, [](const fs_cursor& z, long acc) {
            return std::pair{z, acc + z.node().size};
        });
        std::cout << "  Total size: " << total << " bytes" << std::endl;
        std::cout << "  Walk ended: " << std::boolalpha << done.is_end() << std::endl << std::endl;
    }

    // Example 2: skip a subtree, stop early
    {
        std::cout << "2. traverse_while:" << std::endl;
        auto [done, seen] = tz::traverse_while(c, std::vector<std::string>{},
                                               [](const fs_cursor& z, std::vector<std::string> acc) {
                                                   if (z.node().name == "build") return tz::skip(z, std::move(acc));
                                                   acc.push_back(path_of(z));
                                                   if (z.node().name == "README.md") return tz::halt(z, std::move(acc));
                                                   return tz::cont(z, std::move(acc));
                                               });
        for (const auto& p : seen) std::cout << "  visited " << p << std::endl;
        std::cout << std::endl;
    }

    // Example 3: map every node
    {
        std::cout << "3. map (sizes in KiB):" << std::endl;
        auto kib = tz::map(c, [](const entry& e) {
            entry out = e;
            out.size = e.size / 1024;
            return out;
        });
        for (const entry& e : tz::preorder(kib.subtree())) {
            if (!e.is_dir) std::cout << "  " << e.name << ": " << e.size << " KiB" << std::endl;
        }
        std::cout << std::endl;
    }

    // Example 4: find, then edit in place
    {
        std::cout << "4. find and remove:" << std::endl;
        auto tmp = tz::find(c, [](const fs_cursor& z) { return z.node().name == "tmp"; });
        if (tmp) {
            std::cout << "  Found " << path_of(*tmp) << " at depth " << tmp->depth() << std::endl;
            auto pruned = tmp->remove();
            std::cout << "  After removal the focus is " << path_of(pruned) << std::endl;
            std::cout << "  Remaining nodes: " << std::ranges::distance(tz::preorder(pruned.top())) << std::endl;
        }
    }

    return 0;
}
