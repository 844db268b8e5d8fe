#include <tz/alloc_hooks.hpp>
#include <tz/cursor.hpp>
#include "support/tuple_tree.hpp"
#include <atomic>
#include <cstddef>
#include <iostream>
#include <new>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

using support::node;
using support::term;
using support::zip;

namespace {

std::atomic<int> g_allocs{0};
std::atomic<int> g_frees{0};

void* counting_allocate(std::size_t n, std::size_t align) {
    ++g_allocs;
    return tz::alloc_hooks::allocate_unpooled(n, align);
}

void counting_deallocate(void* p, std::size_t n, std::size_t align) {
    ++g_frees;
    tz::alloc_hooks::deallocate_unpooled(p, n, align);
}

void* failing_allocate(std::size_t, std::size_t) {
    return nullptr;
}

}  // namespace

int main() {
    // Size classes
    {
        using tz::alloc_hooks::pool_class_index;
        TEST(pool_class_index(1) == 0, "pool_class_index: smallest class");
        TEST(pool_class_index(32) == 0, "pool_class_index: class boundary");
        TEST(pool_class_index(33) == 1, "pool_class_index: next class");
        TEST(pool_class_index(512) == 4, "pool_class_index: largest class");
        TEST(pool_class_index(513) == -1, "pool_class_index: oversized");
    }

    // Custom hooks see every cursor allocation
    {
        term tree = node(1, {2, node(3, {4, 5}), 6});
        tz::set_alloc_hooks(counting_allocate, counting_deallocate);
        {
            auto c = zip(tree);
            auto deep = c.down()->right()->down()->right().value();
            TEST(deep.node() == term(5), "hooks: navigation works");
            TEST(deep.root() == tree, "hooks: rebuild works");
            TEST(g_allocs.load() > 0, "hooks: allocations routed through hooks");
        }
        TEST(g_allocs.load() == g_frees.load(), "hooks: every block released");
        tz::reset_alloc_hooks();

        int before = g_allocs.load();
        {
            auto c = zip(tree).down()->right().value();
            TEST(c.node() == node(3, {4, 5}), "reset: navigation works");
        }
        TEST(g_allocs.load() == before, "reset: hooks no longer called");
    }

    // A failed allocation surfaces as std::bad_alloc
    {
        auto c = zip(node(1, {2}));
        tz::set_alloc_hooks(failing_allocate, counting_deallocate);
        bool threw = false;
        try {
            (void)c.down();
        } catch (const std::bad_alloc&) {
            threw = true;
        }
        tz::reset_alloc_hooks();
        TEST(threw, "pool_alloc: null allocation throws bad_alloc");
        TEST(c.down()->node() == term(2), "pool_alloc: cursor usable after failure");
    }

#ifndef NDEBUG
    // Pool reuse on repeated down/up
    {
        term tree = node(1, {2, 3});
        auto c = zip(tree);
        (void)c.down();
        tz::alloc_hooks::reset_pool_stats();
        for (int i = 0; i < 100; ++i) {
            auto child = c.down();
            TEST(child && child->up()->node() == tree, "pool: round trip");
        }
        auto stats = tz::alloc_hooks::get_pool_stats();
        TEST(stats.hits > 0, "pool: freed blocks are reused");
        TEST(stats.pushes > 0, "pool: blocks returned to the free list");
    }
#endif

    std::cout << "\nAll alloc hook tests passed!\n";
    return 0;
}
