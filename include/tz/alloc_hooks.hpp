// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_ALLOC_HOOKS_HPP
#define TZ_ALLOC_HOOKS_HPP

// Allocator hooks, TLS free-list pool, and pool_alloc<T>.
//
// Every cursor move allocates: down() pushes a breadcrumb frame, left()/right()
// push a sibling-list cell, up() drops both again.  Those blocks are small and
// short-lived, so they are recycled through a thread-local free-list pool with
// five size classes (32..512 bytes) instead of going to malloc each time.
// Applications can replace the underlying allocator with set_alloc_hooks().

#include "tz/config.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>
#if defined(_MSC_VER)
# include <malloc.h>  // _aligned_malloc / _aligned_free
#endif

namespace tz {

using allocate_fn = void*(*)(std::size_t size, std::size_t align);
using deallocate_fn = void(*)(void* p, std::size_t size, std::size_t align);

namespace alloc_hooks {

    // Size classes served by the pool.  A sibling-list cell holding a
    // pointer-sized node plus its shared_ptr control block lands in class 32 or
    // 64; a breadcrumb frame (a full cursor plus control block) in 128 or 256.
    constexpr std::array<std::size_t, 5> POOL_CLASSES = {32, 64, 128, 256, 512};
    constexpr std::size_t MAX_POOL_SIZE = POOL_CLASSES.back();
    constexpr int POOL_SLAB_DEPTH = TZ_POOL_SLAB_DEPTH;

    static_assert(POOL_SLAB_DEPTH > 0 && POOL_SLAB_DEPTH <= 255,
                  "TZ_POOL_SLAB_DEPTH must fit the per-class byte counter");

    // Returns the index into POOL_CLASSES for a given size, or -1 if too large.
    inline int pool_class_index(std::size_t n) noexcept {
        for (std::size_t i = 0; i < POOL_CLASSES.size(); ++i) {
            if (n <= POOL_CLASSES[i]) return static_cast<int>(i);
        }
        return -1;
    }

    // Underlying platform allocation used on a pool miss or for oversized
    // blocks.  Alignments up to alignof(std::max_align_t) are already
    // guaranteed by malloc.
    inline void* allocate_unpooled(std::size_t n, std::size_t align) noexcept {
        if (n == 0) return nullptr;
#ifdef _WIN32
        return _aligned_malloc(n, align);
#else
        if (align <= alignof(std::max_align_t)) {
            return std::malloc(n);
        }
        std::size_t adj = ((n + align - 1) / align) * align;
        return std::aligned_alloc(align, adj);
#endif
    }

    inline void deallocate_unpooled(void* p, std::size_t, std::size_t) noexcept {
        if (!p) return;
#ifdef _WIN32
        _aligned_free(p);
#else
        std::free(p);
#endif
    }

    // Per-thread free lists.  The counts share one cache line so that a miss
    // never touches the slot arrays.
    struct alignas(64) TlsFreeLists {
        std::uint8_t counts[POOL_CLASSES.size()];
        void* slots[POOL_CLASSES.size()][POOL_SLAB_DEPTH];
    };

    inline TlsFreeLists& get_tls_free_lists() noexcept {
        static thread_local TlsFreeLists tls{};
        return tls;
    }

    // Pool instrumentation.  Counters are only updated in debug builds.
    struct PoolStats {
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::uint64_t pushes = 0;
        std::uint64_t evictions = 0;
    };

    inline std::atomic<std::uint64_t>& pool_hits() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }
    inline std::atomic<std::uint64_t>& pool_misses() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }
    inline std::atomic<std::uint64_t>& pool_pushes() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }
    inline std::atomic<std::uint64_t>& pool_evictions() noexcept {
        static std::atomic<std::uint64_t> a{0};
        return a;
    }

    inline void reset_pool_stats() noexcept {
        pool_hits().store(0, std::memory_order_relaxed);
        pool_misses().store(0, std::memory_order_relaxed);
        pool_pushes().store(0, std::memory_order_relaxed);
        pool_evictions().store(0, std::memory_order_relaxed);
    }

    inline PoolStats get_pool_stats() noexcept {
        PoolStats s;
        s.hits = pool_hits().load(std::memory_order_relaxed);
        s.misses = pool_misses().load(std::memory_order_relaxed);
        s.pushes = pool_pushes().load(std::memory_order_relaxed);
        s.evictions = pool_evictions().load(std::memory_order_relaxed);
        return s;
    }

    inline void* default_allocate(std::size_t n, std::size_t align) noexcept {
        if (n == 0) return nullptr;

        int idx = pool_class_index(n);
        if (idx < 0 || align > alignof(std::max_align_t)) return allocate_unpooled(n, align);

        TlsFreeLists& tls = get_tls_free_lists();
        if (TZ_LIKELY(tls.counts[idx] > 0)) {
#ifndef NDEBUG
            pool_hits().fetch_add(1, std::memory_order_relaxed);
#endif
            return tls.slots[idx][--tls.counts[idx]];
        }
        // Miss: allocate the whole class so the block can later be recycled
        // into the same class.
#ifndef NDEBUG
        pool_misses().fetch_add(1, std::memory_order_relaxed);
#endif
        return allocate_unpooled(POOL_CLASSES[static_cast<std::size_t>(idx)], align);
    }

    inline void default_deallocate(void* p, std::size_t n, std::size_t align) noexcept {
        if (!p) return;
        int idx = pool_class_index(n);
        if (idx < 0 || align > alignof(std::max_align_t)) {
            deallocate_unpooled(p, n, align);
            return;
        }

        TlsFreeLists& tls = get_tls_free_lists();
        if (tls.counts[idx] < static_cast<std::uint8_t>(POOL_SLAB_DEPTH)) {
            tls.slots[idx][tls.counts[idx]++] = p;
#ifndef NDEBUG
            pool_pushes().fetch_add(1, std::memory_order_relaxed);
#endif
            return;
        }
        deallocate_unpooled(p, n, align);
#ifndef NDEBUG
        pool_evictions().fetch_add(1, std::memory_order_relaxed);
#endif
    }

    inline std::atomic<bool>& hooks_customised() noexcept {
        static std::atomic<bool> customised{false};
        return customised;
    }

    inline std::atomic<allocate_fn>& get_allocate_ptr() noexcept {
        static std::atomic<allocate_fn> ptr{default_allocate};
        return ptr;
    }

    inline std::atomic<deallocate_fn>& get_deallocate_ptr() noexcept {
        static std::atomic<deallocate_fn> ptr{default_deallocate};
        return ptr;
    }

    // TZ_HOOKS_ALWAYS_DEFAULT: hard-wire the "no custom hooks" branch at
    // compile time.  set_alloc_hooks() then has NO effect; use it only in
    // benchmark translation units.
#ifdef TZ_HOOKS_ALWAYS_DEFAULT
    inline constexpr bool _hooks_active() noexcept { return false; }
#else
    inline bool _hooks_active() noexcept {
        return hooks_customised().load(std::memory_order_relaxed);
    }
#endif

    inline void* allocate_bytes(std::size_t n, std::size_t align) noexcept {
        if (!_hooks_active()) {
            return default_allocate(n, align);
        }
        return get_allocate_ptr().load(std::memory_order_relaxed)(n, align);
    }

    inline void deallocate_bytes(void* p, std::size_t n, std::size_t align) noexcept {
        if (!_hooks_active()) {
            default_deallocate(p, n, align);
            return;
        }
        get_deallocate_ptr().load(std::memory_order_relaxed)(p, n, align);
    }

    // Installs custom hooks.  Passing nullptr for both restores the pool.
    // Blocks must be released through the hooks that allocated them, so swap
    // hooks only while no cursor or sibling list is alive.
    inline void set_hooks(allocate_fn a, deallocate_fn d) noexcept {
        hooks_customised().store(a || d, std::memory_order_relaxed);
        get_allocate_ptr().store(a ? a : default_allocate, std::memory_order_relaxed);
        get_deallocate_ptr().store(d ? d : default_deallocate, std::memory_order_relaxed);
    }
}  // namespace alloc_hooks

inline void set_alloc_hooks(allocate_fn a, deallocate_fn d) noexcept { alloc_hooks::set_hooks(a, d); }
inline void reset_alloc_hooks() noexcept { alloc_hooks::set_hooks(nullptr, nullptr); }

// C++ standard allocator backed by the tz allocation hooks.
//
// Used with std::allocate_shared so that the object and its control block
// come from a single pooled block.
template <typename T>
struct pool_alloc {
    using value_type = T;

    pool_alloc() noexcept = default;
    template <typename U> pool_alloc(const pool_alloc<U>&) noexcept {}

    T* allocate(std::size_t n) {
        void* p = alloc_hooks::allocate_bytes(n * sizeof(T), alignof(T));
        if (!p) throw std::bad_alloc{};
        return static_cast<T*>(p);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        alloc_hooks::deallocate_bytes(p, n * sizeof(T), alignof(T));
    }

    template <typename U> bool operator==(const pool_alloc<U>&) const noexcept { return true; }
    template <typename U> bool operator!=(const pool_alloc<U>&) const noexcept { return false; }
};

}  // namespace tz

#endif  // TZ_ALLOC_HOOKS_HPP
