// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_PERSISTENT_LIST_HPP
#define TZ_PERSISTENT_LIST_HPP

// Immutable singly linked list used for the sibling context of a cursor.
//
// A cursor keeps its left siblings nearest-first and its right siblings in
// tree order, and moving left or right only ever touches the head of those
// two lists.  Cells are immutable and shared between every list that was
// derived from them, so a move costs one cell allocation and copying a cursor
// copies two pointers.
//
// Performance characteristics:
// - push_front / pop_front / front: O(1).
// - size: O(1) (cached).
// - reversed / push_back / to_vector: O(n).
// - Copy: O(1), shares all cells.

#include "tz/alloc_hooks.hpp"

#include <cassert>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace tz {

template <typename T>
class persistent_list {
    struct cell {
        T value;
        std::shared_ptr<const cell> next;

        cell(T v, std::shared_ptr<const cell> n)
            : value(std::move(v)), next(std::move(n)) {}
    };

    using cell_ptr = std::shared_ptr<const cell>;

    persistent_list(cell_ptr head, std::size_t size) noexcept
        : _head(std::move(head)), _size(size) {}

    static cell_ptr _make_cell(T value, cell_ptr next) {
        return std::allocate_shared<cell>(pool_alloc<cell>{}, std::move(value), std::move(next));
    }

public:
    using value_type = T;
    using size_type = std::size_t;
    using const_reference = const T&;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator() noexcept = default;
        explicit const_iterator(const cell* c) noexcept : _cell(c) {}

        reference operator*() const noexcept { return _cell->value; }
        pointer operator->() const noexcept { return &_cell->value; }

        const_iterator& operator++() noexcept {
            _cell = _cell->next.get();
            return *this;
        }
        const_iterator operator++(int) noexcept {
            const_iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const const_iterator& other) const noexcept { return _cell == other._cell; }
        bool operator!=(const const_iterator& other) const noexcept { return _cell != other._cell; }

    private:
        const cell* _cell = nullptr;
    };
    using iterator = const_iterator;

    // ========== Constructors ==========

    persistent_list() noexcept = default;

    persistent_list(std::initializer_list<T> values)
        : persistent_list(from_range(values.begin(), values.end())) {}

    // Builds a list holding [first, last) in the same order.
    template <std::bidirectional_iterator It>
    [[nodiscard]] static persistent_list from_range(It first, It last) {
        persistent_list out;
        while (last != first) {
            --last;
            out._head = _make_cell(*last, std::move(out._head));
            ++out._size;
        }
        return out;
    }

    [[nodiscard]] static persistent_list from_vector(std::vector<T> values) {
        persistent_list out;
        for (auto it = values.rbegin(); it != values.rend(); ++it) {
            out._head = _make_cell(std::move(*it), std::move(out._head));
            ++out._size;
        }
        return out;
    }

    persistent_list(const persistent_list&) noexcept = default;
    persistent_list(persistent_list&& other) noexcept
        : _head(std::move(other._head)), _size(std::exchange(other._size, 0)) {}

    persistent_list& operator=(const persistent_list& other) noexcept {
        if (this != &other) {
            cell_ptr head = other._head;
            _release();
            _head = std::move(head);
            _size = other._size;
        }
        return *this;
    }

    persistent_list& operator=(persistent_list&& other) noexcept {
        if (this != &other) {
            _release();
            _head = std::move(other._head);
            _size = other._size;
            other._size = 0;
        }
        return *this;
    }

    // Unlinks uniquely owned cells one at a time; the default destructor would
    // recurse once per cell.
    ~persistent_list() { _release(); }

    // ========== Capacity ==========

    [[nodiscard]] bool empty() const noexcept { return _head == nullptr; }
    [[nodiscard]] size_type size() const noexcept { return _size; }

    // ========== Element Access ==========

    const T& front() const noexcept {
        assert(_head && "front() called on empty persistent_list");
        return _head->value;
    }

    const_iterator begin() const noexcept { return const_iterator(_head.get()); }
    const_iterator end() const noexcept { return const_iterator(); }

    // ========== Derivation ==========

    [[nodiscard]] persistent_list push_front(T value) const {
        return persistent_list(_make_cell(std::move(value), _head), _size + 1);
    }

    [[nodiscard]] persistent_list pop_front() const noexcept {
        assert(_head && "pop_front() called on empty persistent_list");
        return persistent_list(_head->next, _size - 1);
    }

    // O(n): copies every cell.
    [[nodiscard]] persistent_list push_back(T value) const {
        std::vector<T> values = to_vector();
        values.push_back(std::move(value));
        return from_vector(std::move(values));
    }

    [[nodiscard]] persistent_list reversed() const {
        persistent_list out;
        for (const T& v : *this) {
            out._head = _make_cell(v, std::move(out._head));
            ++out._size;
        }
        return out;
    }

    // Prepends every element of `other` in reverse order, i.e. the result is
    // reverse(other) ++ *this.
    [[nodiscard]] persistent_list prepend_reversed(const persistent_list& other) const {
        persistent_list out = *this;
        for (const T& v : other) {
            out._head = _make_cell(v, std::move(out._head));
            ++out._size;
        }
        return out;
    }

    [[nodiscard]] std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(_size);
        for (const T& v : *this) out.push_back(v);
        return out;
    }

    // ========== Comparison ==========

    friend bool operator==(const persistent_list& a, const persistent_list& b)
        requires std::equality_comparable<T>
    {
        if (a._size != b._size) return false;
        const cell* x = a._head.get();
        const cell* y = b._head.get();
        while (x && y) {
            if (x == y) return true;  // Shared tail.
            if (!(x->value == y->value)) return false;
            x = x->next.get();
            y = y->next.get();
        }
        return x == y;
    }

private:
    void _release() noexcept {
        cell_ptr cur = std::move(_head);
        while (cur && cur.use_count() == 1) {
            // Detach the tail before the cell dies so its destructor does not
            // recurse into it.
            cell_ptr next = std::move(const_cast<cell&>(*cur).next);
            cur = std::move(next);
        }
        _size = 0;
    }

    cell_ptr _head{};
    size_type _size = 0;
};

}  // namespace tz

#endif  // TZ_PERSISTENT_LIST_HPP
