// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_PROFILING_HPP
#define TZ_PROFILING_HPP

// Optional scoped profiler for the tz library.
//
// Define TZ_ENABLE_PROFILING before including this header to log how long each
// traversal driver (tz::traverse, tz::traverse_while, tz::map, tz::find) takes,
// together with the number of nodes it visited.  Output goes to std::clog.
// When the macro is not defined the profiler compiles to a zero-cost no-op.

#include <cstddef>
#include <string_view>

#ifdef TZ_ENABLE_PROFILING

#include <chrono>
#include <iostream>
#include <string>

namespace tz {
class profiler {
public:
    explicit profiler(std::string_view label)
        : _label(label), _start(std::chrono::steady_clock::now()) {}
    ~profiler() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - _start).count();
        std::clog << "[tz::profiler] " << _label << " took " << duration << " us";
        if (_visits != 0) std::clog << " (" << _visits << " nodes)";
        std::clog << '\n';
    }

    profiler(const profiler&) = delete;
    profiler& operator=(const profiler&) = delete;

    // Counts one visited node.
    void visit() noexcept { ++_visits; }

private:
    std::string _label;
    std::chrono::steady_clock::time_point _start;
    std::size_t _visits = 0;
};
}

#else  // TZ_ENABLE_PROFILING

namespace tz {
class profiler {
public:
    constexpr explicit profiler(const char*) noexcept {}
    constexpr explicit profiler(std::string_view) noexcept {}
    ~profiler() noexcept = default;

    constexpr void visit() noexcept {}
};
}

#endif  // TZ_ENABLE_PROFILING

#endif  // TZ_PROFILING_HPP
