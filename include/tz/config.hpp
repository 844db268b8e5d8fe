// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_CONFIG_HPP
#define TZ_CONFIG_HPP

// Configuration and feature-detection for tz.
//
// Baseline: C++20 (concepts constrain the capability contract)
// Optional: C++23
//
// This header intentionally contains only preprocessor logic.

#ifndef TZ_POOL_SLAB_DEPTH
// Per-class slot capacity of the thread-local small-block pool used for
// sibling-list cells and breadcrumb frames.  A walk that goes down and back up
// releases one breadcrumb and a handful of cells per level, so a depth of 16
// covers typical trees without returning blocks to malloc.
#define TZ_POOL_SLAB_DEPTH 16
#endif

// TZ_ENABLE_PROFILING: define before including any tz header to log scoped
// timings of the traversal drivers to std::clog (see tz/profiling.hpp).

// TZ_HOOKS_ALWAYS_DEFAULT: define to hard-wire the default allocation path and
// ignore tz::set_alloc_hooks() (see tz/alloc_hooks.hpp).

// -------- Language version detection --------

#if defined(_MSVC_LANG)
#define TZ_CPP_LANG _MSVC_LANG
#else
#define TZ_CPP_LANG __cplusplus
#endif

#if TZ_CPP_LANG >= 202302L
#define TZ_HAS_CPP23 1
#else
#define TZ_HAS_CPP23 0
#endif

#if TZ_CPP_LANG >= 202002L
#define TZ_HAS_CPP20 1
#else
#define TZ_HAS_CPP20 0
#endif

#if !TZ_HAS_CPP20
#error "tz requires C++20 or later"
#endif

// Branch hints
#if defined(__GNUC__) || defined(__clang__)
#define TZ_LIKELY(x) __builtin_expect(!!(x), 1)
#define TZ_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define TZ_LIKELY(x) (x)
#define TZ_UNLIKELY(x) (x)
#endif

#endif  // TZ_CONFIG_HPP
