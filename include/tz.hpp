// Copyright (c) 2026 Jayden Emmanuel.
// Licensed under the FL License. See LICENSE.txt for details.

#ifndef TZ_HPP
#define TZ_HPP

// Umbrella header for the tz library.  Including this single header pulls in
// the cursor, the traversal drivers, the pre-order view and both tree
// adapters.

#include "tz/config.hpp"
#include "tz/capability.hpp"
#include "tz/persistent_list.hpp"
#include "tz/cursor.hpp"
#include "tz/traverse.hpp"
#include "tz/preorder.hpp"
#include "tz/adapters/nested_list.hpp"
#include "tz/adapters/keyed_map.hpp"

namespace tz {
    constexpr int MAJOR_VERSION = 1;
    constexpr int MINOR_VERSION = 0;
    constexpr int PATCH_VERSION = 0;

    // Returns the library version as a human-readable string.
    inline const char* version() noexcept {
        return "1.0.0";
    }
}

#endif  // TZ_HPP
