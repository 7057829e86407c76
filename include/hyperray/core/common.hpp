// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

// Debug-only invariant checks; compiled out unless HYPERRAY_DEBUG is defined
#if defined(HYPERRAY_DEBUG)
    #include <cassert>
    #define HYPERRAY_ASSERT(expr) assert(expr)
#else
    #define HYPERRAY_ASSERT(expr) ((void)0)
#endif
