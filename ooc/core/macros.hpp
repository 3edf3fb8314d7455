#pragma once

#include "ooc/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: ooc/core/macros.hpp
// BRIEF: Compiler abstractions shared by the engine
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define OOC_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define OOC_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define OOC_NODISCARD [[nodiscard]]
    #else
        #define OOC_NODISCARD
    #endif
#else
    #define OOC_NODISCARD
#endif

// =============================================================================
// SECTION 3: Visibility
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define OOC_EXPORT __attribute__((visibility("default")))
#else
    #define OOC_EXPORT
#endif

// =============================================================================
// SECTION 4: Misc
// =============================================================================

/// Silence unused-variable warnings for values kept for debugging
#define OOC_UNUSED(x) ((void)(x))
