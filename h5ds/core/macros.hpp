#pragma once

#include "h5ds/config.hpp"

// =============================================================================
// FILE: h5ds/core/macros.hpp
// BRIEF: Compiler abstractions and attribute helpers
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define H5DS_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define H5DS_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define H5DS_LIKELY(x)   (x)
    #define H5DS_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Compiler Attributes
// =============================================================================

#if defined(__has_cpp_attribute)
    #if __has_cpp_attribute(nodiscard) >= 201603L
        #define H5DS_NODISCARD [[nodiscard]]
    #else
        #define H5DS_NODISCARD
    #endif
#else
    #define H5DS_NODISCARD
#endif

// =============================================================================
// SECTION 3: Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define H5DS_EXPORT __declspec(dllexport)
#else
    #define H5DS_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 4: Stringification
// =============================================================================

#define H5DS_STRINGIFY_IMPL(x) #x
#define H5DS_STRINGIFY(x) H5DS_STRINGIFY_IMPL(x)
