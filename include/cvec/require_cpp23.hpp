#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for cvec
 *
 * This header verifies at compile time that the standard library provides
 * the C++23 features cvec relies on. It is included by the vector library so
 * an insufficient toolchain fails with a readable message.
 *
 * Required compiler versions:
 *   - GCC 13.0+
 *   - Clang 18.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "cvec requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> / VoidResult error handling

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "cvec requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: field iteration in the strict grammar check

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "cvec requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// =============================================================================
// std::to_underlying (__cpp_lib_to_underlying)
// =============================================================================
// Required for: rendering Version and spin parameter enums

#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "cvec requires std::to_underlying (__cpp_lib_to_underlying >= 202102L)."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: value rendering and error messages

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'106L
    #error "cvec requires std::format (__cpp_lib_format >= 202106L)."
#endif

#define CVEC_CPP23_FEATURES_VERIFIED 1
