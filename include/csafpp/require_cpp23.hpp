#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for csafpp
 *
 * Included by common.hpp so every translation unit gets a clear error when
 * the toolchain lacks a library feature csafpp depends on.
 *
 * Required compiler versions:
 *   - GCC 12.0+
 *   - Clang 16.0+ (with libstdc++ 12+ or libc++ 16+)
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus <= 202'002L
    #error "csafpp requires C++23 or later (-std=c++23)."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: ParseResult / InteropResult / Result error propagation
// Minimum value: 202202L

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "csafpp requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 12+ or Clang 16+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================
// Required for: range algorithms over model collections

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 201'911L
    #error "csafpp requires std::ranges (__cpp_lib_ranges >= 201911L)."
#endif

// =============================================================================
// <chrono> (__cpp_lib_chrono)
// =============================================================================
// Required for: Timestamp civil-date conversion (sys_days, year_month_day)

#if !defined(__cpp_lib_chrono) || __cpp_lib_chrono < 201'611L
    #error "csafpp requires <chrono> calendar support (__cpp_lib_chrono >= 201611L)."
#endif

#define CSAFPP_CPP23_FEATURES_VERIFIED 1
