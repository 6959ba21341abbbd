/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Provides the branch-prediction hint used by the contract macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CORE_PLATFORM_HPP
    #define HIVE_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define HIVE_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define HIVE_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define HIVE_COMPILER_MSVC  1
    #else
        #define HIVE_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(HIVE_COMPILER_GCC) || defined(HIVE_COMPILER_CLANG)
        #define HIVE_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define HIVE_UNLIKELY(x)     (x)
    #endif

#endif // HIVE_CORE_PLATFORM_HPP
