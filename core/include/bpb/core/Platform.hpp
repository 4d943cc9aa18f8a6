/**
 * @file Platform.hpp
 * @brief Compile-time platform and compiler detection.
 *
 * The BLE backend and the gamepad driver are both selected from the
 * BPB_OS_* macros defined here, so a given build carries exactly one
 * implementation of each.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_PLATFORM_HPP
    #define BPB_CORE_PLATFORM_HPP

// ---- Operating System ----------------------------------------------------

    #if defined(_WIN32) || defined(_WIN64)
        #define BPB_OS_WINDOWS 1
    #elif defined(__APPLE__)
        #define BPB_OS_MACOS   1
    #elif defined(__linux__)
        #define BPB_OS_LINUX   1
    #else
        #define BPB_OS_UNKNOWN 1
    #endif

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__) || defined(__GNUC__)
        #define BPB_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define BPB_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define BPB_LIKELY(x)       (x)
        #define BPB_UNLIKELY(x)     (x)
    #endif

#endif // BPB_CORE_PLATFORM_HPP
