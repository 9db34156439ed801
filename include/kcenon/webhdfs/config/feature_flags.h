// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for webhdfs_client
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - WEBHDFS_HAS_*        : Optional backends compiled into the library
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/webhdfs/config/feature_flags.h>
 *
 * #if WEBHDFS_HAS_NETWORK_SYSTEM
 *     auto session = std::make_shared<network_http_session>(timeout);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define WEBHDFS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define WEBHDFS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for batch transfers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client used by the production session)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// webhdfs_client Feature Flags
//==============================================================================

/**
 * @brief HTTP backend availability
 *
 * When disabled, network_http_session reports error_code::not_available and
 * callers must inject their own http_session implementation.
 */
#ifndef WEBHDFS_HAS_NETWORK_SYSTEM
    #define WEBHDFS_HAS_NETWORK_SYSTEM KCENON_WITH_NETWORK_SYSTEM
#endif

/**
 * @brief thread_system worker pool availability
 */
#ifndef WEBHDFS_HAS_THREAD_SYSTEM
    #define WEBHDFS_HAS_THREAD_SYSTEM KCENON_WITH_THREAD_SYSTEM
#endif

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system integration requires common_system.
 */
#ifndef WEBHDFS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define WEBHDFS_USE_LOGGER_SYSTEM 1
    #else
        #define WEBHDFS_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef WEBHDFS_PRINT_FEATURE_SUMMARY

#pragma message("=== webhdfs_client Feature Summary ===")

#if WEBHDFS_HAS_NETWORK_SYSTEM
    #pragma message("  HTTP backend (network_system): Enabled")
#else
    #pragma message("  HTTP backend (network_system): Disabled")
#endif

#if WEBHDFS_HAS_THREAD_SYSTEM
    #pragma message("  Worker pool (thread_system): Enabled")
#else
    #pragma message("  Worker pool (thread_system): std::thread fallback")
#endif

#if WEBHDFS_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: stderr fallback")
#endif

#pragma message("======================================")

#endif  // WEBHDFS_PRINT_FEATURE_SUMMARY
