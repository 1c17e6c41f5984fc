// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for object_trans_system
 *
 * This is the central entry point for all feature detection and integration
 * flags in the object_trans_system library. Include this header to get access
 * to all OBJECT_TRANS_HAS_* and KCENON_WITH_* feature macros.
 *
 * Feature categories:
 * - OBJECT_TRANS_HAS_*   : Local feature availability (request signing, etc.)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/object_transfer/config/feature_flags.h>
 *
 * #if OBJECT_TRANS_HAS_REQUEST_SIGNING
 *     headers["Authorization"] = sign(request);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define OBJECT_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define OBJECT_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Object Transfer System Feature Flags
//==============================================================================

/**
 * @brief Request signing support (OpenSSL)
 *
 * When enabled, the S3 object store client signs requests with AWS SigV4
 * using OpenSSL HMAC-SHA256. Set via CMake option OBJECT_TRANS_ENABLE_SIGNING.
 * Without it only anonymous requests against public buckets are possible.
 */
#ifndef OBJECT_TRANS_HAS_REQUEST_SIGNING
    #if defined(OBJECT_TRANS_ENABLE_SIGNING)
        #define OBJECT_TRANS_HAS_REQUEST_SIGNING 1
    #else
        #define OBJECT_TRANS_HAS_REQUEST_SIGNING 0
    #endif
#endif

/**
 * @brief POSIX subprocess support
 *
 * The bulk-tool runner relies on fork/exec/pipe. Always on for POSIX targets.
 */
#ifndef OBJECT_TRANS_HAS_POSIX_PROCESS
    #if defined(__unix__) || defined(__APPLE__)
        #define OBJECT_TRANS_HAS_POSIX_PROCESS 1
    #else
        #define OBJECT_TRANS_HAS_POSIX_PROCESS 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (always available when feature_flags.h is included)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for the traditional path)
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

// network_system integration (HTTP client for object store requests)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in object_transfer
 *
 * logger_system depends on common_system's result types, so both have to be
 * present before the logger is routed through it.
 */
#ifndef OBJECT_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define OBJECT_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define OBJECT_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef OBJECT_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Object Transfer System Feature Summary ===")

#if OBJECT_TRANS_HAS_REQUEST_SIGNING
    #pragma message("  Request signing (OpenSSL): Enabled")
#else
    #pragma message("  Request signing (OpenSSL): Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("==============================================")

#endif // OBJECT_TRANS_PRINT_FEATURE_SUMMARY
