/**
 * @file feature_flags.h
 * @brief Feature and integration flags for remote_project
 *
 * Include this header to get the REMOTE_PROJECT_* and KCENON_WITH_* macros.
 *
 * - KCENON_WITH_*               : kcenon ecosystem integrations (set from BUILD_WITH_*)
 * - REMOTE_PROJECT_USE_LOGGER_SYSTEM : logger_system backend for the library logger
 *
 * @code
 * #include <cavesync/remote_project/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto client = std::make_shared<kcenon::network::core::http_client>(timeout);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// common_system feature flags
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define REMOTE_PROJECT_HAS_COMMON_FEATURE_FLAGS 1
#else
#define REMOTE_PROJECT_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pool for async operations)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP transport)
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
 * @brief Whether the library logger forwards to logger_system
 *
 * logger_system requires common_system, so both integrations must be on.
 */
#ifndef REMOTE_PROJECT_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define REMOTE_PROJECT_USE_LOGGER_SYSTEM 1
    #else
        #define REMOTE_PROJECT_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef REMOTE_PROJECT_PRINT_FEATURE_SUMMARY

#pragma message("=== remote_project Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async fallback)")
#endif

#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr writer)")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("======================================")

#endif // REMOTE_PROJECT_PRINT_FEATURE_SUMMARY
