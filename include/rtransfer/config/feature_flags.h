// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for rtransfer
 *
 * Central entry point for integration flags. The core state machine,
 * negotiator and tracker never depend on these; only the logging backend
 * and the concrete HTTP adapters do.
 *
 * - KCENON_WITH_*           : ecosystem integration flags (set by CMake)
 * - RTRANSFER_USE_LOGGER_SYSTEM : logger_system backend for RT_LOG_* macros
 *
 * @code
 * #include <rtransfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto response = client->get(url, {}, headers);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define RTRANSFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define RTRANSFER_HAS_COMMON_FEATURE_FLAGS 0
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

// logger_system integration (structured logging backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client for fetch and probe adapters)
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
 * @brief Whether RT_LOG_* records are forwarded to logger_system
 *
 * logger_system needs common_system; without both, records go to stderr.
 */
#ifndef RTRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define RTRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define RTRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef RTRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== rtransfer Feature Summary ===")

#if RTRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Not Available (stderr logging)")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Enabled")
#else
    #pragma message("  network_system: Not Available (HTTP adapters disabled)")
#endif

#pragma message("=================================")

#endif // RTRANSFER_PRINT_FEATURE_SUMMARY
