// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for blob_transfer
 *
 * Central entry point for ecosystem integration flags. Include this header
 * to get the KCENON_WITH_* macros and BLOB_TRANSFER_USE_LOGGER_SYSTEM.
 *
 * Each KCENON_WITH_* macro follows the matching BUILD_WITH_* definition
 * that CMake adds when it finds the package.
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define BLOB_TRANSFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BLOB_TRANSFER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (Result types shared with thread_system jobs)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for chunk operations)
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

// network_system integration (HTTP client for the blob endpoint)
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
 * @brief Unified flag for logger_system usage in blob_transfer
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef BLOB_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define BLOB_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Runtime view of the build configuration
//==============================================================================

namespace kcenon::blob_transfer {

/**
 * @brief Ecosystem packages compiled into this build
 */
struct build_features {
    static constexpr bool common_system = KCENON_WITH_COMMON_SYSTEM != 0;
    static constexpr bool thread_system = KCENON_WITH_THREAD_SYSTEM != 0;
    static constexpr bool logger_system = BLOB_TRANSFER_USE_LOGGER_SYSTEM != 0;
    static constexpr bool network_system = KCENON_WITH_NETWORK_SYSTEM != 0;
};

}  // namespace kcenon::blob_transfer
