// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for media_fetch
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - MEDIA_FETCH_HAS_*    : Local feature availability (SFTP backend)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/media_fetch/config/feature_flags.h>
 *
 * #if MEDIA_FETCH_HAS_SFTP
 *     auto store = std::make_shared<sftp_remote_store>(options);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define MEDIA_FETCH_HAS_COMMON_FEATURE_FLAGS 1
#else
#define MEDIA_FETCH_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// media_fetch Feature Flags
//==============================================================================

/**
 * @brief SFTP remote backend (libssh)
 *
 * Set via CMake option MEDIA_FETCH_ENABLE_SFTP when libssh is found.
 */
#ifndef MEDIA_FETCH_HAS_SFTP
    #if defined(MEDIA_FETCH_ENABLE_SFTP)
        #define MEDIA_FETCH_HAS_SFTP 1
    #else
        #define MEDIA_FETCH_HAS_SFTP 0
    #endif
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

// thread_system integration (thread_pool for transfer workers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (async console writer)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif
