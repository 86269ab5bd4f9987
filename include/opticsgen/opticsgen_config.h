// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file opticsgen_config.h
/// @brief Centralized configuration for opticsgen and its dependencies
///
/// Compile-time configuration for the third-party libraries used by opticsgen:
///   - immer: persistent containers holding every derived artifact
///   - zug: function composition in the runtime interpreter
///   - lager: lenses built by the runtime interpreter
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All opticsgen public headers include this file first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OPTICSGEN_CONFIGURED)
#error "immer headers were included before opticsgen/opticsgen_config.h. " \
       "Please include opticsgen headers before any direct immer includes."
#endif

#define OPTICSGEN_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting
///
/// Shape analysis is independent per type and callers are free to analyse
/// types from several threads, sharing the resulting immer containers.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks (only lenses are used)
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose Logging
//
// When OPTICSGEN_VERBOSE_LOG is 1, analysis and generation steps log
// to stderr. Disabled in release builds and enabled in debug builds.
//
// To explicitly enable: #define OPTICSGEN_VERBOSE_LOG 1
// To explicitly disable: #define OPTICSGEN_VERBOSE_LOG 0
// ============================================================

#ifndef OPTICSGEN_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OPTICSGEN_VERBOSE_LOG 0
#  else
#    define OPTICSGEN_VERBOSE_LOG 1
#  endif
#endif

#ifdef OPTICSGEN_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("opticsgen: immer thread safety DISABLED")
#else
#pragma message("opticsgen: immer thread safety ENABLED")
#endif
#if OPTICSGEN_VERBOSE_LOG
#pragma message("opticsgen: verbose logging ENABLED")
#endif
#endif // OPTICSGEN_CONFIG_VERBOSE
