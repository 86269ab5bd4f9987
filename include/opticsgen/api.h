// api.h - Shared library export/import macros for opticsgen

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the opticsgen library.
///
/// - Building opticsgen as a SHARED library: CMake defines OPTICSGEN_EXPORTS
///   (private) and OPTICSGEN_SHARED (public), so OPTICSGEN_API exports.
/// - Consuming the SHARED library: OPTICSGEN_SHARED propagates, OPTICSGEN_API imports.
/// - STATIC builds: OPTICSGEN_API expands to nothing.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OPTICSGEN_SHARED
        #ifdef OPTICSGEN_EXPORTS
            #define OPTICSGEN_API __declspec(dllexport)
        #else
            #define OPTICSGEN_API __declspec(dllimport)
        #endif
    #else
        #define OPTICSGEN_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OPTICSGEN_SHARED) && defined(OPTICSGEN_EXPORTS)
        #define OPTICSGEN_API __attribute__((visibility("default")))
    #else
        #define OPTICSGEN_API
    #endif
#else
    #define OPTICSGEN_API
#endif
