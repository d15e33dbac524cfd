#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PIXOPS_BUILD_SHARED: when building PixOps as shared library
 *   - PIXOPS_USE_SHARED: when using PixOps as shared library
 *   - neither: static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PIXOPS_BUILD_SHARED)
        #define PIXOPS_API __declspec(dllexport)
    #elif defined(PIXOPS_USE_SHARED)
        #define PIXOPS_API __declspec(dllimport)
    #else
        #define PIXOPS_API
    #endif
#else
    #if defined(PIXOPS_BUILD_SHARED)
        #define PIXOPS_API __attribute__((visibility("default")))
    #else
        #define PIXOPS_API
    #endif
#endif
