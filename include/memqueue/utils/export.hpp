/**
 * @file export.hpp
 * @brief Symbol visibility macros for the memqueue_utils shared library.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MEMQUEUE_UTILS_BUILD)
        #define MEMQUEUE_UTILS_API __declspec(dllexport)
    #else
        #define MEMQUEUE_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MEMQUEUE_UTILS_BUILD)
        #define MEMQUEUE_UTILS_API __attribute__((visibility("default")))
    #else
        #define MEMQUEUE_UTILS_API
    #endif
#else
    #define MEMQUEUE_UTILS_API
#endif
