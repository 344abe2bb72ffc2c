/**
 * @file export.hpp
 * @brief Symbol visibility macros for the memqueue_services shared library.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MEMQUEUE_SERVICES_BUILD)
        #define MEMQUEUE_SERVICES_API __declspec(dllexport)
    #else
        #define MEMQUEUE_SERVICES_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MEMQUEUE_SERVICES_BUILD)
        #define MEMQUEUE_SERVICES_API __attribute__((visibility("default")))
    #else
        #define MEMQUEUE_SERVICES_API
    #endif
#else
    #define MEMQUEUE_SERVICES_API
#endif
