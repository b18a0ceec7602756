/**
 * @file export.hpp
 * @brief Symbol visibility macros for the uuidcore_utils library.
 *
 * Defines UUIDCORE_UTILS_API. The build defines UUIDCORE_UTILS_BUILD while
 * compiling the library itself.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UUIDCORE_UTILS_BUILD)
        #define UUIDCORE_UTILS_API __declspec(dllexport)
    #else
        #define UUIDCORE_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UUIDCORE_UTILS_BUILD)
        #define UUIDCORE_UTILS_API __attribute__((visibility("default")))
    #else
        #define UUIDCORE_UTILS_API
    #endif
#else
    #define UUIDCORE_UTILS_API
#endif
