/**
 * @file export.hpp
 * @brief Symbol visibility macros for the uuidcore_core library.
 *
 * Defines UUIDCORE_CORE_API. The build defines UUIDCORE_CORE_BUILD while
 * compiling the library itself.
 *
 * @copyright Copyright (c) 2024 uuidcore Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(UUIDCORE_CORE_BUILD)
        #define UUIDCORE_CORE_API __declspec(dllexport)
    #else
        #define UUIDCORE_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(UUIDCORE_CORE_BUILD)
        #define UUIDCORE_CORE_API __attribute__((visibility("default")))
    #else
        #define UUIDCORE_CORE_API
    #endif
#else
    #define UUIDCORE_CORE_API
#endif
