// api.h - DLL export/import macros for objdiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for objdiff library.
///
/// Usage:
/// - When building objdiff as a SHARED library:
///   - CMake automatically defines OBJDIFF_EXPORTS (private) and OBJDIFF_SHARED (public)
///   - Functions/classes marked with OBJDIFF_API will be exported
///
/// - When using objdiff as a SHARED library:
///   - Link against objdiff target (CMake propagates OBJDIFF_SHARED)
///   - Functions/classes marked with OBJDIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, OBJDIFF_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OBJDIFF_SHARED
        #ifdef OBJDIFF_EXPORTS
            #define OBJDIFF_API __declspec(dllexport)
        #else
            #define OBJDIFF_API __declspec(dllimport)
        #endif
    #else
        #define OBJDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OBJDIFF_SHARED) && defined(OBJDIFF_EXPORTS)
        #define OBJDIFF_API __attribute__((visibility("default")))
    #else
        #define OBJDIFF_API
    #endif
#else
    #define OBJDIFF_API
#endif
