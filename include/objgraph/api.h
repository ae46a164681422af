// api.h - DLL export/import macros for objgraph

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for objgraph library.
///
/// Usage:
/// - When building objgraph as a SHARED library:
///   - CMake defines OBJGRAPH_EXPORTS (private) and OBJGRAPH_SHARED (public)
///   - Functions/classes marked with OBJGRAPH_API will be exported
///
/// - When using objgraph as a SHARED library:
///   - Link against the objgraph target (CMake propagates OBJGRAPH_SHARED)
///   - Functions/classes marked with OBJGRAPH_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, OBJGRAPH_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OBJGRAPH_SHARED
        #ifdef OBJGRAPH_EXPORTS
            #define OBJGRAPH_API __declspec(dllexport)
        #else
            #define OBJGRAPH_API __declspec(dllimport)
        #endif
    #else
        #define OBJGRAPH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OBJGRAPH_SHARED) && defined(OBJGRAPH_EXPORTS)
        #define OBJGRAPH_API __attribute__((visibility("default")))
    #else
        #define OBJGRAPH_API
    #endif
#else
    #define OBJGRAPH_API
#endif
