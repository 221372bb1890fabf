// api.h - DLL export/import macros for json_diff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the json_diff library.
///
/// Usage:
/// - When building json_diff as a SHARED library:
///   - CMake defines JSON_DIFF_EXPORTS (private) and JSON_DIFF_SHARED (public)
///   - Functions/classes marked with JSON_DIFF_API will be exported
///
/// - When using json_diff as a SHARED library:
///   - Link against the json_diff target (CMake propagates JSON_DIFF_SHARED)
///   - Functions/classes marked with JSON_DIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSON_DIFF_API expands to nothing
///
/// Example:
/// @code
/// class JSON_DIFF_API PatchGenerator { ... };
/// JSON_DIFF_API PatchResult generate_patch(...);
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSON_DIFF_SHARED
        #ifdef JSON_DIFF_EXPORTS
            #define JSON_DIFF_API __declspec(dllexport)
        #else
            #define JSON_DIFF_API __declspec(dllimport)
        #endif
    #else
        #define JSON_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSON_DIFF_SHARED) && defined(JSON_DIFF_EXPORTS)
        #define JSON_DIFF_API __attribute__((visibility("default")))
    #else
        #define JSON_DIFF_API
    #endif
#else
    #define JSON_DIFF_API
#endif

// ============================================================
// Template Export Helpers
// ============================================================

// Usage in header:  JSON_DIFF_EXTERN_TEMPLATE struct BasicValue<...>;
// Usage in source:  template struct BasicValue<...>;

#define JSON_DIFF_EXTERN_TEMPLATE extern template
