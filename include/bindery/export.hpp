#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   BINDERY_BUILDING: defined when compiling the bindery library itself
///   BINDERY_STATIC: define when building/linking bindery as a static lib

#if defined(BINDERY_STATIC)
  #define BINDERY_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef BINDERY_BUILDING
    #define BINDERY_EXPORT __declspec(dllexport)
  #else
    #define BINDERY_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define BINDERY_EXPORT __attribute__((visibility("default")))
#else
  #define BINDERY_EXPORT
#endif
