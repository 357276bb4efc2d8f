#pragma once

/// @file export.hpp
/// Symbol visibility for the public libsvcloc API.
///
/// CMake sets LIBSVCLOC_BUILDING while compiling the library and exports
/// LIBSVCLOC_STATIC to consumers of a static build.  The library target is
/// compiled with hidden visibility, so only LIBSVCLOC_EXPORT symbols leave
/// a shared build.

#if defined(_WIN32) || defined(__CYGWIN__)
  #define LIBSVCLOC_DLL_EXPORT __declspec(dllexport)
  #define LIBSVCLOC_DLL_IMPORT __declspec(dllimport)
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBSVCLOC_DLL_EXPORT __attribute__((visibility("default")))
  #define LIBSVCLOC_DLL_IMPORT __attribute__((visibility("default")))
#else
  #define LIBSVCLOC_DLL_EXPORT
  #define LIBSVCLOC_DLL_IMPORT
#endif

#if defined(LIBSVCLOC_STATIC)
  #define LIBSVCLOC_EXPORT
#elif defined(LIBSVCLOC_BUILDING)
  #define LIBSVCLOC_EXPORT LIBSVCLOC_DLL_EXPORT
#else
  #define LIBSVCLOC_EXPORT LIBSVCLOC_DLL_IMPORT
#endif
