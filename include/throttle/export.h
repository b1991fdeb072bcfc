// include/throttle/export.h
#pragma once

#if defined(_WIN32)
  // Set by the build when compiling the shared C ABI itself.
  #if defined(THROTTLE_EXPORTS)
    #define THROTTLE_API __declspec(dllexport)
  #elif !defined(THROTTLE_STATIC)
    #define THROTTLE_API __declspec(dllimport)
  #else
    #define THROTTLE_API
  #endif
#else
  // Non-Windows, or static build
  #define THROTTLE_API
#endif
