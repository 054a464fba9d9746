#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(HOOKSEAL_EXPORTS)
    #define HKS_API __declspec(dllexport)
  #elif defined(HOOKSEAL_SHARED)
    #define HKS_API __declspec(dllimport)
  #else
    #define HKS_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define HKS_API __attribute__((visibility("default")))
#else
  #define HKS_API
#endif
