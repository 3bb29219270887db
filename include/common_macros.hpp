#pragma once

#include <cstdlib>
#include <iostream>

#ifdef DEBUG_BUILD
#define DEBUG_PRINT(...)                                                     \
  do {                                                                       \
    std::cerr << __VA_ARGS__ << std::endl;                                   \
  } while (0)
#else
#define DEBUG_PRINT(...) // No operation
#endif

// Printed only when KUBEPLANE_VERBOSE is set, before logging is configured.
#define KUBEPLANE_VERBOSE_LOG(...)                     \
  do {                                                 \
    if (std::getenv("KUBEPLANE_VERBOSE") != nullptr) { \
      std::cerr << __VA_ARGS__ << std::endl;           \
    }                                                  \
  } while (0)
