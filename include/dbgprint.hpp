#pragma once

#include <fmt/format.h>

// tracing for the merge passes, compiled out unless CIDRKIT_DEBUG is set
#if CIDRKIT_DEBUG
#define DBG_PRINT(...) fmt::print(stderr, __VA_ARGS__)
#else
#define DBG_PRINT(...)
#endif
