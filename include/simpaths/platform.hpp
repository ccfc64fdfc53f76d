#pragma once
/**
 * @file platform.hpp
 * @brief Platform detection for simpaths.
 *
 * The registry relies on POSIX advisory locks (flock), mkstemp/rename for
 * durable replace, and stat() timestamps. Every translation unit that needs
 * platform macros includes this header first.
 *
 * Build-system macros (PLATFORM_LINUX, PLATFORM_APPLE, PLATFORM_FREEBSD) take
 * precedence; compiler predefined macros are the fallback.
 */

#if defined(PLATFORM_LINUX)
#define SIMPATHS_PLATFORM_LINUX 1
#elif defined(PLATFORM_APPLE)
#define SIMPATHS_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define SIMPATHS_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define SIMPATHS_PLATFORM_LINUX 1
#elif defined(__APPLE__) && defined(__MACH__)
#define SIMPATHS_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define SIMPATHS_PLATFORM_FREEBSD 1
#endif

#if defined(SIMPATHS_PLATFORM_LINUX) || defined(SIMPATHS_PLATFORM_APPLE) ||                        \
    defined(SIMPATHS_PLATFORM_FREEBSD)
#define SIMPATHS_IS_POSIX 1
#else
#error "simpaths requires a POSIX platform (flock, mkstemp, rename)."
#endif

#include "simpaths_export.h"
