// uuidkit

#pragma once

#if !defined(UK_ASSERT)
#include <cassert>
#define UK_ASSERT(x, ...) assert(x)
#endif

#if _MSC_VER
#define UK_BREAK() __debugbreak()
#else
#define UK_BREAK() (void)0
#endif

#if !defined(UK_VERIFY)
#define UK_VERIFY(x, ...) !!((x) || (UK_BREAK(), false))
#endif

// unrecoverable misuse; active in every build configuration
#if !defined(UK_FATAL)
#include <cstdio>
#include <cstdlib>
#define UK_FATAL(message) (std::fputs("uuidkit: " message "\n", stderr), UK_BREAK(), std::abort())
#endif

#define UK_GUARD_OR(x, r, ...) \
    if (UK_VERIFY(x))          \
    {                          \
    }                          \
    else                       \
    {                          \
        UK_BREAK();            \
        return (r);            \
    }

#define UK_REQUIRE(x, message) \
    if (UK_VERIFY(x))          \
    {                          \
    }                          \
    else                       \
    {                          \
        UK_FATAL(message);     \
    }
