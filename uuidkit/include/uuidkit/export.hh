// uuidkit

#pragma once

// UK_SHARED is set for every consumer of a shared uuidkit build,
// UK_EXPORT only while compiling uuidkit itself
#if !defined(UK_SHARED)
#define UK_API
#elif defined(_WINDOWS)
#if defined(UK_EXPORT)
#define UK_API __declspec(dllexport)
#else
#define UK_API __declspec(dllimport)
#endif
#else
#define UK_API [[gnu::visibility("default")]]
#endif
