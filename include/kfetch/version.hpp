/*
 * Version macros for kfetch
 *
 * The build system defines KFETCH_VERSION_* from project(VERSION ...); these
 * defaults only apply when a translation unit is compiled outside of it.
 */

#pragma once

#ifndef KFETCH_VERSION_MAJOR
#define KFETCH_VERSION_MAJOR 0
#endif

#ifndef KFETCH_VERSION_MINOR
#define KFETCH_VERSION_MINOR 0
#endif

#ifndef KFETCH_VERSION_PATCH
#define KFETCH_VERSION_PATCH 0
#endif

#ifndef KFETCH_VERSION_STRING
#define KFETCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef KFETCH_BUILD_DATE
#define KFETCH_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: <date>)"
#define KFETCH_VERSION_LONG_STRING KFETCH_VERSION_STRING " (built: " KFETCH_BUILD_DATE ")"

#if defined(__cplusplus)
namespace kfetch {
namespace version {
constexpr int major_v = KFETCH_VERSION_MAJOR;
constexpr int minor_v = KFETCH_VERSION_MINOR;
constexpr int patch_v = KFETCH_VERSION_PATCH;
constexpr const char* string_v = KFETCH_VERSION_STRING;
constexpr const char* long_string_v = KFETCH_VERSION_LONG_STRING;
} // namespace version
} // namespace kfetch
#endif
