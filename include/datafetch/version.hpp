/*
 * Fallback version header for datafetch
 *
 * The build system passes the real values as compile definitions; these
 * defaults keep the code compiling without them.
 */

#pragma once

#ifndef DATAFETCH_VERSION_MAJOR
#define DATAFETCH_VERSION_MAJOR 0
#endif

#ifndef DATAFETCH_VERSION_MINOR
#define DATAFETCH_VERSION_MINOR 0
#endif

#ifndef DATAFETCH_VERSION_PATCH
#define DATAFETCH_VERSION_PATCH 0
#endif

#ifndef DATAFETCH_VERSION_STRING
#define DATAFETCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef DATAFETCH_BUILD_DATE
#define DATAFETCH_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: ...)"
#ifndef DATAFETCH_VERSION_LONG_STRING
#define DATAFETCH_VERSION_LONG_STRING DATAFETCH_VERSION_STRING " (built: " DATAFETCH_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace datafetch::version {
constexpr int major_v = DATAFETCH_VERSION_MAJOR;
constexpr int minor_v = DATAFETCH_VERSION_MINOR;
constexpr int patch_v = DATAFETCH_VERSION_PATCH;
constexpr const char* string_v = DATAFETCH_VERSION_STRING;
constexpr const char* long_string_v = DATAFETCH_VERSION_LONG_STRING;
} // namespace datafetch::version
#endif
