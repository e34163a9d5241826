/*
 * Version macros for namesmith.
 *
 * The build passes NAMESMITH_VERSION_* as compile definitions taken from the CMake
 * project version. The defaults below keep the header usable on its own.
 */

#pragma once

#ifndef NAMESMITH_VERSION_MAJOR
#define NAMESMITH_VERSION_MAJOR 0
#endif

#ifndef NAMESMITH_VERSION_MINOR
#define NAMESMITH_VERSION_MINOR 0
#endif

#ifndef NAMESMITH_VERSION_PATCH
#define NAMESMITH_VERSION_PATCH 0
#endif

#ifndef NAMESMITH_VERSION_STRING
#define NAMESMITH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef NAMESMITH_BUILD_DATE
#define NAMESMITH_BUILD_DATE __DATE__ " " __TIME__
#endif

#if defined(__cplusplus)
namespace namesmith {
namespace version {
constexpr int major_v = NAMESMITH_VERSION_MAJOR;
constexpr int minor_v = NAMESMITH_VERSION_MINOR;
constexpr int patch_v = NAMESMITH_VERSION_PATCH;
constexpr const char* string_v = NAMESMITH_VERSION_STRING;
constexpr const char* build_date_v = NAMESMITH_BUILD_DATE;
} // namespace version
} // namespace namesmith
#endif
