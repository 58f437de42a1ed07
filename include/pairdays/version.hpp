/*
 * Fallback version header for pairdays
 *
 * The build system passes PAIRDAYS_VERSION_* definitions derived from the
 * CMake project version; these defaults keep the sources compiling without
 * them.
 */

#pragma once

#ifndef PAIRDAYS_VERSION_STRING
#define PAIRDAYS_VERSION_STRING "0.0.0+dev"
#endif

#ifndef PAIRDAYS_BUILD_DATE
#define PAIRDAYS_BUILD_DATE __DATE__ " " __TIME__
#endif

#ifndef PAIRDAYS_VERSION_LONG_STRING
#define PAIRDAYS_VERSION_LONG_STRING PAIRDAYS_VERSION_STRING " (built: " PAIRDAYS_BUILD_DATE ")"
#endif
