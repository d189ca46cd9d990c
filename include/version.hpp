#ifndef WATCHRUN_VERSION_HPP
#define WATCHRUN_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define WATCHRUN_VERSION_MAJOR 0
#define WATCHRUN_VERSION_MINOR 1
#define WATCHRUN_VERSION_PATCH 0

#define WATCHRUN_VERSION_STR "0.1.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* WATCHRUN_VERSION = WATCHRUN_VERSION_STR;

#endif /* WATCHRUN_VERSION_HPP */
