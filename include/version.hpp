#ifndef GIT_IGNORE_VERSION_HPP
#define GIT_IGNORE_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define GIT_IGNORE_VERSION_MAJOR 1
#define GIT_IGNORE_VERSION_MINOR 0
#define GIT_IGNORE_VERSION_PATCH 0

#define GIT_IGNORE_VERSION_STR "1.0.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GIT_IGNORE_VERSION = GIT_IGNORE_VERSION_STR;

#endif /* GIT_IGNORE_VERSION_HPP */
