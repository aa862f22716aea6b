#ifndef GITSTAT_VERSION_HPP
#define GITSTAT_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros (safe for .rc files)               */
#define GITSTAT_VERSION_MAJOR 0
#define GITSTAT_VERSION_MINOR 1
#define GITSTAT_VERSION_PATCH 0

/* Keep in sync with project(VERSION) in CMakeLists.txt. */
#define GITSTAT_VERSION_STR "0.1.0"
#define GITSTAT_VERSION_RC GITSTAT_VERSION_MAJOR, GITSTAT_VERSION_MINOR, GITSTAT_VERSION_PATCH, 0
/* ------------------------------------------------------------------ */

#ifndef RC_INVOKED
/* Human-friendly version string for the C++ codebase */
constexpr const char* GITSTAT_VERSION = GITSTAT_VERSION_STR;
#endif /* RC_INVOKED */

#endif /* GITSTAT_VERSION_HPP */
