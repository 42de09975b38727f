#ifndef SELFSYNC_VERSION_HPP
#define SELFSYNC_VERSION_HPP

/* ------------------------------------------------------------------
   Numeric version macros                                            */
#define SELFSYNC_VERSION_MAJOR 0
#define SELFSYNC_VERSION_MINOR 3
#define SELFSYNC_VERSION_PATCH 0

/*
 * Release tag stamped by the packaging job.
 * Example format: "0.3.0" or "0.3.0-rc1".
 */
#define SELFSYNC_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

constexpr const char* SELFSYNC_VERSION = SELFSYNC_VERSION_STR;

#endif /* SELFSYNC_VERSION_HPP */
