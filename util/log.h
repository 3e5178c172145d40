/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef UTIL_LOG_H_
#define UTIL_LOG_H_

#include <config.h>

/* The idea of this is to be able to have one big log file for the entire
 * process, and grep out what you care about. So each module should have its
 * own entry in the enum. Be sure to add new enum entries to the switch in
 * log.cpp
 */
typedef enum {
    GDYN_DEBUG_MEMORY,
    GDYN_DEBUG_CONTEXT,
    GDYN_DEBUG_LIBRARY,
    GDYN_DEBUG_GOBJECT,
    GDYN_DEBUG_GFUNCTION,
    GDYN_DEBUG_GCLOSURE,
    GDYN_DEBUG_GBOXED,
    GDYN_DEBUG_GFUNDAMENTAL,
    GDYN_DEBUG_MARSHAL,
    GDYN_DEBUG_LAST,
} GdynDebugTopic;

/* These defines are because we have some pretty expensive and extremely
 * verbose debug output in certain areas, that's useful sometimes, but just
 * too much to compile in by default. They are switched on from the build
 * configuration.
 *
 * Don't use these special "disabled by default" log macros to print anything
 * that's an abnormal or error situation.
 *
 * Don't use them for one-time events, either. They are for routine stuff that
 * happens over and over and would deluge the logs, so should be off by
 * default.
 */

/* Whether to be verbose about argument, return value and callback marshaling */
#ifndef GDYN_VERBOSE_ENABLE_MARSHAL
#define GDYN_VERBOSE_ENABLE_MARSHAL 0
#endif

/* Whether to be verbose about constructing and destroying native wrappers */
#ifndef GDYN_VERBOSE_ENABLE_LIFECYCLE
#define GDYN_VERBOSE_ENABLE_LIFECYCLE 0
#endif

/* Whether to log all callback GClosure debugging (finalizing, invalidating etc)
 */
#ifndef GDYN_VERBOSE_ENABLE_GCLOSURE
#define GDYN_VERBOSE_ENABLE_GCLOSURE 0
#endif

#if GDYN_VERBOSE_ENABLE_MARSHAL
#    define GDYN_USED_VERBOSE_MARSHAL
#    define gdyn_debug_marshal(topic, ...) \
        do {                               \
            gdyn_debug(topic, __VA_ARGS__); \
        } while (0)
#else
#    define GDYN_USED_VERBOSE_MARSHAL [[maybe_unused]]
#    define gdyn_debug_marshal(topic, ...) ((void)0)
#endif

#if GDYN_VERBOSE_ENABLE_LIFECYCLE
#    define GDYN_USED_VERBOSE_LIFECYCLE
#    define gdyn_debug_lifecycle(topic, ...) \
        do {                                 \
            gdyn_debug(topic, __VA_ARGS__);  \
        } while (0)
#else
#    define GDYN_USED_VERBOSE_LIFECYCLE [[maybe_unused]]
#    define gdyn_debug_lifecycle(topic, ...) ((void)0)
#endif

#if GDYN_VERBOSE_ENABLE_GCLOSURE
#    define GDYN_USED_VERBOSE_GCLOSURE
#    define gdyn_debug_closure(...)                       \
        do {                                              \
            gdyn_debug(GDYN_DEBUG_GCLOSURE, __VA_ARGS__); \
        } while (0)
#else
#    define GDYN_USED_VERBOSE_GCLOSURE [[maybe_unused]]
#    define gdyn_debug_closure(...) ((void)0)
#endif

void gdyn_log_init();
void gdyn_log_cleanup();

[[gnu::format(printf, 2, 3)]] void gdyn_debug(GdynDebugTopic topic,
                                              const char* format, ...);

#endif  // UTIL_LOG_H_
