/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdarg.h>
#include <stdio.h>   // for FILE, fprintf, fflush, fputs, fseek

#include <array>
#include <atomic>  // for atomic_bool
#include <memory>  // for unique_ptr
#include <string>

#include <glib.h>

#include "gdyn/auto.h"
#include "util/log.h"
#include "util/misc.h"

static std::atomic_bool s_initialized = false;
static bool s_debug_log_enabled = false;
static bool s_print_thread = false;
static std::unique_ptr<DebugLogFile> s_log_file;
static Gdyn::AutoTimer s_timer;
static std::array<bool, GDYN_DEBUG_LAST> s_enabled_topics;

static const char* topic_to_prefix(GdynDebugTopic topic) {
    switch (topic) {
        case GDYN_DEBUG_MEMORY:
            return "DYN MEMORY";
        case GDYN_DEBUG_CONTEXT:
            return "DYN CTX";
        case GDYN_DEBUG_LIBRARY:
            return "DYN LIB";
        case GDYN_DEBUG_GOBJECT:
            return "DYN G OBJ";
        case GDYN_DEBUG_GFUNCTION:
            return "DYN G FUNC";
        case GDYN_DEBUG_GCLOSURE:
            return "DYN G CLSR";
        case GDYN_DEBUG_GBOXED:
            return "DYN G BXD";
        case GDYN_DEBUG_GFUNDAMENTAL:
            return "DYN G FNDMTL";
        case GDYN_DEBUG_MARSHAL:
            return "DYN MARSHAL";
        default:
            return "???";
    }
}

static GdynDebugTopic prefix_to_topic(const char* prefix) {
    for (unsigned i = 0; i < GDYN_DEBUG_LAST; i++) {
        auto topic = static_cast<GdynDebugTopic>(i);
        if (g_str_equal(topic_to_prefix(topic), prefix))
            return topic;
    }

    return GDYN_DEBUG_LAST;
}

void gdyn_log_init() {
    bool expected = false;
    if (!s_initialized.compare_exchange_strong(expected, true))
        return;

    if (gdyn_environment_variable_is_set("GDYN_DEBUG_TIMESTAMP"))
        s_timer = g_timer_new();

    s_print_thread = gdyn_environment_variable_is_set("GDYN_DEBUG_THREAD");

    const char* debug_output = g_getenv("GDYN_DEBUG_OUTPUT");
    if (debug_output && !g_str_equal(debug_output, "stderr")) {
        // "debug-%u.log" gives each process its own file
        std::string log_file = gdyn_expand_pid_pattern(debug_output);
        s_log_file = std::make_unique<DebugLogFile>(log_file.c_str());
        if (s_log_file->has_error()) {
            fprintf(stderr, "Failed to open log file `%s': %s\n",
                    s_log_file->path().c_str(),
                    g_strerror(s_log_file->error_code()));
        }
    } else {
        s_log_file = std::make_unique<DebugLogFile>(nullptr);
    }
    s_debug_log_enabled = debug_output != nullptr;

    if (s_debug_log_enabled) {
        auto* topics = g_getenv("GDYN_DEBUG_TOPICS");
        s_enabled_topics.fill(topics == nullptr);
        if (topics) {
            Gdyn::AutoStrv prefixes{g_strsplit(topics, ";", -1)};
            for (unsigned i = 0; prefixes[i] != nullptr; i++) {
                GdynDebugTopic topic = prefix_to_topic(prefixes[i]);
                if (topic != GDYN_DEBUG_LAST)
                    s_enabled_topics[topic] = true;
            }
        }
    }
}

void gdyn_log_cleanup() {
    bool expected = true;
    if (!s_initialized.compare_exchange_strong(expected, false))
        return;

    s_timer = nullptr;
    s_debug_log_enabled = false;
    s_log_file.reset();
    s_enabled_topics.fill(false);
}

#define PREFIX_LENGTH 12

static void write_to_stream(FILE* logfp, const char* prefix, const char* s) {
    /* seek to end to avoid truncating in case we're using shared logfile */
    (void)fseek(logfp, 0, SEEK_END);

    fprintf(logfp, "%*s: %s", PREFIX_LENGTH, prefix, s);
    if (!g_str_has_suffix(s, "\n"))
        fputs("\n", logfp);
    fflush(logfp);
}

void gdyn_debug(GdynDebugTopic topic, const char* format, ...) {
    if (!s_debug_log_enabled || !s_enabled_topics[topic])
        return;

    va_list args;
    va_start(args, format);
    Gdyn::AutoChar s{g_strdup_vprintf(format, args)};
    va_end(args);

    if (s_timer) {
        static double previous = 0.0;
        double total = g_timer_elapsed(s_timer, nullptr) * 1000.0;
        double since = total - previous;
        const char* ts_suffix;

        if (since > 200.0)
            ts_suffix = "!!!!";
        else if (since > 100.0)
            ts_suffix = "!!! ";
        else if (since > 50.0)
            ts_suffix = "!!  ";
        else
            ts_suffix = "    ";

        s = g_strdup_printf("%g %s%s", total, ts_suffix, s.get());
        previous = total;
    }

    if (s_print_thread)
        s = g_strdup_printf("(thread %p) %s", g_thread_self(), s.get());

    write_to_stream(s_log_file->fp(), topic_to_prefix(topic), s);
}
