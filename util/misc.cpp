/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <errno.h>
#include <stdio.h>
#include <string.h>  // for strchr

#include <unistd.h>  // for getpid

#include <string>

#include <glib.h>

#include "util/misc.h"

bool gdyn_environment_variable_is_set(const char* env_variable_name) {
    const char* s = g_getenv(env_variable_name);
    return s && *s != '\0';
}

bool gdyn_utf8_validate(const char* str, size_t len) {
    return g_utf8_validate_len(str, len, nullptr);
}

std::string gdyn_expand_pid_pattern(const char* pattern) {
    const char* c = strchr(pattern, '%');
    if (!c || c[1] != 'u' || strchr(c + 1, '%'))
        return pattern;

    std::string retval{pattern, static_cast<size_t>(c - pattern)};
    retval += std::to_string(getpid());
    retval += c + 2;
    return retval;
}

DebugLogFile::DebugLogFile(const char* path) : m_fp(nullptr), m_errno(0) {
    if (!path)
        return;

    m_path = path;
    // Appending, since several processes may share the file
    m_fp = fopen(path, "a");
    if (!m_fp)
        m_errno = errno;
}

DebugLogFile::~DebugLogFile() {
    if (m_fp)
        fclose(m_fp);
}
