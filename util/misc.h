/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef UTIL_MISC_H_
#define UTIL_MISC_H_

#include <config.h>

#include <stddef.h>  // for size_t
#include <stdio.h>   // for FILE

#include <string>

bool gdyn_environment_variable_is_set(const char* env_variable_name);

// Rejects embedded NULs as well as invalid UTF-8
[[nodiscard]] bool gdyn_utf8_validate(const char* str, size_t len);

// Replaces a "%u" in @pattern with the process ID, if it is the only
// format directive; otherwise returns @pattern unchanged.
[[nodiscard]] std::string gdyn_expand_pid_pattern(const char* pattern);

/*
 * DebugLogFile:
 * Destination of the debug log. Either a file opened for appending, which is
 * closed on destruction, or stderr.
 */
class DebugLogFile {
    FILE* m_fp;
    std::string m_path;
    int m_errno;

    DebugLogFile(const DebugLogFile&) = delete;
    DebugLogFile& operator=(const DebugLogFile&) = delete;

 public:
    // With @path null the log goes to stderr
    explicit DebugLogFile(const char* path);
    ~DebugLogFile();

    [[nodiscard]] FILE* fp() const { return m_fp ? m_fp : stderr; }
    [[nodiscard]] bool has_error() const { return m_errno != 0; }
    [[nodiscard]] int error_code() const { return m_errno; }
    [[nodiscard]] const std::string& path() const { return m_path; }
};

#endif  // UTIL_MISC_H_
