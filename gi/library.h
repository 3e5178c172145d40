/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stddef.h>  // for size_t

#include <glib.h>

#include "gdyn/macros.h"

// Shared libraries are opened on first use and stay open for the lifetime of
// the process. @library is a comma-separated list of candidate sonames tried in
// order; nullptr or the empty string means the main program.

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_library_lookup_symbol(const char* library, const char* symbol,
                                void** address, GError** error);

[[nodiscard]] size_t gdyn_library_cache_size();
