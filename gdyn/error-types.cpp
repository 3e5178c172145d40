/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <glib-object.h>

#include "gdyn/error-types.h"

// clang-format off
G_DEFINE_QUARK(gdyn-error-quark, gdyn_error)
// clang-format on

GType gdyn_error_get_type(void) {
    static const GEnumValue errors[] = {
        {GDYN_ERROR_FAILED, "GDYN_ERROR_FAILED", "failed"},
        {GDYN_ERROR_SYMBOL_RESOLUTION, "GDYN_ERROR_SYMBOL_RESOLUTION",
         "symbol-resolution"},
        {GDYN_ERROR_MARSHAL, "GDYN_ERROR_MARSHAL", "marshal"},
        {GDYN_ERROR_INVALID_TYPE, "GDYN_ERROR_INVALID_TYPE", "invalid-type"},
        {0, nullptr, nullptr}};
    // Initialization of static local variable guaranteed only once in C++11
    static GType g_type_id = g_enum_register_static("GdynError", errors);
    return g_type_id;
}
