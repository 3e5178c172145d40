/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
/*
 * SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
 * SPDX-FileCopyrightText: 2008 litl, LLC
 * SPDX-FileCopyrightText: 2026 gdyn contributors
 */

#ifndef GDYN_ERROR_TYPES_H_
#define GDYN_ERROR_TYPES_H_

#if !defined(INSIDE_GDYN_H) && !defined(GDYN_COMPILATION)
#    error "Only <gdyn/gdyn.h> can be included directly."
#endif

#include <glib-object.h>
#include <glib.h>

#include <gdyn/macros.h>

G_BEGIN_DECLS

GDYN_EXPORT
GQuark gdyn_error_quark(void);
#define GDYN_ERROR gdyn_error_quark()

GDYN_EXPORT
GType gdyn_error_get_type(void);
#define GDYN_TYPE_ERROR gdyn_error_get_type()

typedef enum {
    GDYN_ERROR_FAILED,
    GDYN_ERROR_SYMBOL_RESOLUTION,
    GDYN_ERROR_MARSHAL,
    GDYN_ERROR_INVALID_TYPE,
} GdynError;

G_END_DECLS

#endif /* GDYN_ERROR_TYPES_H_ */
