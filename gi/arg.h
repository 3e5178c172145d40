/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GI_ARG_H_
#define GI_ARG_H_

#include <config.h>

#include <stddef.h>  // for size_t

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"

namespace Gdyn {
class TypeDesc;
}

// Different roles for a GIArgument; currently used only in error and debug
// messages.
typedef enum {
    GDYN_ARGUMENT_ARGUMENT,
    GDYN_ARGUMENT_RETURN_VALUE,
    GDYN_ARGUMENT_FIELD,
    GDYN_ARGUMENT_LIST_ELEMENT,
    GDYN_ARGUMENT_HASH_ELEMENT,
    GDYN_ARGUMENT_ARRAY_ELEMENT,
    GDYN_ARGUMENT_CALLBACK_RETURN_VALUE,
} GdynArgumentType;

[[nodiscard]] char* gdyn_argument_display_name(const char* arg_name,
                                               GdynArgumentType arg_type);

// Converts a managed value into a native one for an in-argument. Strings,
// containers and copies made for the callee are new allocations; whatever is
// left to the caller after the call must be freed with
// gdyn_gi_argument_release_in_arg().
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_value_to_gi_argument(const Gdyn::Value& value,
                               const Gdyn::TypeDesc& type, const char* arg_name,
                               GdynArgumentType arg_type, bool may_be_null,
                               GIArgument* arg, GError** error);

// Converts a native value into a managed one. With a transfer other than
// GI_TRANSFER_NOTHING the native value is consumed: its ownership passes to
// the returned wrapper, or it is freed once copied.
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_value_from_gi_argument(const Gdyn::TypeDesc& type,
                                 GdynArgumentType arg_type, GITransfer transfer,
                                 GIArgument* arg, Gdyn::Value* value_p,
                                 GError** error);

// Frees what gdyn_value_to_gi_argument() allocated and the callee did not take.
// @length is the element count of a sized array, ignored otherwise.
void gdyn_gi_argument_release_in_arg(const Gdyn::TypeDesc& type, size_t length,
                                     GIArgument* arg);

// Frees a native value that is owned by the caller according to @transfer,
// without converting it. @length is as above.
void gdyn_gi_argument_release(const Gdyn::TypeDesc& type, GITransfer transfer,
                              size_t length, GIArgument* arg);

// Moves a value between a GIArgument and memory laid out the way C stores the
// type (a struct field, an element of a C array).
void gdyn_gi_argument_load(const Gdyn::TypeDesc& type, const void* src,
                           GIArgument* arg);
void gdyn_gi_argument_store(const Gdyn::TypeDesc& type, GIArgument* arg,
                            void* dest);

#endif  // GI_ARG_H_
