/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GI_MEMORY_H_
#define GI_MEMORY_H_

#include <config.h>

#include <stddef.h>  // for size_t

#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"

// Typed access to the memory behind a handle. @handle is an object value; the
// caller guarantees that @offset plus the width of @type lies inside it.

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_memory_read(const Gdyn::Value& handle, const Gdyn::TypeDesc& type,
                      size_t offset, Gdyn::Value* value_p, GError** error);

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_memory_write(const Gdyn::Value& handle, const Gdyn::TypeDesc& type,
                       size_t offset, const Gdyn::Value& value, GError** error);

// Zero-initialized buffer owned by the returned handle. If @type_name is a
// registered boxed type the buffer is released with g_boxed_free().
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_memory_alloc(size_t size, const char* type_name, const char* library,
                       Gdyn::Value* value_p, GError** error);

// Borrowed handle to *(handle + @ptr_offset) + @element_offset, or null if the
// pointer field is NULL
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_memory_read_pointer(const Gdyn::Value& handle, size_t ptr_offset,
                              size_t element_offset, Gdyn::Value* value_p,
                              GError** error);

// Copies @size bytes from @source into the element addressed as above
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_memory_write_pointer(const Gdyn::Value& dest, size_t ptr_offset,
                               size_t element_offset, const Gdyn::Value& source,
                               size_t size, GError** error);

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_memory_native_id(const Gdyn::Value& handle, Gdyn::Value* value_p,
                           GError** error);

#endif  // GI_MEMORY_H_
