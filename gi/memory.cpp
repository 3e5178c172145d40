/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>
#include <string.h>  // for memcpy

#include <memory>
#include <string>

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/error-types.h"
#include "gdyn/value.h"
#include "gi/arg-inl.h"
#include "gi/arg.h"
#include "gi/boxed.h"
#include "gi/memory.h"
#include "gi/type-desc.h"
#include "gi/wrapper.h"
#include "util/log.h"

using Gdyn::TypeDesc;
using Gdyn::Value;

GDYN_MARSHAL_RETURN_CONVENTION
static bool handle_to_pointer(const Value& handle, const char* operation,
                              uint8_t** ptr_out, GError** error) {
    void* ptr = handle.isObject() ? handle.native_pointer() : nullptr;
    if (!ptr) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "%s needs a native handle, got %s", operation,
                    handle.debug_string().c_str());
        return false;
    }

    *ptr_out = static_cast<uint8_t*>(ptr);
    return true;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool element_pointer(const Value& handle, const char* operation,
                            size_t ptr_offset, size_t element_offset,
                            uint8_t** element_out, GError** error) {
    uint8_t* base;
    if (!handle_to_pointer(handle, operation, &base, error))
        return false;

    void* field;
    memcpy(&field, base + ptr_offset, sizeof(void*));
    if (!field) {
        *element_out = nullptr;
        return true;
    }

    *element_out = static_cast<uint8_t*>(field) + element_offset;
    return true;
}

bool gdyn_memory_read(const Value& handle, const TypeDesc& type, size_t offset,
                      Value* value_p, GError** error) {
    if (!type.validate(error))
        return false;

    uint8_t* base;
    if (!handle_to_pointer(handle, "read()", &base, error))
        return false;

    switch (type.tag()) {
        case TypeDesc::Tag::INTEGER:
        case TypeDesc::Tag::FLOAT:
        case TypeDesc::Tag::BOOLEAN:
        case TypeDesc::Tag::STRING:
        case TypeDesc::Tag::OBJECT:
        case TypeDesc::Tag::BOXED:
        case TypeDesc::Tag::STRUCT:
        case TypeDesc::Tag::FUNDAMENTAL:
        case TypeDesc::Tag::VARIANT:
            break;
        default:
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                        "Cannot read a field of type %s",
                        type.to_string().c_str());
            return false;
    }

    gdyn_debug_marshal(GDYN_DEBUG_MEMORY, "Reading %s at %p + %zu",
                       type.to_string().c_str(), base, offset);

    // Fields belong to the containing memory, whatever the descriptor says
    GIArgument arg;
    gdyn_gi_argument_load(type, base + offset, &arg);
    return gdyn_value_from_gi_argument(type, GDYN_ARGUMENT_FIELD,
                                       GI_TRANSFER_NOTHING, &arg, value_p,
                                       error);
}

bool gdyn_memory_write(const Value& handle, const TypeDesc& type, size_t offset,
                       const Value& value, GError** error) {
    if (!type.validate(error))
        return false;

    uint8_t* base;
    if (!handle_to_pointer(handle, "write()", &base, error))
        return false;

    gdyn_debug_marshal(GDYN_DEBUG_MEMORY, "Writing %s at %p + %zu",
                       type.to_string().c_str(), base, offset);

    GIArgument arg;
    gdyn_arg_unset(&arg);

    switch (type.tag()) {
        case TypeDesc::Tag::INTEGER:
        case TypeDesc::Tag::FLOAT:
        case TypeDesc::Tag::BOOLEAN:
        // The duplicated string now belongs to the field
        case TypeDesc::Tag::STRING:
            if (!gdyn_value_to_gi_argument(value, type, "value",
                                           GDYN_ARGUMENT_FIELD, true, &arg,
                                           error))
                return false;
            break;

        case TypeDesc::Tag::OBJECT:
        case TypeDesc::Tag::BOXED:
        case TypeDesc::Tag::STRUCT:
            if (!value.isNullOrUndefined() && !value.isObject()) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                            "Field of type %s cannot be set to %s",
                            type.to_string().c_str(),
                            value.debug_string().c_str());
                return false;
            }
            gdyn_arg_set(&arg, value.native_pointer());
            break;

        default:
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                        "Cannot write a field of type %s",
                        type.to_string().c_str());
            return false;
    }

    gdyn_gi_argument_store(type, &arg, base + offset);
    return true;
}

bool gdyn_memory_alloc(size_t size, const char* type_name, const char* library,
                       Value* value_p, GError** error) {
    if (size == 0) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Cannot allocate an empty %s",
                    type_name ? type_name : "buffer");
        return false;
    }

    std::string name{type_name ? type_name : "gpointer"};
    GType gtype = type_name ? g_type_from_name(type_name) : G_TYPE_INVALID;
    if (gtype == G_TYPE_INVALID || !G_TYPE_IS_BOXED(gtype))
        gtype = G_TYPE_NONE;

    gdyn_debug(GDYN_DEBUG_MEMORY, "Allocating %zu bytes for %s from %s%s", size,
               name.c_str(), library && *library ? library : "the program",
               gtype == G_TYPE_NONE ? "" : " (boxed)");

    *value_p = Value::object(
        Gdyn::BoxedInstance::new_allocated(size, gtype, name));
    return true;
}

bool gdyn_memory_read_pointer(const Value& handle, size_t ptr_offset,
                              size_t element_offset, Value* value_p,
                              GError** error) {
    uint8_t* element;
    if (!element_pointer(handle, "readPointer()", ptr_offset, element_offset,
                         &element, error))
        return false;

    if (!element) {
        *value_p = Value::null();
        return true;
    }

    // Size 0: wrapped without copying or ownership
    *value_p = Value::object(Gdyn::BoxedInstance::new_for_struct(
        element, "gpointer", 0, GI_TRANSFER_NOTHING));
    return true;
}

bool gdyn_memory_write_pointer(const Value& dest, size_t ptr_offset,
                               size_t element_offset, const Value& source,
                               size_t size, GError** error) {
    uint8_t* element;
    if (!element_pointer(dest, "writePointer()", ptr_offset, element_offset,
                         &element, error))
        return false;
    if (!element) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "writePointer(): pointer at offset %zu is NULL",
                    ptr_offset);
        return false;
    }

    uint8_t* src;
    if (!handle_to_pointer(source, "writePointer()", &src, error))
        return false;

    memcpy(element, src, size);
    return true;
}

bool gdyn_memory_native_id(const Value& handle, Value* value_p,
                           GError** error) {
    uint8_t* ptr;
    if (!handle_to_pointer(handle, "getNativeId()", &ptr, error))
        return false;

    *value_p = Value::from_uint(reinterpret_cast<uintptr_t>(ptr));
    return true;
}
