/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2020 Marco Trevisan <marco.trevisan@canonical.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>
#include <string.h>  // for memcpy

#include <limits>
#include <string>
#include <type_traits>

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/error-types.h"
#include "gi/arg-inl.h"
#include "gi/arg.h"
#include "gi/boxed.h"
#include "gi/collection.h"
#include "gi/fundamental.h"
#include "gi/object.h"
#include "gi/type-desc.h"
#include "util/log.h"
#include "util/misc.h"

using Gdyn::TypeDesc;
using Gdyn::Value;

char* gdyn_argument_display_name(const char* arg_name,
                                 GdynArgumentType arg_type) {
    switch (arg_type) {
    case GDYN_ARGUMENT_ARGUMENT:
        return g_strdup_printf("Argument '%s'", arg_name ? arg_name : "?");
    case GDYN_ARGUMENT_RETURN_VALUE:
        return g_strdup("Return value");
    case GDYN_ARGUMENT_FIELD:
        return g_strdup("Field");
    case GDYN_ARGUMENT_LIST_ELEMENT:
        return g_strdup("List element");
    case GDYN_ARGUMENT_HASH_ELEMENT:
        return g_strdup("Hash element");
    case GDYN_ARGUMENT_ARRAY_ELEMENT:
        return g_strdup("Array element");
    case GDYN_ARGUMENT_CALLBACK_RETURN_VALUE:
        return g_strdup("Callback return value");
    default:
        g_assert_not_reached ();
    }
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool throw_invalid_argument(const Value& value, const TypeDesc& type,
                                   const char* arg_name,
                                   GdynArgumentType arg_type, GError** error) {
    Gdyn::AutoChar display_name{gdyn_argument_display_name(arg_name, arg_type)};

    g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                "Expected type %s for %s but got type '%s'",
                type.to_string().c_str(), display_name.get(),
                Value::tag_name(value.tag()));
    return false;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool throw_out_of_range(const Value& value, const TypeDesc& type,
                               const char* arg_name, GdynArgumentType arg_type,
                               GError** error) {
    Gdyn::AutoChar display_name{gdyn_argument_display_name(arg_name, arg_type)};

    g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                "%s: value %s is out of range for %s", display_name.get(),
                value.debug_string().c_str(), type.to_string().c_str());
    return false;
}

template <typename T>
[[nodiscard]] static bool value_to_integer(const Value& value, T* out) {
    if constexpr (std::is_signed_v<T>) {
        int64_t i;
        if (!value.toInt64(&i) || i < std::numeric_limits<T>::min() ||
            i > std::numeric_limits<T>::max())
            return false;
        *out = static_cast<T>(i);
    } else {
        uint64_t u;
        if (!value.toUint64(&u) || u > std::numeric_limits<T>::max())
            return false;
        *out = static_cast<T>(u);
    }
    return true;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool value_to_integer_gi_argument(const Value& value,
                                         const TypeDesc& type,
                                         const char* arg_name,
                                         GdynArgumentType arg_type,
                                         GIArgument* arg, GError** error) {
    if (!value.isNumeric())
        return throw_invalid_argument(value, type, arg_name, arg_type, error);

    bool ok = false;
    switch (type.bits()) {
        case 8:
            ok = type.is_signed()
                     ? value_to_integer(value, &gdyn_arg_member<int8_t>(arg))
                     : value_to_integer(value, &gdyn_arg_member<uint8_t>(arg));
            break;
        case 16:
            ok = type.is_signed()
                     ? value_to_integer(value, &gdyn_arg_member<int16_t>(arg))
                     : value_to_integer(value,
                                        &gdyn_arg_member<uint16_t>(arg));
            break;
        case 32:
            ok = type.is_signed()
                     ? value_to_integer(value, &gdyn_arg_member<int32_t>(arg))
                     : value_to_integer(value,
                                        &gdyn_arg_member<uint32_t>(arg));
            break;
        case 64:
            ok = type.is_signed()
                     ? value_to_integer(value, &gdyn_arg_member<int64_t>(arg))
                     : value_to_integer(value,
                                        &gdyn_arg_member<uint64_t>(arg));
            break;
        default:
            g_assert_not_reached();
    }

    if (!ok)
        return throw_out_of_range(value, type, arg_name, arg_type, error);
    return true;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool value_to_string_gi_argument(const Value& value,
                                        const TypeDesc& type,
                                        const char* arg_name,
                                        GdynArgumentType arg_type,
                                        bool may_be_null, GIArgument* arg,
                                        GError** error) {
    if (value.isNullOrUndefined()) {
        if (!may_be_null)
            return throw_invalid_argument(value, type, arg_name, arg_type,
                                          error);
        gdyn_arg_set(arg, nullptr);
        return true;
    }

    if (!value.isString())
        return throw_invalid_argument(value, type, arg_name, arg_type, error);

    const std::string& str = value.toString();
    if (!gdyn_utf8_validate(str.c_str(), str.size())) {
        Gdyn::AutoChar display_name{
            gdyn_argument_display_name(arg_name, arg_type)};
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "%s is not a valid UTF-8 string", display_name.get());
        return false;
    }

    gdyn_arg_set(arg, g_strndup(str.c_str(), str.size()));
    return true;
}

bool gdyn_value_to_gi_argument(const Value& value, const TypeDesc& type,
                               const char* arg_name, GdynArgumentType arg_type,
                               bool may_be_null, GIArgument* arg,
                               GError** error) {
    gdyn_debug_marshal(GDYN_DEBUG_MARSHAL, "Converting %s to %s",
                       value.debug_string().c_str(), type.to_string().c_str());

    gdyn_arg_unset(arg);

    switch (type.tag()) {
        case TypeDesc::Tag::INTEGER:
            return value_to_integer_gi_argument(value, type, arg_name, arg_type,
                                                arg, error);

        case TypeDesc::Tag::FLOAT:
            if (!value.isNumeric())
                return throw_invalid_argument(value, type, arg_name, arg_type,
                                              error);
            if (type.bits() == 32)
                gdyn_arg_set<float>(arg, static_cast<float>(value.toNumber()));
            else
                gdyn_arg_set<double>(arg, value.toNumber());
            return true;

        case TypeDesc::Tag::BOOLEAN:
            if (!value.isBoolean())
                return throw_invalid_argument(value, type, arg_name, arg_type,
                                              error);
            gdyn_arg_set<Gdyn::Tag::GBoolean>(arg, value.toBoolean());
            return true;

        case TypeDesc::Tag::STRING:
            return value_to_string_gi_argument(value, type, arg_name, arg_type,
                                               may_be_null, arg, error);

        case TypeDesc::Tag::OBJECT:
            return Gdyn::ObjectInstance::to_c_ptr(
                value, type.transfer(), may_be_null,
                &gdyn_arg_member<GObject*>(arg), error);

        case TypeDesc::Tag::BOXED:
        case TypeDesc::Tag::STRUCT:
            return Gdyn::BoxedInstance::to_c_ptr(
                type, value, type.transfer(), may_be_null,
                &gdyn_arg_member<void*>(arg), error);

        case TypeDesc::Tag::FUNDAMENTAL:
        case TypeDesc::Tag::VARIANT:
            return Gdyn::FundamentalInstance::to_c_ptr(
                type, value, type.transfer(), may_be_null,
                &gdyn_arg_member<void*>(arg), error);

        case TypeDesc::Tag::ARRAY:
            return gdyn_array_to_gi_argument(value, type, arg_name, arg_type,
                                             may_be_null, arg, error);

        case TypeDesc::Tag::HASH_TABLE:
            return gdyn_hash_to_gi_argument(value, type, arg_name, arg_type,
                                            may_be_null, arg, error);

        case TypeDesc::Tag::NULL_TYPE:
            gdyn_arg_set(arg, nullptr);
            return true;

        case TypeDesc::Tag::REFERENCE:
        case TypeDesc::Tag::CALLBACK:
        case TypeDesc::Tag::VOID: {
            Gdyn::AutoChar display_name{
                gdyn_argument_display_name(arg_name, arg_type)};
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                        "%s cannot be of type %s", display_name.get(),
                        type.to_string().c_str());
            return false;
        }
    }

    g_assert_not_reached();
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool string_from_gi_argument(GITransfer transfer, GIArgument* arg,
                                    Value* value_p, GError** error) {
    char* str = gdyn_arg_get<char*>(arg);
    if (!str) {
        *value_p = Value::null();
        return true;
    }

    Gdyn::AutoChar owned;
    if (transfer != GI_TRANSFER_NOTHING)
        owned = str;

    size_t len = strlen(str);
    if (!gdyn_utf8_validate(str, len)) {
        g_set_error_literal(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                            "Native string is not valid UTF-8");
        return false;
    }

    *value_p = Value::string(std::string{str, len});
    return true;
}

bool gdyn_value_from_gi_argument(const TypeDesc& type,
                                 GdynArgumentType arg_type, GITransfer transfer,
                                 GIArgument* arg, Value* value_p,
                                 GError** error) {
    switch (type.tag()) {
        case TypeDesc::Tag::INTEGER:
            switch (type.bits()) {
                case 8:
                    *value_p = type.is_signed()
                                   ? Value::from_int(gdyn_arg_get<int8_t>(arg))
                                   : Value::from_uint(
                                         gdyn_arg_get<uint8_t>(arg));
                    return true;
                case 16:
                    *value_p = type.is_signed()
                                   ? Value::from_int(gdyn_arg_get<int16_t>(arg))
                                   : Value::from_uint(
                                         gdyn_arg_get<uint16_t>(arg));
                    return true;
                case 32:
                    *value_p = type.is_signed()
                                   ? Value::from_int(gdyn_arg_get<int32_t>(arg))
                                   : Value::from_uint(
                                         gdyn_arg_get<uint32_t>(arg));
                    return true;
                case 64:
                    *value_p = type.is_signed()
                                   ? Value::from_int(gdyn_arg_get<int64_t>(arg))
                                   : Value::from_uint(
                                         gdyn_arg_get<uint64_t>(arg));
                    return true;
                default:
                    g_assert_not_reached();
            }

        case TypeDesc::Tag::FLOAT:
            *value_p = Value::number(type.bits() == 32
                                         ? gdyn_arg_get<float>(arg)
                                         : gdyn_arg_get<double>(arg));
            return true;

        case TypeDesc::Tag::BOOLEAN:
            *value_p = Value::boolean(gdyn_arg_get<Gdyn::Tag::GBoolean>(arg));
            return true;

        case TypeDesc::Tag::STRING:
            return string_from_gi_argument(transfer, arg, value_p, error);

        case TypeDesc::Tag::OBJECT:
            Gdyn::ObjectInstance::set_value_from_gobject(
                gdyn_arg_get<GObject*>(arg), transfer, value_p);
            return true;

        case TypeDesc::Tag::BOXED:
        case TypeDesc::Tag::STRUCT:
            return Gdyn::BoxedInstance::set_value_from_ptr(
                type, gdyn_arg_get<void*>(arg), transfer, value_p, error);

        case TypeDesc::Tag::FUNDAMENTAL:
        case TypeDesc::Tag::VARIANT:
            return Gdyn::FundamentalInstance::set_value_from_ptr(
                type, gdyn_arg_get<void*>(arg), transfer, value_p, error);

        case TypeDesc::Tag::ARRAY:
            return gdyn_array_from_gi_argument(type, transfer, arg, value_p,
                                               error);

        case TypeDesc::Tag::HASH_TABLE:
            return gdyn_hash_from_gi_argument(type, transfer, arg, value_p,
                                              error);

        case TypeDesc::Tag::NULL_TYPE:
            *value_p = Value::null();
            return true;

        case TypeDesc::Tag::VOID:
            *value_p = Value::undefined();
            return true;

        case TypeDesc::Tag::REFERENCE:
        case TypeDesc::Tag::CALLBACK: {
            Gdyn::AutoChar display_name{
                gdyn_argument_display_name(nullptr, arg_type)};
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                        "%s cannot be of type %s", display_name.get(),
                        type.to_string().c_str());
            return false;
        }
    }

    g_assert_not_reached();
}

void gdyn_gi_argument_release_in_arg(const TypeDesc& type, size_t length,
                                     GIArgument* arg) {
    switch (type.tag()) {
        case TypeDesc::Tag::STRING:
            // Owned strings were handed over to the callee
            if (!type.is_owned())
                g_clear_pointer(&gdyn_arg_member<char*>(arg), g_free);
            return;
        case TypeDesc::Tag::ARRAY:
            gdyn_gi_argument_release_in_array(type, length, arg);
            return;
        case TypeDesc::Tag::HASH_TABLE:
            gdyn_gi_argument_release_in_hash(type, arg);
            return;
        default:
            // Borrowed handles were not referenced, and owned ones belong to
            // the callee now
            return;
    }
}

void gdyn_gi_argument_release(const TypeDesc& type, GITransfer transfer,
                              size_t length, GIArgument* arg) {
    if (transfer == GI_TRANSFER_NOTHING)
        return;

    gdyn_debug_marshal(GDYN_DEBUG_GFUNCTION, "Releasing GIArgument %s",
                       type.to_string().c_str());

    void* ptr = gdyn_arg_get<void*>(arg);

    switch (type.tag()) {
        case TypeDesc::Tag::STRING:
            g_clear_pointer(&gdyn_arg_member<char*>(arg), g_free);
            return;

        case TypeDesc::Tag::OBJECT:
            if (ptr)
                g_object_unref(ptr);
            break;

        case TypeDesc::Tag::BOXED: {
            if (!ptr)
                break;
            GType gtype;
            Gdyn::AutoError error;
            if (!Gdyn::BoxedInstance::resolve_gtype(type, &gtype, &error)) {
                g_warning("Cannot release %s: %s", type.to_string().c_str(),
                          error->message);
                break;
            }
            g_boxed_free(gtype, ptr);
            break;
        }

        case TypeDesc::Tag::STRUCT:
            g_free(ptr);
            break;

        case TypeDesc::Tag::FUNDAMENTAL:
        case TypeDesc::Tag::VARIANT: {
            if (!ptr)
                break;
            Gdyn::FundamentalInstance::Functions funcs;
            Gdyn::AutoError error;
            if (!Gdyn::FundamentalInstance::resolve_functions(type, &funcs,
                                                              &error)) {
                g_warning("Cannot release %s: %s", type.to_string().c_str(),
                          error->message);
                break;
            }
            funcs.unref(ptr);
            break;
        }

        case TypeDesc::Tag::ARRAY:
            gdyn_gi_argument_release_array(type, transfer, length, arg);
            return;

        case TypeDesc::Tag::HASH_TABLE:
            gdyn_gi_argument_release_hash(type, transfer, arg);
            return;

        default:
            return;
    }

    gdyn_arg_unset(arg);
}

// All GIArgument members start at the beginning of the union, so the C
// representation of the type is its first native_size() bytes.

void gdyn_gi_argument_load(const TypeDesc& type, const void* src,
                           GIArgument* arg) {
    gdyn_arg_unset(arg);
    memcpy(arg, src, type.native_size());
}

void gdyn_gi_argument_store(const TypeDesc& type, GIArgument* arg,
                            void* dest) {
    memcpy(dest, arg, type.native_size());
}
