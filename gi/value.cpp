/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>

#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>  // for move

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/error-types.h"
#include "gdyn/value.h"
#include "gi/boxed.h"
#include "gi/fundamental.h"
#include "gi/object.h"
#include "gi/type-desc.h"
#include "gi/value.h"
#include "gi/wrapper.h"
#include "util/log.h"

using Gdyn::BoxedInstance;
using Gdyn::FundamentalInstance;
using Gdyn::InstanceKind;
using Gdyn::ObjectInstance;
using Gdyn::TypeDesc;
using Gdyn::Value;

static void* param_spec_ref(void* pspec) {
    return g_param_spec_ref(static_cast<GParamSpec*>(pspec));
}

static void param_spec_unref(void* pspec) {
    g_param_spec_unref(static_cast<GParamSpec*>(pspec));
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool throw_unsupported_gvalue(const GValue* gvalue, const char* what,
                                     GError** error) {
    g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                "Cannot convert GValue of type %s %s", G_VALUE_TYPE_NAME(gvalue),
                what);
    return false;
}

// Reads any numeric GValue; false if the GValue doesn't hold a number.
[[nodiscard]] static bool numeric_from_g_value(const GValue* gvalue,
                                               Value* value_p) {
    switch (G_TYPE_FUNDAMENTAL(G_VALUE_TYPE(gvalue))) {
        case G_TYPE_CHAR:
            *value_p = Value::from_int(g_value_get_schar(gvalue));
            return true;
        case G_TYPE_UCHAR:
            *value_p = Value::from_uint(g_value_get_uchar(gvalue));
            return true;
        case G_TYPE_INT:
            *value_p = Value::from_int(g_value_get_int(gvalue));
            return true;
        case G_TYPE_UINT:
            *value_p = Value::from_uint(g_value_get_uint(gvalue));
            return true;
        case G_TYPE_LONG:
            *value_p = Value::from_int(g_value_get_long(gvalue));
            return true;
        case G_TYPE_ULONG:
            *value_p = Value::from_uint(g_value_get_ulong(gvalue));
            return true;
        case G_TYPE_INT64:
            *value_p = Value::from_int(g_value_get_int64(gvalue));
            return true;
        case G_TYPE_UINT64:
            *value_p = Value::from_uint(g_value_get_uint64(gvalue));
            return true;
        case G_TYPE_ENUM:
            *value_p = Value::from_int(g_value_get_enum(gvalue));
            return true;
        case G_TYPE_FLAGS:
            *value_p = Value::from_uint(g_value_get_flags(gvalue));
            return true;
        case G_TYPE_FLOAT:
            *value_p = Value::number(g_value_get_float(gvalue));
            return true;
        case G_TYPE_DOUBLE:
            *value_p = Value::number(g_value_get_double(gvalue));
            return true;
        default:
            return false;
    }
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool string_from_g_value(const GValue* gvalue, Value* value_p,
                                GError** error) {
    const char* str = g_value_get_string(gvalue);
    if (!str) {
        *value_p = Value::null();
        return true;
    }
    if (!g_utf8_validate(str, -1, nullptr)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "GValue string is not valid UTF-8");
        return false;
    }
    *value_p = Value::string(str);
    return true;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool value_from_g_value_by_gtype(const GValue* gvalue, Value* value_p,
                                        GError** error) {
    GType gtype = G_VALUE_TYPE(gvalue);

    if (numeric_from_g_value(gvalue, value_p))
        return true;

    if (gtype == G_TYPE_BOOLEAN) {
        *value_p = Value::boolean(g_value_get_boolean(gvalue));
    } else if (gtype == G_TYPE_STRING) {
        return string_from_g_value(gvalue, value_p, error);
    } else if (g_type_is_a(gtype, G_TYPE_OBJECT) ||
               g_type_is_a(gtype, G_TYPE_INTERFACE)) {
        ObjectInstance::set_value_from_gobject(
            static_cast<GObject*>(g_value_get_object(gvalue)),
            GI_TRANSFER_NOTHING, value_p);
    } else if (gtype == G_TYPE_STRV) {
        auto* strv = static_cast<char**>(g_value_get_boxed(gvalue));
        Gdyn::ValueVector elements;
        for (char** str = strv; str && *str; str++) {
            if (!g_utf8_validate(*str, -1, nullptr)) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                            "GValue string array element is not valid UTF-8");
                return false;
            }
            elements.push_back(Value::string(*str));
        }
        *value_p = Value::array(std::move(elements));
    } else if (g_type_is_a(gtype, G_TYPE_BOXED)) {
        void* boxed = g_value_get_boxed(gvalue);
        if (!boxed) {
            *value_p = Value::null();
            return true;
        }
        *value_p = Value::object(BoxedInstance::new_for_boxed(
            boxed, gtype, g_type_name(gtype), GI_TRANSFER_NOTHING));
    } else if (gtype == G_TYPE_VARIANT) {
        return FundamentalInstance::set_value_from_ptr(
            *TypeDesc::variant(GI_TRANSFER_NOTHING), g_value_get_variant(gvalue),
            GI_TRANSFER_NOTHING, value_p, error);
    } else if (g_type_is_a(gtype, G_TYPE_PARAM)) {
        GParamSpec* pspec = g_value_get_param(gvalue);
        if (!pspec) {
            *value_p = Value::null();
            return true;
        }
        FundamentalInstance::Functions funcs{param_spec_ref, param_spec_unref,
                                             nullptr, false};
        *value_p = Value::object(FundamentalInstance::wrapper_from_pointer(
            pspec, funcs, GI_TRANSFER_NOTHING));
    } else if (g_type_is_a(gtype, G_TYPE_POINTER)) {
        void* pointer = g_value_get_pointer(gvalue);
        if (!pointer) {
            *value_p = Value::null();
            return true;
        }
        *value_p = Value::object(BoxedInstance::new_for_struct(
            pointer, g_type_name(gtype), 0, GI_TRANSFER_NOTHING));
    } else {
        return throw_unsupported_gvalue(gvalue, "to a managed value", error);
    }

    return true;
}

// Gets the pointer out of a GValue of any pointer-holding fundamental type
[[nodiscard]] static void* pointer_from_g_value(const GValue* gvalue) {
    GType gtype = G_VALUE_TYPE(gvalue);
    if (g_type_is_a(gtype, G_TYPE_BOXED))
        return g_value_get_boxed(gvalue);
    if (g_type_is_a(gtype, G_TYPE_POINTER))
        return g_value_get_pointer(gvalue);
    if (g_value_fits_pointer(gvalue))
        return g_value_peek_pointer(gvalue);
    return nullptr;
}

bool gdyn_value_from_g_value(const GValue* gvalue, const TypeDesc* type,
                             Value* value_p, GError** error) {
    if (!type)
        return value_from_g_value_by_gtype(gvalue, value_p, error);

    gdyn_debug_marshal(GDYN_DEBUG_MARSHAL, "Converting GValue %s as %s",
                       G_VALUE_TYPE_NAME(gvalue), type->to_string().c_str());

    switch (type->tag()) {
        case TypeDesc::Tag::INTEGER: {
            Value number;
            if (!numeric_from_g_value(gvalue, &number))
                return throw_unsupported_gvalue(gvalue, "to an integer", error);

            if (type->is_signed()) {
                int64_t v;
                if (!number.toInt64(&v))
                    return throw_unsupported_gvalue(
                        gvalue, "to a signed integer", error);
                *value_p = Value::from_int(v);
            } else {
                uint64_t v;
                if (!number.toUint64(&v))
                    return throw_unsupported_gvalue(
                        gvalue, "to an unsigned integer", error);
                *value_p = Value::from_uint(v);
            }
            return true;
        }

        case TypeDesc::Tag::FLOAT: {
            Value number;
            if (!numeric_from_g_value(gvalue, &number))
                return throw_unsupported_gvalue(gvalue, "to a number", error);
            *value_p = Value::number(number.toNumber());
            return true;
        }

        case TypeDesc::Tag::BOOLEAN:
            if (G_VALUE_HOLDS_BOOLEAN(gvalue)) {
                *value_p = Value::boolean(g_value_get_boolean(gvalue));
                return true;
            }
            if (G_VALUE_HOLDS_INT(gvalue)) {
                *value_p = Value::boolean(g_value_get_int(gvalue) != 0);
                return true;
            }
            return throw_unsupported_gvalue(gvalue, "to a boolean", error);

        case TypeDesc::Tag::STRING:
            if (!G_VALUE_HOLDS_STRING(gvalue))
                return throw_unsupported_gvalue(gvalue, "to a string", error);
            return string_from_g_value(gvalue, value_p, error);

        case TypeDesc::Tag::OBJECT:
            if (!G_VALUE_HOLDS_OBJECT(gvalue) &&
                !G_TYPE_IS_INTERFACE(G_VALUE_TYPE(gvalue)))
                return throw_unsupported_gvalue(gvalue, "to an object", error);
            ObjectInstance::set_value_from_gobject(
                static_cast<GObject*>(g_value_get_object(gvalue)),
                GI_TRANSFER_NOTHING, value_p);
            return true;

        case TypeDesc::Tag::BOXED: {
            if (!G_VALUE_HOLDS_BOXED(gvalue))
                return throw_unsupported_gvalue(gvalue, "to a boxed value",
                                                error);
            void* boxed = g_value_get_boxed(gvalue);
            if (!boxed) {
                *value_p = Value::null();
                return true;
            }
            GType gtype = G_VALUE_TYPE(gvalue);
            *value_p = Value::object(BoxedInstance::new_for_boxed(
                boxed, gtype, g_type_name(gtype), GI_TRANSFER_NOTHING));
            return true;
        }

        case TypeDesc::Tag::STRUCT:
            return BoxedInstance::set_value_from_ptr(
                *type, pointer_from_g_value(gvalue), GI_TRANSFER_NOTHING,
                value_p, error);

        case TypeDesc::Tag::FUNDAMENTAL:
            return FundamentalInstance::set_value_from_ptr(
                *type, pointer_from_g_value(gvalue), GI_TRANSFER_NOTHING,
                value_p, error);

        case TypeDesc::Tag::VARIANT:
            if (!G_VALUE_HOLDS_VARIANT(gvalue))
                return throw_unsupported_gvalue(gvalue, "to a GVariant", error);
            return FundamentalInstance::set_value_from_ptr(
                *type, g_value_get_variant(gvalue), GI_TRANSFER_NOTHING,
                value_p, error);

        case TypeDesc::Tag::NULL_TYPE:
            *value_p = Value::null();
            return true;

        case TypeDesc::Tag::VOID:
            *value_p = Value::undefined();
            return true;

        case TypeDesc::Tag::ARRAY:
            if (G_VALUE_HOLDS(gvalue, G_TYPE_STRV))
                return value_from_g_value_by_gtype(gvalue, value_p, error);
            [[fallthrough]];
        case TypeDesc::Tag::HASH_TABLE:
        case TypeDesc::Tag::REFERENCE:
        case TypeDesc::Tag::CALLBACK:
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                        "Cannot convert GValue of type %s to %s",
                        G_VALUE_TYPE_NAME(gvalue), type->to_string().c_str());
            return false;
    }

    g_assert_not_reached();
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool throw_expect_type(const Value& value, const GValue* gvalue,
                              GError** error) {
    g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                "Wrong type %s; %s expected", value.debug_string().c_str(),
                G_VALUE_TYPE_NAME(gvalue));
    return false;
}

template <typename T>
GDYN_MARSHAL_RETURN_CONVENTION static bool integer_from_value(
    const Value& value, const GValue* gvalue, T* out, GError** error) {
    if constexpr (std::is_signed_v<T>) {
        int64_t v;
        if (!value.toInt64(&v) || v < std::numeric_limits<T>::min() ||
            v > std::numeric_limits<T>::max())
            return throw_expect_type(value, gvalue, error);
        *out = static_cast<T>(v);
    } else {
        uint64_t v;
        if (!value.toUint64(&v) || v > std::numeric_limits<T>::max())
            return throw_expect_type(value, gvalue, error);
        *out = static_cast<T>(v);
    }
    return true;
}

// Checks that a managed handle holds the kind of instance a GValue expects
[[nodiscard]] static Gdyn::NativeInstance* instance_of_kind(
    const Value& value, InstanceKind kind1, InstanceKind kind2) {
    if (!value.isObject())
        return nullptr;
    InstanceKind kind = value.toObject()->kind();
    if (kind != kind1 && kind != kind2)
        return nullptr;
    return value.toObject().get();
}

bool gdyn_value_to_g_value(const Value& value, GValue* gvalue,
                           GError** error) {
    GType gtype = G_VALUE_TYPE(gvalue);

    gdyn_debug_marshal(GDYN_DEBUG_MARSHAL, "Converting %s to GValue %s",
                       value.debug_string().c_str(), g_type_name(gtype));

    // A callback that returns nothing leaves the zero value in place
    if (value.isUndefined())
        return true;

    switch (G_TYPE_FUNDAMENTAL(gtype)) {
        case G_TYPE_BOOLEAN:
            if (!value.isBoolean())
                return throw_expect_type(value, gvalue, error);
            g_value_set_boolean(gvalue, value.toBoolean());
            return true;

        case G_TYPE_CHAR: {
            int8_t v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_schar(gvalue, v);
            return true;
        }
        case G_TYPE_UCHAR: {
            uint8_t v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_uchar(gvalue, v);
            return true;
        }
        case G_TYPE_INT: {
            int v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_int(gvalue, v);
            return true;
        }
        case G_TYPE_UINT: {
            unsigned v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_uint(gvalue, v);
            return true;
        }
        case G_TYPE_LONG: {
            long v;  // NOLINT(runtime/int)
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_long(gvalue, v);
            return true;
        }
        case G_TYPE_ULONG: {
            unsigned long v;  // NOLINT(runtime/int)
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_ulong(gvalue, v);
            return true;
        }
        case G_TYPE_INT64: {
            int64_t v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_int64(gvalue, v);
            return true;
        }
        case G_TYPE_UINT64: {
            uint64_t v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_uint64(gvalue, v);
            return true;
        }
        case G_TYPE_ENUM: {
            int v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_enum(gvalue, v);
            return true;
        }
        case G_TYPE_FLAGS: {
            unsigned v;
            if (!integer_from_value(value, gvalue, &v, error))
                return false;
            g_value_set_flags(gvalue, v);
            return true;
        }

        case G_TYPE_FLOAT:
            if (!value.isNumeric())
                return throw_expect_type(value, gvalue, error);
            g_value_set_float(gvalue, value.toNumber());
            return true;
        case G_TYPE_DOUBLE:
            if (!value.isNumeric())
                return throw_expect_type(value, gvalue, error);
            g_value_set_double(gvalue, value.toNumber());
            return true;

        case G_TYPE_STRING:
            if (value.isNull()) {
                g_value_set_string(gvalue, nullptr);
                return true;
            }
            if (!value.isString())
                return throw_expect_type(value, gvalue, error);
            g_value_set_string(gvalue, value.toString().c_str());
            return true;

        case G_TYPE_OBJECT:
        case G_TYPE_INTERFACE: {
            GObject* gobj;
            if (!ObjectInstance::to_c_ptr(value, GI_TRANSFER_NOTHING,
                                          /* may_be_null = */ true, &gobj,
                                          error))
                return false;
            if (gobj && !g_type_is_a(G_OBJECT_TYPE(gobj), gtype)) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                            "%s is not a %s", G_OBJECT_TYPE_NAME(gobj),
                            g_type_name(gtype));
                return false;
            }
            g_value_set_object(gvalue, gobj);
            return true;
        }

        case G_TYPE_BOXED: {
            if (value.isNull()) {
                g_value_set_boxed(gvalue, nullptr);
                return true;
            }
            Gdyn::NativeInstance* instance = instance_of_kind(
                value, InstanceKind::BOXED, InstanceKind::STRUCT);
            if (!instance)
                return throw_expect_type(value, gvalue, error);
            g_value_set_boxed(gvalue, instance->ptr());
            return true;
        }

        case G_TYPE_VARIANT: {
            if (value.isNull()) {
                g_value_set_variant(gvalue, nullptr);
                return true;
            }
            Gdyn::NativeInstance* instance = instance_of_kind(
                value, InstanceKind::VARIANT, InstanceKind::VARIANT);
            if (!instance)
                return throw_expect_type(value, gvalue, error);
            g_value_set_variant(gvalue, static_cast<GVariant*>(instance->ptr()));
            return true;
        }

        case G_TYPE_PARAM: {
            if (value.isNull()) {
                g_value_set_param(gvalue, nullptr);
                return true;
            }
            Gdyn::NativeInstance* instance = instance_of_kind(
                value, InstanceKind::FUNDAMENTAL, InstanceKind::FUNDAMENTAL);
            if (!instance)
                return throw_expect_type(value, gvalue, error);
            g_value_set_param(gvalue, static_cast<GParamSpec*>(instance->ptr()));
            return true;
        }

        case G_TYPE_POINTER:
            if (!value.isNull() && !value.isObject())
                return throw_expect_type(value, gvalue, error);
            g_value_set_pointer(gvalue, value.native_pointer());
            return true;

        default:
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                        "Cannot convert %s to GValue of type %s",
                        value.debug_string().c_str(), g_type_name(gtype));
            return false;
    }
}
