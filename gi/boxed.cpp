/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <string.h>  // for memcpy

#include <memory>
#include <string>

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/error-types.h"
#include "gi/boxed.h"
#include "gi/library.h"
#include "gi/type-desc.h"
#include "util/log.h"

namespace Gdyn {

BoxedInstance::BoxedInstance(void* ptr, GType gtype, size_t size,
                             const std::string& name, bool is_struct)
    : NativeInstance(ptr),
      m_gtype(gtype),
      m_size(size),
      m_type_name(name),
      m_owning_ptr(false),
      m_is_struct(is_struct) {}

BoxedInstance::~BoxedInstance() {
    debug_lifecycle("Wrapper destroyed");

    if (!m_owning_ptr || !m_ptr)
        return;

    if (m_gtype != G_TYPE_NONE && g_type_is_a(m_gtype, G_TYPE_BOXED)) {
        g_boxed_free(m_gtype, m_ptr);
        return;
    }

    g_free(m_ptr);
}

/*
 * BoxedInstance::copy_boxed:
 *
 * Replace the borrowed pointer with a new one allocated using g_boxed_copy().
 */
void BoxedInstance::copy_boxed(void* boxed_ptr) {
    m_ptr = g_boxed_copy(m_gtype, boxed_ptr);
    m_owning_ptr = true;
    debug_lifecycle("Boxed pointer created with g_boxed_copy()");
}

/*
 * BoxedInstance::copy_memory:
 *
 * Replace the borrowed pointer with a new one allocated by copying the struct's
 * bytes.
 */
void BoxedInstance::copy_memory(void* struct_ptr) {
    m_ptr = g_memdup2(struct_ptr, m_size);
    m_owning_ptr = true;
    debug_lifecycle("Struct pointer created by copying memory");
}

std::shared_ptr<BoxedInstance> BoxedInstance::new_for_boxed(
    void* ptr, GType gtype, const std::string& type_name, GITransfer transfer) {
    std::shared_ptr<BoxedInstance> priv{
        new BoxedInstance(ptr, gtype, 0, type_name, false)};

    if (transfer == GI_TRANSFER_NOTHING) {
        priv->copy_boxed(ptr);
    } else {
        priv->m_owning_ptr = true;
        priv->debug_lifecycle("Boxed pointer acquired");
    }

    return priv;
}

std::shared_ptr<BoxedInstance> BoxedInstance::new_for_struct(
    void* ptr, const std::string& type_name, size_t size, GITransfer transfer) {
    std::shared_ptr<BoxedInstance> priv{
        new BoxedInstance(ptr, G_TYPE_NONE, size, type_name, true)};

    if (transfer != GI_TRANSFER_NOTHING) {
        priv->m_owning_ptr = true;
        priv->debug_lifecycle("Struct pointer acquired");
    } else if (size > 0) {
        priv->copy_memory(ptr);
    } else {
        priv->debug_lifecycle("Struct pointer borrowed");
    }

    return priv;
}

std::shared_ptr<BoxedInstance> BoxedInstance::new_allocated(
    size_t size, GType gtype, const std::string& type_name) {
    std::shared_ptr<BoxedInstance> priv{new BoxedInstance(
        g_malloc0(size), gtype, size, type_name, gtype == G_TYPE_NONE)};
    priv->m_owning_ptr = true;
    priv->debug_lifecycle("Pointer directly allocated");
    return priv;
}

bool BoxedInstance::resolve_gtype(const TypeDesc& desc, GType* gtype_out,
                                  GError** error) {
    GType gtype = G_TYPE_INVALID;

    if (!desc.get_type_function().empty()) {
        void* get_type;
        if (!gdyn_library_lookup_symbol(desc.library().c_str(),
                                        desc.get_type_function().c_str(),
                                        &get_type, error))
            return false;
        gtype = reinterpret_cast<GType (*)()>(get_type)();
    } else {
        gtype = g_type_from_name(desc.type_name().c_str());
    }

    if (gtype == G_TYPE_INVALID || !g_type_is_a(gtype, G_TYPE_BOXED)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "'%s' is not a registered boxed type",
                    desc.type_name().c_str());
        return false;
    }

    *gtype_out = gtype;
    return true;
}

bool BoxedInstance::set_value_from_ptr(const TypeDesc& desc, void* ptr,
                                       GITransfer transfer, Value* value_p,
                                       GError** error) {
    if (!ptr) {
        *value_p = Value::null();
        return true;
    }

    if (desc.tag() == TypeDesc::Tag::STRUCT) {
        *value_p = Value::object(new_for_struct(ptr, desc.type_name(),
                                                desc.struct_size(), transfer));
        return true;
    }

    GType gtype;
    if (!resolve_gtype(desc, &gtype, error))
        return false;

    *value_p = Value::object(
        new_for_boxed(ptr, gtype, g_type_name(gtype), transfer));
    return true;
}

bool BoxedInstance::to_c_ptr(const TypeDesc& desc, const Value& value,
                             GITransfer transfer, bool may_be_null, void** ptr,
                             GError** error) {
    if (value.isNullOrUndefined()) {
        if (!may_be_null) {
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                        "Expected %s, got null", desc.to_string().c_str());
            return false;
        }
        *ptr = nullptr;
        return true;
    }

    if (!value.isObject() ||
        (value.toObject()->kind() != InstanceKind::BOXED &&
         value.toObject()->kind() != InstanceKind::STRUCT)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Expected %s, got %s", desc.to_string().c_str(),
                    value.debug_string().c_str());
        return false;
    }

    void* boxed_ptr = value.native_pointer();
    if (transfer == GI_TRANSFER_NOTHING) {
        *ptr = boxed_ptr;
        return true;
    }

    if (desc.tag() == TypeDesc::Tag::BOXED) {
        GType gtype;
        if (!resolve_gtype(desc, &gtype, error))
            return false;
        *ptr = g_boxed_copy(gtype, boxed_ptr);
        return true;
    }

    auto* priv = static_cast<BoxedInstance*>(value.toObject().get());
    size_t size = desc.struct_size() ? desc.struct_size() : priv->m_size;
    if (size == 0) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Cannot transfer ownership of %s of unknown size",
                    priv->type_name());
        return false;
    }
    *ptr = g_memdup2(boxed_ptr, size);
    return true;
}

}  // namespace Gdyn
