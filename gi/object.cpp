/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <memory>
#include <unordered_map>
#include <utility>  // for pair

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/error-types.h"
#include "gi/object.h"
#include "util/log.h"

namespace Gdyn {

// Non-owning: an entry is removed by the destructor of the wrapper it points
// to. The raw pointer tells apart a stale entry from its replacement.
using ObjectCache =
    std::unordered_map<GObject*, std::pair<ObjectInstance*,
                                           std::weak_ptr<NativeInstance>>>;

static ObjectCache& object_cache() {
    static ObjectCache cache;
    return cache;
}

ObjectInstance::ObjectInstance(GObject* gobj) : NativeInstance(gobj), m_refs(0) {}

ObjectInstance::~ObjectInstance() {
    debug_lifecycle("Wrapper destroyed");

    ObjectCache& cache = object_cache();
    auto it = cache.find(gobj());
    if (it != cache.end() && it->second.first == this)
        cache.erase(it);

    gdyn_debug(GDYN_DEBUG_GOBJECT, "Releasing %u reference(s) on %s %p", m_refs,
               type_name(), m_ptr);

    for (; m_refs > 0; m_refs--)
        g_object_unref(m_ptr);
}

ObjectInstance* ObjectInstance::for_gobject(GObject* gobj) {
    ObjectCache& cache = object_cache();
    auto it = cache.find(gobj);
    if (it == cache.end() || it->second.second.expired())
        return nullptr;
    return it->second.first;
}

/*
 * ObjectInstance::new_for_gobject:
 *
 * Creates a new wrapper for the GObject pointer @gobj and records it in the
 * identity cache.
 */
std::shared_ptr<ObjectInstance> ObjectInstance::new_for_gobject(
    GObject* gobj, GITransfer transfer) {
    gdyn_debug_marshal(GDYN_DEBUG_GOBJECT, "Wrapping %s %p (%s)",
                       G_OBJECT_TYPE_NAME(gobj), gobj,
                       transfer == GI_TRANSFER_NOTHING ? "borrowed" : "owned");

    std::shared_ptr<ObjectInstance> priv{new ObjectInstance(gobj)};

    // An owned floating reference becomes the wrapper's reference; a borrowed
    // one is claimed (sunk if floating).
    if (transfer == GI_TRANSFER_NOTHING || g_object_is_floating(gobj))
        g_object_ref_sink(gobj);
    priv->m_refs = 1;

    object_cache()[gobj] = {priv.get(), priv};
    priv->debug_lifecycle("Wrapper created");
    return priv;
}

/*
 * ObjectInstance::wrapper_from_gobject:
 *
 * Gets the wrapper for the GObject pointer @gobj. If one already exists, then
 * it is returned, otherwise a new one is created with
 * ObjectInstance::new_for_gobject().
 */
std::shared_ptr<ObjectInstance> ObjectInstance::wrapper_from_gobject(
    GObject* gobj, GITransfer transfer) {
    g_assert(gobj && "Cannot get wrapper for null GObject pointer");

    ObjectInstance* priv = ObjectInstance::for_gobject(gobj);
    if (!priv)
        return new_for_gobject(gobj, transfer);

    // The caller handed us a reference that we now hold for the lifetime of
    // the existing wrapper
    if (transfer != GI_TRANSFER_NOTHING) {
        if (g_object_is_floating(gobj))
            g_object_ref_sink(gobj);
        priv->m_refs++;
        gdyn_debug_marshal(GDYN_DEBUG_GOBJECT,
                           "Wrapper for %s %p now holds %u reference(s)",
                           priv->type_name(), gobj, priv->m_refs);
    }

    return std::static_pointer_cast<ObjectInstance>(priv->shared_from_this());
}

void ObjectInstance::set_value_from_gobject(GObject* gobj, GITransfer transfer,
                                            Value* value_p) {
    if (!gobj) {
        *value_p = Value::null();
        return;
    }

    *value_p = Value::object(wrapper_from_gobject(gobj, transfer));
}

bool ObjectInstance::to_c_ptr(const Value& value, GITransfer transfer,
                              bool may_be_null, GObject** ptr,
                              GError** error) {
    if (value.isNullOrUndefined()) {
        if (!may_be_null) {
            g_set_error_literal(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                                "Expected an object, got null");
            return false;
        }
        *ptr = nullptr;
        return true;
    }

    if (!value.isObject() ||
        value.toObject()->kind() != InstanceKind::OBJECT) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Expected a GObject, got %s", value.debug_string().c_str());
        return false;
    }

    GObject* gobj = G_OBJECT(value.native_pointer());
    if (transfer != GI_TRANSFER_NOTHING)
        g_object_ref(gobj);

    *ptr = gobj;
    return true;
}

size_t ObjectInstance::cache_size() { return object_cache().size(); }

void ObjectInstance::clear_cache() {
    gdyn_debug(GDYN_DEBUG_GOBJECT, "Clearing %zu wrapper(s) from object cache",
               object_cache().size());
    object_cache().clear();
}

}  // namespace Gdyn
