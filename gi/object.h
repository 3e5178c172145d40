/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stddef.h>  // for size_t

#include <memory>

#include <girepository/girepository.h>
#include <glib-object.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"
#include "gi/wrapper.h"
#include "util/log.h"

namespace Gdyn {

/*
 * ObjectInstance:
 *
 * Managed handle to a GObject. The wrapper counts the references it has
 * claimed on the object in m_refs: one for a borrowed retrieval, plus one for
 * each owned retrieval of the same pointer, and releases all of them in its
 * destructor.
 */
class GDYN_EXPORT ObjectInstance : public NativeInstance {
    unsigned m_refs;

    explicit ObjectInstance(GObject* gobj);

    GdynDebugTopic debug_topic() const override { return GDYN_DEBUG_GOBJECT; }

    [[nodiscard]] static ObjectInstance* for_gobject(GObject* gobj);
    static std::shared_ptr<ObjectInstance> new_for_gobject(GObject* gobj,
                                                           GITransfer transfer);

 public:
    ~ObjectInstance() override;

    [[nodiscard]] GObject* gobj() const { return G_OBJECT(m_ptr); }
    [[nodiscard]] GType gtype() const { return G_OBJECT_TYPE(gobj()); }
    [[nodiscard]] unsigned refs_held() const { return m_refs; }

    [[nodiscard]] InstanceKind kind() const override {
        return InstanceKind::OBJECT;
    }
    [[nodiscard]] bool owns_native() const override { return m_refs > 0; }
    [[nodiscard]] const char* type_name() const override {
        return g_type_name(gtype());
    }

    // Returns the single wrapper for @gobj, creating it if needed. With
    // GI_TRANSFER_EVERYTHING the reference passed in by the caller is kept by
    // the wrapper; otherwise a new wrapper takes its own reference.
    [[nodiscard]] static std::shared_ptr<ObjectInstance> wrapper_from_gobject(
        GObject* gobj, GITransfer transfer);

    static void set_value_from_gobject(GObject* gobj, GITransfer transfer,
                                       Value* value_p);

    // Extracts the GObject from a managed value. Null is accepted only if
    // @may_be_null. With GI_TRANSFER_EVERYTHING the callee is given a new
    // reference.
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool to_c_ptr(const Value& value, GITransfer transfer,
                         bool may_be_null, GObject** ptr, GError** error);

    [[nodiscard]] static size_t cache_size();
    // Forgets all wrappers; live wrappers keep their references
    static void clear_cache();
};

}  // namespace Gdyn
