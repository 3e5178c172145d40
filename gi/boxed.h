/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stddef.h>  // for size_t

#include <memory>
#include <string>

#include <girepository/girepository.h>
#include <glib-object.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"
#include "gi/wrapper.h"
#include "util/log.h"

namespace Gdyn {

/*
 * BoxedInstance:
 *
 * Managed handle to a boxed GType instance or to a plain C struct. Borrowed
 * memory is copied on retrieval (g_boxed_copy() or a plain memory copy when
 * the struct size is known), so each BoxedInstance usually owns its pointer
 * outright. Only a borrowed struct of unknown size is wrapped without
 * ownership.
 */
class GDYN_EXPORT BoxedInstance : public NativeInstance {
    GType m_gtype;  // G_TYPE_NONE for plain structs
    size_t m_size;  // 0 if unknown
    std::string m_type_name;
    bool m_owning_ptr : 1;
    bool m_is_struct : 1;

    BoxedInstance(void* ptr, GType gtype, size_t size, const std::string& name,
                  bool is_struct);

    GdynDebugTopic debug_topic() const override { return GDYN_DEBUG_GBOXED; }

    void copy_boxed(void* boxed_ptr);
    void copy_memory(void* struct_ptr);

 public:
    ~BoxedInstance() override;

    [[nodiscard]] GType gtype() const { return m_gtype; }
    [[nodiscard]] size_t size() const { return m_size; }

    [[nodiscard]] InstanceKind kind() const override {
        return m_is_struct ? InstanceKind::STRUCT : InstanceKind::BOXED;
    }
    [[nodiscard]] bool owns_native() const override { return m_owning_ptr; }
    [[nodiscard]] const char* type_name() const override {
        return m_type_name.c_str();
    }

    [[nodiscard]] static std::shared_ptr<BoxedInstance> new_for_boxed(
        void* ptr, GType gtype, const std::string& type_name,
        GITransfer transfer);
    [[nodiscard]] static std::shared_ptr<BoxedInstance> new_for_struct(
        void* ptr, const std::string& type_name, size_t size,
        GITransfer transfer);
    // Zero-initialized memory owned by the wrapper
    [[nodiscard]] static std::shared_ptr<BoxedInstance> new_allocated(
        size_t size, GType gtype, const std::string& type_name);

    // Resolves the GType named by a Boxed descriptor, through its
    // get_type_function in its library if it has one, or else by name in the
    // type system. The latter fails for types that were not registered yet.
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool resolve_gtype(const TypeDesc& desc, GType* gtype_out,
                              GError** error);

    // Wraps a pointer read from a Boxed or Struct slot, following the
    // ownership rules above. A null pointer gives a null value.
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool set_value_from_ptr(const TypeDesc& desc, void* ptr,
                                   GITransfer transfer, Value* value_p,
                                   GError** error);

    // Extracts the pointer from a managed value for a Boxed or Struct slot.
    // With GI_TRANSFER_EVERYTHING the callee is given its own copy.
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool to_c_ptr(const TypeDesc& desc, const Value& value,
                         GITransfer transfer, bool may_be_null, void** ptr,
                         GError** error);
};

}  // namespace Gdyn
