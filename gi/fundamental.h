/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2013 Intel Corporation
// SPDX-FileCopyrightText: 2008-2010 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stddef.h>  // for size_t

#include <memory>

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"
#include "gi/wrapper.h"
#include "util/log.h"

namespace Gdyn {

/*
 * FundamentalInstance:
 *
 * Managed handle to a reference-counted instance that is not a GObject: a
 * fundamental type with its own ref and unref functions, or a GVariant. Like
 * ObjectInstance it keeps an identity cache and counts the references it has
 * claimed.
 */
class GDYN_EXPORT FundamentalInstance : public NativeInstance {
 public:
    using RefFunction = void* (*)(void*);
    using UnrefFunction = void (*)(void*);

    struct Functions {
        RefFunction ref;
        UnrefFunction unref;
        // Turns a floating reference handed to us into a normal one
        RefFunction sink;
        bool is_variant;
    };

 private:
    Functions m_funcs;
    unsigned m_refs;

    FundamentalInstance(void* ptr, const Functions& funcs);

    GdynDebugTopic debug_topic() const override {
        return GDYN_DEBUG_GFUNDAMENTAL;
    }

    void ref() { m_funcs.ref(m_ptr); }
    void unref() { m_funcs.unref(m_ptr); }

    [[nodiscard]] static FundamentalInstance* for_pointer(void* ptr);

 public:
    ~FundamentalInstance() override;

    [[nodiscard]] unsigned refs_held() const { return m_refs; }

    [[nodiscard]] InstanceKind kind() const override {
        return m_funcs.is_variant ? InstanceKind::VARIANT
                                  : InstanceKind::FUNDAMENTAL;
    }
    [[nodiscard]] bool owns_native() const override { return m_refs > 0; }
    [[nodiscard]] const char* type_name() const override;

    // Looks up the ref and unref functions named by a Fundamental descriptor,
    // or the GVariant functions for a Variant descriptor.
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool resolve_functions(const TypeDesc& desc, Functions* funcs,
                                  GError** error);

    [[nodiscard]] static std::shared_ptr<FundamentalInstance>
    wrapper_from_pointer(void* ptr, const Functions& funcs,
                         GITransfer transfer);

    GDYN_MARSHAL_RETURN_CONVENTION
    static bool set_value_from_ptr(const TypeDesc& desc, void* ptr,
                                   GITransfer transfer, Value* value_p,
                                   GError** error);

    // With GI_TRANSFER_EVERYTHING the callee is given a new reference.
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool to_c_ptr(const TypeDesc& desc, const Value& value,
                         GITransfer transfer, bool may_be_null, void** ptr,
                         GError** error);

    [[nodiscard]] static size_t cache_size();
    static void clear_cache();
};

}  // namespace Gdyn
