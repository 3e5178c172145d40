/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2013 Intel Corporation
// SPDX-FileCopyrightText: 2008-2010 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <memory>
#include <unordered_map>
#include <utility>  // for pair

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/error-types.h"
#include "gi/fundamental.h"
#include "gi/library.h"
#include "gi/type-desc.h"
#include "util/log.h"

namespace Gdyn {

using FundamentalCache =
    std::unordered_map<void*, std::pair<FundamentalInstance*,
                                        std::weak_ptr<NativeInstance>>>;

static FundamentalCache& fundamental_cache() {
    static FundamentalCache cache;
    return cache;
}

static void* variant_ref_sink(void* variant) {
    return g_variant_ref_sink(static_cast<GVariant*>(variant));
}

static void* variant_take_ref(void* variant) {
    return g_variant_take_ref(static_cast<GVariant*>(variant));
}

static void variant_unref(void* variant) {
    g_variant_unref(static_cast<GVariant*>(variant));
}

FundamentalInstance::FundamentalInstance(void* ptr, const Functions& funcs)
    : NativeInstance(ptr), m_funcs(funcs), m_refs(0) {}

FundamentalInstance::~FundamentalInstance() {
    debug_lifecycle("Wrapper destroyed");

    FundamentalCache& cache = fundamental_cache();
    auto it = cache.find(m_ptr);
    if (it != cache.end() && it->second.first == this)
        cache.erase(it);

    for (; m_refs > 0; m_refs--)
        unref();
}

const char* FundamentalInstance::type_name() const {
    if (m_funcs.is_variant)
        return "GVariant";
    return "fundamental";
}

FundamentalInstance* FundamentalInstance::for_pointer(void* ptr) {
    FundamentalCache& cache = fundamental_cache();
    auto it = cache.find(ptr);
    if (it == cache.end() || it->second.second.expired())
        return nullptr;
    return it->second.first;
}

bool FundamentalInstance::resolve_functions(const TypeDesc& desc,
                                            Functions* funcs, GError** error) {
    if (desc.tag() == TypeDesc::Tag::VARIANT) {
        *funcs = {variant_ref_sink, variant_unref, variant_take_ref, true};
        return true;
    }

    void* ref;
    void* unref;
    if (!gdyn_library_lookup_symbol(desc.library().c_str(),
                                    desc.ref_function().c_str(), &ref,
                                    error) ||
        !gdyn_library_lookup_symbol(desc.library().c_str(),
                                    desc.unref_function().c_str(), &unref,
                                    error))
        return false;

    *funcs = {reinterpret_cast<RefFunction>(ref),
              reinterpret_cast<UnrefFunction>(unref), nullptr, false};
    return true;
}

std::shared_ptr<FundamentalInstance> FundamentalInstance::wrapper_from_pointer(
    void* ptr, const Functions& funcs, GITransfer transfer) {
    g_assert(ptr && "Cannot get wrapper for null fundamental pointer");

    FundamentalInstance* priv = for_pointer(ptr);
    if (priv) {
        if (transfer != GI_TRANSFER_NOTHING) {
            if (funcs.sink)
                funcs.sink(ptr);
            priv->m_refs++;
        }
        return std::static_pointer_cast<FundamentalInstance>(
            priv->shared_from_this());
    }

    std::shared_ptr<FundamentalInstance> retval{
        new FundamentalInstance(ptr, funcs)};
    if (transfer == GI_TRANSFER_NOTHING)
        retval->ref();
    else if (funcs.sink)
        funcs.sink(ptr);
    retval->m_refs = 1;

    fundamental_cache()[ptr] = {retval.get(), retval};
    retval->debug_lifecycle("Wrapper created");
    return retval;
}

bool FundamentalInstance::set_value_from_ptr(const TypeDesc& desc, void* ptr,
                                             GITransfer transfer,
                                             Value* value_p, GError** error) {
    if (!ptr) {
        *value_p = Value::null();
        return true;
    }

    Functions funcs;
    if (!resolve_functions(desc, &funcs, error))
        return false;

    *value_p = Value::object(wrapper_from_pointer(ptr, funcs, transfer));
    return true;
}

bool FundamentalInstance::to_c_ptr(const TypeDesc& desc, const Value& value,
                                   GITransfer transfer, bool may_be_null,
                                   void** ptr, GError** error) {
    if (value.isNullOrUndefined()) {
        if (!may_be_null) {
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                        "Expected %s, got null", desc.to_string().c_str());
            return false;
        }
        *ptr = nullptr;
        return true;
    }

    InstanceKind expected = desc.tag() == TypeDesc::Tag::VARIANT
                                ? InstanceKind::VARIANT
                                : InstanceKind::FUNDAMENTAL;
    if (!value.isObject() || value.toObject()->kind() != expected) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Expected %s, got %s", desc.to_string().c_str(),
                    value.debug_string().c_str());
        return false;
    }

    auto* priv = static_cast<FundamentalInstance*>(value.toObject().get());
    if (transfer != GI_TRANSFER_NOTHING)
        priv->ref();

    *ptr = priv->m_ptr;
    return true;
}

size_t FundamentalInstance::cache_size() { return fundamental_cache().size(); }

void FundamentalInstance::clear_cache() {
    gdyn_debug(GDYN_DEBUG_GFUNDAMENTAL,
               "Clearing %zu wrapper(s) from fundamental cache",
               fundamental_cache().size());
    fundamental_cache().clear();
}

}  // namespace Gdyn
