/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2021 Canonical Ltd.
// SPDX-FileContributor: Marco Trevisan <marco.trevisan@canonical.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <unordered_set>
#include <utility>  // for move
#include <vector>

#include <glib-object.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gi/closure.h"
#include "gi/type-desc.h"
#include "gi/value.h"
#include "util/log.h"

namespace Gdyn {

static std::unordered_set<Closure*>& live_closures() {
    static std::unordered_set<Closure*> closures;
    return closures;
}

Closure::Closure(std::shared_ptr<const Callable> callable, TypeDescPtr type)
    : m_callable(std::move(callable)), m_type(std::move(type)) {
    live_closures().insert(this);

    g_closure_add_invalidate_notifier(this, nullptr, [](void*, GClosure* closure) {
        static_cast<Closure*>(closure)->closure_invalidated();
    });

    gdyn_debug_closure("Create closure %p for %s callback", this,
                       TypeDesc::trampoline_name(m_type->trampoline()));
}

Closure::~Closure() {
    gdyn_debug_closure("Finalizing closure %p", this);
    live_closures().erase(this);
}

Closure* Closure::create(std::shared_ptr<const Callable> callable,
                         TypeDescPtr type) {
    auto* self = new Closure(std::move(callable), std::move(type));
    self->add_finalize_notifier<Closure>();
    g_closure_set_marshal(self, marshal_cb);
    return self;
}

/* Invalidation is like "dispose" - it is guaranteed to happen at
 * finalize, but may happen before finalize. Normally, g_closure_invalidate()
 * is called when the "target" of the closure becomes invalid, so that the
 * source (the signal connection, say) can be removed. Here that happens when
 * the engine is stopped.
 *
 * Unlike "dispose" invalidation only happens once.
 */
void Closure::closure_invalidated() {
    gdyn_debug_closure("Invalidating closure %p", this);

    live_closures().erase(this);
    reset();
}

void Closure::acquire() {
    g_closure_ref(this);
    g_closure_sink(this);
}

void Closure::release(void* data) {
    if (!data)
        return;

    auto* self = static_cast<Closure*>(data);
    gdyn_debug_closure("Native code released closure %p", self);
    g_closure_invalidate(self);
    g_closure_unref(self);
}

size_t Closure::n_live() { return live_closures().size(); }

void Closure::invalidate_all() {
    // Invalidating removes the closure from the set
    std::vector<Closure*> closures{live_closures().begin(),
                                   live_closures().end()};

    gdyn_debug(GDYN_DEBUG_GCLOSURE, "Invalidating %zu closure(s)",
               closures.size());

    for (Closure* closure : closures) {
        Ptr guard{closure, TakeOwnership{}};
        g_closure_invalidate(closure);
    }
}

bool Closure::invoke(const ValueVector& args, Value* rval) {
    if (!m_callable) {
        /* We were destroyed; become a no-op */
        gdyn_debug_closure("Invoking invalidated closure %p, ignoring", this);
        return false;
    }

    // The callable may drop the last reference to the closure, for example by
    // disconnecting itself, so keep both alive until it returns
    Ptr guard{this, TakeOwnership{}};
    std::shared_ptr<const Callable> callable = m_callable;

    AutoError error;
    if (!(*callable)(args, rval, &error)) {
        g_warning("Callback %s failed: %s",
                  TypeDesc::trampoline_name(m_type->trampoline()),
                  error ? error->message : "unknown error");
        return false;
    }

    return true;
}

const TypeDesc* Closure::param_type(unsigned index) const {
    if (m_type->trampoline() == TrampolineKind::ASYNC_READY) {
        if (index == 0)
            return m_type->source_type().get();
        if (index == 1)
            return m_type->result_type().get();
        return nullptr;
    }

    const std::vector<TypeDescPtr>& arg_types = m_type->arg_types();
    if (index < arg_types.size())
        return arg_types[index].get();
    return nullptr;
}

void Closure::marshal(GValue* return_value, unsigned n_param_values,
                      const GValue* param_values, void*, void*) {
    gdyn_debug_marshal(GDYN_DEBUG_GCLOSURE,
                       "Marshal closure %p with %u parameters", this,
                       n_param_values);

    if (!is_valid()) {
        gdyn_debug_closure("Closure %p invoked after invalidation", this);
        return;
    }

    ValueVector args;
    args.reserve(n_param_values);
    for (unsigned ix = 0; ix < n_param_values; ix++) {
        Value arg;
        AutoError error;
        if (!gdyn_value_from_g_value(&param_values[ix], param_type(ix), &arg,
                                     &error)) {
            g_critical("Unable to convert argument %u of %s callback: %s", ix,
                       TypeDesc::trampoline_name(m_type->trampoline()),
                       error->message);
            return;
        }
        args.push_back(std::move(arg));
    }

    Value rval;
    if (!invoke(args, &rval))
        return;

    if (!return_value || !G_IS_VALUE(return_value))
        return;

    const TypeDescPtr& return_type = m_type->return_type();
    if (return_type && return_type->tag() == TypeDesc::Tag::VOID)
        return;

    AutoError error;
    if (!gdyn_value_to_g_value(rval, return_value, &error))
        g_warning("Invalid return value from %s callback: %s",
                  TypeDesc::trampoline_name(m_type->trampoline()),
                  error->message);
}

}  // namespace Gdyn
