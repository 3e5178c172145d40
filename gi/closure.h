/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2021 Canonical Ltd.
// SPDX-FileContributor: Marco Trevisan <marco.trevisan@canonical.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GI_CLOSURE_H_
#define GI_CLOSURE_H_

#include <config.h>

#include <stddef.h>

#include <memory>
#include <type_traits>

#include <glib-object.h>

#include "gdyn/auto.h"
#include "gdyn/macros.h"
#include "gdyn/value.h"

namespace Gdyn {

class TypeDesc;

/*
 * Closure:
 *
 * A GClosure that calls a managed Callable. Every callback handed to native
 * code is one of these: signal connections receive it directly, and the other
 * trampoline kinds receive it as their user data and invoke it with
 * g_closure_invoke().
 *
 * All closures that have not been invalidated are tracked, so that stopping
 * the engine can invalidate them; an invalidated closure drops its callable
 * and further invocations do nothing.
 */
class GDYN_EXPORT Closure : public GClosure {
 protected:
    Closure(std::shared_ptr<const Callable> callable, TypeDescPtr type);
    ~Closure();

    // Need to call this if inheriting from Closure to call the dtor
    template <class C>
    constexpr void add_finalize_notifier() {
        static_assert(std::is_base_of_v<Closure, C>);
        g_closure_add_finalize_notifier(
            this, nullptr,
            [](void*, GClosure* closure) { static_cast<C*>(closure)->~C(); });
    }

    void* operator new(size_t size) {
        return g_closure_new_simple(size, nullptr);
    }

    void operator delete(void* p) { unref(static_cast<Closure*>(p)); }

 public:
    static Closure* ref(Closure* self) {
        return static_cast<Closure*>(g_closure_ref(self));
    }
    static void unref(Closure* self) { g_closure_unref(self); }

    using Ptr = Gdyn::AutoPointer<Closure, Closure, unref, ref>;

    [[nodiscard]] constexpr static Closure* for_gclosure(GClosure* gclosure) {
        // We need to do this in order to ensure this is a constant expression
        return static_cast<Closure*>(static_cast<void*>(gclosure));
    }

    // Returns a floating closure for the Callback descriptor @type
    [[nodiscard]] static Closure* create(
        std::shared_ptr<const Callable> callable, TypeDescPtr type);

    [[nodiscard]] bool is_valid() const { return !!m_callable; }
    [[nodiscard]] const TypeDesc& type() const { return *m_type; }

    // Calls the callable. If the closure was invalidated, or the callable
    // fails, a warning is logged, @rval is left alone and false is returned.
    bool invoke(const ValueVector& args, Value* rval);

    // Makes the closure native code holds through a user data pointer. The
    // reference is dropped by release().
    void acquire();
    static void release(void* data);

    [[nodiscard]] static size_t n_live();
    static void invalidate_all();

 private:
    void reset() { m_callable.reset(); }

    static void marshal_cb(GClosure* closure, GValue* ret, unsigned n_params,
                           const GValue* params, void* hint, void* data) {
        for_gclosure(closure)->marshal(ret, n_params, params, hint, data);
    }

    [[nodiscard]] const TypeDesc* param_type(unsigned index) const;
    void closure_invalidated();
    void marshal(GValue* ret, unsigned n_params, const GValue* params,
                 void* hint, void* data);

    std::shared_ptr<const Callable> m_callable;
    TypeDescPtr m_type;
};

}  // namespace Gdyn

#endif  // GI_CLOSURE_H_
