/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2013 Giovanni Campagna <scampa.giovanni@gmail.com>
// SPDX-FileCopyrightText: 2021 Evan Welsh <contact@evanwelsh.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stddef.h>  // for size_t

#include <memory>
#include <string>
#include <utility>  // for move
#include <vector>

#include <gio/gio.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/engine.h"
#include "gdyn/error-types.h"
#include "gdyn/value.h"
#include "gi/closure.h"
#include "gi/function.h"
#include "gi/fundamental.h"
#include "gi/memory.h"
#include "gi/object.h"
#include "util/log.h"

namespace Gdyn {

/*
 * Engine:
 *
 * Process-wide state between gdyn_start() and gdyn_stop(): the application,
 * held so that it stays registered, and the thread everything must run on.
 * The wrapper caches and the closure registry live in their own modules and
 * are torn down from here.
 */
class Engine {
    AutoUnref<GApplication> m_application;
    GThread* m_thread = nullptr;

    Engine() = default;

 public:
    [[nodiscard]] static Engine& get() {
        static Engine engine;
        return engine;
    }

    [[nodiscard]] bool is_started() const { return !!m_application; }

    GApplication* start(const char* application_id, GApplicationFlags flags,
                        GError** error);
    void stop();
    void poll();

    void ensure_started(const char* operation) const {
        if (!is_started())
            g_error("%s() called before gdyn_start() or after gdyn_stop()",
                    operation);
        if (g_thread_self() != m_thread)
            g_critical("%s() called from a thread other than the one that "
                       "called gdyn_start()",
                       operation);
    }
};

GApplication* Engine::start(const char* application_id,
                            GApplicationFlags flags, GError** error) {
    if (m_application) {
        gdyn_debug(GDYN_DEBUG_CONTEXT, "Already started as %s",
                   g_application_get_application_id(m_application));
        return m_application;
    }

    gdyn_log_init();

    if (application_id && !g_application_id_is_valid(application_id)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_FAILED,
                    "'%s' is not a valid application ID", application_id);
        return nullptr;
    }

    AutoUnref<GApplication> application{
        g_application_new(application_id, flags)};

    AutoError register_error;
    if (!g_application_register(application, nullptr, &register_error)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_FAILED,
                    "Cannot register application %s: %s",
                    application_id ? application_id : "(null)",
                    register_error->message);
        return nullptr;
    }

    g_application_hold(application);
    m_application = std::move(application);
    m_thread = g_thread_self();

    gdyn_debug(GDYN_DEBUG_CONTEXT, "Started application %s (%p)",
               application_id ? application_id : "(null)",
               m_application.get());
    return m_application;
}

void Engine::stop() {
    if (!m_application) {
        gdyn_debug(GDYN_DEBUG_CONTEXT, "Not started, nothing to stop");
        return;
    }

    gdyn_debug(GDYN_DEBUG_CONTEXT, "Stopping application %p",
               m_application.get());

    // Late invocations from native code become no-ops
    Closure::invalidate_all();

    g_application_release(m_application);
    m_application.reset();
    m_thread = nullptr;

    ObjectInstance::clear_cache();
    FundamentalInstance::clear_cache();

    gdyn_log_cleanup();
}

void Engine::poll() {
    AutoMainContext main_context{g_main_context_ref_thread_default()};

    while (g_main_context_pending(main_context))
        g_main_context_iteration(main_context, /* may_block = */ false);
}

}  // namespace Gdyn

using Gdyn::Engine;
using Gdyn::Value;

GApplication* gdyn_start(const char* application_id, GApplicationFlags flags,
                         GError** error) {
    return Engine::get().start(application_id, flags, error);
}

void gdyn_stop() { Engine::get().stop(); }

bool gdyn_is_started() { return Engine::get().is_started(); }

void gdyn_poll() {
    Engine::get().ensure_started("gdyn_poll");
    Engine::get().poll();
}

bool gdyn_call(const char* library, const char* symbol,
               const Gdyn::ArgumentVector& args,
               const Gdyn::TypeDescPtr& return_type, Value* rval,
               GError** error) {
    Engine::get().ensure_started("gdyn_call");

    std::unique_ptr<Gdyn::Function> function;
    if (!Gdyn::Function::create(library, symbol, args, return_type, &function,
                                error))
        return false;

    return function->invoke(args, rval, error);
}

bool gdyn_batch_call(const std::vector<Gdyn::Call>& calls, GError** error) {
    Engine::get().ensure_started("gdyn_batch_call");

    gdyn_debug(GDYN_DEBUG_GFUNCTION, "Batch of %zu call(s)", calls.size());

    for (const Gdyn::Call& call : calls) {
        std::unique_ptr<Gdyn::Function> function;
        Value ignored;
        if (!Gdyn::Function::create(call.library.c_str(), call.symbol.c_str(),
                                    call.args, nullptr, &function, error) ||
            !function->invoke(call.args, &ignored, error))
            return false;
    }

    return true;
}

bool gdyn_read(const Value& handle, const Gdyn::TypeDescPtr& type,
               size_t offset, Value* value_p, GError** error) {
    Engine::get().ensure_started("gdyn_read");
    g_return_val_if_fail(type, false);
    return gdyn_memory_read(handle, *type, offset, value_p, error);
}

bool gdyn_write(const Value& handle, const Gdyn::TypeDescPtr& type,
                size_t offset, const Value& value, GError** error) {
    Engine::get().ensure_started("gdyn_write");
    g_return_val_if_fail(type, false);
    return gdyn_memory_write(handle, *type, offset, value, error);
}

bool gdyn_alloc(size_t size, const char* type_name, const char* library,
                Value* value_p, GError** error) {
    Engine::get().ensure_started("gdyn_alloc");
    return gdyn_memory_alloc(size, type_name, library, value_p, error);
}

bool gdyn_read_pointer(const Value& handle, size_t ptr_offset,
                       size_t element_offset, Value* value_p, GError** error) {
    Engine::get().ensure_started("gdyn_read_pointer");
    return gdyn_memory_read_pointer(handle, ptr_offset, element_offset, value_p,
                                    error);
}

bool gdyn_write_pointer(const Value& dest, size_t ptr_offset,
                        size_t element_offset, const Value& source, size_t size,
                        GError** error) {
    Engine::get().ensure_started("gdyn_write_pointer");
    return gdyn_memory_write_pointer(dest, ptr_offset, element_offset, source,
                                     size, error);
}

bool gdyn_get_native_id(const Value& handle, Value* value_p, GError** error) {
    Engine::get().ensure_started("gdyn_get_native_id");
    return gdyn_memory_native_id(handle, value_p, error);
}

Value gdyn_create_ref(Value initial, Gdyn::TypeDescPtr inner_type) {
    return Value::ref(
        std::make_shared<Gdyn::RefCell>(std::move(initial),
                                        std::move(inner_type)));
}
