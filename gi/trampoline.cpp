/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <array>
#include <vector>

#include <cairo-gobject.h>
#include <cairo.h>
#include <gio/gio.h>
#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/error-types.h"
#include "gi/arg-inl.h"
#include "gi/arg.h"
#include "gi/boxed.h"
#include "gi/closure.h"
#include "gi/trampoline.h"
#include "gi/type-desc.h"
#include "gi/value.h"
#include "util/log.h"

using Gdyn::AutoGValue;
using Gdyn::Closure;
using Gdyn::TrampolineKind;
using Gdyn::TypeDesc;

template <size_t N>
using GValueArray = std::array<AutoGValue, N>;

[[nodiscard]] static Closure* closure_from_data(void* data,
                                                const char* trampoline) {
    if (!data) {
        g_warning("%s trampoline called without user data, callback skipped",
                  trampoline);
        return nullptr;
    }
    return static_cast<Closure*>(data);
}

static void invoke(Closure* closure, GValue* return_value, unsigned n_params,
                   const GValue* params) {
    // Keep the closure alive even if the callback causes native code to drop
    // it, for example by calling a nested destroy notify
    Closure::Ptr guard{closure, Gdyn::TakeOwnership{}};
    g_closure_invoke(closure, return_value, n_params, params, nullptr);
}

static void set_object(GValue* gvalue, void* gobj) {
    g_value_init(gvalue, G_TYPE_OBJECT);
    g_value_set_object(gvalue, gobj);
}

/*
 * Compare and tree model items are plain pointers as far as the native
 * signature is concerned. The descriptor given for the argument, if any, says
 * what they point to.
 */
static void set_pointer_as(GValue* gvalue, const TypeDesc* type, void* pointer,
                           TypeDesc::Tag default_tag) {
    TypeDesc::Tag tag = type ? type->tag() : default_tag;

    switch (tag) {
        case TypeDesc::Tag::OBJECT:
            set_object(gvalue, pointer);
            return;
        case TypeDesc::Tag::STRING:
            g_value_init(gvalue, G_TYPE_STRING);
            g_value_set_string(gvalue, static_cast<const char*>(pointer));
            return;
        case TypeDesc::Tag::VARIANT:
            g_value_init(gvalue, G_TYPE_VARIANT);
            g_value_set_variant(gvalue, static_cast<GVariant*>(pointer));
            return;
        case TypeDesc::Tag::BOXED: {
            GType gtype;
            Gdyn::AutoError error;
            if (Gdyn::BoxedInstance::resolve_gtype(*type, &gtype, &error)) {
                g_value_init(gvalue, gtype);
                g_value_set_boxed(gvalue, pointer);
                return;
            }
            g_warning("Passing callback argument as a plain pointer: %s",
                      error->message);
            break;
        }
        default:
            break;
    }

    g_value_init(gvalue, G_TYPE_POINTER);
    g_value_set_pointer(gvalue, pointer);
}

static void destroy_trampoline(void* data) {
    Closure* closure = closure_from_data(data, "destroy");
    if (!closure)
        return;

    invoke(closure, nullptr, 0, nullptr);
    Closure::release(closure);
}

static gboolean source_trampoline(void* data) {
    Closure* closure = closure_from_data(data, "source");
    if (!closure)
        return G_SOURCE_REMOVE;

    AutoGValue rval{G_TYPE_BOOLEAN};
    invoke(closure, &rval, 0, nullptr);
    return g_value_get_boolean(&rval);
}

static void draw_trampoline(GObject* drawing_area, cairo_t* cr, int width,
                            int height, void* data) {
    Closure* closure = closure_from_data(data, "draw");
    if (!closure)
        return;

    GValueArray<4> params;
    set_object(&params[0], drawing_area);
    g_value_init(&params[1], CAIRO_GOBJECT_TYPE_CONTEXT);
    g_value_set_boxed(&params[1], cr);
    g_value_init(&params[2], G_TYPE_INT);
    g_value_set_int(&params[2], width);
    g_value_init(&params[3], G_TYPE_INT);
    g_value_set_int(&params[3], height);

    invoke(closure, nullptr, params.size(), params.data());
}

static void async_ready_trampoline(GObject* source_object, GAsyncResult* res,
                                   void* data) {
    Closure* closure = closure_from_data(data, "asyncReady");
    if (!closure)
        return;

    GValueArray<2> params;
    set_object(&params[0], source_object);
    set_object(&params[1], res);

    invoke(closure, nullptr, params.size(), params.data());
    Closure::release(closure);
}

static gboolean shortcut_trampoline(GObject* widget, GVariant* args,
                                    void* data) {
    Closure* closure = closure_from_data(data, "shortcut");
    if (!closure)
        return false;

    GValueArray<2> params;
    set_object(&params[0], widget);
    g_value_init(&params[1], G_TYPE_VARIANT);
    g_value_set_variant(&params[1], args);

    AutoGValue rval{G_TYPE_BOOLEAN};
    invoke(closure, &rval, params.size(), params.data());
    return g_value_get_boolean(&rval);
}

static int compare_trampoline(const void* a, const void* b, void* data) {
    Closure* closure = closure_from_data(data, "compare");
    if (!closure)
        return 0;

    const std::vector<Gdyn::TypeDescPtr>& arg_types =
        closure->type().arg_types();

    GValueArray<2> params;
    for (size_t ix = 0; ix < params.size(); ix++) {
        const TypeDesc* type =
            ix < arg_types.size() ? arg_types[ix].get() : nullptr;
        set_pointer_as(&params[ix], type,
                       const_cast<void*>(ix == 0 ? a : b),
                       TypeDesc::Tag::NULL_TYPE);
    }

    AutoGValue rval{G_TYPE_INT};
    invoke(closure, &rval, params.size(), params.data());
    return g_value_get_int(&rval);
}

static gboolean tick_trampoline(GObject* widget, GObject* frame_clock,
                                void* data) {
    Closure* closure = closure_from_data(data, "tick");
    if (!closure)
        return G_SOURCE_REMOVE;

    GValueArray<2> params;
    set_object(&params[0], widget);
    set_object(&params[1], frame_clock);

    AutoGValue rval{G_TYPE_BOOLEAN};
    invoke(closure, &rval, params.size(), params.data());
    return g_value_get_boolean(&rval);
}

static GListModel* tree_model_create_trampoline(void* item, void* data) {
    Closure* closure = closure_from_data(data, "treeModelCreate");
    if (!closure)
        return nullptr;

    const std::vector<Gdyn::TypeDescPtr>& arg_types =
        closure->type().arg_types();

    AutoGValue param;
    set_pointer_as(&param, arg_types.empty() ? nullptr : arg_types[0].get(),
                   item, TypeDesc::Tag::OBJECT);

    AutoGValue rval{G_TYPE_OBJECT};
    invoke(closure, &rval, 1, &param);

    // The caller owns the returned model
    GObject* model = G_OBJECT(g_value_dup_object(&rval));
    if (model && !G_IS_LIST_MODEL(model)) {
        g_warning("treeModelCreate callback returned a %s, not a GListModel",
                  G_OBJECT_TYPE_NAME(model));
        g_object_unref(model);
        return nullptr;
    }
    return G_LIST_MODEL(model);
}

static void animation_target_trampoline(double value, void* data) {
    Closure* closure = closure_from_data(data, "animationTarget");
    if (!closure)
        return;

    AutoGValue param{G_TYPE_DOUBLE};
    g_value_set_double(&param, value);

    invoke(closure, nullptr, 1, &param);
}

// Returns a newly allocated string, which the caller frees
static char* scale_format_value_trampoline(GObject* scale, double value,
                                           void* data) {
    Closure* closure = closure_from_data(data, "scaleFormatValue");
    if (!closure)
        return nullptr;

    GValueArray<2> params;
    set_object(&params[0], scale);
    g_value_init(&params[1], G_TYPE_DOUBLE);
    g_value_set_double(&params[1], value);

    AutoGValue rval{G_TYPE_STRING};
    invoke(closure, &rval, params.size(), params.data());
    return g_value_dup_string(&rval);
}

/*
 * Paths and points are boxed types of a toolkit this library does not link
 * against, so like compare items they are passed as the argument descriptors
 * say, or as plain pointers.
 */
static gboolean path_intersection_trampoline(void* path1, const void* point1,
                                             void* path2, const void* point2,
                                             int kind, void* data) {
    Closure* closure = closure_from_data(data, "pathIntersection");
    if (!closure)
        return false;

    const std::vector<Gdyn::TypeDescPtr>& arg_types =
        closure->type().arg_types();
    auto arg_type = [&arg_types](size_t ix) -> const TypeDesc* {
        return ix < arg_types.size() ? arg_types[ix].get() : nullptr;
    };

    GValueArray<5> params;
    set_pointer_as(&params[0], arg_type(0), path1, TypeDesc::Tag::NULL_TYPE);
    set_pointer_as(&params[1], arg_type(1), const_cast<void*>(point1),
                   TypeDesc::Tag::NULL_TYPE);
    set_pointer_as(&params[2], arg_type(2), path2, TypeDesc::Tag::NULL_TYPE);
    set_pointer_as(&params[3], arg_type(3), const_cast<void*>(point2),
                   TypeDesc::Tag::NULL_TYPE);
    g_value_init(&params[4], G_TYPE_INT);
    g_value_set_int(&params[4], kind);

    // Keep iterating unless told otherwise
    AutoGValue rval{G_TYPE_BOOLEAN};
    g_value_set_boolean(&rval, true);
    invoke(closure, &rval, params.size(), params.data());
    return g_value_get_boolean(&rval);
}

[[nodiscard]] static void* trampoline_for_kind(TrampolineKind kind) {
    switch (kind) {
        case TrampolineKind::CLOSURE:
            return nullptr;
        case TrampolineKind::DESTROY:
            return reinterpret_cast<void*>(destroy_trampoline);
        case TrampolineKind::SOURCE:
            return reinterpret_cast<void*>(source_trampoline);
        case TrampolineKind::DRAW:
            return reinterpret_cast<void*>(draw_trampoline);
        case TrampolineKind::ASYNC_READY:
            return reinterpret_cast<void*>(async_ready_trampoline);
        case TrampolineKind::SHORTCUT:
            return reinterpret_cast<void*>(shortcut_trampoline);
        case TrampolineKind::COMPARE:
            return reinterpret_cast<void*>(compare_trampoline);
        case TrampolineKind::TICK:
            return reinterpret_cast<void*>(tick_trampoline);
        case TrampolineKind::TREE_MODEL_CREATE:
            return reinterpret_cast<void*>(tree_model_create_trampoline);
        case TrampolineKind::ANIMATION_TARGET:
            return reinterpret_cast<void*>(animation_target_trampoline);
        case TrampolineKind::SCALE_FORMAT_VALUE:
            return reinterpret_cast<void*>(scale_format_value_trampoline);
        case TrampolineKind::PATH_INTERSECTION:
            return reinterpret_cast<void*>(path_intersection_trampoline);
    }
    g_assert_not_reached();
}

bool gdyn_callback_to_native_slots(const Gdyn::Value& value,
                                   const Gdyn::TypeDescPtr& type_ptr,
                                   const char* arg_name,
                                   bool may_be_null, GIArgument* slots,
                                   Closure** closure_out, GError** error) {
    const TypeDesc& type = *type_ptr;
    unsigned n_slots = type.n_native_slots();
    for (unsigned ix = 0; ix < n_slots; ix++)
        gdyn_arg_unset(&slots[ix]);
    *closure_out = nullptr;

    if (value.isNullOrUndefined()) {
        if (may_be_null)
            return true;
        Gdyn::AutoChar display_name{
            gdyn_argument_display_name(arg_name, GDYN_ARGUMENT_ARGUMENT)};
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "%s may not be null", display_name.get());
        return false;
    }

    if (!value.isCallback()) {
        Gdyn::AutoChar display_name{
            gdyn_argument_display_name(arg_name, GDYN_ARGUMENT_ARGUMENT)};
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Expected a callback for %s but got %s",
                    display_name.get(), value.debug_string().c_str());
        return false;
    }

    Closure* closure = Closure::create(value.toCallback(), type_ptr);
    void* fn = trampoline_for_kind(type.trampoline());

    gdyn_debug_marshal(GDYN_DEBUG_GCLOSURE, "Passing %s closure %p",
                       TypeDesc::trampoline_name(type.trampoline()), closure);

    switch (type.trampoline()) {
        case TrampolineKind::CLOSURE:
            // Floating; the callee sinks it if it keeps it
            gdyn_arg_set(&slots[0], static_cast<GClosure*>(closure));
            break;
        case TrampolineKind::DESTROY:
            closure->acquire();
            gdyn_arg_set(&slots[0], closure);
            gdyn_arg_set(&slots[1], fn);
            break;
        case TrampolineKind::ASYNC_READY:
        case TrampolineKind::COMPARE:
        case TrampolineKind::PATH_INTERSECTION:
            closure->acquire();
            gdyn_arg_set(&slots[0], fn);
            gdyn_arg_set(&slots[1], closure);
            break;
        case TrampolineKind::SOURCE:
        case TrampolineKind::DRAW:
        case TrampolineKind::SHORTCUT:
        case TrampolineKind::TICK:
        case TrampolineKind::TREE_MODEL_CREATE:
        case TrampolineKind::ANIMATION_TARGET:
        case TrampolineKind::SCALE_FORMAT_VALUE:
            closure->acquire();
            gdyn_arg_set(&slots[0], fn);
            gdyn_arg_set(&slots[1], closure);
            gdyn_arg_set(&slots[2], Closure::release);
            break;
    }

    *closure_out = closure;
    return true;
}

void gdyn_callback_after_call(const TypeDesc& type, Closure* closure) {
    if (!closure)
        return;

    switch (type.trampoline()) {
        case TrampolineKind::CLOSURE:
            // If the callee didn't keep the closure, this frees it
            Closure::ref(closure);
            g_closure_sink(closure);
            Closure::unref(closure);
            return;
        case TrampolineKind::COMPARE:
        case TrampolineKind::PATH_INTERSECTION:
            Closure::release(closure);
            return;
        default:
            // Released by native code, through the destroy notify or the
            // one-shot trampoline
            return;
    }
}

void gdyn_callback_release_unused(const TypeDesc& type, Closure* closure) {
    if (!closure)
        return;

    if (type.trampoline() == TrampolineKind::CLOSURE)
        gdyn_callback_after_call(type, closure);
    else
        Closure::release(closure);
}
