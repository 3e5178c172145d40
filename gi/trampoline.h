/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GI_TRAMPOLINE_H_
#define GI_TRAMPOLINE_H_

#include <config.h>

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"

namespace Gdyn {
class Closure;
class TypeDesc;
}  // namespace Gdyn

/*
 * Callback arguments expand to several native slots, in the order the native
 * API takes them:
 *
 *   closure                 GClosure*, ownership taken by the callee
 *   destroy                 data, fn                  (fn runs once)
 *   asyncReady, compare,
 *   pathIntersection        fn, data
 *   source, draw, shortcut,
 *   tick, treeModelCreate,
 *   animationTarget,
 *   scaleFormatValue        fn, data, destroy_notify
 *
 * @slots must have room for type->n_native_slots() arguments. A null value
 * fills every slot with NULL. On success *@closure_out is the closure created
 * for the call, to be passed to gdyn_callback_after_call() once the native
 * function returns.
 */
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_callback_to_native_slots(const Gdyn::Value& value,
                                   const Gdyn::TypeDescPtr& type,
                                   const char* arg_name, bool may_be_null,
                                   GIArgument* slots,
                                   Gdyn::Closure** closure_out, GError** error);

// Drops the references that only had to last for the duration of the call
void gdyn_callback_after_call(const Gdyn::TypeDesc& type,
                              Gdyn::Closure* closure);

// Frees a closure whose native call never happened
void gdyn_callback_release_unused(const Gdyn::TypeDesc& type,
                                  Gdyn::Closure* closure);

#endif  // GI_TRAMPOLINE_H_
