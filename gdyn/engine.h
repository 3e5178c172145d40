/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GDYN_ENGINE_H_
#define GDYN_ENGINE_H_

#if !defined(INSIDE_GDYN_H) && !defined(GDYN_COMPILATION)
#    error "Only <gdyn/gdyn.h> can be included directly."
#endif

#include <stddef.h>  // for size_t

#include <string>
#include <vector>

#include <gio/gio.h>
#include <glib.h>

#include <gdyn/macros.h>
#include <gdyn/value.h>

namespace Gdyn {

// One element of gdyn_batch_call(); the function returns void
struct Call {
    std::string library;
    std::string symbol;
    ArgumentVector args;
};

}  // namespace Gdyn

/* Lifecycle. Everything below except gdyn_create_ref() aborts when used
 * before gdyn_start() or after gdyn_stop(). */

GDYN_EXPORT GDYN_USE GApplication* gdyn_start(const char* application_id,
                                              GApplicationFlags flags,
                                              GError** error);
GDYN_EXPORT void gdyn_stop(void);
GDYN_EXPORT GDYN_USE bool gdyn_is_started(void);
GDYN_EXPORT void gdyn_poll(void);

/* Foreign calls */

GDYN_EXPORT GDYN_USE bool gdyn_call(const char* library, const char* symbol,
                                    const Gdyn::ArgumentVector& args,
                                    const Gdyn::TypeDescPtr& return_type,
                                    Gdyn::Value* rval, GError** error);
GDYN_EXPORT GDYN_USE bool gdyn_batch_call(const std::vector<Gdyn::Call>& calls,
                                          GError** error);

/* Memory */

GDYN_EXPORT GDYN_USE bool gdyn_read(const Gdyn::Value& handle,
                                    const Gdyn::TypeDescPtr& type,
                                    size_t offset, Gdyn::Value* value_p,
                                    GError** error);
GDYN_EXPORT GDYN_USE bool gdyn_write(const Gdyn::Value& handle,
                                     const Gdyn::TypeDescPtr& type,
                                     size_t offset, const Gdyn::Value& value,
                                     GError** error);
GDYN_EXPORT GDYN_USE bool gdyn_alloc(size_t size, const char* type_name,
                                     const char* library, Gdyn::Value* value_p,
                                     GError** error);
GDYN_EXPORT GDYN_USE bool gdyn_read_pointer(const Gdyn::Value& handle,
                                            size_t ptr_offset,
                                            size_t element_offset,
                                            Gdyn::Value* value_p,
                                            GError** error);
GDYN_EXPORT GDYN_USE bool gdyn_write_pointer(const Gdyn::Value& dest,
                                             size_t ptr_offset,
                                             size_t element_offset,
                                             const Gdyn::Value& source,
                                             size_t size, GError** error);
GDYN_EXPORT GDYN_USE bool gdyn_get_native_id(const Gdyn::Value& handle,
                                             Gdyn::Value* value_p,
                                             GError** error);

/* Out-parameters. With @inner_type null the type is fixed by the first call
 * that uses the cell. */
GDYN_EXPORT GDYN_USE Gdyn::Value gdyn_create_ref(
    Gdyn::Value initial, Gdyn::TypeDescPtr inner_type = nullptr);

#endif /* GDYN_ENGINE_H_ */
