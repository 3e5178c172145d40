/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stddef.h>  // for size_t

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"
#include "gi/arg.h"

namespace Gdyn {
class TypeDesc;
}

// Managed arrays and maps to and from the native containers: C arrays, GList,
// GSList, GPtrArray, GArray and GHashTable. Elements are converted with
// gdyn_value_to_gi_argument() and gdyn_value_from_gi_argument() using the
// element descriptor.

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_array_to_gi_argument(const Gdyn::Value& value,
                               const Gdyn::TypeDesc& type, const char* arg_name,
                               GdynArgumentType arg_type, bool may_be_null,
                               GIArgument* arg, GError** error);

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_hash_to_gi_argument(const Gdyn::Value& value,
                              const Gdyn::TypeDesc& type, const char* arg_name,
                              GdynArgumentType arg_type, bool may_be_null,
                              GIArgument* arg, GError** error);

// Fails for sized arrays, whose length is not part of the container
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_array_from_gi_argument(const Gdyn::TypeDesc& type,
                                 GITransfer transfer, GIArgument* arg,
                                 Gdyn::Value* value_p, GError** error);

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_array_from_explicit_array(const Gdyn::TypeDesc& type,
                                    GITransfer transfer, GIArgument* arg,
                                    size_t length, Gdyn::Value* value_p,
                                    GError** error);

GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_hash_from_gi_argument(const Gdyn::TypeDesc& type,
                                GITransfer transfer, GIArgument* arg,
                                Gdyn::Value* value_p, GError** error);

void gdyn_gi_argument_release_in_array(const Gdyn::TypeDesc& type,
                                       size_t length, GIArgument* arg);
void gdyn_gi_argument_release_in_hash(const Gdyn::TypeDesc& type,
                                      GIArgument* arg);

void gdyn_gi_argument_release_array(const Gdyn::TypeDesc& type,
                                    GITransfer transfer, size_t length,
                                    GIArgument* arg);
void gdyn_gi_argument_release_hash(const Gdyn::TypeDesc& type,
                                   GITransfer transfer, GIArgument* arg);
