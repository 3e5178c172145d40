/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GI_VALUE_H_
#define GI_VALUE_H_

#include <config.h>

#include <utility>  // for move, swap
#include <vector>

#include <glib-object.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"

namespace Gdyn {
class TypeDesc;

struct AutoGValue : GValue {
    AutoGValue() : GValue(G_VALUE_INIT) {
        static_assert(sizeof(AutoGValue) == sizeof(GValue));
    }
    explicit AutoGValue(GType gtype) : AutoGValue() {
        g_value_init(this, gtype);
    }
    AutoGValue(AutoGValue const& src) : AutoGValue(G_VALUE_TYPE(&src)) {
        g_value_copy(&src, this);
    }
    AutoGValue& operator=(AutoGValue other) {
        // We need to cast to GValue here not to make swap to recurse here
        std::swap(*static_cast<GValue*>(this), *static_cast<GValue*>(&other));
        return *this;
    }
    AutoGValue(AutoGValue&& src) : AutoGValue() {
        std::swap(*static_cast<GValue*>(this), *static_cast<GValue*>(&src));
    }
    ~AutoGValue() {
        if (G_IS_VALUE(this))
            g_value_unset(this);
    }
};

}  // namespace Gdyn

using AutoGValueVector = std::vector<Gdyn::AutoGValue>;

// Converts the contents of @gvalue into a managed value. The contents are
// borrowed: objects are wrapped with a new reference and boxed values are
// copied. @type, if not null, chooses the managed representation (for example
// an Integer descriptor for an enum GValue); otherwise the GValue's own type
// decides.
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_value_from_g_value(const GValue* gvalue, const Gdyn::TypeDesc* type,
                             Gdyn::Value* value_p, GError** error);

// Stores @value into @gvalue, which must already be initialized to the type
// the native side expects. The GValue holds its own copy or reference.
GDYN_MARSHAL_RETURN_CONVENTION
bool gdyn_value_to_g_value(const Gdyn::Value& value, GValue* gvalue,
                           GError** error);

#endif  // GI_VALUE_H_
