/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#ifndef GI_FUNCTION_H_
#define GI_FUNCTION_H_

#include <config.h>

#include <stddef.h>  // for size_t

#include <memory>  // for unique_ptr
#include <string>
#include <vector>

#include <ffi.h>
#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"
#include "gi/arg.h"

namespace Gdyn {

struct CallState;

/*
 * Function:
 *
 * A native function resolved from a library, with the libffi call interface
 * prepared from the descriptors of its arguments and return value.
 */
class Function {
    std::string m_library;
    std::string m_symbol;
    void* m_address = nullptr;
    std::vector<TypeDescPtr> m_arg_types;
    TypeDescPtr m_return_type;
    std::vector<ffi_type*> m_ffi_types;
    ffi_cif m_cif;

    Function(const char* library, const char* symbol);

    GDYN_MARSHAL_RETURN_CONVENTION
    bool init(const ArgumentVector& args, const TypeDescPtr& return_type,
              GError** error);

    GDYN_MARSHAL_RETURN_CONVENTION
    bool fill_in_arg(CallState* state, unsigned index, GError** error);
    GDYN_MARSHAL_RETURN_CONVENTION
    bool fill_reference_arg(CallState* state, unsigned index, GError** error);
    GDYN_MARSHAL_RETURN_CONVENTION
    bool length_from_arg(CallState* state, int index, size_t* length,
                         GError** error);
    GDYN_MARSHAL_RETURN_CONVENTION
    bool convert_out_value(CallState* state, const TypeDesc& type,
                           GdynArgumentType arg_type, GITransfer transfer,
                           GIArgument* arg, Value* value_p, GError** error);
    GDYN_MARSHAL_RETURN_CONVENTION
    bool write_back_reference(CallState* state, unsigned index,
                              GError** error);
    void release_arg(CallState* state, unsigned index, bool was_called);

 public:
    [[nodiscard]] std::string format_name() const;

    // Resolves @symbol and checks every descriptor
    GDYN_MARSHAL_RETURN_CONVENTION
    static bool create(const char* library, const char* symbol,
                       const ArgumentVector& args,
                       const TypeDescPtr& return_type,
                       std::unique_ptr<Function>* function_out,
                       GError** error);

    // @args must have the descriptors the function was created with
    GDYN_MARSHAL_RETURN_CONVENTION
    bool invoke(const ArgumentVector& args, Value* rval, GError** error);
};

}  // namespace Gdyn

#endif  // GI_FUNCTION_H_
