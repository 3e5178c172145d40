/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>

#include <memory>
#include <string>
#include <utility>  // for move
#include <vector>

#include <ffi.h>
#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/error-types.h"
#include "gdyn/value.h"
#include "gi/arg-inl.h"
#include "gi/arg.h"
#include "gi/closure.h"
#include "gi/collection.h"
#include "gi/function.h"
#include "gi/library.h"
#include "gi/trampoline.h"
#include "gi/type-desc.h"
#include "util/log.h"

namespace Gdyn {

// Per-argument bookkeeping for one invocation
struct ArgumentState {
    unsigned first_slot = 0;
    // A native value was built for the argument and must be released
    bool converted = false;
    // Element count of an array argument, for releasing sized arrays
    size_t length = 0;
    Closure* closure = nullptr;

    // Reference arguments: the scratch slot passed by address, and what it
    // held before the call
    bool uses_scratch = false;
    bool written_back = false;
    GIArgument scratch = {};
    GIArgument scratch_initial = {};
};

struct CallState {
    explicit CallState(const ArgumentVector& call_args) : args(call_args) {}

    const ArgumentVector& args;
    std::vector<GIArgument> in_args;  // one per native slot
    std::vector<ArgumentState> arg_states;
};

// libffi widens integer return values to a full register
union ReturnValue {
    ffi_arg v_ffi_arg;
    ffi_sarg v_ffi_sarg;
    GIArgument arg;
};

static void extract_ffi_return_value(const TypeDesc& type,
                                     ReturnValue* return_value,
                                     GIArgument* arg) {
    gdyn_arg_unset(arg);

    switch (type.tag()) {
        case TypeDesc::Tag::VOID:
            return;

        case TypeDesc::Tag::INTEGER:
            switch (type.bits()) {
                case 8:
                    if (type.is_signed())
                        gdyn_arg_set<int8_t>(arg, return_value->v_ffi_sarg);
                    else
                        gdyn_arg_set<uint8_t>(arg, return_value->v_ffi_arg);
                    return;
                case 16:
                    if (type.is_signed())
                        gdyn_arg_set<int16_t>(arg, return_value->v_ffi_sarg);
                    else
                        gdyn_arg_set<uint16_t>(arg, return_value->v_ffi_arg);
                    return;
                case 32:
                    if (type.is_signed())
                        gdyn_arg_set<int32_t>(arg, return_value->v_ffi_sarg);
                    else
                        gdyn_arg_set<uint32_t>(arg, return_value->v_ffi_arg);
                    return;
                default:
                    *arg = return_value->arg;
                    return;
            }

        case TypeDesc::Tag::BOOLEAN:
            gdyn_arg_set<Gdyn::Tag::GBoolean>(arg, return_value->v_ffi_sarg);
            return;

        case TypeDesc::Tag::FLOAT:
            if (type.bits() == 32)
                gdyn_arg_set<float>(arg, return_value->arg.v_float);
            else
                gdyn_arg_set<double>(arg, return_value->arg.v_double);
            return;

        default:
            gdyn_arg_set(arg, return_value->arg.v_pointer);
            return;
    }
}

// References to these types can receive a caller-allocated instance
[[nodiscard]] static bool accepts_caller_allocated(const TypeDesc& type) {
    return type.tag() == TypeDesc::Tag::OBJECT ||
           type.tag() == TypeDesc::Tag::BOXED ||
           type.tag() == TypeDesc::Tag::STRUCT;
}

[[nodiscard]] static size_t array_length_of(const TypeDesc& type,
                                            const Value& value) {
    if (type.tag() == TypeDesc::Tag::ARRAY && value.isArray())
        return value.toArray().size();
    return 0;
}

// Frees an in-argument that never reached the callee, including what would
// have been transferred to it
static void release_unpassed(const TypeDesc& type, size_t length,
                             GIArgument* arg) {
    if (type.is_owned())
        gdyn_gi_argument_release(type, type.transfer(), length, arg);
    else
        gdyn_gi_argument_release_in_arg(type, length, arg);
}

Function::Function(const char* library, const char* symbol)
    : m_library(library ? library : ""), m_symbol(symbol) {}

std::string Function::format_name() const {
    if (m_library.empty())
        return m_symbol;
    return m_symbol + " (" + m_library + ")";
}

bool Function::create(const char* library, const char* symbol,
                      const ArgumentVector& args,
                      const TypeDescPtr& return_type,
                      std::unique_ptr<Function>* function_out,
                      GError** error) {
    std::unique_ptr<Function> function{new Function(library, symbol)};
    if (!function->init(args, return_type, error))
        return false;

    *function_out = std::move(function);
    return true;
}

bool Function::init(const ArgumentVector& args, const TypeDescPtr& return_type,
                    GError** error) {
    for (unsigned ix = 0; ix < args.size(); ix++) {
        const TypeDescPtr& type = args[ix].type;
        if (!type) {
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                        "Argument %u of %s has no type", ix,
                        format_name().c_str());
            return false;
        }
        if (!type->validate(error))
            return false;
        if (type->tag() == TypeDesc::Tag::VOID) {
            g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                        "Argument %u of %s cannot be void", ix,
                        format_name().c_str());
            return false;
        }

        m_arg_types.push_back(type);
        if (type->tag() == TypeDesc::Tag::CALLBACK) {
            for (unsigned slot = 0; slot < type->n_native_slots(); slot++)
                m_ffi_types.push_back(&ffi_type_pointer);
        } else {
            m_ffi_types.push_back(type->ffi_slot_type());
        }
    }

    m_return_type = return_type ? return_type : TypeDesc::void_type();
    if (!m_return_type->validate(error))
        return false;
    if (m_return_type->tag() == TypeDesc::Tag::REFERENCE ||
        m_return_type->tag() == TypeDesc::Tag::CALLBACK) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "%s cannot return %s", format_name().c_str(),
                    m_return_type->to_string().c_str());
        return false;
    }

    if (!gdyn_library_lookup_symbol(m_library.c_str(), m_symbol.c_str(),
                                    &m_address, error))
        return false;

    ffi_status status =
        ffi_prep_cif(&m_cif, FFI_DEFAULT_ABI, m_ffi_types.size(),
                     m_return_type->ffi_slot_type(), m_ffi_types.data());
    if (status != FFI_OK) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_FAILED,
                    "Cannot prepare the call interface of %s (status %d)",
                    format_name().c_str(), status);
        return false;
    }

    gdyn_debug(GDYN_DEBUG_GFUNCTION, "Prepared %s with %zu native slots",
               format_name().c_str(), m_ffi_types.size());
    return true;
}

bool Function::fill_reference_arg(CallState* state, unsigned index,
                                  GError** error) {
    const Argument& arg = state->args[index];
    ArgumentState& arg_state = state->arg_states[index];
    GIArgument* slot = &state->in_args[arg_state.first_slot];
    const TypeDescPtr& inner_ptr = m_arg_types[index]->inner_type();
    const TypeDesc& inner = *inner_ptr;

    // Nobody wants this output
    if (arg.value.isNullOrUndefined()) {
        gdyn_arg_set(slot, nullptr);
        return true;
    }

    AutoChar arg_name{g_strdup_printf("%u", index)};

    if (!arg.value.isRef()) {
        AutoChar display_name{
            gdyn_argument_display_name(arg_name, GDYN_ARGUMENT_ARGUMENT)};
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "%s must be a reference cell, got %s", display_name.get(),
                    arg.value.debug_string().c_str());
        return false;
    }

    const std::shared_ptr<RefCell>& cell = arg.value.toRef();
    if (!cell->bind_type(inner_ptr, error))
        return false;

    const Value& current = cell->value();
    if (accepts_caller_allocated(inner) && current.isObject()) {
        gdyn_arg_set(slot, current.native_pointer());
        return true;
    }

    gdyn_arg_unset(&arg_state.scratch);
    if (!current.isNullOrUndefined()) {
        if (!gdyn_value_to_gi_argument(current, inner, arg_name,
                                       GDYN_ARGUMENT_ARGUMENT, true,
                                       &arg_state.scratch, error))
            return false;
        arg_state.length = array_length_of(inner, current);
    }

    arg_state.scratch_initial = arg_state.scratch;
    arg_state.uses_scratch = true;
    gdyn_arg_set(slot, &arg_state.scratch);
    return true;
}

bool Function::fill_in_arg(CallState* state, unsigned index, GError** error) {
    const Argument& arg = state->args[index];
    const TypeDescPtr& type = m_arg_types[index];
    ArgumentState& arg_state = state->arg_states[index];
    GIArgument* slot = &state->in_args[arg_state.first_slot];

    gdyn_debug_marshal(GDYN_DEBUG_GFUNCTION,
                       "Marshalling argument %u in, %s, native slot %u", index,
                       type->to_string().c_str(), arg_state.first_slot);

    AutoChar arg_name{g_strdup_printf("%u", index)};

    switch (type->tag()) {
        case TypeDesc::Tag::CALLBACK:
            return gdyn_callback_to_native_slots(arg.value, type, arg_name,
                                                 arg.optional, slot,
                                                 &arg_state.closure, error);

        case TypeDesc::Tag::REFERENCE:
            return fill_reference_arg(state, index, error);

        default:
            if (!gdyn_value_to_gi_argument(arg.value, *type, arg_name,
                                           GDYN_ARGUMENT_ARGUMENT, arg.optional,
                                           slot, error))
                return false;
            arg_state.converted = true;
            arg_state.length = array_length_of(*type, arg.value);
            return true;
    }
}

bool Function::length_from_arg(CallState* state, int index, size_t* length,
                               GError** error) {
    if (index < 0 || static_cast<size_t>(index) >= m_arg_types.size()) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "Array length argument %d of %s does not exist", index,
                    format_name().c_str());
        return false;
    }

    const TypeDesc& type = *m_arg_types[index];
    ArgumentState& arg_state = state->arg_states[index];
    const TypeDesc* int_type = nullptr;
    GIArgument* arg = nullptr;

    if (type.tag() == TypeDesc::Tag::INTEGER) {
        int_type = &type;
        arg = &state->in_args[arg_state.first_slot];
    } else if (type.tag() == TypeDesc::Tag::REFERENCE &&
               type.inner_type()->tag() == TypeDesc::Tag::INTEGER &&
               arg_state.uses_scratch) {
        int_type = type.inner_type().get();
        arg = &arg_state.scratch;
    }

    if (!int_type) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "Argument %d of %s is %s, not an array length", index,
                    format_name().c_str(), type.to_string().c_str());
        return false;
    }

    Value length_value;
    uint64_t n;
    if (!gdyn_value_from_gi_argument(*int_type, GDYN_ARGUMENT_ARGUMENT,
                                     GI_TRANSFER_NOTHING, arg, &length_value,
                                     error))
        return false;
    if (!length_value.toUint64(&n)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Invalid array length %s in argument %d of %s",
                    length_value.debug_string().c_str(), index,
                    format_name().c_str());
        return false;
    }

    *length = n;
    return true;
}

bool Function::convert_out_value(CallState* state, const TypeDesc& type,
                                 GdynArgumentType arg_type,
                                 GITransfer transfer, GIArgument* arg,
                                 Value* value_p, GError** error) {
    if (type.tag() == TypeDesc::Tag::ARRAY &&
        type.container() == ContainerKind::SIZED_ARRAY &&
        gdyn_arg_get<void*>(arg)) {
        size_t length;
        if (!length_from_arg(state, type.length_param_index(), &length,
                             error)) {
            gdyn_gi_argument_release(type, transfer, 0, arg);
            return false;
        }
        return gdyn_array_from_explicit_array(type, transfer, arg, length,
                                              value_p, error);
    }

    return gdyn_value_from_gi_argument(type, arg_type, transfer, arg, value_p,
                                       error);
}

/*
 * Function::write_back_reference:
 *
 * Copies the final contents of a reference argument's scratch slot into its
 * cell, and frees what the engine put in the slot before the call. A pointer
 * left unchanged by the callee is still ours; a new one was given to us
 * according to the inner type's transfer.
 */
bool Function::write_back_reference(CallState* state, unsigned index,
                                    GError** error) {
    ArgumentState& arg_state = state->arg_states[index];
    if (!arg_state.uses_scratch || arg_state.written_back)
        return true;
    arg_state.written_back = true;

    const TypeDesc& inner = *m_arg_types[index]->inner_type();
    GIArgument* final_arg = &arg_state.scratch;
    bool unchanged = !inner.is_pointer() ||
                     gdyn_arg_get<void*>(final_arg) ==
                         gdyn_arg_get<void*>(&arg_state.scratch_initial);

    gdyn_debug_marshal(GDYN_DEBUG_GFUNCTION,
                       "Marshalling reference argument %u out, %s%s", index,
                       inner.to_string().c_str(),
                       unchanged ? " (unchanged)" : "");

    Value out_value;
    bool ok;
    if (unchanged) {
        ok = convert_out_value(state, inner, GDYN_ARGUMENT_ARGUMENT,
                               GI_TRANSFER_NOTHING, final_arg, &out_value,
                               error);
        if (inner.is_pointer())
            release_unpassed(inner, arg_state.length,
                             &arg_state.scratch_initial);
    } else {
        ok = convert_out_value(state, inner, GDYN_ARGUMENT_ARGUMENT,
                               inner.transfer(), final_arg, &out_value, error);
        if (!inner.is_owned())
            gdyn_gi_argument_release_in_arg(inner, arg_state.length,
                                            &arg_state.scratch_initial);
    }

    if (!ok)
        return false;

    state->args[index].value.toRef()->set_value(std::move(out_value));
    return true;
}

void Function::release_arg(CallState* state, unsigned index, bool was_called) {
    const TypeDesc& type = *m_arg_types[index];
    ArgumentState& arg_state = state->arg_states[index];
    GIArgument* slot = &state->in_args[arg_state.first_slot];

    switch (type.tag()) {
        case TypeDesc::Tag::CALLBACK:
            if (was_called)
                gdyn_callback_after_call(type, arg_state.closure);
            else
                gdyn_callback_release_unused(type, arg_state.closure);
            arg_state.closure = nullptr;
            return;

        case TypeDesc::Tag::REFERENCE:
            if (arg_state.uses_scratch && !arg_state.written_back) {
                release_unpassed(*type.inner_type(), arg_state.length,
                                 &arg_state.scratch);
                arg_state.written_back = true;
            }
            return;

        default:
            if (!arg_state.converted)
                return;
            arg_state.converted = false;
            if (was_called)
                gdyn_gi_argument_release_in_arg(type, arg_state.length, slot);
            else
                release_unpassed(type, arg_state.length, slot);
            return;
    }
}

bool Function::invoke(const ArgumentVector& args, Value* rval,
                      GError** error) {
    g_assert(args.size() == m_arg_types.size() &&
             "Arguments do not match the prepared function");

    CallState state{args};
    state.in_args.resize(m_ffi_types.size());
    state.arg_states.resize(args.size());

    unsigned slot = 0;
    for (unsigned ix = 0; ix < args.size(); ix++) {
        state.arg_states[ix].first_slot = slot;
        slot += m_arg_types[ix]->n_native_slots();
    }

    std::vector<void*> ffi_arg_pointers(m_ffi_types.size());
    for (size_t ix = 0; ix < ffi_arg_pointers.size(); ix++)
        ffi_arg_pointers[ix] = &state.in_args[ix];

    unsigned processed = 0;
    for (; processed < args.size(); processed++) {
        if (!fill_in_arg(&state, processed, error))
            break;
    }

    // Did argument conversion fail? In that case, skip invocation and release
    // what was converted so far, including what would have been transferred.
    if (processed < args.size()) {
        for (unsigned ix = 0; ix < processed; ix++)
            release_arg(&state, ix, false);
        return false;
    }

    gdyn_debug_marshal(GDYN_DEBUG_GFUNCTION, "Calling %s",
                       format_name().c_str());

    ReturnValue return_value;
    void* return_value_p =
        m_return_type->tag() == TypeDesc::Tag::VOID ? nullptr : &return_value;
    ffi_call(&m_cif, FFI_FN(m_address), return_value_p,
             ffi_arg_pointers.data());

    GIArgument return_arg;
    extract_ffi_return_value(*m_return_type, &return_value, &return_arg);

    // Write back every reference even after a failure, so the scratch slots
    // are released; report the first error.
    bool ok = true;
    for (unsigned ix = 0; ix < args.size(); ix++) {
        AutoError out_error;
        if (!write_back_reference(&state, ix, &out_error) && ok) {
            ok = false;
            g_propagate_error(error, out_error.release());
        }
    }

    Value retval;
    if (ok) {
        ok = convert_out_value(&state, *m_return_type,
                               GDYN_ARGUMENT_RETURN_VALUE,
                               m_return_type->transfer(), &return_arg, &retval,
                               error);
    } else {
        gdyn_gi_argument_release(*m_return_type, m_return_type->transfer(), 0,
                                 &return_arg);
    }

    for (unsigned ix = 0; ix < args.size(); ix++)
        release_arg(&state, ix, true);

    if (!ok)
        return false;

    *rval = std::move(retval);
    return true;
}

}  // namespace Gdyn
