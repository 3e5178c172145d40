/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stddef.h>

#include <memory>
#include <string>
#include <utility>  // for move
#include <vector>

#include <ffi.h>
#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/error-types.h"
#include "gi/type-desc.h"

namespace Gdyn {

TypeDescPtr TypeDesc::integer(unsigned bits, bool is_signed) {
    auto desc = std::make_shared<TypeDesc>(Tag::INTEGER);
    desc->m_bits = bits;
    desc->m_signed = is_signed;
    return desc;
}

TypeDescPtr TypeDesc::floating(unsigned bits) {
    auto desc = std::make_shared<TypeDesc>(Tag::FLOAT);
    desc->m_bits = bits;
    desc->m_signed = true;
    return desc;
}

TypeDescPtr TypeDesc::boolean() {
    return std::make_shared<TypeDesc>(Tag::BOOLEAN);
}

TypeDescPtr TypeDesc::string(GITransfer transfer) {
    auto desc = std::make_shared<TypeDesc>(Tag::STRING);
    desc->m_transfer = transfer;
    return desc;
}

TypeDescPtr TypeDesc::object(GITransfer transfer) {
    auto desc = std::make_shared<TypeDesc>(Tag::OBJECT);
    desc->m_transfer = transfer;
    return desc;
}

TypeDescPtr TypeDesc::boxed(GITransfer transfer, const std::string& type_name,
                            const std::string& library,
                            const std::string& get_type_function) {
    auto desc = std::make_shared<TypeDesc>(Tag::BOXED);
    desc->m_transfer = transfer;
    desc->m_type_name = type_name;
    desc->m_library = library;
    desc->m_get_type_function = get_type_function;
    return desc;
}

TypeDescPtr TypeDesc::structure(GITransfer transfer,
                                const std::string& type_name, size_t size) {
    auto desc = std::make_shared<TypeDesc>(Tag::STRUCT);
    desc->m_transfer = transfer;
    desc->m_type_name = type_name;
    desc->m_struct_size = size;
    return desc;
}

TypeDescPtr TypeDesc::fundamental(GITransfer transfer,
                                  const std::string& library,
                                  const std::string& ref_function,
                                  const std::string& unref_function) {
    auto desc = std::make_shared<TypeDesc>(Tag::FUNDAMENTAL);
    desc->m_transfer = transfer;
    desc->m_library = library;
    desc->m_ref_function = ref_function;
    desc->m_unref_function = unref_function;
    return desc;
}

TypeDescPtr TypeDesc::variant(GITransfer transfer) {
    auto desc = std::make_shared<TypeDesc>(Tag::VARIANT);
    desc->m_transfer = transfer;
    return desc;
}

TypeDescPtr TypeDesc::array(TypeDescPtr item, ContainerKind container,
                            GITransfer transfer, const ArrayOptions& options) {
    auto desc = std::make_shared<TypeDesc>(Tag::ARRAY);
    desc->m_item = std::move(item);
    desc->m_container = container;
    desc->m_transfer = transfer;
    desc->m_array = options;
    return desc;
}

TypeDescPtr TypeDesc::hash_table(TypeDescPtr key, TypeDescPtr value,
                                 GITransfer transfer) {
    auto desc = std::make_shared<TypeDesc>(Tag::HASH_TABLE);
    desc->m_item = std::move(key);
    desc->m_value = std::move(value);
    desc->m_transfer = transfer;
    return desc;
}

TypeDescPtr TypeDesc::reference(TypeDescPtr inner) {
    auto desc = std::make_shared<TypeDesc>(Tag::REFERENCE);
    desc->m_item = std::move(inner);
    return desc;
}

TypeDescPtr TypeDesc::callback(TrampolineKind kind,
                               std::vector<TypeDescPtr> arg_types,
                               TypeDescPtr return_type,
                               TypeDescPtr source_type,
                               TypeDescPtr result_type) {
    auto desc = std::make_shared<TypeDesc>(Tag::CALLBACK);
    desc->m_trampoline = kind;
    desc->m_arg_types = std::move(arg_types);
    desc->m_return_type = std::move(return_type);
    desc->m_source_type = std::move(source_type);
    desc->m_result_type = std::move(result_type);
    return desc;
}

TypeDescPtr TypeDesc::null() {
    return std::make_shared<TypeDesc>(Tag::NULL_TYPE);
}

TypeDescPtr TypeDesc::void_type() {
    return std::make_shared<TypeDesc>(Tag::VOID);
}

size_t TypeDesc::element_size() const {
    if (m_array.element_size != 0)
        return m_array.element_size;
    return m_item ? m_item->native_size() : 0;
}

bool TypeDesc::is_pointer() const {
    switch (m_tag) {
        case Tag::INTEGER:
        case Tag::FLOAT:
        case Tag::BOOLEAN:
        case Tag::VOID:
        case Tag::CALLBACK:
            return false;
        case Tag::STRING:
        case Tag::OBJECT:
        case Tag::BOXED:
        case Tag::STRUCT:
        case Tag::FUNDAMENTAL:
        case Tag::VARIANT:
        case Tag::ARRAY:
        case Tag::HASH_TABLE:
        case Tag::REFERENCE:
        case Tag::NULL_TYPE:
            return true;
    }
    g_return_val_if_reached(false);
}

bool TypeDesc::is_handle() const {
    return m_tag == Tag::OBJECT || m_tag == Tag::BOXED ||
           m_tag == Tag::STRUCT || m_tag == Tag::FUNDAMENTAL ||
           m_tag == Tag::VARIANT;
}

size_t TypeDesc::native_size() const {
    switch (m_tag) {
        case Tag::INTEGER:
        case Tag::FLOAT:
            return m_bits / 8;
        case Tag::BOOLEAN:
            return sizeof(gboolean);
        case Tag::VOID:
            return 0;
        default:
            return sizeof(void*);
    }
}

ffi_type* TypeDesc::ffi_slot_type() const {
    switch (m_tag) {
        case Tag::INTEGER:
            switch (m_bits) {
                case 8:
                    return m_signed ? &ffi_type_sint8 : &ffi_type_uint8;
                case 16:
                    return m_signed ? &ffi_type_sint16 : &ffi_type_uint16;
                case 32:
                    return m_signed ? &ffi_type_sint32 : &ffi_type_uint32;
                case 64:
                    return m_signed ? &ffi_type_sint64 : &ffi_type_uint64;
                default:
                    g_return_val_if_reached(&ffi_type_void);
            }
        case Tag::FLOAT:
            return m_bits == 32 ? &ffi_type_float : &ffi_type_double;
        case Tag::BOOLEAN:
            return &ffi_type_sint32;
        case Tag::VOID:
            return &ffi_type_void;
        default:
            return &ffi_type_pointer;
    }
}

unsigned TypeDesc::n_native_slots() const {
    if (m_tag == Tag::VOID)
        return 0;
    if (m_tag != Tag::CALLBACK)
        return 1;

    switch (m_trampoline) {
        case TrampolineKind::CLOSURE:
            return 1;
        case TrampolineKind::DESTROY:
        case TrampolineKind::ASYNC_READY:
        case TrampolineKind::COMPARE:
        case TrampolineKind::PATH_INTERSECTION:
            return 2;
        case TrampolineKind::SOURCE:
        case TrampolineKind::DRAW:
        case TrampolineKind::SHORTCUT:
        case TrampolineKind::TICK:
        case TrampolineKind::TREE_MODEL_CREATE:
        case TrampolineKind::ANIMATION_TARGET:
        case TrampolineKind::SCALE_FORMAT_VALUE:
            return 3;
    }
    g_return_val_if_reached(1);
}

// Types that can sit in a container, a reference cell or a callback argument
static bool is_value_type(const TypeDesc& desc) {
    switch (desc.tag()) {
        case TypeDesc::Tag::VOID:
        case TypeDesc::Tag::NULL_TYPE:
        case TypeDesc::Tag::CALLBACK:
        case TypeDesc::Tag::REFERENCE:
            return false;
        default:
            return true;
    }
}

static bool validate_component(const TypeDescPtr& component, const char* role,
                               const TypeDesc& parent, GError** error) {
    if (!component) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "%s is missing its %s type", parent.to_string().c_str(),
                    role);
        return false;
    }
    if (!is_value_type(*component)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "%s cannot have %s as its %s type",
                    parent.to_string().c_str(),
                    TypeDesc::tag_name(component->tag()), role);
        return false;
    }
    return component->validate(error);
}

bool TypeDesc::validate(GError** error) const {
    if (m_transfer == GI_TRANSFER_CONTAINER && m_tag != Tag::ARRAY &&
        m_tag != Tag::HASH_TABLE) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "Container transfer is only valid for containers, not %s",
                    tag_name(m_tag));
        return false;
    }

    switch (m_tag) {
        case Tag::INTEGER:
            if (m_bits != 8 && m_bits != 16 && m_bits != 32 && m_bits != 64) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                            "Invalid integer size %u", m_bits);
                return false;
            }
            return true;

        case Tag::FLOAT:
            if (m_bits != 32 && m_bits != 64) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                            "Invalid float size %u", m_bits);
                return false;
            }
            return true;

        case Tag::BOXED:
            if (m_type_name.empty() && m_get_type_function.empty()) {
                g_set_error_literal(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                                    "Boxed type needs a type name");
                return false;
            }
            return true;

        case Tag::FUNDAMENTAL:
            if (m_ref_function.empty() || m_unref_function.empty()) {
                g_set_error_literal(
                    error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                    "Fundamental type needs ref and unref functions");
                return false;
            }
            return true;

        case Tag::ARRAY:
            if (!validate_component(m_item, "item", *this, error))
                return false;
            if (m_container == ContainerKind::SIZED_ARRAY &&
                m_array.length_param_index < 0) {
                g_set_error_literal(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                                    "Sized array needs a length parameter");
                return false;
            }
            if (m_container == ContainerKind::FIXED_ARRAY &&
                m_array.fixed_size == 0) {
                g_set_error_literal(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                                    "Fixed array needs a size");
                return false;
            }
            if (m_container != ContainerKind::SIZED_ARRAY &&
                m_array.length_param_index >= 0) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                            "%s cannot have a length parameter",
                            container_name(m_container));
                return false;
            }
            if (m_container != ContainerKind::FIXED_ARRAY &&
                m_array.fixed_size != 0) {
                g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                            "%s cannot have a fixed size",
                            container_name(m_container));
                return false;
            }
            if (m_array.element_size != 0) {
                if (m_container != ContainerKind::BYTE_ARRAY) {
                    g_set_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                                "%s cannot have an element size",
                                container_name(m_container));
                    return false;
                }
                // GArray stride must hold a whole item
                if (m_array.element_size < m_item->native_size()) {
                    g_set_error(
                        error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE,
                        "Element size %zu is smaller than the %zu-byte %s item",
                        m_array.element_size, m_item->native_size(),
                        tag_name(m_item->tag()));
                    return false;
                }
            }
            return true;

        case Tag::HASH_TABLE:
            return validate_component(m_item, "key", *this, error) &&
                   validate_component(m_value, "value", *this, error);

        case Tag::REFERENCE:
            return validate_component(m_item, "inner", *this, error);

        case Tag::CALLBACK:
            for (const TypeDescPtr& arg : m_arg_types) {
                if (!validate_component(arg, "argument", *this, error))
                    return false;
            }
            if (m_return_type && m_return_type->tag() != Tag::VOID &&
                !validate_component(m_return_type, "return", *this, error))
                return false;
            if (m_source_type &&
                !validate_component(m_source_type, "source", *this, error))
                return false;
            if (m_result_type &&
                !validate_component(m_result_type, "result", *this, error))
                return false;
            return true;

        case Tag::BOOLEAN:
        case Tag::STRING:
        case Tag::OBJECT:
        case Tag::STRUCT:
        case Tag::VARIANT:
        case Tag::NULL_TYPE:
        case Tag::VOID:
            return true;
    }
    g_return_val_if_reached(false);
}

static bool equal_components(const TypeDescPtr& a, const TypeDescPtr& b) {
    if (!a || !b)
        return !a && !b;
    return a->equals(*b);
}

bool TypeDesc::equals(const TypeDesc& other) const {
    if (m_tag != other.m_tag || m_transfer != other.m_transfer)
        return false;

    switch (m_tag) {
        case Tag::INTEGER:
        case Tag::FLOAT:
            return m_bits == other.m_bits && m_signed == other.m_signed;
        case Tag::BOXED:
            return m_type_name == other.m_type_name &&
                   m_library == other.m_library &&
                   m_get_type_function == other.m_get_type_function;
        case Tag::STRUCT:
            return m_type_name == other.m_type_name &&
                   m_struct_size == other.m_struct_size;
        case Tag::FUNDAMENTAL:
            return m_library == other.m_library &&
                   m_ref_function == other.m_ref_function &&
                   m_unref_function == other.m_unref_function;
        case Tag::ARRAY:
            return m_container == other.m_container &&
                   m_array.length_param_index ==
                       other.m_array.length_param_index &&
                   m_array.fixed_size == other.m_array.fixed_size &&
                   m_array.element_size == other.m_array.element_size &&
                   equal_components(m_item, other.m_item);
        case Tag::HASH_TABLE:
            return equal_components(m_item, other.m_item) &&
                   equal_components(m_value, other.m_value);
        case Tag::REFERENCE:
            return equal_components(m_item, other.m_item);
        case Tag::CALLBACK:
            if (m_trampoline != other.m_trampoline ||
                m_arg_types.size() != other.m_arg_types.size())
                return false;
            for (size_t ix = 0; ix < m_arg_types.size(); ix++) {
                if (!equal_components(m_arg_types[ix], other.m_arg_types[ix]))
                    return false;
            }
            return equal_components(m_return_type, other.m_return_type) &&
                   equal_components(m_source_type, other.m_source_type) &&
                   equal_components(m_result_type, other.m_result_type);
        case Tag::BOOLEAN:
        case Tag::STRING:
        case Tag::OBJECT:
        case Tag::VARIANT:
        case Tag::NULL_TYPE:
        case Tag::VOID:
            return true;
    }
    g_return_val_if_reached(false);
}

const char* TypeDesc::tag_name(Tag tag) {
    switch (tag) {
        case Tag::INTEGER:
            return "Integer";
        case Tag::FLOAT:
            return "Float";
        case Tag::BOOLEAN:
            return "Boolean";
        case Tag::STRING:
            return "String";
        case Tag::OBJECT:
            return "Object";
        case Tag::BOXED:
            return "Boxed";
        case Tag::STRUCT:
            return "Struct";
        case Tag::FUNDAMENTAL:
            return "Fundamental";
        case Tag::VARIANT:
            return "Variant";
        case Tag::ARRAY:
            return "Array";
        case Tag::HASH_TABLE:
            return "HashTable";
        case Tag::REFERENCE:
            return "Reference";
        case Tag::CALLBACK:
            return "Callback";
        case Tag::NULL_TYPE:
            return "Null";
        case Tag::VOID:
            return "Void";
    }
    g_return_val_if_reached("invalid");
}

const char* TypeDesc::container_name(ContainerKind container) {
    switch (container) {
        case ContainerKind::FLAT_ARRAY:
            return "flatArray";
        case ContainerKind::SINGLY_LINKED_LIST:
            return "singlyLinkedList";
        case ContainerKind::DOUBLY_LINKED_LIST:
            return "doublyLinkedList";
        case ContainerKind::POINTER_ARRAY:
            return "pointerArray";
        case ContainerKind::BYTE_ARRAY:
            return "byteArray";
        case ContainerKind::SIZED_ARRAY:
            return "sizedArray";
        case ContainerKind::FIXED_ARRAY:
            return "fixedArray";
    }
    g_return_val_if_reached("invalid");
}

const char* TypeDesc::trampoline_name(TrampolineKind kind) {
    switch (kind) {
        case TrampolineKind::CLOSURE:
            return "closure";
        case TrampolineKind::DESTROY:
            return "destroy";
        case TrampolineKind::SOURCE:
            return "source";
        case TrampolineKind::DRAW:
            return "draw";
        case TrampolineKind::ASYNC_READY:
            return "asyncReady";
        case TrampolineKind::SHORTCUT:
            return "shortcut";
        case TrampolineKind::COMPARE:
            return "compare";
        case TrampolineKind::TICK:
            return "tick";
        case TrampolineKind::TREE_MODEL_CREATE:
            return "treeModelCreate";
        case TrampolineKind::ANIMATION_TARGET:
            return "animationTarget";
        case TrampolineKind::SCALE_FORMAT_VALUE:
            return "scaleFormatValue";
        case TrampolineKind::PATH_INTERSECTION:
            return "pathIntersection";
    }
    g_return_val_if_reached("invalid");
}

static const char* transfer_name(GITransfer transfer) {
    switch (transfer) {
        case GI_TRANSFER_NOTHING:
            return "borrowed";
        case GI_TRANSFER_CONTAINER:
            return "container";
        case GI_TRANSFER_EVERYTHING:
            return "owned";
    }
    return "?";
}

static std::string component_string(const TypeDescPtr& component) {
    return component ? component->to_string() : "?";
}

std::string TypeDesc::to_string() const {
    std::string retval{tag_name(m_tag)};

    switch (m_tag) {
        case Tag::INTEGER:
            retval += (m_signed ? "(int" : "(uint") + std::to_string(m_bits) +
                      ")";
            break;
        case Tag::FLOAT:
            retval += "(" + std::to_string(m_bits) + ")";
            break;
        case Tag::STRING:
        case Tag::OBJECT:
        case Tag::VARIANT:
            retval += std::string{"("} + transfer_name(m_transfer) + ")";
            break;
        case Tag::BOXED:
        case Tag::STRUCT:
            retval += "(" + m_type_name + ", " + transfer_name(m_transfer) + ")";
            break;
        case Tag::FUNDAMENTAL:
            retval += "(" + m_ref_function + "/" + m_unref_function + ", " +
                      transfer_name(m_transfer) + ")";
            break;
        case Tag::ARRAY:
            retval += "<" + component_string(m_item) + ">(" +
                      container_name(m_container) + ", " +
                      transfer_name(m_transfer) + ")";
            break;
        case Tag::HASH_TABLE:
            retval += "<" + component_string(m_item) + ", " +
                      component_string(m_value) + ">(" +
                      transfer_name(m_transfer) + ")";
            break;
        case Tag::REFERENCE:
            retval += "<" + component_string(m_item) + ">";
            break;
        case Tag::CALLBACK:
            retval += std::string{"("} + trampoline_name(m_trampoline) + ")";
            break;
        case Tag::BOOLEAN:
        case Tag::NULL_TYPE:
        case Tag::VOID:
            break;
    }

    return retval;
}

}  // namespace Gdyn
