/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stddef.h>  // for size_t
#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include <ffi.h>
#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/macros.h"
#include "gdyn/value.h"  // for TypeDescPtr

namespace Gdyn {

enum class ContainerKind : uint8_t {
    FLAT_ARRAY,          // C array, NULL- or zero-terminated
    SINGLY_LINKED_LIST,  // GSList
    DOUBLY_LINKED_LIST,  // GList
    POINTER_ARRAY,       // GPtrArray
    BYTE_ARRAY,          // GArray
    SIZED_ARRAY,         // C array, length in another argument
    FIXED_ARRAY,         // C array of a length known in advance
};

// Each kind fixes the native signature of the callback and the slots its
// argument expands to. See gi/trampoline.h.
enum class TrampolineKind : uint8_t {
    CLOSURE,
    DESTROY,
    SOURCE,
    DRAW,
    ASYNC_READY,
    SHORTCUT,
    COMPARE,
    TICK,
    TREE_MODEL_CREATE,
    ANIMATION_TARGET,
    SCALE_FORMAT_VALUE,
    PATH_INTERSECTION,
};

struct ArrayOptions {
    int length_param_index = -1;
    size_t fixed_size = 0;
    // GArray element size; 0 means the natural size of the item type
    size_t element_size = 0;
};

/*
 * TypeDesc:
 *
 * Immutable description of how one native slot is marshaled. Descriptors are
 * created only through the static factories below, which do not check them;
 * call validate() (the dispatcher does) before interpreting one.
 */
class GDYN_EXPORT TypeDesc {
 public:
    enum class Tag : uint8_t {
        INTEGER,
        FLOAT,
        BOOLEAN,
        STRING,
        OBJECT,
        BOXED,
        STRUCT,
        FUNDAMENTAL,
        VARIANT,
        ARRAY,
        HASH_TABLE,
        REFERENCE,
        CALLBACK,
        NULL_TYPE,
        VOID,
    };

    explicit TypeDesc(Tag tag) : m_tag(tag) {}

    [[nodiscard]] static TypeDescPtr integer(unsigned bits, bool is_signed);
    [[nodiscard]] static TypeDescPtr floating(unsigned bits);
    [[nodiscard]] static TypeDescPtr boolean();
    [[nodiscard]] static TypeDescPtr string(GITransfer transfer);
    [[nodiscard]] static TypeDescPtr object(GITransfer transfer);
    [[nodiscard]] static TypeDescPtr boxed(
        GITransfer transfer, const std::string& type_name,
        const std::string& library = {},
        const std::string& get_type_function = {});
    [[nodiscard]] static TypeDescPtr structure(GITransfer transfer,
                                               const std::string& type_name,
                                               size_t size = 0);
    [[nodiscard]] static TypeDescPtr fundamental(
        GITransfer transfer, const std::string& library,
        const std::string& ref_function, const std::string& unref_function);
    [[nodiscard]] static TypeDescPtr variant(GITransfer transfer);
    [[nodiscard]] static TypeDescPtr array(TypeDescPtr item,
                                           ContainerKind container,
                                           GITransfer transfer,
                                           const ArrayOptions& options = {});
    [[nodiscard]] static TypeDescPtr hash_table(TypeDescPtr key,
                                                TypeDescPtr value,
                                                GITransfer transfer);
    [[nodiscard]] static TypeDescPtr reference(TypeDescPtr inner);
    [[nodiscard]] static TypeDescPtr callback(
        TrampolineKind kind, std::vector<TypeDescPtr> arg_types = {},
        TypeDescPtr return_type = nullptr, TypeDescPtr source_type = nullptr,
        TypeDescPtr result_type = nullptr);
    [[nodiscard]] static TypeDescPtr null();
    [[nodiscard]] static TypeDescPtr void_type();

    // Accessors

    [[nodiscard]] Tag tag() const { return m_tag; }
    [[nodiscard]] GITransfer transfer() const { return m_transfer; }
    [[nodiscard]] bool is_owned() const {
        return m_transfer != GI_TRANSFER_NOTHING;
    }
    [[nodiscard]] unsigned bits() const { return m_bits; }
    [[nodiscard]] bool is_signed() const { return m_signed; }
    [[nodiscard]] const std::string& type_name() const { return m_type_name; }
    [[nodiscard]] const std::string& library() const { return m_library; }
    [[nodiscard]] const std::string& get_type_function() const {
        return m_get_type_function;
    }
    [[nodiscard]] const std::string& ref_function() const {
        return m_ref_function;
    }
    [[nodiscard]] const std::string& unref_function() const {
        return m_unref_function;
    }
    // Struct size, 0 if unknown
    [[nodiscard]] size_t struct_size() const { return m_struct_size; }

    // Array item, hash table key, or reference inner type
    [[nodiscard]] const TypeDescPtr& item_type() const { return m_item; }
    [[nodiscard]] const TypeDescPtr& key_type() const { return m_item; }
    [[nodiscard]] const TypeDescPtr& inner_type() const { return m_item; }
    [[nodiscard]] const TypeDescPtr& value_type() const { return m_value; }

    [[nodiscard]] ContainerKind container() const { return m_container; }
    [[nodiscard]] int length_param_index() const {
        return m_array.length_param_index;
    }
    [[nodiscard]] size_t fixed_size() const { return m_array.fixed_size; }
    [[nodiscard]] size_t element_size() const;

    [[nodiscard]] TrampolineKind trampoline() const { return m_trampoline; }
    [[nodiscard]] const std::vector<TypeDescPtr>& arg_types() const {
        return m_arg_types;
    }
    [[nodiscard]] const TypeDescPtr& return_type() const {
        return m_return_type;
    }
    [[nodiscard]] const TypeDescPtr& source_type() const {
        return m_source_type;
    }
    [[nodiscard]] const TypeDescPtr& result_type() const {
        return m_result_type;
    }

    // Derived properties

    // Types that occupy a pointer-sized native slot
    [[nodiscard]] bool is_pointer() const;
    // Types whose values are wrapped in a NativeInstance
    [[nodiscard]] bool is_handle() const;
    // Size of the value when stored in memory (struct fields, C arrays)
    [[nodiscard]] size_t native_size() const;
    [[nodiscard]] ffi_type* ffi_slot_type() const;
    [[nodiscard]] unsigned n_native_slots() const;

    GDYN_MARSHAL_RETURN_CONVENTION
    bool validate(GError** error) const;

    [[nodiscard]] bool equals(const TypeDesc& other) const;
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static const char* tag_name(Tag tag);
    [[nodiscard]] static const char* container_name(ContainerKind container);
    [[nodiscard]] static const char* trampoline_name(TrampolineKind kind);

 private:
    Tag m_tag;
    GITransfer m_transfer = GI_TRANSFER_NOTHING;
    bool m_signed = false;
    unsigned m_bits = 0;

    std::string m_type_name;
    std::string m_library;
    std::string m_get_type_function;
    std::string m_ref_function;
    std::string m_unref_function;
    size_t m_struct_size = 0;

    TypeDescPtr m_item;
    TypeDescPtr m_value;
    ContainerKind m_container = ContainerKind::FLAT_ARRAY;
    ArrayOptions m_array;

    TrampolineKind m_trampoline = TrampolineKind::CLOSURE;
    std::vector<TypeDescPtr> m_arg_types;
    TypeDescPtr m_return_type;
    TypeDescPtr m_source_type;
    TypeDescPtr m_result_type;
};

}  // namespace Gdyn
