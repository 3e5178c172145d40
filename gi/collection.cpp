/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2008 litl, LLC
// SPDX-FileCopyrightText: 2020 Marco Trevisan <marco.trevisan@canonical.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>
#include <string.h>  // for memcmp

#include <algorithm>  // for max
#include <type_traits>
#include <utility>  // for move
#include <vector>

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/error-types.h"
#include "gi/arg-inl.h"
#include "gi/arg.h"
#include "gi/collection.h"
#include "gi/type-desc.h"
#include "util/log.h"

using Gdyn::ContainerKind;
using Gdyn::TypeDesc;
using Gdyn::Value;
using Gdyn::ValueMap;
using Gdyn::ValueVector;

using NativeElements = std::vector<GIArgument>;

// Types that don't fit in a pointer are stored in lists and hash tables as
// pointers to heap-allocated values
[[nodiscard]] static bool type_needs_heap_value(const TypeDesc& type) {
    return (type.tag() == TypeDesc::Tag::INTEGER && type.bits() == 64) ||
           type.tag() == TypeDesc::Tag::FLOAT;
}

template <typename TAG>
[[nodiscard]] static void* stuff_int(GIArgument* arg) {
    return gdyn_int_to_pointer(gdyn_arg_get<TAG>(arg));
}

[[nodiscard]] static void* hash_pointer_from_argument(const TypeDesc& type,
                                                      GIArgument* arg) {
    if (type.is_pointer())
        return gdyn_arg_get<void*>(arg);
    if (type_needs_heap_value(type))
        return g_memdup2(arg, type.native_size());
    if (type.tag() == TypeDesc::Tag::BOOLEAN)
        return stuff_int<Gdyn::Tag::GBoolean>(arg);

    g_assert(type.tag() == TypeDesc::Tag::INTEGER);
    switch (type.bits()) {
        case 8:
            return type.is_signed() ? stuff_int<int8_t>(arg)
                                    : stuff_int<uint8_t>(arg);
        case 16:
            return type.is_signed() ? stuff_int<int16_t>(arg)
                                    : stuff_int<uint16_t>(arg);
        default:
            return type.is_signed() ? stuff_int<int32_t>(arg)
                                    : stuff_int<uint32_t>(arg);
    }
}

static void hash_pointer_to_argument(const TypeDesc& type, void* pointer,
                                     GIArgument* arg) {
    gdyn_arg_unset(arg);

    if (type.is_pointer()) {
        gdyn_arg_set(arg, pointer);
        return;
    }
    if (type_needs_heap_value(type)) {
        if (pointer)
            gdyn_gi_argument_load(type, pointer, arg);
        return;
    }
    if (type.tag() == TypeDesc::Tag::BOOLEAN) {
        gdyn_arg_set<Gdyn::Tag::GBoolean>(arg,
                                          gdyn_pointer_to_int<int>(pointer));
        return;
    }

    g_assert(type.tag() == TypeDesc::Tag::INTEGER);
    switch (type.bits()) {
        case 8:
            if (type.is_signed())
                gdyn_arg_set<int8_t>(arg, gdyn_pointer_to_int<int8_t>(pointer));
            else
                gdyn_arg_set<uint8_t>(arg,
                                      gdyn_pointer_to_int<uint8_t>(pointer));
            return;
        case 16:
            if (type.is_signed())
                gdyn_arg_set<int16_t>(arg,
                                      gdyn_pointer_to_int<int16_t>(pointer));
            else
                gdyn_arg_set<uint16_t>(arg,
                                       gdyn_pointer_to_int<uint16_t>(pointer));
            return;
        default:
            if (type.is_signed())
                gdyn_arg_set<int32_t>(arg,
                                      gdyn_pointer_to_int<int32_t>(pointer));
            else
                gdyn_arg_set<uint32_t>(arg,
                                       gdyn_pointer_to_int<uint32_t>(pointer));
            return;
    }
}

// Frees an element converted for the callee that the callee never received
static void release_unused_element(const TypeDesc& type, GIArgument* arg) {
    if (type.is_owned())
        gdyn_gi_argument_release(type, type.transfer(), 0, arg);
    else
        gdyn_gi_argument_release_in_arg(type, 0, arg);
}

// Frees an element of an in-argument container after the call. Owned elements
// went to the callee.
static void release_in_element(const TypeDesc& type, GIArgument* arg,
                               void* hash_pointer) {
    if (!type.is_owned())
        gdyn_gi_argument_release_in_arg(type, 0, arg);
    if (hash_pointer && type_needs_heap_value(type))
        g_free(hash_pointer);
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool throw_invalid_container(const Value& value, const TypeDesc& type,
                                    const char* arg_name,
                                    GdynArgumentType arg_type, GError** error) {
    Gdyn::AutoChar display_name{gdyn_argument_display_name(arg_name, arg_type)};

    g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                "Expected type %s for %s but got type '%s'",
                type.to_string().c_str(), display_name.get(),
                Value::tag_name(value.tag()));
    return false;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool convert_elements(const ValueVector& values, const TypeDesc& item,
                             const char* arg_name, GdynArgumentType elem_type,
                             bool may_be_null, NativeElements* elements,
                             GError** error) {
    elements->reserve(values.size());

    for (const Value& value : values) {
        GIArgument elem_arg;
        if (!gdyn_value_to_gi_argument(value, item, arg_name, elem_type,
                                       may_be_null, &elem_arg, error)) {
            for (GIArgument& converted : *elements)
                release_unused_element(item, &converted);
            elements->clear();
            return false;
        }
        elements->push_back(elem_arg);
    }

    return true;
}

template <typename T>
[[nodiscard]] static T* elements_to_list(const TypeDesc& item,
                                         NativeElements* elements) {
    T* list = nullptr;

    for (GIArgument& elem_arg : *elements) {
        void* hash_pointer = hash_pointer_from_argument(item, &elem_arg);

        if constexpr (std::is_same_v<T, GList>)
            list = g_list_prepend(list, hash_pointer);
        else if constexpr (std::is_same_v<T, GSList>)
            list = g_slist_prepend(list, hash_pointer);
    }

    if constexpr (std::is_same_v<T, GList>)
        list = g_list_reverse(list);
    else if constexpr (std::is_same_v<T, GSList>)
        list = g_slist_reverse(list);

    return list;
}

// Packs the elements into a C array, adding a zero terminator if asked
[[nodiscard]] static void* elements_to_c_array(const TypeDesc& item,
                                               NativeElements* elements,
                                               bool zero_terminated) {
    size_t element_size = item.native_size();
    size_t n_slots = elements->size() + (zero_terminated ? 1 : 0);
    auto* data = static_cast<uint8_t*>(
        g_malloc0(std::max<size_t>(n_slots, 1) * element_size));

    for (size_t ix = 0; ix < elements->size(); ix++)
        gdyn_gi_argument_store(item, &(*elements)[ix],
                               data + ix * element_size);

    return data;
}

[[nodiscard]] static GArray* elements_to_garray(const TypeDesc& type,
                                                NativeElements* elements) {
    const TypeDesc& item = *type.item_type();
    size_t element_size = type.element_size();

    GArray* array = g_array_sized_new(/* zero_terminated = */ false,
                                      /* clear = */ true, element_size,
                                      elements->size());
    g_array_set_size(array, elements->size());

    for (size_t ix = 0; ix < elements->size(); ix++)
        gdyn_gi_argument_store(item, &(*elements)[ix],
                               array->data + ix * element_size);

    return array;
}

bool gdyn_array_to_gi_argument(const Value& value, const TypeDesc& type,
                               const char* arg_name, GdynArgumentType arg_type,
                               bool may_be_null, GIArgument* arg,
                               GError** error) {
    if (value.isNullOrUndefined()) {
        if (!may_be_null)
            return throw_invalid_container(value, type, arg_name, arg_type,
                                           error);
        gdyn_arg_set(arg, nullptr);
        return true;
    }

    if (!value.isArray())
        return throw_invalid_container(value, type, arg_name, arg_type, error);

    const ValueVector& values = value.toArray();
    const TypeDesc& item = *type.item_type();
    ContainerKind container = type.container();

    if (container == ContainerKind::FIXED_ARRAY &&
        values.size() != type.fixed_size()) {
        Gdyn::AutoChar display_name{
            gdyn_argument_display_name(arg_name, arg_type)};
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "%s must have exactly %zu elements, got %zu",
                    display_name.get(), type.fixed_size(), values.size());
        return false;
    }

    // A NULL pointer would end a terminated array early
    bool elements_may_be_null =
        container != ContainerKind::FLAT_ARRAY || !item.is_pointer();
    GdynArgumentType elem_type =
        container == ContainerKind::SINGLY_LINKED_LIST ||
                container == ContainerKind::DOUBLY_LINKED_LIST
            ? GDYN_ARGUMENT_LIST_ELEMENT
            : GDYN_ARGUMENT_ARRAY_ELEMENT;

    NativeElements elements;
    if (!convert_elements(values, item, arg_name, elem_type,
                          elements_may_be_null, &elements, error))
        return false;

    switch (container) {
        case ContainerKind::FLAT_ARRAY:
            gdyn_arg_set(arg, elements_to_c_array(item, &elements, true));
            break;
        case ContainerKind::SIZED_ARRAY:
        case ContainerKind::FIXED_ARRAY:
            gdyn_arg_set(arg, elements_to_c_array(item, &elements, false));
            break;
        case ContainerKind::SINGLY_LINKED_LIST:
            gdyn_arg_set(arg, elements_to_list<GSList>(item, &elements));
            break;
        case ContainerKind::DOUBLY_LINKED_LIST:
            gdyn_arg_set(arg, elements_to_list<GList>(item, &elements));
            break;
        case ContainerKind::POINTER_ARRAY: {
            GPtrArray* array = g_ptr_array_sized_new(elements.size());
            for (GIArgument& elem_arg : elements)
                g_ptr_array_add(array,
                                hash_pointer_from_argument(item, &elem_arg));
            gdyn_arg_set(arg, array);
            break;
        }
        case ContainerKind::BYTE_ARRAY:
            gdyn_arg_set(arg, elements_to_garray(type, &elements));
            break;
    }

    gdyn_debug_marshal(GDYN_DEBUG_MARSHAL, "Built %s of %zu elements",
                       type.to_string().c_str(), elements.size());
    return true;
}

[[nodiscard]] static GHashTable* create_hash_table_for_key_type(
    const TypeDesc& key_type) {
    /* Don't use key/value destructor functions here, because we can't
     * construct correct ones in general if the value type is complex.
     * Rely on the type-aware release functions. */
    if (key_type.tag() == TypeDesc::Tag::STRING)
        return g_hash_table_new(g_str_hash, g_str_equal);
    return g_hash_table_new(g_direct_hash, g_direct_equal);
}

bool gdyn_hash_to_gi_argument(const Value& value, const TypeDesc& type,
                              const char* arg_name, GdynArgumentType arg_type,
                              bool may_be_null, GIArgument* arg,
                              GError** error) {
    if (value.isNullOrUndefined()) {
        if (!may_be_null)
            return throw_invalid_container(value, type, arg_name, arg_type,
                                           error);
        gdyn_arg_set(arg, nullptr);
        return true;
    }

    if (!value.isMap())
        return throw_invalid_container(value, type, arg_name, arg_type, error);

    const TypeDesc& key_type = *type.key_type();
    const TypeDesc& value_type = *type.value_type();

    ValueVector keys, values;
    for (const auto& entry : value.toMap()) {
        keys.push_back(entry.first);
        values.push_back(entry.second);
    }

    NativeElements key_args, value_args;
    if (!convert_elements(keys, key_type, arg_name, GDYN_ARGUMENT_HASH_ELEMENT,
                          false, &key_args, error))
        return false;
    if (!convert_elements(values, value_type, arg_name,
                          GDYN_ARGUMENT_HASH_ELEMENT, true, &value_args,
                          error)) {
        for (GIArgument& key_arg : key_args)
            release_unused_element(key_type, &key_arg);
        return false;
    }

    GHashTable* result = create_hash_table_for_key_type(key_type);
    for (size_t ix = 0; ix < key_args.size(); ix++) {
        g_hash_table_insert(
            result, hash_pointer_from_argument(key_type, &key_args[ix]),
            hash_pointer_from_argument(value_type, &value_args[ix]));
    }

    gdyn_arg_set(arg, result);
    return true;
}

// Length of a terminated C array: the first element whose bytes are all zero
[[nodiscard]] static size_t terminated_array_length(const TypeDesc& item,
                                                    const void* data) {
    static const uint8_t zero[sizeof(GIArgument)] = {};
    size_t element_size = item.native_size();
    auto* bytes = static_cast<const uint8_t*>(data);

    size_t length = 0;
    while (memcmp(bytes + length * element_size, zero, element_size) != 0)
        length++;
    return length;
}

/*
 * for_each_element:
 *
 * Calls @func(GIArgument* element, void* hash_pointer) for each element of the
 * native container in @arg, in order. @hash_pointer is the pointer stored in a
 * list or pointer array, or nullptr for elements stored inline. @length is only
 * used for sized arrays.
 */
template <typename F>
static void for_each_element(const TypeDesc& type, GIArgument* arg,
                             size_t length, F&& func) {
    const TypeDesc& item = *type.item_type();
    void* container = gdyn_arg_get<void*>(arg);
    if (!container)
        return;

    GIArgument elem_arg;

    switch (type.container()) {
        case ContainerKind::FLAT_ARRAY:
        case ContainerKind::SIZED_ARRAY:
        case ContainerKind::FIXED_ARRAY: {
            if (type.container() == ContainerKind::FLAT_ARRAY)
                length = terminated_array_length(item, container);
            else if (type.container() == ContainerKind::FIXED_ARRAY)
                length = type.fixed_size();

            auto* data = static_cast<uint8_t*>(container);
            for (size_t ix = 0; ix < length; ix++) {
                gdyn_gi_argument_load(item, data + ix * item.native_size(),
                                      &elem_arg);
                func(&elem_arg, nullptr);
            }
            return;
        }
        case ContainerKind::SINGLY_LINKED_LIST:
            for (GSList* l = static_cast<GSList*>(container); l; l = l->next) {
                hash_pointer_to_argument(item, l->data, &elem_arg);
                func(&elem_arg, l->data);
            }
            return;
        case ContainerKind::DOUBLY_LINKED_LIST:
            for (GList* l = static_cast<GList*>(container); l; l = l->next) {
                hash_pointer_to_argument(item, l->data, &elem_arg);
                func(&elem_arg, l->data);
            }
            return;
        case ContainerKind::POINTER_ARRAY: {
            auto* array = static_cast<GPtrArray*>(container);
            for (unsigned ix = 0; ix < array->len; ix++) {
                void* pointer = g_ptr_array_index(array, ix);
                hash_pointer_to_argument(item, pointer, &elem_arg);
                func(&elem_arg, pointer);
            }
            return;
        }
        case ContainerKind::BYTE_ARRAY: {
            auto* array = static_cast<GArray*>(container);
            unsigned element_size = g_array_get_element_size(array);
            for (unsigned ix = 0; ix < array->len; ix++) {
                gdyn_gi_argument_load(item, array->data + ix * element_size,
                                      &elem_arg);
                func(&elem_arg, nullptr);
            }
            return;
        }
    }
}

// Frees the container structure only. @elements_taken means the elements were
// moved out, so element free functions set by native code must not run.
static void free_container(const TypeDesc& type, GIArgument* arg,
                           bool elements_taken) {
    void* container = gdyn_arg_get<void*>(arg);
    if (!container)
        return;

    switch (type.container()) {
        case ContainerKind::FLAT_ARRAY:
        case ContainerKind::SIZED_ARRAY:
        case ContainerKind::FIXED_ARRAY:
            g_free(container);
            break;
        case ContainerKind::SINGLY_LINKED_LIST:
            g_slist_free(static_cast<GSList*>(container));
            break;
        case ContainerKind::DOUBLY_LINKED_LIST:
            g_list_free(static_cast<GList*>(container));
            break;
        case ContainerKind::POINTER_ARRAY: {
            auto* array = static_cast<GPtrArray*>(container);
            if (elements_taken)
                g_ptr_array_set_free_func(array, nullptr);
            g_ptr_array_unref(array);
            break;
        }
        case ContainerKind::BYTE_ARRAY: {
            auto* array = static_cast<GArray*>(container);
            if (elements_taken)
                g_array_set_clear_func(array, nullptr);
            g_array_unref(array);
            break;
        }
    }

    gdyn_arg_unset(arg);
}

// Boxed 64-bit and floating point keys or values of @hash, which the table's
// own free functions would have released had the entries not been stolen
static void free_stolen_heap_values(const TypeDesc& type, GHashTable* hash) {
    bool heap_keys = type_needs_heap_value(*type.key_type());
    bool heap_values = type_needs_heap_value(*type.value_type());
    if (!heap_keys && !heap_values)
        return;

    GHashTableIter iter;
    void* key_pointer;
    void* value_pointer;
    g_hash_table_iter_init(&iter, hash);
    while (g_hash_table_iter_next(&iter, &key_pointer, &value_pointer)) {
        if (heap_keys)
            g_free(key_pointer);
        if (heap_values)
            g_free(value_pointer);
    }
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool array_from_gi_argument_internal(const TypeDesc& type,
                                            GITransfer transfer,
                                            GIArgument* arg, size_t length,
                                            Value* value_p, GError** error) {
    const TypeDesc& item = *type.item_type();
    GITransfer element_transfer =
        transfer == GI_TRANSFER_NOTHING ? GI_TRANSFER_NOTHING : item.transfer();
    GdynArgumentType elem_type =
        type.container() == ContainerKind::SINGLY_LINKED_LIST ||
                type.container() == ContainerKind::DOUBLY_LINKED_LIST
            ? GDYN_ARGUMENT_LIST_ELEMENT
            : GDYN_ARGUMENT_ARRAY_ELEMENT;

    ValueVector elements;
    bool ok = true;
    for_each_element(type, arg, length,
                     [&](GIArgument* elem_arg, void* hash_pointer) {
                         if (ok) {
                             Value elem;
                             ok = gdyn_value_from_gi_argument(
                                 item, elem_type, element_transfer, elem_arg,
                                 &elem, error);
                             elements.push_back(std::move(elem));
                         } else {
                             // Not converted, so not owned by any value
                             gdyn_gi_argument_release(item, element_transfer,
                                                      0, elem_arg);
                         }
                         if (transfer != GI_TRANSFER_NOTHING && hash_pointer &&
                             type_needs_heap_value(item))
                             g_free(hash_pointer);
                     });

    if (transfer != GI_TRANSFER_NOTHING)
        free_container(type, arg,
                       element_transfer != GI_TRANSFER_NOTHING);

    if (!ok)
        return false;

    *value_p = Value::array(std::move(elements));
    return true;
}

bool gdyn_array_from_gi_argument(const TypeDesc& type, GITransfer transfer,
                                 GIArgument* arg, Value* value_p,
                                 GError** error) {
    if (type.container() == ContainerKind::SIZED_ARRAY &&
        gdyn_arg_get<void*>(arg)) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                    "Length of %s is not known here",
                    type.to_string().c_str());
        return false;
    }

    return array_from_gi_argument_internal(type, transfer, arg, 0, value_p,
                                           error);
}

bool gdyn_array_from_explicit_array(const TypeDesc& type, GITransfer transfer,
                                    GIArgument* arg, size_t length,
                                    Value* value_p, GError** error) {
    return array_from_gi_argument_internal(type, transfer, arg, length, value_p,
                                           error);
}

bool gdyn_hash_from_gi_argument(const TypeDesc& type, GITransfer transfer,
                                GIArgument* arg, Value* value_p,
                                GError** error) {
    const TypeDesc& key_type = *type.key_type();
    const TypeDesc& value_type = *type.value_type();
    auto* hash = gdyn_arg_get<GHashTable*>(arg);

    if (!hash) {
        *value_p = Value::map({});
        return true;
    }

    GITransfer key_transfer = transfer == GI_TRANSFER_NOTHING
                                  ? GI_TRANSFER_NOTHING
                                  : key_type.transfer();
    GITransfer value_transfer = transfer == GI_TRANSFER_NOTHING
                                    ? GI_TRANSFER_NOTHING
                                    : value_type.transfer();

    ValueMap entries;
    bool ok = true;

    GHashTableIter iter;
    void* key_pointer;
    void* value_pointer;
    g_hash_table_iter_init(&iter, hash);
    while (g_hash_table_iter_next(&iter, &key_pointer, &value_pointer)) {
        GIArgument key_arg, value_arg;
        hash_pointer_to_argument(key_type, key_pointer, &key_arg);
        hash_pointer_to_argument(value_type, value_pointer, &value_arg);

        Value key, value;
        if (!ok) {
            gdyn_gi_argument_release(key_type, key_transfer, 0, &key_arg);
            gdyn_gi_argument_release(value_type, value_transfer, 0,
                                     &value_arg);
        } else if (!gdyn_value_from_gi_argument(
                       key_type, GDYN_ARGUMENT_HASH_ELEMENT, key_transfer,
                       &key_arg, &key, error)) {
            ok = false;
            gdyn_gi_argument_release(value_type, value_transfer, 0,
                                     &value_arg);
        } else if (!gdyn_value_from_gi_argument(
                       value_type, GDYN_ARGUMENT_HASH_ELEMENT, value_transfer,
                       &value_arg, &value, error)) {
            ok = false;
        } else {
            entries.emplace_back(std::move(key), std::move(value));
        }
    }

    if (transfer != GI_TRANSFER_NOTHING) {
        if (key_transfer != GI_TRANSFER_NOTHING ||
            value_transfer != GI_TRANSFER_NOTHING) {
            free_stolen_heap_values(type, hash);
            g_hash_table_steal_all(hash);
        }
        g_hash_table_unref(hash);
        gdyn_arg_unset(arg);
    }

    if (!ok)
        return false;

    *value_p = Value::map(std::move(entries));
    return true;
}

void gdyn_gi_argument_release_in_array(const TypeDesc& type, size_t length,
                                       GIArgument* arg) {
    // With GI_TRANSFER_CONTAINER and GI_TRANSFER_EVERYTHING the container is
    // the callee's business
    if (type.transfer() != GI_TRANSFER_NOTHING)
        return;

    gdyn_debug_marshal(GDYN_DEBUG_GFUNCTION, "Releasing %s in param",
                       type.to_string().c_str());

    const TypeDesc& item = *type.item_type();
    for_each_element(type, arg, length,
                     [&item](GIArgument* elem_arg, void* hash_pointer) {
                         release_in_element(item, elem_arg, hash_pointer);
                     });
    free_container(type, arg, false);
}

void gdyn_gi_argument_release_in_hash(const TypeDesc& type, GIArgument* arg) {
    if (type.transfer() != GI_TRANSFER_NOTHING)
        return;

    auto* hash = gdyn_arg_get<GHashTable*>(arg);
    if (!hash)
        return;

    const TypeDesc& key_type = *type.key_type();
    const TypeDesc& value_type = *type.value_type();

    GHashTableIter iter;
    void* key_pointer;
    void* value_pointer;
    g_hash_table_iter_init(&iter, hash);
    while (g_hash_table_iter_next(&iter, &key_pointer, &value_pointer)) {
        GIArgument key_arg, value_arg;
        hash_pointer_to_argument(key_type, key_pointer, &key_arg);
        hash_pointer_to_argument(value_type, value_pointer, &value_arg);
        release_in_element(key_type, &key_arg, key_pointer);
        release_in_element(value_type, &value_arg, value_pointer);
    }

    g_hash_table_unref(hash);
    gdyn_arg_unset(arg);
}

void gdyn_gi_argument_release_array(const TypeDesc& type, GITransfer transfer,
                                    size_t length, GIArgument* arg) {
    if (transfer == GI_TRANSFER_NOTHING)
        return;

    const TypeDesc& item = *type.item_type();
    bool elements_owned =
        transfer == GI_TRANSFER_EVERYTHING && item.is_owned();

    for_each_element(type, arg, length,
                     [&](GIArgument* elem_arg, void* hash_pointer) {
                         if (elements_owned)
                             gdyn_gi_argument_release(item, item.transfer(), 0,
                                                      elem_arg);
                         if (hash_pointer && type_needs_heap_value(item))
                             g_free(hash_pointer);
                     });
    free_container(type, arg, elements_owned);
}

void gdyn_gi_argument_release_hash(const TypeDesc& type, GITransfer transfer,
                                   GIArgument* arg) {
    if (transfer == GI_TRANSFER_NOTHING)
        return;

    auto* hash = gdyn_arg_get<GHashTable*>(arg);
    if (!hash)
        return;

    const TypeDesc& key_type = *type.key_type();
    const TypeDesc& value_type = *type.value_type();
    bool elements_owned = transfer == GI_TRANSFER_EVERYTHING &&
                          (key_type.is_owned() || value_type.is_owned());

    if (elements_owned) {
        GHashTableIter iter;
        void* key_pointer;
        void* value_pointer;
        g_hash_table_iter_init(&iter, hash);
        while (g_hash_table_iter_next(&iter, &key_pointer, &value_pointer)) {
            GIArgument key_arg, value_arg;
            hash_pointer_to_argument(key_type, key_pointer, &key_arg);
            hash_pointer_to_argument(value_type, value_pointer, &value_arg);
            gdyn_gi_argument_release(key_type, key_type.transfer(), 0,
                                     &key_arg);
            gdyn_gi_argument_release(value_type, value_type.transfer(), 0,
                                     &value_arg);
        }
        free_stolen_heap_values(type, hash);
        g_hash_table_steal_all(hash);
    }

    g_hash_table_unref(hash);
    gdyn_arg_unset(arg);
}
