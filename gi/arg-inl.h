/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2020 Marco Trevisan <marco.trevisan@canonical.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stdint.h>
#include <string.h>  // for memset

#include <cstddef>  // for nullptr_t
#include <type_traits>

#include <girepository/girepository.h>
#include <glib.h>  // for gboolean

// GIArgument accessor templates
//
// These are intended to make access to the GIArgument union more type-safe and
// reduce bugs that occur from assigning to one member and reading from another.
// (These bugs often work fine on one processor architecture but crash on
// another.)
//
// gdyn_arg_member<T>(GIArgument*) - returns a reference to the appropriate
//   union member that would hold the type T. Rarely used, unless as a pointer
//   to a return location.
// gdyn_arg_get<T>(GIArgument*) - returns the value of type T from the
//   appropriate union member.
// gdyn_arg_set(GIArgument*, T) - sets the appropriate union member for type T.
// gdyn_arg_unset(GIArgument*) - zeroes the whole union.
// gdyn_arg_steal<T>(GIArgument*) - sets the zero value in the appropriate
//   union member for type T and returns the replaced value.

namespace Gdyn {
namespace Tag {
// gboolean is an int, so it needs its own tag to be told apart from int32_t
struct GBoolean {};

template <typename TAG>
struct Real {
    using type = TAG;
};
template <>
struct Real<GBoolean> {
    using type = gboolean;
};
template <typename TAG>
using RealT = typename Real<TAG>::type;
}  // namespace Tag
}  // namespace Gdyn

template <typename T>
constexpr void* gdyn_int_to_pointer(T v) {
    static_assert(std::is_integral_v<T>, "Need integer value");

    if constexpr (std::is_signed_v<T>)
        return reinterpret_cast<void*>(static_cast<intptr_t>(v));
    else
        return reinterpret_cast<void*>(static_cast<uintptr_t>(v));
}

template <typename T>
constexpr T gdyn_pointer_to_int(void* p) {
    static_assert(std::is_integral_v<T>, "Need integer value");

    if constexpr (std::is_signed_v<T>)
        return static_cast<T>(reinterpret_cast<intptr_t>(p));
    else
        return static_cast<T>(reinterpret_cast<uintptr_t>(p));
}

template <auto GIArgument::*member>
[[nodiscard]] constexpr inline decltype(auto) gdyn_arg_member(GIArgument* arg) {
    return (arg->*member);
}

template <typename TAG>
[[nodiscard]] constexpr inline decltype(auto) gdyn_arg_member(GIArgument* arg) {
    if constexpr (std::is_same_v<TAG, Gdyn::Tag::GBoolean>)
        return gdyn_arg_member<&GIArgument::v_boolean>(arg);

    if constexpr (std::is_same_v<TAG, int8_t>)
        return gdyn_arg_member<&GIArgument::v_int8>(arg);
    if constexpr (std::is_same_v<TAG, uint8_t>)
        return gdyn_arg_member<&GIArgument::v_uint8>(arg);
    if constexpr (std::is_same_v<TAG, int16_t>)
        return gdyn_arg_member<&GIArgument::v_int16>(arg);
    if constexpr (std::is_same_v<TAG, uint16_t>)
        return gdyn_arg_member<&GIArgument::v_uint16>(arg);
    if constexpr (std::is_same_v<TAG, int32_t>)
        return gdyn_arg_member<&GIArgument::v_int32>(arg);
    if constexpr (std::is_same_v<TAG, uint32_t>)
        return gdyn_arg_member<&GIArgument::v_uint32>(arg);
    if constexpr (std::is_same_v<TAG, int64_t>)
        return gdyn_arg_member<&GIArgument::v_int64>(arg);
    if constexpr (std::is_same_v<TAG, uint64_t>)
        return gdyn_arg_member<&GIArgument::v_uint64>(arg);

    if constexpr (std::is_same_v<TAG, float>)
        return gdyn_arg_member<&GIArgument::v_float>(arg);

    if constexpr (std::is_same_v<TAG, double>)
        return gdyn_arg_member<&GIArgument::v_double>(arg);

    if constexpr (std::is_same_v<TAG, char*>)
        return gdyn_arg_member<&GIArgument::v_string>(arg);

    if constexpr (std::is_same_v<TAG, void*>)
        return gdyn_arg_member<&GIArgument::v_pointer>(arg);

    if constexpr (std::is_pointer<TAG>() && !std::is_same_v<TAG, char*> &&
                  !std::is_same_v<TAG, void*>) {
        using NonconstPtrT =
            std::add_pointer_t<std::remove_const_t<std::remove_pointer_t<TAG>>>;
        return reinterpret_cast<NonconstPtrT&>(
            gdyn_arg_member<&GIArgument::v_pointer>(arg));
    }
}

template <typename TAG, typename = std::enable_if_t<
                            std::is_arithmetic_v<Gdyn::Tag::RealT<TAG>>>>
constexpr inline void gdyn_arg_set(GIArgument* arg, Gdyn::Tag::RealT<TAG> v) {
    if constexpr (std::is_same_v<TAG, Gdyn::Tag::GBoolean>)
        v = !!v;

    gdyn_arg_member<TAG>(arg) = v;
}

// Specialization for non-function pointers, so that you don't have to repeat
// the pointer type explicitly for type deduction, and that takes care of
// GIArgument not having constness
template <typename T, typename = std::enable_if_t<!std::is_function_v<T>>>
constexpr inline void gdyn_arg_set(GIArgument* arg, T* v) {
    using NonconstPtrT = std::add_pointer_t<std::remove_const_t<T>>;
    gdyn_arg_member<NonconstPtrT>(arg) = const_cast<NonconstPtrT>(v);
}

// Overload for nullptr since it's not handled by T*
constexpr inline void gdyn_arg_set(GIArgument* arg, std::nullptr_t) {
    gdyn_arg_member<void*>(arg) = nullptr;
}

// Store function pointers as void*. It is a requirement of GLib that your
// compiler can do this
template <typename ReturnT, typename... Args>
constexpr inline void gdyn_arg_set(GIArgument* arg, ReturnT (*v)(Args...)) {
    gdyn_arg_member<void*>(arg) = reinterpret_cast<void*>(v);
}

template <typename TAG>
[[nodiscard]] constexpr inline Gdyn::Tag::RealT<TAG> gdyn_arg_get(
    GIArgument* arg) {
    if constexpr (std::is_same_v<TAG, Gdyn::Tag::GBoolean>)
        return Gdyn::Tag::RealT<TAG>(!!gdyn_arg_member<TAG>(arg));

    return gdyn_arg_member<TAG>(arg);
}

inline void gdyn_arg_unset(GIArgument* arg) {
    // Clear all bits of the out C value. No one member is guaranteed to span
    // the whole union on all architectures, so use memset() instead of
    // gdyn_arg_set<T>(arg, 0) for some type T.
    memset(arg, 0, sizeof(GIArgument));
}

template <typename TAG>
[[nodiscard]] constexpr inline Gdyn::Tag::RealT<TAG> gdyn_arg_steal(
    GIArgument* arg) {
    auto val = gdyn_arg_get<TAG>(arg);
    gdyn_arg_unset(arg);
    return val;
}
