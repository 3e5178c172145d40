/* -*- mode: C; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
/*
 * SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
 * SPDX-FileCopyrightText: 2017 Chun-wei Fan
 * SPDX-FileCopyrightText: 2026 gdyn contributors
 */

#ifndef GDYN_MACROS_H_
#define GDYN_MACROS_H_

#include <glib.h>

#ifdef G_OS_WIN32
# ifdef GDYN_COMPILATION
#  define GDYN_EXPORT __declspec(dllexport)
# else
#  define GDYN_EXPORT __declspec(dllimport)
# endif
#else
#    define GDYN_EXPORT __attribute__((visibility("default")))
#endif

/**
 * GDYN_USE:
 *
 * Indicates a return value must be used, or the compiler should log a warning.
 * Equivalent to [[nodiscard]], but this macro is for use in external headers
 * which are not necessarily compiled with a C++ compiler.
 */
#if defined(__GNUC__) || defined(__clang__)
#    define GDYN_USE __attribute__((warn_unused_result))
#else
#    define GDYN_USE
#endif

/**
 * GDYN_MARSHAL_RETURN_CONVENTION:
 *
 * Same as [[nodiscard]], but indicates that a return value of true or non-null
 * means that the passed-in GError** was left untouched. Conversely, a return
 * value of false or nullptr means that the error must have been set (if the
 * caller passed a non-null location).
 *
 * It's intended as documentation for the programmer and for static analysis
 * tools. If not using them, then it has the same effect as [[nodiscard]].
 */
#ifdef __clang_analyzer__
#    define GDYN_MARSHAL_RETURN_CONVENTION \
        [[nodiscard]] __attribute__((annotate("gerror_return_convention")))
#else
#    define GDYN_MARSHAL_RETURN_CONVENTION [[nodiscard]]
#endif

#ifdef __GNUC__
#    define GDYN_ALWAYS_INLINE __attribute__((always_inline))
#else
#    define GDYN_ALWAYS_INLINE
#endif

#endif /* GDYN_MACROS_H_ */
