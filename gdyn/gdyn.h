/* -*- mode: C; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
/*
 * SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
 * SPDX-FileCopyrightText: 2008 litl, LLC
 * SPDX-FileCopyrightText: 2026 gdyn contributors
 */

#ifndef GDYN_GDYN_H_
#define GDYN_GDYN_H_

#define INSIDE_GDYN_H

#include <gdyn/engine.h>
#include <gdyn/error-types.h>
#include <gdyn/macros.h>
#include <gdyn/value.h>

#undef INSIDE_GDYN_H

#endif /* GDYN_GDYN_H_ */
