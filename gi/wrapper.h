/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2018 Philip Chimento <philip.chimento@gmail.com>
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stdint.h>

#include <memory>
#include <string>

#include <glib.h>

#include "gdyn/macros.h"
#include "util/log.h"

namespace Gdyn {

enum class InstanceKind : uint8_t {
    OBJECT,
    BOXED,
    STRUCT,
    FUNDAMENTAL,
    VARIANT,
};

/*
 * NativeInstance:
 *
 * Base class of the managed handles to native memory. A NativeInstance is only
 * ever held through std::shared_ptr; when the last managed reference goes away
 * the subclass destructor gives back whatever the wrapper owned (references,
 * copies, allocations).
 *
 * ObjectInstance and FundamentalInstance keep an identity cache, so that at
 * most one wrapper exists for each native pointer. BoxedInstance copies the
 * memory it wraps, so there is no need for one.
 */
class GDYN_EXPORT NativeInstance
    : public std::enable_shared_from_this<NativeInstance> {
 protected:
    void* m_ptr;

    explicit NativeInstance(void* ptr) : m_ptr(ptr) {}

    NativeInstance(const NativeInstance&) = delete;
    NativeInstance& operator=(const NativeInstance&) = delete;

    virtual GdynDebugTopic debug_topic() const = 0;

    void debug_lifecycle(const char* message GDYN_USED_VERBOSE_LIFECYCLE) const {
        gdyn_debug_lifecycle(debug_topic(), "[%p: %s] %s", m_ptr,
                             format_name().c_str(), message);
    }

 public:
    virtual ~NativeInstance() = default;

    [[nodiscard]] void* ptr() const { return m_ptr; }

    [[nodiscard]] virtual InstanceKind kind() const = 0;
    // Whether the wrapper releases something when it is destroyed
    [[nodiscard]] virtual bool owns_native() const = 0;
    [[nodiscard]] virtual const char* type_name() const = 0;

    [[nodiscard]] std::string format_name() const {
        return std::string{type_name()} + " " + ptr_str();
    }

    [[nodiscard]] std::string ptr_str() const {
        char buf[2 + 2 * sizeof(void*) + 1];
        g_snprintf(buf, sizeof(buf), "%p", m_ptr);
        return buf;
    }
};

}  // namespace Gdyn
