/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#pragma once

#include <config.h>

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>  // for pair
#include <variant>
#include <vector>

#include <glib.h>

#include "gdyn/macros.h"

namespace Gdyn {

class NativeInstance;
class RefCell;
class TypeDesc;
class Value;

using TypeDescPtr = std::shared_ptr<const TypeDesc>;
using ValueVector = std::vector<Value>;
using ValueMap = std::vector<std::pair<Value, Value>>;

// A managed function. Returning false means the call failed; the error is
// logged by whoever invoked the callable and a zero value is used instead.
using Callable =
    std::function<bool(const ValueVector& args, Value* rval, GError** error)>;

// The dynamic value exchanged with native code. Like a script engine value it
// carries its own type tag; descriptors decide how it crosses the boundary.
class GDYN_EXPORT Value {
 public:
    enum class Tag : uint8_t {
        UNDEFINED,
        NULL_VALUE,
        BOOLEAN,
        NUMBER,
        INT,
        UINT,
        STRING,
        OBJECT,
        ARRAY,
        MAP,
        CALLBACK,
        REF,
    };

 private:
    struct Undefined {};
    struct Null {};

    // Alternatives are in the same order as Tag
    using Storage =
        std::variant<Undefined, Null, bool, double, int64_t, uint64_t,
                     std::string, std::shared_ptr<NativeInstance>,
                     std::shared_ptr<const ValueVector>,
                     std::shared_ptr<const ValueMap>,
                     std::shared_ptr<const Callable>, std::shared_ptr<RefCell>>;

    explicit Value(Storage storage) : m_storage(std::move(storage)) {}

 public:
    Value() : m_storage(Undefined{}) {}

    [[nodiscard]] static Value undefined() { return Value{}; }
    [[nodiscard]] static Value null() { return Value{Null{}}; }
    [[nodiscard]] static Value boolean(bool b) { return Value{b}; }
    [[nodiscard]] static Value number(double d) { return Value{d}; }
    [[nodiscard]] static Value from_int(int64_t i) { return Value{i}; }
    [[nodiscard]] static Value from_uint(uint64_t u) { return Value{u}; }
    [[nodiscard]] static Value string(std::string s) {
        return Value{std::move(s)};
    }
    [[nodiscard]] static Value object(std::shared_ptr<NativeInstance> instance);
    [[nodiscard]] static Value array(ValueVector elements);
    [[nodiscard]] static Value map(ValueMap entries);
    [[nodiscard]] static Value callback(Callable callable);
    [[nodiscard]] static Value ref(std::shared_ptr<RefCell> cell);

    [[nodiscard]] Tag tag() const { return static_cast<Tag>(m_storage.index()); }

    [[nodiscard]] bool isUndefined() const { return tag() == Tag::UNDEFINED; }
    [[nodiscard]] bool isNull() const { return tag() == Tag::NULL_VALUE; }
    [[nodiscard]] bool isNullOrUndefined() const {
        return isNull() || isUndefined();
    }
    [[nodiscard]] bool isBoolean() const { return tag() == Tag::BOOLEAN; }
    [[nodiscard]] bool isNumeric() const {
        return tag() == Tag::NUMBER || tag() == Tag::INT || tag() == Tag::UINT;
    }
    [[nodiscard]] bool isString() const { return tag() == Tag::STRING; }
    [[nodiscard]] bool isObject() const { return tag() == Tag::OBJECT; }
    [[nodiscard]] bool isArray() const { return tag() == Tag::ARRAY; }
    [[nodiscard]] bool isMap() const { return tag() == Tag::MAP; }
    [[nodiscard]] bool isCallback() const { return tag() == Tag::CALLBACK; }
    [[nodiscard]] bool isRef() const { return tag() == Tag::REF; }

    [[nodiscard]] bool toBoolean() const { return std::get<bool>(m_storage); }
    // Any numeric tag, converted to double
    [[nodiscard]] double toNumber() const;
    [[nodiscard]] const std::string& toString() const {
        return std::get<std::string>(m_storage);
    }
    [[nodiscard]] const std::shared_ptr<NativeInstance>& toObject() const {
        return std::get<std::shared_ptr<NativeInstance>>(m_storage);
    }
    [[nodiscard]] const ValueVector& toArray() const {
        return *std::get<std::shared_ptr<const ValueVector>>(m_storage);
    }
    [[nodiscard]] const ValueMap& toMap() const {
        return *std::get<std::shared_ptr<const ValueMap>>(m_storage);
    }
    [[nodiscard]] const std::shared_ptr<const Callable>& toCallback() const {
        return std::get<std::shared_ptr<const Callable>>(m_storage);
    }
    [[nodiscard]] const std::shared_ptr<RefCell>& toRef() const {
        return std::get<std::shared_ptr<RefCell>>(m_storage);
    }

    // Exact integer extraction; false if the value is not numeric, is not an
    // integer, or does not fit.
    [[nodiscard]] bool toInt64(int64_t* out) const;
    [[nodiscard]] bool toUint64(uint64_t* out) const;

    // Native address of an OBJECT value, nullptr for null/undefined
    [[nodiscard]] void* native_pointer() const;

    // Structural equality; objects compare by native address
    [[nodiscard]] bool equals(const Value& other) const;

    [[nodiscard]] std::string debug_string() const;
    [[nodiscard]] static const char* tag_name(Tag tag);

 private:
    Storage m_storage;
};

// Out-parameter box. The inner type is fixed either at creation or by the
// first call that uses the cell.
class GDYN_EXPORT RefCell {
 public:
    explicit RefCell(Value initial, TypeDescPtr type = nullptr)
        : m_value(std::move(initial)), m_type(std::move(type)) {}

    [[nodiscard]] const Value& value() const { return m_value; }
    void set_value(Value value) { m_value = std::move(value); }

    [[nodiscard]] const TypeDescPtr& type() const { return m_type; }

    GDYN_MARSHAL_RETURN_CONVENTION
    bool bind_type(const TypeDescPtr& type, GError** error);

 private:
    Value m_value;
    TypeDescPtr m_type;
};

// One argument of a native call
struct GDYN_EXPORT Argument {
    TypeDescPtr type;
    Value value;
    // Null is accepted for pointer types
    bool optional = false;
};

using ArgumentVector = std::vector<Argument>;

}  // namespace Gdyn
