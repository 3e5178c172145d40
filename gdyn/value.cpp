/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <math.h>
#include <stdint.h>

#include <limits>
#include <string>
#include <utility>  // for move

#include <glib.h>

#include "gdyn/error-types.h"
#include "gdyn/value.h"
#include "gi/type-desc.h"
#include "gi/wrapper.h"

namespace Gdyn {

Value Value::object(std::shared_ptr<NativeInstance> instance) {
    if (!instance)
        return Value::null();
    return Value{std::move(instance)};
}

Value Value::array(ValueVector elements) {
    return Value{std::shared_ptr<const ValueVector>{
        std::make_shared<ValueVector>(std::move(elements))}};
}

Value Value::map(ValueMap entries) {
    return Value{std::shared_ptr<const ValueMap>{
        std::make_shared<ValueMap>(std::move(entries))}};
}

Value Value::callback(Callable callable) {
    return Value{std::shared_ptr<const Callable>{
        std::make_shared<Callable>(std::move(callable))}};
}

Value Value::ref(std::shared_ptr<RefCell> cell) {
    return Value{std::move(cell)};
}

double Value::toNumber() const {
    switch (tag()) {
        case Tag::NUMBER:
            return std::get<double>(m_storage);
        case Tag::INT:
            return static_cast<double>(std::get<int64_t>(m_storage));
        case Tag::UINT:
            return static_cast<double>(std::get<uint64_t>(m_storage));
        default:
            g_return_val_if_reached(0.0);
    }
}

bool Value::toInt64(int64_t* out) const {
    switch (tag()) {
        case Tag::INT:
            *out = std::get<int64_t>(m_storage);
            return true;
        case Tag::UINT: {
            uint64_t u = std::get<uint64_t>(m_storage);
            if (u > uint64_t(std::numeric_limits<int64_t>::max()))
                return false;
            *out = static_cast<int64_t>(u);
            return true;
        }
        case Tag::NUMBER: {
            double d = std::get<double>(m_storage);
            // 2^63 is exactly representable, anything at or past it is not
            if (!isfinite(d) || trunc(d) != d || d < -9223372036854775808.0 ||
                d >= 9223372036854775808.0)
                return false;
            *out = static_cast<int64_t>(d);
            return true;
        }
        default:
            return false;
    }
}

bool Value::toUint64(uint64_t* out) const {
    switch (tag()) {
        case Tag::UINT:
            *out = std::get<uint64_t>(m_storage);
            return true;
        case Tag::INT: {
            int64_t i = std::get<int64_t>(m_storage);
            if (i < 0)
                return false;
            *out = static_cast<uint64_t>(i);
            return true;
        }
        case Tag::NUMBER: {
            double d = std::get<double>(m_storage);
            if (!isfinite(d) || trunc(d) != d || d < 0.0 ||
                d >= 18446744073709551616.0)
                return false;
            *out = static_cast<uint64_t>(d);
            return true;
        }
        default:
            return false;
    }
}

void* Value::native_pointer() const {
    if (!isObject())
        return nullptr;
    return toObject()->ptr();
}

bool Value::equals(const Value& other) const {
    if (isNumeric() && other.isNumeric()) {
        int64_t a, b;
        uint64_t ua, ub;
        if (toInt64(&a) && other.toInt64(&b))
            return a == b;
        if (toUint64(&ua) && other.toUint64(&ub))
            return ua == ub;
        return toNumber() == other.toNumber();
    }

    if (tag() != other.tag())
        return false;

    switch (tag()) {
        case Tag::UNDEFINED:
        case Tag::NULL_VALUE:
            return true;
        case Tag::BOOLEAN:
            return toBoolean() == other.toBoolean();
        case Tag::STRING:
            return toString() == other.toString();
        case Tag::OBJECT:
            return native_pointer() == other.native_pointer();
        case Tag::ARRAY: {
            const ValueVector& a = toArray();
            const ValueVector& b = other.toArray();
            if (a.size() != b.size())
                return false;
            for (size_t ix = 0; ix < a.size(); ix++) {
                if (!a[ix].equals(b[ix]))
                    return false;
            }
            return true;
        }
        case Tag::MAP: {
            const ValueMap& a = toMap();
            const ValueMap& b = other.toMap();
            if (a.size() != b.size())
                return false;
            for (size_t ix = 0; ix < a.size(); ix++) {
                if (!a[ix].first.equals(b[ix].first) ||
                    !a[ix].second.equals(b[ix].second))
                    return false;
            }
            return true;
        }
        case Tag::CALLBACK:
            return toCallback() == other.toCallback();
        case Tag::REF:
            return toRef() == other.toRef();
        case Tag::NUMBER:
        case Tag::INT:
        case Tag::UINT:
            break;
    }
    g_return_val_if_reached(false);
}

const char* Value::tag_name(Tag tag) {
    switch (tag) {
        case Tag::UNDEFINED:
            return "undefined";
        case Tag::NULL_VALUE:
            return "null";
        case Tag::BOOLEAN:
            return "boolean";
        case Tag::NUMBER:
            return "number";
        case Tag::INT:
            return "int";
        case Tag::UINT:
            return "uint";
        case Tag::STRING:
            return "string";
        case Tag::OBJECT:
            return "object";
        case Tag::ARRAY:
            return "array";
        case Tag::MAP:
            return "map";
        case Tag::CALLBACK:
            return "callback";
        case Tag::REF:
            return "ref";
    }
    g_return_val_if_reached("invalid");
}

std::string Value::debug_string() const {
    switch (tag()) {
        case Tag::BOOLEAN:
            return toBoolean() ? "true" : "false";
        case Tag::NUMBER:
            return std::to_string(std::get<double>(m_storage));
        case Tag::INT:
            return std::to_string(std::get<int64_t>(m_storage));
        case Tag::UINT:
            return std::to_string(std::get<uint64_t>(m_storage));
        case Tag::STRING:
            return "\"" + toString() + "\"";
        case Tag::OBJECT:
            return toObject()->format_name();
        case Tag::ARRAY:
            return "[array of " + std::to_string(toArray().size()) + "]";
        case Tag::MAP:
            return "{map of " + std::to_string(toMap().size()) + "}";
        case Tag::REF:
            return "ref(" + toRef()->value().debug_string() + ")";
        default:
            return tag_name(tag());
    }
}

bool RefCell::bind_type(const TypeDescPtr& type, GError** error) {
    if (!m_type) {
        m_type = type;
        return true;
    }
    if (m_type->equals(*type))
        return true;

    g_set_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL,
                "Reference cell holds %s, cannot be used as %s",
                m_type->to_string().c_str(), type->to_string().c_str());
    return false;
}

}  // namespace Gdyn
