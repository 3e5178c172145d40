/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stddef.h>  // for offsetof
#include <stdint.h>
#include <string.h>  // for strlen

#include <string>

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/gdyn.h"
#include "gi/type-desc.h"
#include "test/gdyn-test-natives.h"
#include "test/gdyn-test-utils.h"

namespace Gdyn {
namespace Test {

static Value new_point(int x, int y) {
    Value point = call(GDYN_TEST_PROGRAM, "gdyn_test_point_new",
                       {{int_type(), Value::from_int(x)},
                        {int_type(), Value::from_int(y)}},
                       TypeDesc::structure(GI_TRANSFER_EVERYTHING,
                                           "GdynTestPoint",
                                           sizeof(GdynTestPoint)));
    g_assert_true(point.isObject());
    return point;
}

static Value read_field(const Value& handle, const TypeDescPtr& type,
                        size_t offset) {
    AutoError error;
    Value retval;
    g_assert_true(gdyn_read(handle, type, offset, &retval, &error));
    g_assert_no_error(error);
    return retval;
}

static void write_field(const Value& handle, const TypeDescPtr& type,
                        size_t offset, const Value& value) {
    AutoError error;
    g_assert_true(gdyn_write(handle, type, offset, value, &error));
    g_assert_no_error(error);
}

static void test_read_write_scalars(GdynUnitTestFixture*, const void*) {
    Value point = new_point(3, 4);

    assert_int_value(read_field(point, int_type(), offsetof(GdynTestPoint, x)),
                     3);
    assert_int_value(read_field(point, int_type(), offsetof(GdynTestPoint, y)),
                     4);

    write_field(point, int_type(), offsetof(GdynTestPoint, x),
                Value::from_int(-30));
    write_field(point, TypeDesc::floating(64),
                offsetof(GdynTestPoint, weight), Value::number(0.75));
    write_field(point, TypeDesc::boolean(), offsetof(GdynTestPoint, visible),
                Value::boolean(true));

    Value sum = call(GDYN_TEST_PROGRAM, "gdyn_test_point_sum",
                     {{TypeDesc::structure(GI_TRANSFER_NOTHING,
                                           "GdynTestPoint"),
                       point}},
                     int_type());
    assert_int_value(sum, -26);

    assert_equal(read_field(point, TypeDesc::floating(64),
                            offsetof(GdynTestPoint, weight))
                     .toNumber(),
                 0.75);
    g_assert_true(read_field(point, TypeDesc::boolean(),
                             offsetof(GdynTestPoint, visible))
                      .toBoolean());

    auto* native = static_cast<GdynTestPoint*>(point.native_pointer());
    g_assert_cmpint(native->x, ==, -30);
    g_assert_true(native->visible);
}

static void test_read_write_string(GdynUnitTestFixture*, const void*) {
    Value point = new_point(0, 0);
    auto string_type = TypeDesc::string(GI_TRANSFER_NOTHING);
    size_t offset = offsetof(GdynTestPoint, label);

    g_assert_true(read_field(point, string_type, offset).isNull());

    write_field(point, string_type, offset, Value::string("origin"));
    assert_string_value(read_field(point, string_type, offset), "origin");

    // The field owns a copy
    auto* native = static_cast<GdynTestPoint*>(point.native_pointer());
    g_assert_cmpstr(native->label, ==, "origin");
    g_clear_pointer(&native->label, g_free);

    write_field(point, string_type, offset, Value::string(""));
    Value empty = read_field(point, string_type, offset);
    g_assert_true(empty.isString());
    assert_string_value(empty, "");
    g_clear_pointer(&native->label, g_free);

    std::string long_label(64 * 1024, 'x');
    long_label += "\303\211\303\226";
    write_field(point, string_type, offset, Value::string(long_label));
    Value read_back = read_field(point, string_type, offset);
    g_assert_true(read_back.isString());
    g_assert_true(read_back.toString() == long_label);
    g_assert_cmpuint(strlen(native->label), ==, long_label.size());
    g_clear_pointer(&native->label, g_free);
}

static void test_write_errors(GdynUnitTestFixture*, const void*) {
    Value point = new_point(0, 0);
    AutoError error;

    g_assert_false(gdyn_write(point, int_type(8), 0, Value::from_int(1000),
                              &error));
    g_assert_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL);
    error.reset();

    g_assert_false(gdyn_write(point, TypeDesc::variant(GI_TRANSFER_NOTHING), 0,
                              Value::null(), &error));
    g_assert_error(error, GDYN_ERROR, GDYN_ERROR_INVALID_TYPE);
    error.reset();

    Value retval;
    g_assert_false(gdyn_read(Value::null(), int_type(), 0, &retval, &error));
    g_assert_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL);
}

static void test_read_object_field(GdynUnitTestFixture*, const void*) {
    Value object = new_test_object();
    Value holder;
    AutoError error;
    g_assert_true(gdyn_alloc(sizeof(void*), nullptr, nullptr, &holder, &error));

    auto object_type = test_object_type(GI_TRANSFER_NOTHING);
    write_field(holder, object_type, 0, object);
    unsigned initial = refcount(object);

    // A borrowed read returns the existing wrapper
    Value read_back = read_field(holder, object_type, 0);
    g_assert_true(read_back.toObject() == object.toObject());
    g_assert_cmpuint(refcount(object), ==, initial);

    write_field(holder, object_type, 0, Value::null());
    g_assert_true(read_field(holder, object_type, 0).isNull());
}

static void test_alloc(GdynUnitTestFixture*, const void*) {
    AutoError error;
    Value plain;
    g_assert_true(gdyn_alloc(sizeof(GdynTestPoint), "GdynTestPoint", nullptr,
                             &plain, &error));
    g_assert_no_error(error);
    g_assert_true(plain.isObject());
    assert_int_value(read_field(plain, int_type(), offsetof(GdynTestPoint, y)),
                     0);

    // Registered boxed types are freed with g_boxed_free()
    g_assert_true(g_type_is_a(GDYN_TEST_TYPE_RECT, G_TYPE_BOXED));
    Value rect;
    g_assert_true(gdyn_alloc(sizeof(GdynTestRect), "GdynTestRect",
                             GDYN_TEST_PROGRAM, &rect, &error));
    g_assert_no_error(error);
    g_assert_cmpstr(rect.toObject()->type_name(), ==, "GdynTestRect");

    g_assert_false(gdyn_alloc(0, nullptr, nullptr, &rect, &error));
    g_assert_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL);
}

static void test_pointer_fields(GdynUnitTestFixture*, const void*) {
    Value point = new_point(0, 0);
    auto* native = static_cast<GdynTestPoint*>(point.native_pointer());
    native->samples = g_new0(int16_t, 4);
    native->samples[2] = -5;

    AutoError error;
    Value element;
    g_assert_true(gdyn_read_pointer(point, offsetof(GdynTestPoint, samples),
                                    2 * sizeof(int16_t), &element, &error));
    g_assert_no_error(error);
    assert_int_value(read_field(element, int_type(16), 0), -5);

    Value source;
    g_assert_true(gdyn_alloc(sizeof(int16_t), nullptr, nullptr, &source,
                             &error));
    write_field(source, int_type(16), 0, Value::from_int(77));
    g_assert_true(gdyn_write_pointer(point, offsetof(GdynTestPoint, samples),
                                     3 * sizeof(int16_t), source,
                                     sizeof(int16_t), &error));
    g_assert_no_error(error);
    g_assert_cmpint(native->samples[3], ==, 77);

    g_clear_pointer(&native->samples, g_free);

    g_assert_true(gdyn_read_pointer(point, offsetof(GdynTestPoint, samples), 0,
                                    &element, &error));
    g_assert_true(element.isNull());

    g_assert_false(gdyn_write_pointer(point, offsetof(GdynTestPoint, samples),
                                      0, source, sizeof(int16_t), &error));
    g_assert_error(error, GDYN_ERROR, GDYN_ERROR_MARSHAL);
}

static void test_native_id(GdynUnitTestFixture*, const void*) {
    Value object = new_test_object();
    AutoError error;
    Value id;
    g_assert_true(gdyn_get_native_id(object, &id, &error));
    g_assert_no_error(error);

    uint64_t address;
    g_assert_true(id.toUint64(&address));
    g_assert_true(reinterpret_cast<void*>(address) == object.native_pointer());
}

void add_tests_for_memory() {
    GDYN_TEST_ADD("/memory/read-write/scalars", test_read_write_scalars);
    GDYN_TEST_ADD("/memory/read-write/string", test_read_write_string);
    GDYN_TEST_ADD("/memory/read-write/object", test_read_object_field);
    GDYN_TEST_ADD("/memory/write/errors", test_write_errors);
    GDYN_TEST_ADD("/memory/alloc", test_alloc);
    GDYN_TEST_ADD("/memory/pointer-fields", test_pointer_fields);
    GDYN_TEST_ADD("/memory/native-id", test_native_id);
}

}  // namespace Test
}  // namespace Gdyn
