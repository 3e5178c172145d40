/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>
#include <string.h>  // for strlen

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/gdyn.h"
#include "gi/type-desc.h"
#include "test/gdyn-test-utils.h"

#define VALID_UTF8_STRING "\303\211\303\226 foobar \343\203\237"

namespace Gdyn {
namespace Test {

template <typename T>
static void assert_integer_round_trip(const char* symbol, T value) {
    constexpr bool is_signed = std::numeric_limits<T>::is_signed;
    auto type = TypeDesc::integer(sizeof(T) * 8, is_signed);
    Value arg = is_signed ? Value::from_int(value) : Value::from_uint(value);

    Value retval = call(GDYN_TEST_PROGRAM, symbol, {{type, arg}}, type);

    if constexpr (is_signed) {
        int64_t result;
        g_assert_true(retval.toInt64(&result));
        g_assert_cmpint(result, ==, value);
    } else {
        uint64_t result;
        g_assert_true(retval.toUint64(&result));
        g_assert_cmpuint(result, ==, value);
    }
}

static void test_integers_round_trip(GdynUnitTestFixture*, const void*) {
    assert_integer_round_trip<int8_t>("gdyn_test_echo_int8", INT8_MIN);
    assert_integer_round_trip<int8_t>("gdyn_test_echo_int8", INT8_MAX);
    assert_integer_round_trip<uint8_t>("gdyn_test_echo_uint8", UINT8_MAX);
    assert_integer_round_trip<int16_t>("gdyn_test_echo_int16", INT16_MIN);
    assert_integer_round_trip<uint16_t>("gdyn_test_echo_uint16", UINT16_MAX);
    assert_integer_round_trip<int32_t>("gdyn_test_echo_int32", INT32_MIN);
    assert_integer_round_trip<int32_t>("gdyn_test_echo_int32", -1);
    assert_integer_round_trip<uint32_t>("gdyn_test_echo_uint32", UINT32_MAX);
    assert_integer_round_trip<int64_t>("gdyn_test_echo_int64", INT64_MIN);
    assert_integer_round_trip<int64_t>("gdyn_test_echo_int64", INT64_MAX);
    assert_integer_round_trip<uint64_t>("gdyn_test_echo_uint64", UINT64_MAX);
}

static void test_floats_round_trip(GdynUnitTestFixture*, const void*) {
    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_echo_float",
                        {{TypeDesc::floating(32), Value::number(1.5)}},
                        TypeDesc::floating(32));
    assert_equal(retval.toNumber(), 1.5);

    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_echo_double",
                  {{TypeDesc::floating(64), Value::number(-2.25e300)}},
                  TypeDesc::floating(64));
    assert_equal(retval.toNumber(), -2.25e300);

    // Integers are accepted for floating-point slots
    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_echo_double",
                  {{TypeDesc::floating(64), Value::from_int(7)}},
                  TypeDesc::floating(64));
    assert_equal(retval.toNumber(), 7.0);
}

static void test_booleans(GdynUnitTestFixture*, const void*) {
    for (bool b : {true, false}) {
        Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_echo_boolean",
                            {{TypeDesc::boolean(), Value::boolean(b)}},
                            TypeDesc::boolean());
        g_assert_true(retval.isBoolean());
        g_assert_cmpint(retval.toBoolean(), ==, b);

        retval = call(GDYN_TEST_PROGRAM, "gdyn_test_negate",
                      {{TypeDesc::boolean(), Value::boolean(b)}},
                      TypeDesc::boolean());
        g_assert_cmpint(retval.toBoolean(), ==, !b);
    }
}

static void test_mixed_arguments(GdynUnitTestFixture*, const void*) {
    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_mixed_sum",
                        {{int_type(8), Value::from_int(-1)},
                         {int_type(16), Value::from_int(1000)},
                         {int_type(32), Value::from_int(-100000)},
                         {int_type(64), Value::from_int(10000000000)},
                         {TypeDesc::floating(32), Value::number(0.5)},
                         {TypeDesc::floating(64), Value::number(0.25)}},
                        TypeDesc::floating(64));
    assert_equal(retval.toNumber(), 9999900999.75);
}

static void test_void_return(GdynUnitTestFixture*, const void*) {
    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_object_drop_singleton",
                        {}, TypeDesc::void_type());
    g_assert_true(retval.isUndefined());

    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_object_drop_singleton", {});
    g_assert_true(retval.isUndefined());
}

static void test_strings(GdynUnitTestFixture*, const void*) {
    auto borrowed = TypeDesc::string(GI_TRANSFER_NOTHING);

    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_concat",
                        {{borrowed, Value::string(VALID_UTF8_STRING)},
                         {borrowed, Value::string("!")}},
                        TypeDesc::string(GI_TRANSFER_EVERYTHING));
    assert_string_value(retval, VALID_UTF8_STRING "!");

    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_static_string", {}, borrowed);
    assert_string_value(retval, "static");

    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_string_length",
                  {{borrowed, Value::null(), true}}, int_type());
    assert_int_value(retval, -1);

    // The callee frees the string it is given
    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_string_consume",
                  {{TypeDesc::string(GI_TRANSFER_EVERYTHING),
                    Value::string("consumed")}},
                  int_type());
    assert_int_value(retval, 8);

    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_concat",
                  {{borrowed, Value::string("")}, {borrowed, Value::string("")}},
                  TypeDesc::string(GI_TRANSFER_EVERYTHING));
    assert_string_value(retval, "");
    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_string_length",
                          {{borrowed, Value::string("")}}, int_type()),
                     0);

    std::string long_string;
    for (size_t ix = 0; ix < 64 * 1024; ix++)
        long_string.push_back('a' + ix % 26);
    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_concat",
                  {{borrowed, Value::string(long_string)},
                   {borrowed, Value::string(VALID_UTF8_STRING)}},
                  TypeDesc::string(GI_TRANSFER_EVERYTHING));
    g_assert_true(retval.isString());
    g_assert_cmpuint(retval.toString().size(), ==,
                     long_string.size() + strlen(VALID_UTF8_STRING));
    g_assert_true(retval.toString() == long_string + VALID_UTF8_STRING);
}

static void test_null_descriptor(GdynUnitTestFixture*, const void*) {
    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_is_null",
                        {{TypeDesc::null(), Value::undefined()}},
                        TypeDesc::boolean());
    g_assert_true(retval.toBoolean());
}

static void test_marshal_errors(GdynUnitTestFixture*, const void*) {
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int8",
                      {{int_type(8), Value::from_int(128)}}, int_type(8),
                      GDYN_ERROR_MARSHAL);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_uint8",
                      {{int_type(8, false), Value::from_int(-1)}},
                      int_type(8, false), GDYN_ERROR_MARSHAL);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int32",
                      {{int_type(), Value::number(1.5)}}, int_type(),
                      GDYN_ERROR_MARSHAL);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int32",
                      {{int_type(), Value::string("1")}}, int_type(),
                      GDYN_ERROR_MARSHAL);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_boolean",
                      {{TypeDesc::boolean(), Value::from_int(1)}},
                      TypeDesc::boolean(), GDYN_ERROR_MARSHAL);

    auto borrowed = TypeDesc::string(GI_TRANSFER_NOTHING);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_string_length",
                      {{borrowed, Value::string("\xff\xfe")}}, int_type(),
                      GDYN_ERROR_MARSHAL);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_string_length",
                      {{borrowed, Value::null()}}, int_type(),
                      GDYN_ERROR_MARSHAL);
}

static void test_marshal_error_releases_converted(GdynUnitTestFixture*,
                                                  const void*) {
    Value object = new_test_object();
    unsigned initial = refcount(object);

    // The first argument is converted, with a reference for the callee,
    // before the second one fails
    call_expect_error(
        GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
        {{test_object_type(GI_TRANSFER_EVERYTHING), object},
         {test_object_type(GI_TRANSFER_NOTHING), Value::string("child")}},
        nullptr, GDYN_ERROR_MARSHAL);

    g_assert_cmpuint(refcount(object), ==, initial);
}

static void test_symbol_resolution_errors(GdynUnitTestFixture*, const void*) {
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_does_not_exist", {},
                      nullptr, GDYN_ERROR_SYMBOL_RESOLUTION);
    call_expect_error("libgdyn-does-not-exist.so.0", "g_free", {}, nullptr,
                      GDYN_ERROR_SYMBOL_RESOLUTION);
}

static void test_library_candidates(GdynUnitTestFixture*, const void*) {
    // The first loadable candidate is used
    Value retval = call("libgdyn-does-not-exist.so.0, " GDYN_TEST_LIBGLIB,
                        "g_str_has_prefix",
                        {{TypeDesc::string(GI_TRANSFER_NOTHING),
                          Value::string("gdyn engine")},
                         {TypeDesc::string(GI_TRANSFER_NOTHING),
                          Value::string("gdyn")}},
                        TypeDesc::boolean());
    g_assert_true(retval.toBoolean());
}

static void test_invalid_descriptors(GdynUnitTestFixture*, const void*) {
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int32",
                      {{TypeDesc::integer(24, true), Value::from_int(1)}},
                      int_type(), GDYN_ERROR_INVALID_TYPE);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int32",
                      {{TypeDesc::void_type(), Value::undefined()}},
                      int_type(), GDYN_ERROR_INVALID_TYPE);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int32",
                      {{int_type(), Value::from_int(1)}},
                      TypeDesc::reference(int_type()),
                      GDYN_ERROR_INVALID_TYPE);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_echo_int32",
                      {{nullptr, Value::from_int(1)}}, int_type(),
                      GDYN_ERROR_INVALID_TYPE);

    // GArray stride narrower than its items
    ArrayOptions narrow;
    narrow.element_size = 4;
    ValueVector numbers;
    for (int ix = 0; ix < 4; ix++)
        numbers.push_back(Value::from_int(ix));
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_garray_sum",
                      {{TypeDesc::array(TypeDesc::integer(64, true),
                                        ContainerKind::BYTE_ARRAY,
                                        GI_TRANSFER_NOTHING, narrow),
                        Value::array(std::move(numbers))}},
                      TypeDesc::floating(64), GDYN_ERROR_INVALID_TYPE);
}

static void test_out_parameters(GdynUnitTestFixture*, const void*) {
    Value quotient = gdyn_create_ref(Value::undefined());
    Value remainder = gdyn_create_ref(Value::undefined());
    Value error_out = gdyn_create_ref(Value::null());
    auto error_type = TypeDesc::reference(
        TypeDesc::boxed(GI_TRANSFER_EVERYTHING, "GError", GDYN_TEST_LIBGOBJECT,
                        "g_error_get_type"));

    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_divide",
                        {{int_type(), Value::from_int(17)},
                         {int_type(), Value::from_int(5)},
                         {TypeDesc::reference(int_type()), quotient},
                         {TypeDesc::reference(int_type()), remainder},
                         {error_type, error_out}},
                        TypeDesc::boolean());
    g_assert_true(retval.toBoolean());
    assert_int_value(quotient.toRef()->value(), 3);
    assert_int_value(remainder.toRef()->value(), 2);
    g_assert_true(error_out.toRef()->value().isNull());

    // A null reference is an output nobody wants
    retval = call(GDYN_TEST_PROGRAM, "gdyn_test_divide",
                  {{int_type(), Value::from_int(1)},
                   {int_type(), Value::from_int(0)},
                   {TypeDesc::reference(int_type()), Value::null()},
                   {TypeDesc::reference(int_type()), Value::null()},
                   {error_type, error_out}},
                  TypeDesc::boolean());
    g_assert_false(retval.toBoolean());

    const Value& native_error = error_out.toRef()->value();
    g_assert_true(native_error.isObject());
    auto* gerror = static_cast<GError*>(native_error.native_pointer());
    g_assert_error(gerror, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT);
    g_assert_cmpstr(gerror->message, ==, "Division by zero");
}

static void test_inout_parameters(GdynUnitTestFixture*, const void*) {
    Value number = gdyn_create_ref(Value::from_int(21));
    call(GDYN_TEST_PROGRAM, "gdyn_test_double_inout",
         {{TypeDesc::reference(int_type()), number}});
    assert_int_value(number.toRef()->value(), 42);

    auto owned_string = TypeDesc::string(GI_TRANSFER_EVERYTHING);
    Value text = gdyn_create_ref(Value::string("shout"));
    call(GDYN_TEST_PROGRAM, "gdyn_test_upcase_inout",
         {{TypeDesc::reference(owned_string), text}});
    assert_string_value(text.toRef()->value(), "SHOUT");

    Value out = gdyn_create_ref(Value::undefined());
    call(GDYN_TEST_PROGRAM, "gdyn_test_out_string",
         {{TypeDesc::reference(owned_string), out}});
    assert_string_value(out.toRef()->value(), "out");

    Value static_out = gdyn_create_ref(Value::undefined());
    call(GDYN_TEST_PROGRAM, "gdyn_test_out_static_string",
         {{TypeDesc::reference(TypeDesc::string(GI_TRANSFER_NOTHING)),
           static_out}});
    assert_string_value(static_out.toRef()->value(), "static out");
}

static void test_reference_type_is_latched(GdynUnitTestFixture*,
                                           const void*) {
    Value number = gdyn_create_ref(Value::from_int(1));
    call(GDYN_TEST_PROGRAM, "gdyn_test_double_inout",
         {{TypeDesc::reference(int_type()), number}});

    call_expect_error(
        GDYN_TEST_PROGRAM, "gdyn_test_double_inout",
        {{TypeDesc::reference(TypeDesc::integer(32, false)), number}}, nullptr,
        GDYN_ERROR_MARSHAL);

    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_double_inout",
                      {{TypeDesc::reference(int_type()), Value::from_int(1)}},
                      nullptr, GDYN_ERROR_MARSHAL);
}

static void test_caller_allocated_reference(GdynUnitTestFixture*,
                                            const void*) {
    AutoError error;
    Value rect;
    g_assert_true(gdyn_alloc(2 * sizeof(int32_t), "GdynTestRect",
                             GDYN_TEST_PROGRAM, &rect, &error));
    g_assert_no_error(error);

    auto rect_type = TypeDesc::boxed(GI_TRANSFER_NOTHING, "GdynTestRect",
                                     GDYN_TEST_PROGRAM,
                                     "gdyn_test_rect_get_type");
    Value cell = gdyn_create_ref(rect);
    call(GDYN_TEST_PROGRAM, "gdyn_test_fill_rect",
         {{TypeDesc::reference(rect_type), cell},
          {int_type(), Value::from_int(3)},
          {int_type(), Value::from_int(4)}});

    // Filled in place
    g_assert_true(cell.toRef()->value().native_pointer() ==
                  rect.native_pointer());
    Value area = call(GDYN_TEST_PROGRAM, "gdyn_test_rect_area",
                      {{rect_type, rect}}, int_type());
    assert_int_value(area, 12);
}

static void test_batch_call(GdynUnitTestFixture*, const void*) {
    Value object = new_test_object();
    Value child = new_test_object();
    auto borrowed = test_object_type(GI_TRANSFER_NOTHING);

    AutoError error;
    std::vector<Call> calls{
        {GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
         {{borrowed, object}, {borrowed, child}}},
        {GDYN_TEST_PROGRAM, "gdyn_test_object_drop_singleton", {}},
    };
    g_assert_true(gdyn_batch_call(calls, &error));
    g_assert_no_error(error);

    Value retval = call(GDYN_TEST_PROGRAM, "gdyn_test_object_get_child",
                        {{borrowed, object}}, borrowed);
    g_assert_true(retval.equals(child));

    // Stops at the first failure
    Value number = gdyn_create_ref(Value::from_int(1));
    std::vector<Call> failing{
        {GDYN_TEST_PROGRAM, "gdyn_test_double_inout",
         {{TypeDesc::reference(int_type()), number}}},
        {GDYN_TEST_PROGRAM, "gdyn_test_does_not_exist", {}},
        {GDYN_TEST_PROGRAM, "gdyn_test_double_inout",
         {{TypeDesc::reference(int_type()), number}}},
    };
    g_assert_false(gdyn_batch_call(failing, &error));
    g_assert_error(error, GDYN_ERROR, GDYN_ERROR_SYMBOL_RESOLUTION);
    assert_int_value(number.toRef()->value(), 2);
}

void add_tests_for_call() {
    GDYN_TEST_ADD("/call/integers/round-trip", test_integers_round_trip);
    GDYN_TEST_ADD("/call/floats/round-trip", test_floats_round_trip);
    GDYN_TEST_ADD("/call/booleans", test_booleans);
    GDYN_TEST_ADD("/call/mixed-arguments", test_mixed_arguments);
    GDYN_TEST_ADD("/call/void-return", test_void_return);
    GDYN_TEST_ADD("/call/strings", test_strings);
    GDYN_TEST_ADD("/call/null-descriptor", test_null_descriptor);
    GDYN_TEST_ADD("/call/errors/marshal", test_marshal_errors);
    GDYN_TEST_ADD("/call/errors/marshal-releases-converted",
                  test_marshal_error_releases_converted);
    GDYN_TEST_ADD("/call/errors/symbol-resolution",
                  test_symbol_resolution_errors);
    GDYN_TEST_ADD("/call/errors/invalid-descriptors", test_invalid_descriptors);
    GDYN_TEST_ADD("/call/library-candidates", test_library_candidates);
    GDYN_TEST_ADD("/call/reference/out", test_out_parameters);
    GDYN_TEST_ADD("/call/reference/inout", test_inout_parameters);
    GDYN_TEST_ADD("/call/reference/latched-type",
                  test_reference_type_is_latched);
    GDYN_TEST_ADD("/call/reference/caller-allocated",
                  test_caller_allocated_reference);
    GDYN_TEST_ADD("/call/batch", test_batch_call);
}

}  // namespace Test
}  // namespace Gdyn
