/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stdint.h>

#include <initializer_list>
#include <string>
#include <utility>  // for move

#include <girepository/girepository.h>
#include <glib.h>

#include "gdyn/gdyn.h"
#include "gi/type-desc.h"
#include "test/gdyn-test-utils.h"

namespace Gdyn {
namespace Test {

static TypeDescPtr strv_type(GITransfer transfer) {
    return TypeDesc::array(TypeDesc::string(transfer),
                           ContainerKind::FLAT_ARRAY, transfer);
}

static Value strings(std::initializer_list<const char*> items) {
    ValueVector values;
    for (const char* item : items)
        values.push_back(Value::string(item));
    return Value::array(std::move(values));
}

static Value ints(std::initializer_list<int> items) {
    ValueVector values;
    for (int item : items)
        values.push_back(Value::from_int(item));
    return Value::array(std::move(values));
}

static void assert_int_array(const Value& value,
                             std::initializer_list<int> expected) {
    g_assert_true(value.isArray());
    const ValueVector& values = value.toArray();
    g_assert_cmpuint(values.size(), ==, expected.size());
    size_t ix = 0;
    for (int item : expected)
        assert_int_value(values[ix++], item);
}

static void test_strv(GdynUnitTestFixture*, const void*) {
    Value words = strings({"alpha", "beta", "gamma"});

    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_strv_length",
                          {{strv_type(GI_TRANSFER_NOTHING), words}}, int_type()),
                     3);

    Value copy = call(GDYN_TEST_PROGRAM, "gdyn_test_strv_copy",
                      {{strv_type(GI_TRANSFER_NOTHING), words}},
                      strv_type(GI_TRANSFER_EVERYTHING));
    g_assert_true(copy.equals(words));

    // Copying a copy changes nothing
    Value copy2 = call(GDYN_TEST_PROGRAM, "gdyn_test_strv_copy",
                       {{strv_type(GI_TRANSFER_NOTHING), copy}},
                       strv_type(GI_TRANSFER_EVERYTHING));
    g_assert_true(copy2.equals(words));

    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_strv_length",
                          {{strv_type(GI_TRANSFER_NOTHING), Value::null(), true}},
                          int_type()),
                     -1);
}

static void test_empty_strv(GdynUnitTestFixture*, const void*) {
    Value empty = Value::array({});

    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_strv_length",
                          {{strv_type(GI_TRANSFER_NOTHING), empty}}, int_type()),
                     0);

    Value copy = call(GDYN_TEST_PROGRAM, "gdyn_test_strv_copy",
                      {{strv_type(GI_TRANSFER_NOTHING), empty}},
                      strv_type(GI_TRANSFER_EVERYTHING));
    g_assert_true(copy.isArray());
    g_assert_cmpuint(copy.toArray().size(), ==, 0);

    Value returned = call(GDYN_TEST_PROGRAM, "gdyn_test_strv_empty", {},
                          strv_type(GI_TRANSFER_EVERYTHING));
    g_assert_true(returned.isArray());
    g_assert_cmpuint(returned.toArray().size(), ==, 0);
}

static void test_strv_rejects_null_elements(GdynUnitTestFixture*, const void*) {
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_strv_length",
                      {{strv_type(GI_TRANSFER_NOTHING),
                        Value::array({Value::string("a"), Value::null()})}},
                      int_type(), GDYN_ERROR_MARSHAL);
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_strv_length",
                      {{strv_type(GI_TRANSFER_NOTHING), Value::string("a")}},
                      int_type(), GDYN_ERROR_MARSHAL);
}

static void test_sized_array(GdynUnitTestFixture*, const void*) {
    ArrayOptions options;
    options.length_param_index = 1;
    auto type = TypeDesc::array(int_type(), ContainerKind::SIZED_ARRAY,
                                GI_TRANSFER_NOTHING, options);

    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_sum_array",
                          {{type, ints({1, 2, 3, 4})},
                           {int_type(), Value::from_int(4)}},
                          int_type()),
                     10);
}

static void test_fixed_array(GdynUnitTestFixture*, const void*) {
    ArrayOptions options;
    options.fixed_size = 3;
    auto type = TypeDesc::array(int_type(), ContainerKind::FIXED_ARRAY,
                                GI_TRANSFER_NOTHING, options);

    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_sum_fixed3",
                          {{type, ints({5, 6, 7})}}, int_type()),
                     18);

    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_sum_fixed3",
                      {{type, ints({5, 6})}}, int_type(), GDYN_ERROR_MARSHAL);
}

static void test_sized_return(GdynUnitTestFixture*, const void*) {
    ArrayOptions options;
    options.length_param_index = 1;
    auto type = TypeDesc::array(int_type(), ContainerKind::SIZED_ARRAY,
                                GI_TRANSFER_EVERYTHING, options);
    auto length_type = TypeDesc::reference(int_type());

    Value length = gdyn_create_ref(Value::undefined());
    Value range = call(GDYN_TEST_PROGRAM, "gdyn_test_range",
                       {{int_type(), Value::from_int(5)},
                        {length_type, length}},
                       type);
    assert_int_array(range, {0, 1, 2, 3, 4});
    assert_int_value(length.toRef()->value(), 5);

    range = call(GDYN_TEST_PROGRAM, "gdyn_test_range",
                 {{int_type(), Value::from_int(0)}, {length_type, length}},
                 type);
    assert_int_array(range, {});

    // The length argument must exist
    ArrayOptions bad_options;
    bad_options.length_param_index = 7;
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_range",
                      {{int_type(), Value::from_int(3)}, {length_type, length}},
                      TypeDesc::array(int_type(), ContainerKind::SIZED_ARRAY,
                                      GI_TRANSFER_EVERYTHING, bad_options),
                      GDYN_ERROR_INVALID_TYPE);
}

static void test_lists(GdynUnitTestFixture*, const void*) {
    auto int_list = [](GITransfer transfer) {
        return TypeDesc::array(int_type(), ContainerKind::DOUBLY_LINKED_LIST,
                               transfer);
    };

    Value range = call(GDYN_TEST_PROGRAM, "gdyn_test_list_range",
                       {{int_type(), Value::from_int(4)}},
                       int_list(GI_TRANSFER_CONTAINER));
    assert_int_array(range, {0, 1, 2, 3});

    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_list_sum",
                          {{int_list(GI_TRANSFER_NOTHING), range}}, int_type()),
                     6);

    Value empty = call(GDYN_TEST_PROGRAM, "gdyn_test_list_range",
                       {{int_type(), Value::from_int(0)}},
                       int_list(GI_TRANSFER_CONTAINER));
    assert_int_array(empty, {});

    auto word_list = [](GITransfer transfer) {
        return TypeDesc::array(TypeDesc::string(transfer),
                               ContainerKind::SINGLY_LINKED_LIST, transfer);
    };

    Value words = call(GDYN_TEST_PROGRAM, "gdyn_test_slist_words", {},
                       word_list(GI_TRANSFER_EVERYTHING));
    g_assert_true(words.equals(strings({"one", "two", "three"})));

    assert_string_value(call(GDYN_TEST_PROGRAM, "gdyn_test_slist_join",
                             {{word_list(GI_TRANSFER_NOTHING), words}},
                             TypeDesc::string(GI_TRANSFER_EVERYTHING)),
                        "one two three");
}

static void test_ptr_array(GdynUnitTestFixture*, const void*) {
    Value objects = call(
        GDYN_TEST_PROGRAM, "gdyn_test_ptr_array_objects",
        {{int_type(), Value::from_int(3)}},
        TypeDesc::array(test_object_type(GI_TRANSFER_EVERYTHING),
                        ContainerKind::POINTER_ARRAY, GI_TRANSFER_EVERYTHING));
    g_assert_true(objects.isArray());
    g_assert_cmpuint(objects.toArray().size(), ==, 3);

    // The references of the elements now belong to their wrappers
    for (const Value& object : objects.toArray())
        g_assert_cmpuint(refcount(object), ==, 1);
}

static void test_garray(GdynUnitTestFixture*, const void*) {
    auto type = [](GITransfer transfer) {
        return TypeDesc::array(TypeDesc::floating(64),
                               ContainerKind::BYTE_ARRAY, transfer);
    };

    Value doubles = call(GDYN_TEST_PROGRAM, "gdyn_test_garray_doubles",
                         {{int_type(), Value::from_int(4)}},
                         type(GI_TRANSFER_EVERYTHING));
    g_assert_true(doubles.isArray());
    g_assert_cmpuint(doubles.toArray().size(), ==, 4);
    assert_equal(doubles.toArray()[3].toNumber(), 1.5);

    Value sum = call(GDYN_TEST_PROGRAM, "gdyn_test_garray_sum",
                     {{type(GI_TRANSFER_NOTHING), doubles}},
                     TypeDesc::floating(64));
    assert_equal(sum.toNumber(), 3.0);
}

static void test_hash_tables(GdynUnitTestFixture*, const void*) {
    auto owned_string = TypeDesc::string(GI_TRANSFER_EVERYTHING);
    Value colors = call(
        GDYN_TEST_PROGRAM, "gdyn_test_hash_colors", {},
        TypeDesc::hash_table(owned_string, owned_string, GI_TRANSFER_EVERYTHING));
    g_assert_true(colors.isMap());
    g_assert_cmpuint(colors.toMap().size(), ==, 2);
    for (const auto& entry : colors.toMap()) {
        const std::string& key = entry.first.toString();
        if (key == "sky")
            assert_string_value(entry.second, "blue");
        else if (key == "grass")
            assert_string_value(entry.second, "green");
        else
            g_assert_not_reached();
    }

    auto int_map = TypeDesc::hash_table(TypeDesc::string(GI_TRANSFER_NOTHING),
                                        int_type(), GI_TRANSFER_NOTHING);
    Value counts = Value::map({{Value::string("apples"), Value::from_int(3)},
                               {Value::string("pears"), Value::from_int(8)}});
    assert_int_value(call(GDYN_TEST_PROGRAM, "gdyn_test_hash_lookup_int",
                          {{int_map, counts},
                           {TypeDesc::string(GI_TRANSFER_NOTHING),
                            Value::string("pears")}},
                          int_type()),
                     8);

    Value size = call(GDYN_TEST_PROGRAM, "gdyn_test_hash_size",
                      {{int_map, Value::map({})}}, int_type(32, false));
    assert_int_value(size, 0);

    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_hash_size",
                      {{int_map, ints({1})}}, int_type(32, false),
                      GDYN_ERROR_MARSHAL);
}

static unsigned n_tracked_alive() {
    Value count = call(GDYN_TEST_PROGRAM, "gdyn_test_n_tracked_alive", {},
                       int_type(32, false));
    uint64_t n;
    g_assert_true(count.toUint64(&n));
    return n;
}

static void test_conversion_failure_releases_elements(GdynUnitTestFixture*,
                                                      const void*) {
    auto table_type = TypeDesc::hash_table(
        TypeDesc::string(GI_TRANSFER_EVERYTHING),
        test_object_type(GI_TRANSFER_EVERYTHING), GI_TRANSFER_EVERYTHING);
    unsigned before = n_tracked_alive();

    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_tracked_table",
                      {{TypeDesc::boolean(), Value::boolean(true)}},
                      table_type, GDYN_ERROR_MARSHAL);
    g_assert_cmpuint(n_tracked_alive(), ==, before);

    call_expect_error(
        GDYN_TEST_PROGRAM, "gdyn_test_tracked_tables", {},
        TypeDesc::array(table_type, ContainerKind::DOUBLY_LINKED_LIST,
                        GI_TRANSFER_EVERYTHING),
        GDYN_ERROR_MARSHAL);
    g_assert_cmpuint(n_tracked_alive(), ==, before);

    // Converted tables keep their objects only as long as the values
    {
        Value table = call(GDYN_TEST_PROGRAM, "gdyn_test_tracked_table",
                           {{TypeDesc::boolean(), Value::boolean(false)}},
                           table_type);
        g_assert_cmpuint(table.toMap().size(), ==, 3);
        g_assert_cmpuint(n_tracked_alive(), ==, before + 3);
    }
    g_assert_cmpuint(n_tracked_alive(), ==, before);
}

void add_tests_for_collections() {
    GDYN_TEST_ADD("/collections/strv", test_strv);
    GDYN_TEST_ADD("/collections/strv/empty", test_empty_strv);
    GDYN_TEST_ADD("/collections/strv/invalid", test_strv_rejects_null_elements);
    GDYN_TEST_ADD("/collections/array/sized", test_sized_array);
    GDYN_TEST_ADD("/collections/array/fixed", test_fixed_array);
    GDYN_TEST_ADD("/collections/array/sized-return", test_sized_return);
    GDYN_TEST_ADD("/collections/lists", test_lists);
    GDYN_TEST_ADD("/collections/ptr-array", test_ptr_array);
    GDYN_TEST_ADD("/collections/garray", test_garray);
    GDYN_TEST_ADD("/collections/hash-table", test_hash_tables);
    GDYN_TEST_ADD("/collections/conversion-failure/releases-elements",
                  test_conversion_failure_releases_elements);
}

}  // namespace Test
}  // namespace Gdyn
