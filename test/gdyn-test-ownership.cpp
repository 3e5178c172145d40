/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stddef.h>  // for offsetof
#include <stdint.h>

#include <vector>

#include <girepository/girepository.h>
#include <glib-object.h>
#include <glib.h>

#include "gdyn/auto.h"
#include "gdyn/gdyn.h"
#include "gi/closure.h"
#include "gi/object.h"
#include "gi/type-desc.h"
#include "test/gdyn-test-utils.h"

namespace Gdyn {
namespace Test {

// Number of GObject wrappers alive in the identity cache
static size_t live_wrappers() { return ObjectInstance::cache_size(); }

static Value peek_singleton() {
    return call(GDYN_TEST_PROGRAM, "gdyn_test_object_peek_singleton", {},
                test_object_type(GI_TRANSFER_NOTHING));
}

static void drop_singleton() {
    call(GDYN_TEST_PROGRAM, "gdyn_test_object_drop_singleton", {});
}

static void test_owned_return(GdynUnitTestFixture*, const void*) {
    Value object = new_test_object();
    g_assert_cmpuint(refcount(object), ==, 1);
}

static void test_borrowed_return(GdynUnitTestFixture*, const void*) {
    {
        Value first = peek_singleton();
        // One reference for the singleton, one for the wrapper
        g_assert_cmpuint(refcount(first), ==, 2);

        Value second = peek_singleton();
        g_assert_true(first.toObject() == second.toObject());
        g_assert_cmpuint(refcount(second), ==, 2);
    }

    Value again = peek_singleton();
    g_assert_cmpuint(refcount(again), ==, 2);
    drop_singleton();
    g_assert_cmpuint(refcount(again), ==, 1);
}

static void test_owned_retrieval_of_cached_pointer(GdynUnitTestFixture*,
                                                   const void*) {
    {
        Value object = peek_singleton();
        unsigned initial = refcount(object);

        auto ref_type = test_object_type(GI_TRANSFER_EVERYTHING);
        Value extra1 = call(GDYN_TEST_LIBGOBJECT, "g_object_ref",
                            {{test_object_type(GI_TRANSFER_NOTHING), object}},
                            ref_type);
        Value extra2 = call(GDYN_TEST_LIBGOBJECT, "g_object_ref",
                            {{test_object_type(GI_TRANSFER_NOTHING), object}},
                            ref_type);
        g_assert_true(extra1.toObject() == object.toObject());
        g_assert_true(extra2.toObject() == object.toObject());
        g_assert_cmpuint(refcount(object), ==, initial + 2);
    }

    // All references held by the wrapper were released with it
    Value object = peek_singleton();
    g_assert_cmpuint(refcount(object), ==, 2);
    drop_singleton();
}

static void test_owned_argument(GdynUnitTestFixture*, const void*) {
    Value object = new_test_object();

    // The callee consumes the reference added for it
    call(GDYN_TEST_PROGRAM, "gdyn_test_object_consume",
         {{test_object_type(GI_TRANSFER_EVERYTHING), object}});
    g_assert_cmpuint(refcount(object), ==, 1);
}

static void test_floating_sink(GdynUnitTestFixture*, const void*) {
    Value object = call(GDYN_TEST_PROGRAM, "gdyn_test_new_floating", {},
                        test_object_type(GI_TRANSFER_NOTHING));
    g_assert_cmpuint(refcount(object), ==, 1);

    Value floating = call(GDYN_TEST_LIBGOBJECT, "g_object_is_floating",
                          {{test_object_type(GI_TRANSFER_NOTHING), object}},
                          TypeDesc::boolean());
    g_assert_false(floating.toBoolean());
}

static void test_identity_cache(GdynUnitTestFixture*, const void*) {
    size_t initial = live_wrappers();
    {
        Value object = new_test_object();
        g_assert_cmpuint(live_wrappers(), ==, initial + 1);

        Value child = new_test_object();
        call(GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
             {{test_object_type(GI_TRANSFER_NOTHING), object},
              {test_object_type(GI_TRANSFER_NOTHING), child}});

        Value same = call(GDYN_TEST_PROGRAM, "gdyn_test_object_get_child",
                          {{test_object_type(GI_TRANSFER_NOTHING), object}},
                          test_object_type(GI_TRANSFER_NOTHING));
        g_assert_true(same.toObject() == child.toObject());
        g_assert_cmpuint(live_wrappers(), ==, initial + 2);
    }
    g_assert_cmpuint(live_wrappers(), ==, initial);
}

static void test_null_property(GdynUnitTestFixture*, const void*) {
    Value object = new_test_object();
    auto borrowed = test_object_type(GI_TRANSFER_NOTHING);

    call(GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
         {{borrowed, object}, {borrowed, new_test_object()}});
    g_assert_true(call(GDYN_TEST_PROGRAM, "gdyn_test_object_get_child",
                       {{borrowed, object}}, borrowed)
                      .isObject());

    call(GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
         {{borrowed, object}, {borrowed, Value::null(), true}});
    Value child = call(GDYN_TEST_PROGRAM, "gdyn_test_object_get_child",
                       {{borrowed, object}}, borrowed);
    g_assert_true(child.isNull());

    // Null is rejected unless the argument is optional
    call_expect_error(GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
                      {{borrowed, object}, {borrowed, Value::null()}}, nullptr,
                      GDYN_ERROR_MARSHAL);
}

static void test_list_store_ownership(GdynUnitTestFixture*, const void*) {
    auto borrowed = test_object_type(GI_TRANSFER_NOTHING);
    Value store = call(GDYN_TEST_LIBGIO, "g_list_store_new",
                       {{int_type(64, false),
                         Value::from_uint(test_object_gtype())}},
                       test_object_type(GI_TRANSFER_EVERYTHING));
    Value item = new_test_object();
    unsigned initial = refcount(item);

    call(GDYN_TEST_LIBGIO, "g_list_store_append",
         {{borrowed, store}, {borrowed, item}});
    g_assert_cmpuint(refcount(item), ==, initial + 1);

    Value n_items = call(GDYN_TEST_LIBGIO, "g_list_model_get_n_items",
                         {{borrowed, store}}, int_type(32, false));
    assert_int_value(n_items, 1);

    // get_item returns a new reference, kept by the existing wrapper
    Value fetched = call(GDYN_TEST_LIBGIO, "g_list_model_get_item",
                         {{borrowed, store},
                          {int_type(32, false), Value::from_uint(0)}},
                         test_object_type(GI_TRANSFER_EVERYTHING));
    g_assert_true(fetched.toObject() == item.toObject());
    g_assert_cmpuint(refcount(item), ==, initial + 2);

    call(GDYN_TEST_LIBGIO, "g_list_store_remove",
         {{borrowed, store}, {int_type(32, false), Value::from_uint(0)}});
    g_assert_cmpuint(refcount(item), ==, initial + 1);
    assert_int_value(call(GDYN_TEST_LIBGIO, "g_list_model_get_n_items",
                          {{borrowed, store}}, int_type(32, false)),
                     0);

    // The same holds for each of several children in sequence
    std::vector<Value> children;
    std::vector<unsigned> initial_refs;
    for (unsigned ix = 0; ix < 5; ix++) {
        children.push_back(new_test_object());
        initial_refs.push_back(refcount(children.back()));

        call(GDYN_TEST_LIBGIO, "g_list_store_append",
             {{borrowed, store}, {borrowed, children.back()}});
        for (unsigned added = 0; added <= ix; added++)
            g_assert_cmpuint(refcount(children[added]), ==,
                             initial_refs[added] + 1);
    }
    assert_int_value(call(GDYN_TEST_LIBGIO, "g_list_model_get_n_items",
                          {{borrowed, store}}, int_type(32, false)),
                     5);

    for (unsigned ix = 0; ix < 5; ix++) {
        call(GDYN_TEST_LIBGIO, "g_list_store_remove",
             {{borrowed, store}, {int_type(32, false), Value::from_uint(0)}});
        for (unsigned child = 0; child < 5; child++) {
            unsigned expected = initial_refs[child] + (child > ix ? 1 : 0);
            g_assert_cmpuint(refcount(children[child]), ==, expected);
        }
    }
    assert_int_value(call(GDYN_TEST_LIBGIO, "g_list_model_get_n_items",
                          {{borrowed, store}}, int_type(32, false)),
                     0);
}

static void test_no_leaks(GdynUnitTestFixture*, const void*) {
    auto borrowed = test_object_type(GI_TRANSFER_NOTHING);
    Value object = new_test_object();
    Value child = new_test_object();
    unsigned object_refs = refcount(object);
    size_t wrappers = live_wrappers();

    for (unsigned ix = 0; ix < 500; ix++) {
        call(GDYN_TEST_PROGRAM, "gdyn_test_object_set_child",
             {{borrowed, object}, {borrowed, child}});
        Value read_back = call(GDYN_TEST_PROGRAM, "gdyn_test_object_get_child",
                               {{borrowed, object}}, borrowed);
        g_assert_true(read_back.toObject() == child.toObject());

        Value cell = gdyn_create_ref(Value::null());
        call(GDYN_TEST_PROGRAM, "gdyn_test_out_object",
             {{TypeDesc::reference(test_object_type(GI_TRANSFER_EVERYTHING)),
               cell}});
        g_assert_true(cell.toRef()->value().isObject());
    }

    g_assert_cmpuint(refcount(object), ==, object_refs);
    // The object holds one reference on its child
    g_assert_cmpuint(refcount(child), ==, 2);
    g_assert_cmpuint(live_wrappers(), ==, wrappers);
}

static void test_no_leaks_with_callbacks(GdynUnitTestFixture*, const void*) {
    auto borrowed = test_object_type(GI_TRANSFER_NOTHING);
    Value object = new_test_object();
    unsigned object_refs = refcount(object);
    size_t wrappers = live_wrappers();
    size_t closures = Closure::n_live();
    unsigned calls = 0;

    for (unsigned ix = 0; ix < 500; ix++) {
        Value source = Value::callback(
            [&calls](const ValueVector&, Value* rval, GError**) {
                calls++;
                *rval = Value::boolean(false);
                return true;
            });
        assert_int_value(
            call(GDYN_TEST_PROGRAM, "gdyn_test_invoke_source",
                 {{TypeDesc::callback(TrampolineKind::SOURCE), source}},
                 int_type()),
            1);

        Value handler = Value::callback(
            [&calls](const ValueVector& args, Value* rval, GError**) {
                g_assert_true(args[0].isObject());
                calls++;
                *rval = Value::from_int(0);
                return true;
            });
        Value id = call(GDYN_TEST_LIBGOBJECT, "g_signal_connect_closure",
                        {{borrowed, object},
                         {TypeDesc::string(GI_TRANSFER_NOTHING),
                          Value::string("ping")},
                         {TypeDesc::callback(TrampolineKind::CLOSURE), handler},
                         {TypeDesc::boolean(), Value::boolean(false)}},
                        int_type(64, false));
        call(GDYN_TEST_PROGRAM, "gdyn_test_object_emit_ping",
             {{borrowed, object}, {int_type(), Value::from_int(1)}},
             int_type());
        call(GDYN_TEST_LIBGOBJECT, "g_signal_handler_disconnect",
             {{borrowed, object}, {int_type(64, false), id}});
    }

    g_assert_cmpuint(calls, ==, 1000);
    g_assert_cmpuint(Closure::n_live(), ==, closures);
    g_assert_cmpuint(live_wrappers(), ==, wrappers);
    g_assert_cmpuint(refcount(object), ==, object_refs);
}

static void test_variant(GdynUnitTestFixture*, const void*) {
    auto borrowed = TypeDesc::variant(GI_TRANSFER_NOTHING);

    // The floating reference is sunk by the wrapper
    Value variant = call(GDYN_TEST_LIBGLIB, "g_variant_new_int32",
                         {{int_type(), Value::from_int(7)}}, borrowed);
    g_assert_true(variant.isObject());

    Value floating = call(GDYN_TEST_LIBGLIB, "g_variant_is_floating",
                          {{borrowed, variant}}, TypeDesc::boolean());
    g_assert_false(floating.toBoolean());

    assert_int_value(call(GDYN_TEST_LIBGLIB, "g_variant_get_int32",
                          {{borrowed, variant}}, int_type()),
                     7);
    assert_string_value(call(GDYN_TEST_LIBGLIB, "g_variant_get_type_string",
                             {{borrowed, variant}},
                             TypeDesc::string(GI_TRANSFER_NOTHING)),
                        "i");
}

static void test_fundamental(GdynUnitTestFixture*, const void*) {
    auto param_type = [](GITransfer transfer) {
        return TypeDesc::fundamental(transfer, GDYN_TEST_LIBGOBJECT,
                                     "g_param_spec_ref_sink",
                                     "g_param_spec_unref");
    };
    auto borrowed = param_type(GI_TRANSFER_NOTHING);
    auto string = TypeDesc::string(GI_TRANSFER_NOTHING);

    Value pspec = call(GDYN_TEST_LIBGOBJECT, "g_param_spec_int",
                       {{string, Value::string("count")},
                        {string, Value::null(), true},
                        {string, Value::null(), true},
                        {int_type(), Value::from_int(0)},
                        {int_type(), Value::from_int(10)},
                        {int_type(), Value::from_int(5)},
                        {int_type(), Value::from_int(G_PARAM_READWRITE)}},
                       borrowed);
    g_assert_true(pspec.isObject());

    auto ref_count = [&pspec]() {
        Value count;
        AutoError error;
        g_assert_true(gdyn_read(pspec, int_type(32, false),
                                offsetof(GParamSpec, ref_count), &count,
                                &error));
        g_assert_no_error(error);
        uint64_t retval;
        g_assert_true(count.toUint64(&retval));
        return retval;
    };

    // Sinking the floating reference makes it the wrapper's
    g_assert_cmpuint(ref_count(), ==, 1);

    assert_string_value(call(GDYN_TEST_LIBGOBJECT, "g_param_spec_get_name",
                             {{borrowed, pspec}}, string),
                        "count");

    Value same = call(GDYN_TEST_LIBGOBJECT, "g_param_spec_ref",
                      {{borrowed, pspec}}, param_type(GI_TRANSFER_EVERYTHING));
    g_assert_true(same.toObject() == pspec.toObject());
    g_assert_cmpuint(ref_count(), ==, 2);
}

void add_tests_for_ownership() {
    GDYN_TEST_ADD("/ownership/return/owned", test_owned_return);
    GDYN_TEST_ADD("/ownership/return/borrowed", test_borrowed_return);
    GDYN_TEST_ADD("/ownership/return/owned-cached",
                  test_owned_retrieval_of_cached_pointer);
    GDYN_TEST_ADD("/ownership/argument/owned", test_owned_argument);
    GDYN_TEST_ADD("/ownership/floating", test_floating_sink);
    GDYN_TEST_ADD("/ownership/identity-cache", test_identity_cache);
    GDYN_TEST_ADD("/ownership/null-property", test_null_property);
    GDYN_TEST_ADD("/ownership/list-store", test_list_store_ownership);
    GDYN_TEST_ADD("/ownership/no-leaks", test_no_leaks);
    GDYN_TEST_ADD("/ownership/no-leaks/callbacks",
                  test_no_leaks_with_callbacks);
    GDYN_TEST_ADD("/ownership/variant", test_variant);
    GDYN_TEST_ADD("/ownership/fundamental", test_fundamental);
}

}  // namespace Test
}  // namespace Gdyn
