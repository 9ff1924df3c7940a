#include <long-bytes/array_ref.hh>
#include <long-bytes/error.hh>
#include <long-bytes/linked_byte_array.hh>
#include <long-bytes/long_byte_array.hh>

#include <nexus/test.hh>

#include "test-helpers.hh"

#include <vector>

using lb::test::no_error;
using lb::test::same_bytes;
using lb::test::throws;
using lb::test::value;

TEST("linked_byte_array - projection onto the base")
{
    auto const arr = lb::long_byte_array::create(100, 16);
    for (lb::isize i = 0; i < 100; ++i)
        arr->put(i, lb::test::pattern_at(i));

    auto const view = lb::linked_byte_array::create(arr, 40, 20);
    CHECK(view->length() == 20);
    CHECK(view->offset() == 40);

    for (lb::isize i = 0; i < view->length(); ++i)
        CHECK(value(view->get(i)) == value(arr->get(40 + i)));

    SECTION("writes go to the base")
    {
        view->put(0, lb::byte(0xEE));
        CHECK(value(arr->get(40)) == 0xEE);
    }

    SECTION("writes to the base are seen by the view")
    {
        arr->put(59, lb::byte(0xDD));
        CHECK(value(view->get(19)) == 0xDD);
    }

    SECTION("bounds are the view's own")
    {
        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)view->get(20); }));
        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)view->get(-1); }));
        CHECK(throws(lb::error_kind::out_of_range, [&] { view->put(20, lb::byte(1)); }));

        // element 60 of the base is valid, but not through the view
        CHECK(no_error([&] { (void)arr->get(60); }));
        CHECK(value(arr->get(60)) == value(lb::test::pattern_at(60)));
    }
}

TEST("linked_byte_array - a view reads exactly like get_sub_array")
{
    auto const arr = lb::long_byte_array::create(500, 64);
    arr->put(10, lb::byte(1));
    arr->put(200, lb::byte(2));
    arr->put(499, lb::byte(3));

    auto const view = lb::linked_byte_array::create(arr, 5, 490);
    CHECK(same_bytes(view->to_regular_array(), arr->get_sub_array(5, 490)));
    CHECK(same_bytes(view->get_sub_array(100, 200), arr->get_sub_array(105, 200)));
}

TEST("linked_byte_array - chains add offsets")
{
    auto const arr = lb::long_byte_array::create(100);
    auto const mid = lb::linked_byte_array::create(arr, 40, 20);
    auto const inner = lb::linked_byte_array::create(mid, 5, 10);

    inner->put(0, lb::byte(7));
    CHECK(value(arr->get(45)) == 7);
    CHECK(value(mid->get(5)) == 7);

    arr->put(54, lb::byte(8));
    CHECK(value(inner->get(9)) == 8);

    CHECK(throws(lb::error_kind::out_of_range, [&] { (void)inner->get(10); }));

    CHECK(inner->linked_to().is_view());
    CHECK(inner->linked_to().as_view() == mid);
    CHECK(mid->linked_to().as_array() == arr);
}

TEST("linked_byte_array - construction")
{
    auto const arr = lb::long_byte_array::create(100);

    SECTION("full-length view is transparent")
    {
        auto const view = lb::linked_byte_array::create(arr, 0, 100);
        arr->put(99, lb::byte(4));
        view->put(0, lb::byte(5));

        CHECK(same_bytes(view->to_regular_array(), arr->to_regular_array()));
    }

    SECTION("boundaries")
    {
        CHECK(no_error([&] { (void)lb::linked_byte_array::create(arr, 100, 0); }));
        CHECK(no_error([&] { (void)lb::linked_byte_array::create(arr, 0, 0); }));
        CHECK(no_error([&] { (void)lb::linked_byte_array::create(arr, 99, 1); }));

        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)lb::linked_byte_array::create(arr, 99, 2); }));
        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)lb::linked_byte_array::create(arr, 101, 0); }));
        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)lb::linked_byte_array::create(arr, -1, 10); }));
        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)lb::linked_byte_array::create(arr, 0, -1); }));
    }

    SECTION("a view is checked against its base view, not the root")
    {
        auto const mid = lb::linked_byte_array::create(arr, 40, 20);
        CHECK(throws(lb::error_kind::out_of_range, [&] { (void)lb::linked_byte_array::create(mid, 10, 11); }));
        CHECK(no_error([&] { (void)lb::linked_byte_array::create(mid, 10, 10); }));
    }

    SECTION("null base")
    {
        CHECK(throws(lb::error_kind::null_base, [] { (void)lb::linked_byte_array::create(lb::array_ref(), 0, 0); }));
        CHECK(throws(lb::error_kind::null_base,
                     [] { (void)lb::linked_byte_array::create(std::shared_ptr<lb::long_byte_array>(), 0, 0); }));
    }

    SECTION("the view keeps its base alive")
    {
        auto base = lb::long_byte_array::create(10);
        base->put(3, lb::byte(9));
        auto const view = lb::linked_byte_array::create(base, 2, 5);
        base.reset();

        CHECK(value(view->get(1)) == 9);
    }
}

TEST("linked_byte_array - put_range and get_sub_array")
{
    auto const arr = lb::long_byte_array::create(100, 8);
    auto const view = lb::linked_byte_array::create(arr, 30, 40);

    std::vector<lb::byte> data = {lb::byte(1), lb::byte(2), lb::byte(3)};
    view->put_range(37, lb::span<lb::byte const>(data));

    CHECK(value(arr->get(67)) == 1);
    CHECK(value(arr->get(69)) == 3);
    CHECK(same_bytes(view->get_sub_array(37, 3), data));

    CHECK(throws(lb::error_kind::out_of_range, [&] { view->put_range(38, lb::span<lb::byte const>(data)); }));
    CHECK(throws(lb::error_kind::out_of_range, [&] { (void)view->get_sub_array(38, 3); }));
    CHECK(throws(lb::error_kind::out_of_range, [&] { (void)view->get_sub_array(40, 0); }));
    CHECK(throws(lb::error_kind::invalid_argument, [&] { (void)view->get_sub_array(0, -1); }));

    // nothing outside the window was touched
    CHECK(value(arr->get(70)) == 0);
}

TEST("linked_byte_array - single buffer limit applies to the view's own length")
{
    auto const arr = lb::long_byte_array::create(lb::isize(1) << 40);

    SECTION("too large for one buffer")
    {
        auto const view = lb::linked_byte_array::create(arr, 7, lb::max_buffer_size + 1);
        CHECK(throws(lb::error_kind::too_large, [&] { (void)view->to_regular_array(); }));
        CHECK(throws(lb::error_kind::too_large, [&] { (void)view->get_sub_array(0, lb::max_buffer_size + 1); }));
        CHECK(arr->block_count() == 0);
    }

    SECTION("a small view of a huge base is fine")
    {
        auto const view = lb::linked_byte_array::create(arr, (lb::isize(1) << 40) - 16, 16);
        view->put(15, lb::byte(1));
        auto const bytes = view->to_regular_array();
        REQUIRE(bytes.size() == 16);
        CHECK(value(bytes[15]) == 1);
        CHECK(arr->block_count() == 1);
    }
}

TEST("linked_byte_array - write")
{
    SECTION("emits the view's elements in order")
    {
        auto const arr = lb::long_byte_array::create(10000, 100);
        for (lb::isize i = 0; i < arr->length(); i += 7)
            arr->put(i, lb::test::pattern_at(i));

        auto const view = lb::linked_byte_array::create(arr, 123, 9000);

        std::vector<lb::byte> out;
        view->write(
            [&](lb::span<lb::byte const> chunk)
            {
                out.insert(out.end(), chunk.begin(), chunk.end());
                return true;
            });

        CHECK(same_bytes(out, view->to_regular_array()));

        // writing does not materialize any block of the base
        CHECK(arr->block_count() == 100);
    }

    SECTION("empty view never calls the sink")
    {
        auto const arr = lb::long_byte_array::create(10);
        auto const view = lb::linked_byte_array::create(arr, 10, 0);
        int calls = 0;
        view->write(
            [&](lb::span<lb::byte const>)
            {
                ++calls;
                return true;
            });
        CHECK(calls == 0);
    }

    SECTION("rejecting sink")
    {
        auto const arr = lb::long_byte_array::create(10);
        auto const view = lb::linked_byte_array::create(arr, 0, 10);
        CHECK(throws(lb::error_kind::io_failure, [&] { view->write([](lb::span<lb::byte const>) { return false; }); }));
    }
}

TEST("linked_byte_array - to_string")
{
    auto const arr = lb::long_byte_array::create(100);
    auto const view = lb::linked_byte_array::create(arr, 40, 20);
    CHECK(view->to_string() == "linked_byte_array[0,19] at offset 40 -> long_byte_array[0,99]");

    auto const inner = lb::linked_byte_array::create(view, 5, 10);
    CHECK(inner->to_string() == "linked_byte_array[0,9] at offset 5 -> linked_byte_array[0,19] at offset 40 -> long_byte_array[0,99]");
}
