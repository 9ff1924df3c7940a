#include <long-bytes/array_ref.hh>
#include <long-bytes/error.hh>
#include <long-bytes/linked_byte_array.hh>
#include <long-bytes/long_byte_array.hh>

#include <nexus/test.hh>

#include "test-helpers.hh"

#include <vector>

using lb::test::same_bytes;
using lb::test::throws;
using lb::test::value;

TEST("array_ref - empty handle")
{
    auto const ref = lb::array_ref();
    CHECK(!ref.is_valid());
    CHECK(!ref);
    CHECK(!ref.is_view());
    CHECK(ref.as_array() == nullptr);
    CHECK(ref.as_view() == nullptr);
    CHECK(ref.to_string() == "array_ref[empty]");

    CHECK(throws(lb::error_kind::null_base, [&] { (void)ref.length(); }));
    CHECK(throws(lb::error_kind::null_base, [&] { (void)ref.get(0); }));
    CHECK(throws(lb::error_kind::null_base, [&] { ref.put(0, lb::byte(1)); }));
    CHECK(throws(lb::error_kind::null_base, [&] { (void)ref.get_sub_array(0, 0); }));
    CHECK(throws(lb::error_kind::null_base, [&] { (void)ref.to_regular_array(); }));
    CHECK(throws(lb::error_kind::null_base, [&] { ref.write([](lb::span<lb::byte const>) { return true; }); }));

    // null pointers collapse to the empty handle
    CHECK(!lb::array_ref(std::shared_ptr<lb::long_byte_array>()).is_valid());
    CHECK(!lb::array_ref(std::shared_ptr<lb::linked_byte_array>()).is_valid());
}

TEST("array_ref - both kinds answer the same operations")
{
    auto const arr = lb::long_byte_array::create(64, 8);
    auto const view = lb::linked_byte_array::create(arr, 16, 32);

    lb::array_ref const direct = arr;
    lb::array_ref const linked = view;

    CHECK(direct.is_valid());
    CHECK(!direct.is_view());
    CHECK(direct.as_array() == arr);
    CHECK(direct.as_view() == nullptr);

    CHECK(linked.is_view());
    CHECK(linked.as_view() == view);
    CHECK(linked.as_array() == nullptr);

    CHECK(direct.length() == 64);
    CHECK(linked.length() == 32);

    linked.put(0, lb::byte(11));
    CHECK(value(direct.get(16)) == 11);

    std::vector<lb::byte> data = {lb::byte(1), lb::byte(2)};
    direct.put_range(46, lb::span<lb::byte const>(data));
    CHECK(same_bytes(linked.get_sub_array(30, 2), data));

    CHECK(same_bytes(linked.to_regular_array(), direct.get_sub_array(16, 32)));

    std::vector<lb::byte> out;
    linked.write(
        [&](lb::span<lb::byte const> chunk)
        {
            out.insert(out.end(), chunk.begin(), chunk.end());
            return true;
        });
    CHECK(same_bytes(out, linked.to_regular_array()));

    CHECK(direct.to_string() == arr->to_string());
    CHECK(linked.to_string() == view->to_string());
}

TEST("array_ref - copies share the array")
{
    auto const arr = lb::long_byte_array::create(10);
    lb::array_ref const a = arr;
    lb::array_ref const b = a; // NOLINT(performance-unnecessary-copy-initialization)

    a.put(5, lb::byte(3));
    CHECK(value(b.get(5)) == 3);
    CHECK(a.as_array() == b.as_array());
}

TEST("array_ref - errors of the referenced array pass through")
{
    lb::array_ref const ref = lb::long_byte_array::create(10);
    CHECK(throws(lb::error_kind::out_of_range, [&] { (void)ref.get(10); }));
    CHECK(throws(lb::error_kind::invalid_argument, [&] { (void)ref.get_sub_array(0, -1); }));
}
