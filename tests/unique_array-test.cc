#include <long-bytes/unique_array.hh>

#include <nexus/test.hh>

#include "test-helpers.hh"

#include <vector>

using lb::test::value;

TEST("unique_array - factories")
{
    SECTION("default is empty")
    {
        auto const a = lb::unique_array<lb::byte>();
        CHECK(a.empty());
        CHECK(a.size() == 0);
        CHECK(a.data() == nullptr);
    }

    SECTION("create_defaulted zero-fills")
    {
        auto const a = lb::unique_array<lb::byte>::create_defaulted(1000);
        CHECK(a.size() == 1000);
        auto all_zero = true;
        for (auto b : a)
            all_zero = all_zero && value(b) == 0;
        CHECK(all_zero);
    }

    SECTION("create_uninitialized has the requested size")
    {
        auto const a = lb::unique_array<lb::i64>::create_uninitialized(16);
        CHECK(a.size() == 16);
        CHECK(a.data() != nullptr);
    }

    SECTION("create_copy_of copies")
    {
        std::vector<int> src = {1, 2, 3};
        auto const a = lb::unique_array<int>::create_copy_of(lb::span<int const>(src));
        src[0] = 100;
        CHECK(a.size() == 3);
        CHECK(a[0] == 1);
        CHECK(a[2] == 3);
    }

    SECTION("zero sizes")
    {
        CHECK(lb::unique_array<int>::create_defaulted(0).empty());
        CHECK(lb::unique_array<int>::create_copy_of(lb::span<int const>()).empty());
    }
}

TEST("unique_array - move semantics")
{
    auto a = lb::unique_array<int>::create_defaulted(4);
    a[1] = 9;
    auto const* const data = a.data();

    auto b = lb::move(a);
    CHECK(b.data() == data);
    CHECK(b[1] == 9);
    CHECK(a.empty()); // NOLINT(bugprone-use-after-move)
    CHECK(a.data() == nullptr);

    auto c = lb::unique_array<int>::create_defaulted(2);
    c = lb::move(b);
    CHECK(c.size() == 4);
    CHECK(c.data() == data);
}
