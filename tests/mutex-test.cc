#include <long-bytes/mutex.hh>

#include <nexus/test.hh>

#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

TEST("mutex - construction")
{
    SECTION("default construction")
    {
        auto m = lb::mutex<int>{};
        auto value = m.lock([](int const& val) { return val; });
        CHECK(value == 0);
    }

    SECTION("construction with initial value")
    {
        auto m = lb::mutex<int>{42};
        auto value = m.lock([](int const& val) { return val; });
        CHECK(value == 42);
    }

    SECTION("construction with multiple arguments")
    {
        auto m = lb::mutex<std::string>{3, 'x'};
        auto value = m.lock([](std::string const& val) { return val; });
        CHECK(value == "xxx");
    }
}

TEST("mutex - lock with modification")
{
    auto m = lb::mutex<int>{0};
    m.lock([](int& val) { ++val; });
    m.lock([](int& val) { ++val; });
    m.lock([](int& val) { ++val; });
    CHECK(m.lock([](int const& val) { return val; }) == 3);

    // returns by value, never a reference into the protected data
    auto value = m.lock([](int& val) { return val++; });
    CHECK(value == 3);
    CHECK(m.lock([](int const& val) { return val; }) == 4);
}

TEST("mutex - const access")
{
    auto const m = lb::mutex<std::unordered_map<int, int>>{};
    auto const size = m.lock([](std::unordered_map<int, int> const& table) { return table.size(); });
    CHECK(size == 0u);
}

TEST("mutex - concurrent find-or-insert")
{
    // the access pattern of the block table: look up, create if missing, modify
    auto table = lb::mutex<std::unordered_map<int, int>>{};
    auto constexpr thread_count = 8;
    auto constexpr rounds = 1000;

    std::vector<std::thread> threads;
    for (auto t = 0; t < thread_count; ++t)
        threads.emplace_back(
            [&table]
            {
                for (auto i = 0; i < rounds; ++i)
                    table.lock([&](std::unordered_map<int, int>& map) { ++map[i % 10]; });
            });

    for (auto& th : threads)
        th.join();

    auto const counts = table.lock([](std::unordered_map<int, int> const& map) { return map; });
    CHECK(counts.size() == 10u);
    for (auto const& [key, count] : counts)
        CHECK(count == thread_count * rounds / 10);
}
