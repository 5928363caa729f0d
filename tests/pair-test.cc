#include <keyed-core/map_entry.hh>
#include <keyed-core/pair.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

static_assert(std::is_aggregate_v<kc::pair<int, float>>);
static_assert(std::is_trivially_copyable_v<kc::pair<int, char>>);

TEST("pair - aggregate and comparison")
{
    auto const a = kc::pair<int, char>{1, 'a'};
    auto const b = kc::pair<int, char>{1, 'b'};

    CHECK(a.first == 1);
    CHECK(a.second == 'a');
    CHECK((a == a));
    CHECK((a != b));
    CHECK((a < b));
    CHECK((kc::pair<int, char>{0, 'z'} < a));
}

TEST("pair - structured bindings")
{
    auto p = kc::pair<int, std::string>{3, "three"};

    auto& [k, v] = p;
    v += "!";
    k = 4;
    CHECK(p.first == 4);
    CHECK(p.second == "three!");

    auto [k2, v2] = kc::pair<int, std::string>{5, "five"};
    CHECK(k2 == 5);
    CHECK(v2 == "five");
}

TEST("map_entry - key is read-only, value is mutable")
{
    auto e = kc::map_entry<int, std::string>(17, 2, "two");

    CHECK(e.key() == 2);
    CHECK(e.value() == "two");
    CHECK(e.key_hash() == 17);

    auto& [key, value] = e;
    static_assert(std::is_same_v<decltype(key), int const>);
    static_assert(std::is_same_v<decltype(value), std::string>);

    value = "deux";
    CHECK(e.value() == "deux");

    CHECK((e.to_pair() == kc::pair<int, std::string>{2, "deux"}));
    CHECK((e == kc::pair<int, std::string>{2, "deux"}));
    CHECK(!(e == kc::pair<int, std::string>{2, "two"}));
}

TEST("map_entry - equality ignores the cached hash")
{
    auto const a = kc::map_entry<int, int>(1, 5, 50);
    auto const b = kc::map_entry<int, int>(2, 5, 50);
    auto const c = kc::map_entry<int, int>(1, 5, 51);

    CHECK((a == b));
    CHECK(!(a == c));
}
