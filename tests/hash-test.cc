#include <keyed-core/hash.hh>

#include <nexus/test.hh>

#include <set>
#include <string>

namespace
{
enum class color
{
    red,
    green,
    blue
};

struct point
{
    int x = 0;
    int y = 0;

    kc::u64 hash() const { return kc::hash_combine(kc::hash<int>{}(x), kc::hash<int>{}(y)); }
    bool operator==(point const&) const = default;
};
} // namespace

TEST("hash - deterministic")
{
    CHECK(kc::hash<int>{}(42) == kc::hash<int>{}(42));
    CHECK(kc::hash<std::string>{}("key") == kc::hash<std::string>{}(std::string("key")));
    CHECK(kc::hash<color>{}(color::green) == kc::hash<color>{}(color::green));

    int value = 0;
    CHECK(kc::hash<int*>{}(&value) == kc::hash<int*>{}(&value));

    int values[2] = {};
    CHECK(kc::hash<int*>{}(&values[0]) != kc::hash<int*>{}(&values[1]));
    CHECK(kc::hash<int const*>{}(nullptr) == kc::hash_mix(0));
}

TEST("hash - integers are spread")
{
    SECTION("distinct inputs give distinct hashes")
    {
        std::set<kc::u64> seen;
        for (int i = 0; i < 1000; ++i)
            seen.insert(kc::hash<int>{}(i));
        CHECK(seen.size() == 1000);
    }

    SECTION("consecutive keys differ in the low bits")
    {
        // the map takes the low bits as slot index
        std::set<kc::u64> low_bits;
        for (int i = 0; i < 64; ++i)
            low_bits.insert(kc::hash<int>{}(i) & 63);
        CHECK(low_bits.size() > 16);
    }

    CHECK(kc::hash_mix(0) == 0);
    CHECK(kc::hash_mix(1) != 1);
}

TEST("hash - member hash and std::hash fallback")
{
    CHECK(kc::hash<point>{}(point{1, 2}) == kc::hash<point>{}(point{1, 2}));
    CHECK(kc::hash<point>{}(point{1, 2}) != kc::hash<point>{}(point{2, 1}));

    CHECK(kc::hash<std::string>{}("a") != kc::hash<std::string>{}("b"));
    CHECK(kc::hash<double>{}(1.5) == kc::hash<double>{}(1.5));
}

TEST("hash - hash_combine is order dependent")
{
    auto const a = kc::hash<int>{}(1);
    auto const b = kc::hash<int>{}(2);
    CHECK(kc::hash_combine(a, b) != kc::hash_combine(b, a));
    CHECK(kc::hash_combine(a, b) == kc::hash_combine(a, b));
}

TEST("equal_to")
{
    CHECK(kc::equal_to<int>{}(3, 3));
    CHECK(!kc::equal_to<int>{}(3, 4));
    CHECK(kc::equal_to<std::string>{}("abc", "abc"));
    CHECK(kc::equal_to<point>{}(point{1, 2}, point{1, 2}));
}

static_assert(kc::hash<int>{}(7) == kc::hash_mix(7));
