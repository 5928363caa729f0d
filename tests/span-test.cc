#include <keyed-core/pair.hh>
#include <keyed-core/span.hh>
#include <keyed-core/vector.hh>

#include <nexus/test.hh>

#include <type_traits>

// static assertions for triviality
static_assert(std::is_trivially_copyable_v<kc::span<int>>, "span should be trivially copyable");

// verify triviality even with non-trivial element type
namespace
{
struct non_trivial
{
    int value = 0;
    ~non_trivial() {} // makes it non-trivial
};

int sum(kc::span<int const> values)
{
    int s = 0;
    for (auto v : values)
        s += v;
    return s;
}
} // namespace

static_assert(std::is_trivially_copyable_v<kc::span<non_trivial>>,
              "span should be trivially copyable even with non-trivial T");

// mutable spans convert to const spans, not the other way around
static_assert(std::is_convertible_v<kc::span<int>, kc::span<int const>>);
static_assert(!std::is_convertible_v<kc::span<int const>, kc::span<int>>);

TEST("span - construction")
{
    SECTION("default construction")
    {
        auto const s = kc::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer + size construction")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = kc::span<int>(data, 5);
        CHECK(s.data() == data);
        CHECK(s.size() == 5);
        CHECK(!s.empty());
    }

    SECTION("C array")
    {
        int data[] = {1, 2, 3};
        kc::span<int> s = data;
        CHECK(s.size() == 3);
        CHECK(s.front() == 1);
        CHECK(s.back() == 3);
    }

    SECTION("initializer_list as argument")
    {
        CHECK(sum({1, 2, 3, 4}) == 10);
        CHECK(sum({}) == 0);
    }

    SECTION("container")
    {
        kc::vector<int> v;
        v.push_back(4);
        v.push_back(5);

        auto const s = kc::span<int>(v);
        CHECK(s.data() == v.data());
        CHECK(s.size() == 2);
        CHECK(sum(kc::span<int const>(v)) == 9);
    }

    SECTION("const conversion")
    {
        int data[] = {7, 8};
        auto const s = kc::span<int>(data);
        kc::span<int const> cs = s;
        CHECK(cs.data() == data);
        CHECK(cs.size() == 2);
    }
}

TEST("span - element access writes through")
{
    int data[] = {1, 2, 3};
    auto const s = kc::span<int>(data);

    s[1] = 20;
    for (auto& v : s)
        v += 1;

    CHECK(data[0] == 2);
    CHECK(data[1] == 21);
    CHECK(data[2] == 4);
}

TEST("span - pairs as copy-out buffer")
{
    kc::pair<int, char> buffer[3] = {};
    auto const s = kc::span<kc::pair<int, char>>(buffer);

    s[2] = {5, 'e'};
    CHECK(buffer[2].first == 5);
    CHECK(buffer[2].second == 'e');
    CHECK(buffer[0].first == 0);
}
