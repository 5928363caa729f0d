#include <keyed-core/assert-handler.hh>
#include <keyed-core/macros.hh>
#include <keyed-core/span.hh>
#include <keyed-core/utility.hh>
#include <keyed-core/vector.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <limits>
#include <new>
#include <string>
#include <vector>

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    [[nodiscard]] static int live() { return ctor_count + copy_ctor_count + move_ctor_count - dtor_count; }

    Tracked() { ++ctor_count; }
    explicit Tracked(int v) : value(v) { ++ctor_count; }
    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    Tracked(Tracked&& rhs) noexcept : value(rhs.value)
    {
        ++move_ctor_count;
        rhs.value = -1;
    }
    Tracked& operator=(Tracked const& rhs) = default;
    Tracked& operator=(Tracked&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
    ~Tracked() { ++dtor_count; }
};

// construction fails for negative values
struct Picky
{
    int value = 0;
    explicit Picky(int v) : value(v)
    {
        if (v < 0)
            throw v;
    }
};

struct assertion_failed
{
};

template <class F>
bool asserts(F&& f)
{
    auto handler = kc::impl::scoped_assertion_handler([](kc::impl::assertion_info const&) { throw assertion_failed{}; });
    try
    {
        f();
    }
    catch (assertion_failed const&)
    {
        return true;
    }
    return false;
}

template <class T>
std::vector<T> to_std(kc::vector<T> const& v)
{
    return std::vector<T>(v.begin(), v.end());
}
} // namespace

TEST("vector - default construction")
{
    kc::vector<int> v;
    CHECK(v.size() == 0);
    CHECK(v.empty());
    CHECK(v.begin() == v.end());
    CHECK(v.capacity() == 0);
    CHECK(v.data() == nullptr);

    Tracked::reset_counters();
    {
        kc::vector<Tracked> t;
        CHECK(t.empty());
    }
    CHECK(Tracked::ctor_count == 0);
    CHECK(Tracked::dtor_count == 0);
}

TEST("vector - factories")
{
    SECTION("create_with_capacity")
    {
        auto v = kc::vector<int>::create_with_capacity(10);
        CHECK(v.empty());
        CHECK(v.capacity() >= 10);
        CHECK(v.has_capacity_back_for(10));

        auto const p = v.data();
        for (int i = 0; i < 10; ++i)
            v.push_back(i);
        CHECK(v.data() == p);
    }

    SECTION("create_with_capacity(0) does not allocate")
    {
        auto v = kc::vector<int>::create_with_capacity(0);
        CHECK(v.capacity() == 0);
        CHECK(v.data() == nullptr);
    }

    SECTION("create_defaulted")
    {
        auto v = kc::vector<int>::create_defaulted(4);
        CHECK((to_std(v) == std::vector<int>{0, 0, 0, 0}));
    }

    SECTION("create_filled")
    {
        auto v = kc::vector<std::string>::create_filled(3, "x");
        REQUIRE(v.size() == 3);
        CHECK(v[0] == "x");
        CHECK(v[2] == "x");
    }

    SECTION("create_copy_of")
    {
        int const source[] = {3, 1, 4};
        auto v = kc::vector<int>::create_copy_of(kc::span<int const>(source));
        CHECK((to_std(v) == std::vector<int>{3, 1, 4}));
    }

    SECTION("buffers are cache line aligned")
    {
        auto v = kc::vector<char>::create_with_capacity(1);
        CHECK(reinterpret_cast<std::uintptr_t>(v.data()) % 64 == 0);
        CHECK(v.capacity() == 64);
    }
}

TEST("vector - push_back and growth")
{
    Tracked::reset_counters();
    {
        kc::vector<Tracked> v;
        for (int i = 0; i < 100; ++i)
            v.emplace_back(i);

        REQUIRE(v.size() == 100);
        for (int i = 0; i < 100; ++i)
            CHECK(v[i].value == i);

        CHECK(v.front().value == 0);
        CHECK(v.back().value == 99);
        CHECK(Tracked::copy_ctor_count == 0);
        CHECK(Tracked::live() == 100);
    }
    CHECK(Tracked::live() == 0);

    SECTION("push_back from own element during growth")
    {
        kc::vector<std::string> v;
        v.push_back("first");
        while (v.size() < v.capacity())
            v.push_back("fill");

        v.push_back(v[0]); // triggers reallocation
        CHECK(v.back() == "first");
        CHECK(v[0] == "first");
    }

    SECTION("failed construction leaves size unchanged")
    {
        kc::vector<Picky> v;
        v.emplace_back(1);
        v.emplace_back(2);

        bool thrown = false;
        try
        {
            v.emplace_back(-1);
        }
        catch (int)
        {
            thrown = true;
        }
        CHECK(thrown);
        CHECK(v.size() == 2);
        CHECK(v.back().value == 2);
    }
}

TEST("vector - insert_at and remove_at preserve order")
{
    kc::vector<int> v;
    for (int i = 0; i < 5; ++i)
        v.push_back(i);

    SECTION("insert front, middle, end")
    {
        v.insert_at(0, 10);
        v.insert_at(3, 11);
        v.insert_at(v.size(), 12);
        CHECK((to_std(v) == std::vector<int>{10, 0, 1, 11, 2, 3, 4, 12}));
    }

    SECTION("insert a copy of an own element")
    {
        v.insert_at(1, v[4]);
        CHECK((to_std(v) == std::vector<int>{0, 4, 1, 2, 3, 4}));
    }

    SECTION("insert while full")
    {
        while (v.size() < v.capacity())
            v.push_back(-1);
        auto const cap = v.capacity();

        v.insert_at(2, 99);
        CHECK(v.capacity() > cap);
        CHECK(v[1] == 1);
        CHECK(v[2] == 99);
        CHECK(v[3] == 2);
    }

    SECTION("remove front, middle, back")
    {
        v.remove_at(0);
        v.remove_at(1);
        v.remove_at(v.size() - 1);
        CHECK((to_std(v) == std::vector<int>{1, 3}));
    }

    SECTION("remove_back and pop_back")
    {
        v.remove_back();
        CHECK(v.pop_back() == 3);
        CHECK((to_std(v) == std::vector<int>{0, 1, 2}));
    }

    SECTION("non-trivial elements")
    {
        Tracked::reset_counters();
        {
            kc::vector<Tracked> t;
            for (int i = 0; i < 6; ++i)
                t.emplace_back(i);
            t.emplace_at(2, 42);
            t.remove_at(0);
            REQUIRE(t.size() == 6);
            CHECK(t[0].value == 1);
            CHECK(t[1].value == 42);
            CHECK(t[5].value == 5);
            CHECK(Tracked::live() == 6);
        }
        CHECK(Tracked::live() == 0);
    }

    SECTION("failed positional construction leaves the vector unchanged")
    {
        kc::vector<Picky> p;
        p.emplace_back(1);
        p.emplace_back(2);
        p.emplace_back(3);

        bool thrown = false;
        try
        {
            p.emplace_at(1, -5);
        }
        catch (int)
        {
            thrown = true;
        }
        CHECK(thrown);
        REQUIRE(p.size() == 3);
        CHECK(p[0].value == 1);
        CHECK(p[1].value == 2);
        CHECK(p[2].value == 3);
    }
}

TEST("vector - reserve and clear")
{
    kc::vector<int> v;
    v.push_back(1);
    v.push_back(2);

    v.reserve(100);
    CHECK(v.capacity() >= 100);
    CHECK((to_std(v) == std::vector<int>{1, 2}));

    auto const cap = v.capacity();
    v.reserve(10);
    CHECK(v.capacity() == cap);

    v.clear();
    CHECK(v.empty());
    CHECK(v.capacity() == cap);

    SECTION("unaddressable capacity")
    {
        v.push_back(7);
        bool thrown = false;
        try
        {
            v.reserve(std::numeric_limits<kc::isize>::max() / 2);
        }
        catch (std::bad_alloc const&)
        {
            thrown = true;
        }
        CHECK(thrown);
        CHECK(v.capacity() == cap);
        CHECK((to_std(v) == std::vector<int>{7}));
    }
}

TEST("vector - value semantics")
{
    kc::vector<std::string> v;
    v.push_back("a");
    v.push_back("b");

    SECTION("copy")
    {
        auto c = v;
        c[0] = "x";
        CHECK(v[0] == "a");
        CHECK(c.size() == 2);

        kc::vector<std::string> d;
        d.push_back("z");
        d = v;
        CHECK(d.size() == 2);
        CHECK(d[1] == "b");
    }

    SECTION("move")
    {
        auto const p = v.data();
        auto m = kc::move(v);
        CHECK(m.data() == p);
        CHECK(m.size() == 2);
        CHECK(v.empty()); // NOLINT(bugprone-use-after-move)
        CHECK(v.capacity() == 0);
    }
}

#if KC_ASSERT_ENABLED
TEST("vector - precondition violations assert")
{
    kc::vector<int> v;
    CHECK(asserts([&] { (void)v[0]; }));
    CHECK(asserts([&] { (void)v.front(); }));
    CHECK(asserts([&] { v.remove_back(); }));
    CHECK(asserts([&] { v.remove_at(0); }));
    CHECK(asserts([&] { v.insert_at(1, 5); }));

    v.push_back(1);
    CHECK(asserts([&] { (void)v[1]; }));
    CHECK(asserts([&] { (void)v[-1]; }));
    CHECK(!asserts([&] { (void)v[0]; }));
}
#endif
