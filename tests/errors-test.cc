#include <keyed-core/errors.hh>
#include <keyed-core/ordered_map.hh>

#include <nexus/test.hh>

#include <exception>
#include <string>
#include <type_traits>

static_assert(std::is_base_of_v<std::exception, kc::map_error>);
static_assert(std::is_base_of_v<kc::map_error, kc::duplicate_key_error>);
static_assert(std::is_base_of_v<kc::map_error, kc::key_not_found_error>);
static_assert(std::is_base_of_v<kc::map_error, kc::index_out_of_range_error>);
static_assert(std::is_base_of_v<kc::map_error, kc::invalid_argument_error>);

TEST("errors - message and site")
{
    int const line = __LINE__ + 1;
    auto const e = kc::map_error("something went wrong");

    CHECK(std::string(e.what()) == "something went wrong");
    CHECK(e.message() == "something went wrong");
    CHECK(std::string(e.site().file_name()).ends_with("errors-test.cc"));
    CHECK(int(e.site().line()) == line);
}

TEST("errors - to_string")
{
    auto const e = kc::invalid_argument_error("bad capacity");
    auto const s = e.to_string();

    CHECK(s.starts_with("error: bad capacity\n  at "));
    CHECK(s.find("errors-test.cc:") != std::string::npos);
    CHECK(s.ends_with("\n"));

    auto const site = e.site();
    CHECK(s == "error: bad capacity\n  at " + std::string(site.file_name()) + ":" + std::to_string(site.line()) + " - "
                   + std::string(site.function_name()) + "\n");
}

TEST("errors - thrown by ordered_map")
{
    kc::ordered_map<int, int> m;
    m.add(1, 10);

    SECTION("duplicate key")
    {
        try
        {
            m.add(1, 20);
            CHECK(false);
        }
        catch (kc::duplicate_key_error const& e)
        {
            CHECK(e.message() == "an entry with the same key already exists");
        }
    }

    SECTION("missing key")
    {
        try
        {
            (void)m.get(2);
            CHECK(false);
        }
        catch (kc::key_not_found_error const& e)
        {
            CHECK(e.message() == "the key is not present");
        }
    }

    SECTION("position")
    {
        try
        {
            (void)m.get_at(3);
            CHECK(false);
        }
        catch (kc::index_out_of_range_error const& e)
        {
            CHECK(e.index() == 3);
            CHECK(e.size() == 1);
            CHECK(e.message() == "get_at: index 3 is out of range [0, 1)");
        }

        try
        {
            m.insert_at(-2, 5, 50);
            CHECK(false);
        }
        catch (kc::index_out_of_range_error const& e)
        {
            CHECK(e.message() == "insert_at: index -2 is out of range [0, 1]");
        }
    }

    SECTION("all errors are catchable as map_error")
    {
        int caught = 0;
        auto attempt = [&](auto&& f)
        {
            try
            {
                f();
            }
            catch (kc::map_error const&)
            {
                ++caught;
            }
        };

        attempt([&] { m.add(1, 0); });
        attempt([&] { (void)m.get(9); });
        attempt([&] { m.remove_at(4); });
        attempt([&] { (void)m.reserve(-1); });
        CHECK(caught == 4);
    }
}
