#include <inline-core/capacity_error.hh>
#include <inline-core/result.hh>
#include <inline-core/span.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <string>
#include <type_traits>

using test::move_only;
using test::tracked;

static_assert(std::is_trivially_copyable_v<ic::result<int, float>>);
static_assert(std::is_trivially_copyable_v<ic::result<ic::unit, ic::capacity_error<int>>>);
static_assert(!std::is_trivially_copyable_v<ic::result<ic::unit, ic::capacity_error<std::string>>>);
static_assert(!std::is_copy_constructible_v<ic::result<ic::unit, ic::capacity_error<move_only>>>);
static_assert(std::is_move_constructible_v<ic::result<ic::unit, ic::capacity_error<move_only>>>);

namespace
{
ic::result<int, std::string> parse_digit(char c)
{
    if (c < '0' || c > '9')
        return ic::error(std::string("not a digit: ") + c);
    return c - '0';
}
} // namespace

TEST("result - value and error alternatives")
{
    SECTION("value")
    {
        auto const r = parse_digit('7');
        REQUIRE(r.has_value());
        CHECK(!r.has_error());
        CHECK(r.value() == 7);
        CHECK(r.value_or(-1) == 7);
        CHECK(r.error_or("none") == "none");
    }

    SECTION("error")
    {
        auto const r = parse_digit('x');
        REQUIRE(r.has_error());
        CHECK(!r.has_value());
        CHECK(r.error() == "not a digit: x");
        CHECK(r.value_or(-1) == -1);
    }

    SECTION("default construction holds a default error")
    {
        auto const r = ic::result<int, std::string>{};
        CHECK(r.has_error());
        CHECK(r.error().empty());
    }

    SECTION("wrong alternative access is checked")
    {
#if IC_ASSERT_ENABLED
        auto const r = parse_digit('x');
        CHECK(test::triggers_assertion([&] { (void)r.value(); }));
        auto const v = parse_digit('1');
        CHECK(test::triggers_assertion([&] { (void)v.error(); }));
#endif
    }
}

TEST("result - capacity errors")
{
    using push_result = ic::result<ic::unit, ic::capacity_error<std::string>>;

    SECTION("success carries unit")
    {
        push_result const r = ic::unit{};
        CHECK(r.has_value());
        CHECK(r.value() == ic::unit{});
    }

    SECTION("the rejected element can be moved back out")
    {
        push_result r = ic::error(ic::capacity_error<std::string>{std::string("payload")});
        REQUIRE(r.has_error());
        CHECK(std::string(r.error().message()) == "insufficient capacity");

        std::string back = ic::move(r).error().value;
        CHECK(back == "payload");
    }

    SECTION("move-only payloads")
    {
        using mo_result = ic::result<ic::unit, ic::capacity_error<move_only>>;
        mo_result r = ic::error(ic::capacity_error<move_only>{move_only(5)});

        auto moved = ic::move(r);
        REQUIRE(moved.has_error());
        CHECK(moved.error().value.value == 5);
        CHECK(r.has_error()); // stays in its alternative
        CHECK(r.error().value.value == -1);
    }

    SECTION("span payloads")
    {
        int const data[] = {1, 2, 3};
        ic::result<ic::unit, ic::capacity_error<ic::span<int const>>> const r
            = ic::error(ic::capacity_error<ic::span<int const>>{ic::span<int const>(data)});

        REQUIRE(r.has_error());
        CHECK(r.error().value.data() == data);
        CHECK(r.error().value.size() == 3);
    }

    SECTION("payload equality")
    {
        CHECK(ic::capacity_error<int>{3} == ic::capacity_error<int>{3});
        CHECK(ic::capacity_error<int>{3} != ic::capacity_error<int>{4});
    }
}

TEST("result - lifetime of the alternatives")
{
    SECTION("each alternative is destroyed once")
    {
        tracked::reset_counters();
        {
            ic::result<tracked, int> a = tracked(1);
            ic::result<int, tracked> b = ic::error(tracked(2));
            auto c = a;
            auto d = ic::move(b);
            CHECK(c.value().value == 1);
            CHECK(d.error().value == 2);
        }
        CHECK(tracked::live() == 0);
    }

    SECTION("switching alternatives")
    {
        tracked::reset_counters();
        {
            ic::result<tracked, std::string> r = tracked(1);
            r.emplace_error("failed");
            CHECK(r.has_error());
            CHECK(tracked::live() == 0);

            r.emplace_value(2);
            CHECK(r.value().value == 2);
            CHECK(tracked::live() == 1);
        }
        CHECK(tracked::live() == 0);
    }

    SECTION("assignment across alternatives")
    {
        tracked::reset_counters();
        {
            ic::result<tracked, std::string> a = tracked(1);
            ic::result<tracked, std::string> b = ic::error(std::string("e"));

            b = a;
            CHECK(b.has_value());
            CHECK(b.value().value == 1);

            a = ic::result<tracked, std::string>(ic::error(std::string("other")));
            CHECK(a.has_error());
            CHECK(a.error() == "other");
        }
        CHECK(tracked::live() == 0);
    }

    SECTION("converting between result types")
    {
        ic::result<int, char const*> small = 4;
        auto const big = ic::result<long, std::string>(ic::move(small));
        REQUIRE(big.has_value());
        CHECK(big.value() == 4);
    }
}
