#include <inline-core/fixed_vector.hh>
#include <inline-core/span.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <string>
#include <type_traits>
#include <vector>

static_assert(std::is_trivially_copyable_v<ic::span<int>>);
static_assert(std::is_trivially_copyable_v<ic::span<std::string>>, "span stays trivially copyable for non-trivial T");
static_assert(std::is_convertible_v<ic::span<int>, ic::span<int const>>);
static_assert(!std::is_convertible_v<ic::span<int const>, ic::span<int>>);

TEST("span - construction")
{
    SECTION("default")
    {
        auto const s = ic::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer and size, pointer range")
    {
        int data[] = {1, 2, 3, 4};
        auto const a = ic::span<int>{data, 4};
        auto const b = ic::span<int>{data, data + 4};
        CHECK(a.data() == data);
        CHECK(a.size() == 4);
        CHECK(b.size() == 4);
        CHECK(a == b);
    }

    SECTION("C array")
    {
        int data[] = {5, 6, 7};
        auto const s = ic::span<int>(data);
        CHECK(s.size() == 3);
        CHECK(s.size_bytes() == 3 * ic::isize(sizeof(int)));
        CHECK(s.front() == 5);
        CHECK(s.back() == 7);
    }

    SECTION("containers with data() and size()")
    {
        auto vec = std::vector<int>{1, 2, 3};
        auto const s = ic::span<int>(vec);
        CHECK(s.data() == vec.data());
        CHECK(s.size() == 3);

        auto fv = ic::fixed_vector<int, 4>::create_copy_of({8, 9});
        auto const t = ic::span<int const>(fv);
        CHECK(t.data() == fv.data());
        CHECK(t.size() == 2);
    }

    SECTION("mutable to const")
    {
        int data[] = {1, 2};
        ic::span<int> const m(data);
        ic::span<int const> const c = m;
        CHECK(c.data() == data);
        CHECK(c.size() == 2);
    }

    SECTION("writes go through to the viewed elements")
    {
        auto fv = ic::fixed_vector<int, 4>::create_copy_of({1, 2, 3});
        auto s = fv.as_span();
        s[1] = 20;
        for (auto& e : s.subspan(2))
            e = 30;
        CHECK(fv.as_span() == ic::span<int const>({1, 20, 30}));
    }
}

TEST("span - subviews")
{
    int data[] = {0, 1, 2, 3, 4, 5};
    auto const s = ic::span<int const>(data);

    SECTION("subspan")
    {
        CHECK(s.subspan(2, 3) == ic::span<int const>({2, 3, 4}));
        CHECK(s.subspan(4) == ic::span<int const>({4, 5}));
        CHECK(s.subspan(6).empty());
        CHECK(s.subspan(0, 0).empty());
        CHECK(s.subspan(1, 2).data() == data + 1);
    }

    SECTION("first and last")
    {
        CHECK(s.first(2) == ic::span<int const>({0, 1}));
        CHECK(s.last(2) == ic::span<int const>({4, 5}));
        CHECK(s.first(0).empty());
        CHECK(s.last(6) == s);
    }

    SECTION("out of range is fatal")
    {
        auto const msg = test::assertion_message_of([&] { (void)s.subspan(4, 3); });
        REQUIRE(msg.has_value());
        CHECK(msg->find("[4, 7)") != std::string::npos);
        CHECK(msg->find("size 6") != std::string::npos);

        CHECK(test::triggers_assertion([&] { (void)s.subspan(7); }));
        CHECK(test::triggers_assertion([&] { (void)s.subspan(-1, 1); }));
        CHECK(test::triggers_assertion([&] { (void)s.subspan(0, -1); }));
        CHECK(test::triggers_assertion([&] { (void)s.first(7); }));
    }
}

TEST("span - equality")
{
    SECTION("compares elements, not addresses")
    {
        int a[] = {1, 2, 3};
        int b[] = {1, 2, 3};
        int c[] = {1, 2, 4};
        CHECK(ic::span<int>(a) == ic::span<int>(b));
        CHECK(ic::span<int>(a) != ic::span<int>(c));
        CHECK(ic::span<int>(a).first(2) == ic::span<int>(c).first(2));
    }

    SECTION("different sizes are never equal")
    {
        int a[] = {1, 2, 3};
        CHECK(ic::span<int>(a) != ic::span<int>(a).first(2));
        CHECK(ic::span<int>() == ic::span<int>(a).first(0));
    }

    SECTION("strings")
    {
        auto const v = ic::fixed_vector<std::string, 4>::create_copy_of({"x", "y"});
        CHECK(v.as_span() == ic::span<std::string const>({"x", "y"}));
    }
}
