#include <inline-core/assert-handler.hh>
#include <inline-core/assertf.hh>
#include <inline-core/fixed_vector.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
struct handler_fired
{
};
} // namespace

TEST("assertions - failing assertion reports expression, message and location")
{
    std::optional<ic::impl::assertion_info> captured;
    // CAREFUL: depends on the formatting of the block below
    int const test_line = __LINE__ + 11; // line of IC_ASSERTF_ALWAYS

    {
        auto handler = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const& info)
            {
                captured = info;
                throw handler_fired{}; // returning would abort
            });
        try
        {
            IC_ASSERTF_ALWAYS(1 + 1 == 3, "capacity {} exceeded by {}", 8, 1);
        }
        catch (handler_fired) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "capacity 8 exceeded by 1");

    auto const file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - plain message")
{
    std::string message;
    {
        auto handler = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const& info)
            {
                message = info.message;
                throw handler_fired{};
            });
        try
        {
            IC_ASSERT_ALWAYS(false, "drain cursors crossed");
        }
        catch (handler_fired) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    CHECK(message == "drain cursors crossed");
}

TEST("assertions - passing assertions are silent and do not format")
{
    bool handler_called = false;
    int evaluations = 0;

    auto count = [&]() -> int
    {
        ++evaluations;
        return 7;
    };

    {
        auto handler = ic::impl::scoped_assertion_handler([&](ic::impl::assertion_info const&) { handler_called = true; });
        IC_ASSERTF_ALWAYS(true, "unused {}", count());
        IC_ASSERTF(2 > 1, "unused {}", count());
        IC_ASSERT(true, "unused");
    }

    CHECK(!handler_called);
    CHECK(evaluations == 0);
}

#if IC_ASSERT_ENABLED
TEST("assertions - IC_ASSERT is active in this configuration")
{
    bool fired = false;
    {
        auto handler = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const&)
            {
                fired = true;
                throw handler_fired{};
            });
        try
        {
            IC_ASSERT(false, "debug-only check");
        }
        catch (handler_fired) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    CHECK(fired);
}
#endif

TEST("assertions - handler stack is LIFO")
{
    std::vector<char> events;

    auto outer = ic::impl::scoped_assertion_handler(
        [&](ic::impl::assertion_info const&)
        {
            events.push_back('o');
            throw handler_fired{};
        });

    {
        auto inner = ic::impl::scoped_assertion_handler(
            [&](ic::impl::assertion_info const&)
            {
                events.push_back('i');
                throw handler_fired{};
            });

        try
        {
            IC_ASSERT_ALWAYS(false, "inner active");
        }
        catch (handler_fired) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        IC_ASSERT_ALWAYS(false, "outer active");
    }
    catch (handler_fired) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(events == (std::vector<char>{'i', 'o'}));
}

TEST("assertions - a handler that throws is still popped")
{
    struct inner_exception
    {
    };

    int outer_calls = 0;
    auto outer = ic::impl::scoped_assertion_handler(
        [&](ic::impl::assertion_info const&)
        {
            ++outer_calls;
            throw handler_fired{};
        });

    try
    {
        auto inner = ic::impl::scoped_assertion_handler([](ic::impl::assertion_info const&) { throw inner_exception{}; });
        IC_ASSERT_ALWAYS(false, "goes to inner");
        CHECK(false); // unreachable
    }
    catch (inner_exception const&) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_calls == 0);

    try
    {
        IC_ASSERT_ALWAYS(false, "goes to outer");
    }
    catch (handler_fired) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_calls == 1);
}

TEST("assertions - container errors go through the handler")
{
    std::vector<std::string> messages;
    auto handler = ic::impl::scoped_assertion_handler(
        [&](ic::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw handler_fired{};
        });

    auto v = ic::fixed_vector<int, 2>::create_copy_of({10, 20});

    try
    {
        (void)v[2];
    }
    catch (handler_fired) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        v.push_back(30);
    }
    catch (handler_fired) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "fixed_vector::operator[]: index 2 is out of bounds in vector of size 2");
    CHECK(messages[1] == "fixed_vector::push_back(): insufficient capacity (capacity 2)");

    // both failures left the vector as it was
    CHECK(v.size() == 2);
    CHECK(v[0] == 10);
    CHECK(v[1] == 20);
}

TEST("assertions - handler count follows scopes")
{
    auto const base = ic::impl::assertion_handler_count();
    {
        auto a = ic::impl::scoped_assertion_handler([](ic::impl::assertion_info const&) { throw handler_fired{}; });
        CHECK(ic::impl::assertion_handler_count() == base + 1);
        {
            auto b = ic::impl::scoped_assertion_handler([](ic::impl::assertion_info const&) { throw handler_fired{}; });
            CHECK(ic::impl::assertion_handler_count() == base + 2);
        }
        CHECK(ic::impl::assertion_handler_count() == base + 1);
    }
    CHECK(ic::impl::assertion_handler_count() == base);
}
