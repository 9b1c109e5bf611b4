#include <buffer-core/assert-handler.hh>
#include <buffer-core/assert.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>


TEST("assertions - failing check calls handler with correct payload")
{
    std::optional<bc::impl::assertion_info> captured;
    // CAREFUL: relies on the check below staying on this line offset
    int const test_line = __LINE__ + 12; // line where BC_CHECK_INDEX is called

    {
        auto handler = bc::impl::scoped_assertion_handler(
            [&](bc::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            int idx = 7;
            BC_CHECK_INDEX(idx < 5, "index must be small");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK((captured->kind == bc::violation::index_out_of_range));

    // Expression: should contain the stringified condition
    CHECK(captured->expression.find("idx < 5") != std::string::npos);

    CHECK(captured->message == "index must be small");

    // Location: file name should end with this test file
    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));

    CHECK(captured->location.line() == test_line);

    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - each macro reports its violation kind")
{
    std::vector<bc::violation> kinds;

    auto handler = bc::impl::scoped_assertion_handler(
        [&](bc::impl::assertion_info const& info)
        {
            kinds.push_back(info.kind);
            throw 0;
        });

    try
    {
        BC_ASSERT_ALWAYS(false, "invariant");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    try
    {
        BC_CHECK_INDEX(false, "index");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    try
    {
        BC_CHECK_CAPACITY(false, "capacity");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(kinds.size() == 3);
    CHECK((kinds[0] == bc::violation::assertion));
    CHECK((kinds[1] == bc::violation::index_out_of_range));
    CHECK((kinds[2] == bc::violation::capacity_exceeded));
}

TEST("assertions - passing check does not call handler")
{
    bool handler_called = false;
    int counter = 0;

    auto expensive = [&]() -> int
    {
        ++counter;
        return 99;
    };

    {
        auto handler
            = bc::impl::scoped_assertion_handler([&](bc::impl::assertion_info const&) { handler_called = true; });
        BC_ASSERT_ALWAYS(expensive() == 99, "should not matter");
        BC_CHECK_INDEX(true, "should not matter");
        BC_CHECK_CAPACITY(1 < 2, "should not matter");
    }

    CHECK(!handler_called);
    CHECK(counter == 1); // condition is evaluated exactly once
}

#if BC_ASSERT_ENABLED
TEST("assertions - BC_ASSERT is active in this configuration")
{
    bool handler_called = false;

    auto handler = bc::impl::scoped_assertion_handler(
        [&](bc::impl::assertion_info const& info)
        {
            handler_called = true;
            CHECK((info.kind == bc::violation::assertion));
            throw 0;
        });

    try
    {
        BC_ASSERT(false, "debug-only invariant");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(handler_called);
}
#endif

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = bc::impl::scoped_assertion_handler(
        [&](bc::impl::assertion_info const&)
        {
            events.push_back(1); // handler A
            throw 0;
        });

    {
        auto handler_b = bc::impl::scoped_assertion_handler(
            [&](bc::impl::assertion_info const&)
            {
                events.push_back(2); // handler B
                throw 0;
            });

        // Trigger failure with B active
        try
        {
            BC_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    // B is now popped

    // Trigger failure with only A active
    try
    {
        BC_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2); // first failure hit handler B
    CHECK(events[1] == 1); // second failure hit handler A
}

TEST("assertions - scoped_assertion_handler pops on scope exit even when handler throws")
{
    std::vector<int> events;
    bool outer_handler_works = false;

    auto outer = bc::impl::scoped_assertion_handler(
        [&](bc::impl::assertion_info const&)
        {
            events.push_back(1);
            outer_handler_works = true;
            throw 0; // Must throw to prevent abort
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = bc::impl::scoped_assertion_handler(
            [&](bc::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        BC_CHECK_INDEX(false, "trigger inner");
        CHECK(false); // should not reach here
    }
    catch (sentinel_exception const&)
    {
        // Expected: inner handler threw
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    // outer handler is on top again
    outer_handler_works = false;
    try
    {
        BC_CHECK_CAPACITY(false, "trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_handler_works);
    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - push and pop without scope")
{
    int calls = 0;

    bc::impl::push_assertion_handler(
        [&](bc::impl::assertion_info const&)
        {
            ++calls;
            throw 0;
        });

    try
    {
        BC_ASSERT_ALWAYS(false, "manual handler");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    bc::impl::pop_assertion_handler();
    CHECK(calls == 1);

    // popping an empty stack is harmless
    bc::impl::pop_assertion_handler();
}

TEST("assertions - violation names")
{
    CHECK(std::string(bc::impl::to_string(bc::violation::assertion)) == "assertion");
    CHECK(std::string(bc::impl::to_string(bc::violation::index_out_of_range)) == "index out of range");
    CHECK(std::string(bc::impl::to_string(bc::violation::capacity_exceeded)) == "capacity exceeded");
}
