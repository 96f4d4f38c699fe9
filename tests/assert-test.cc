#include <stack-core/assert-handler.hh>
#include <stack-core/assertf.hh>
#include <stack-core/make_stack_vec.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
struct unwind
{
};

// captures the first failure in f and unwinds out of it
template <class F>
std::optional<sc::impl::assertion_info> capture_failure(F&& f)
{
    std::optional<sc::impl::assertion_info> captured;
    auto handler = sc::impl::scoped_assertion_handler(
        [&](sc::impl::assertion_info const& info)
        {
            captured = info;
            throw unwind{};
        });
    try
    {
        f();
    }
    catch (unwind) // NOLINT(bugprone-empty-catch)
    {
    }
    return captured;
}
} // namespace

TEST("assertions - formatted failure reports expression, message and location")
{
    int const expected_line = __LINE__ + 1;
    auto const info = capture_failure([] { SC_ASSERTF_ALWAYS(1 + 1 == 3, "math is {} today", "broken"); });

    REQUIRE(info.has_value());
    CHECK(info->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(info->message == "math is broken today");
    CHECK(std::string(info->location.file_name()).ends_with("assert-test.cc"));
    CHECK(int(info->location.line()) == expected_line);
}

TEST("assertions - passing assertions do not evaluate message arguments")
{
    auto evaluated = 0;
    auto count = [&]
    {
        ++evaluated;
        return 1;
    };

    auto const info = capture_failure(
        [&]
        {
            SC_ASSERTF_ALWAYS(true, "{}", count());
            SC_ASSERTF(true, "{}", count());
            SC_ASSERT_ALWAYS(evaluated == 0, "never");
        });

    CHECK(!info.has_value());
    CHECK(evaluated == 0);
}

TEST("assertions - handlers nest")
{
    std::vector<int> events;

    auto outer = sc::impl::scoped_assertion_handler(
        [&](sc::impl::assertion_info const&)
        {
            events.push_back(1);
            throw unwind{};
        });

    {
        auto inner = sc::impl::scoped_assertion_handler(
            [&](sc::impl::assertion_info const&)
            {
                events.push_back(2);
                throw unwind{};
            });

        try
        {
            SC_ASSERT_ALWAYS(false, "inner");
        }
        catch (unwind) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        SC_ASSERT_ALWAYS(false, "outer");
    }
    catch (unwind) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - panicking stack_vec calls point at the container")
{
    auto v = sc::make_stack_vec<2>(1, 2);

    auto const push = capture_failure([&] { v.push(3); });
    REQUIRE(push.has_value());
    CHECK(push->message == "push failed: not enough space in stack_vec (capacity is 2)");
    CHECK(std::string(push->location.file_name()).ends_with("stack_vec.hh"));

    auto const remove = capture_failure([&] { v.remove(-1); });
    REQUIRE(remove.has_value());
    CHECK(remove->message == "removal index (is -1) should be < len (is 2)");

    CHECK(v.len() == 2);
}

#if SC_ASSERT_ENABLED
TEST("assertions - unchecked preconditions are asserted in checked builds")
{
    auto v = sc::make_stack_vec_full(1);

    auto const info = capture_failure([&] { v.push_unchecked(2); });
    REQUIRE(info.has_value());
    CHECK(v.len() == 1);

    auto const index = capture_failure([&] { (void)v[1]; });
    CHECK(index.has_value());

    auto const set_len = capture_failure([&] { v.set_len(2); });
    CHECK(set_len.has_value());
    CHECK(v.len() == 1);
}
#endif
