#include <stack-core/assert-handler.hh>
#include <stack-core/make_stack_vec.hh>

#include <nexus/test.hh>

#include <limits>
#include <string>
#include <type_traits>

static_assert(std::is_same_v<decltype(sc::make_stack_vec<int, 6>()), sc::stack_vec<int, 6>>);
static_assert(std::is_same_v<decltype(sc::make_stack_vec<8>(1, 2, 3)), sc::stack_vec<int, 8>>);
static_assert(std::is_same_v<decltype(sc::make_stack_vec_full(1, 2, 3)), sc::stack_vec<int, 3>>);
static_assert(std::is_same_v<decltype(sc::make_stack_vec_filled<4>(1.5, 2)), sc::stack_vec<double, 4>>);

TEST("make_stack_vec - empty")
{
    CHECK(sc::make_stack_vec<int, 6>() == sc::stack_vec<int, 6>());
    CHECK(sc::make_stack_vec<int, 6>().is_empty());
}

TEST("make_stack_vec - element list")
{
    SECTION("same as from_array")
    {
        auto v = sc::make_stack_vec<4>(4, 3, 2, 1);
        CHECK(v == sc::stack_vec<int, 4>::from_array({4, 3, 2, 1}).value());
        CHECK(v.len() == 4);
    }

    SECTION("capacity above the element count")
    {
        auto v = sc::make_stack_vec<7>(1, 4, 5);
        CHECK(v.capacity() == 7);
        CHECK(v.len() == 3);
        CHECK(v[2] == 5);
    }

    SECTION("element type follows the first element")
    {
        auto v = sc::make_stack_vec<3>(std::string("a"), "b");
        REQUIRE(v.len() == 2);
        CHECK(v[1] == "b");
    }

    SECTION("full")
    {
        auto v = sc::make_stack_vec_full(4, 3, 2, 1);
        CHECK(v.is_full());
        CHECK(v == sc::stack_vec<int, 4>::from_full_array({4, 3, 2, 1}));
    }
}

TEST("make_stack_vec - filled")
{
    SECTION("same as from_value")
    {
        auto v = sc::make_stack_vec_filled<7>(69, 7);
        CHECK(v == sc::stack_vec<int, 7>::from_value(69, 7).value());
        CHECK(v.is_full());

        CHECK(sc::make_stack_vec_filled<11>(std::string("zz"), 3).len() == 3);
        CHECK(sc::make_stack_vec_filled<3>(0, 0).is_empty());
    }

    SECTION("count above capacity panics")
    {
        std::string message;
        {
            auto handler = sc::impl::scoped_assertion_handler(
                [&](sc::impl::assertion_info const& info)
                {
                    message = info.message;
                    throw 0;
                });
            try
            {
                (void)sc::make_stack_vec_filled<2>(1, 3);
                CHECK(false); // should not reach here
            }
            catch (int) // NOLINT(bugprone-empty-catch)
            {
            }
        }
        CHECK(message == "extend failed: capacity too low (is 2, required 3)");
    }

    SECTION("count at the isize maximum panics")
    {
        std::string message;
        {
            auto handler = sc::impl::scoped_assertion_handler(
                [&](sc::impl::assertion_info const& info)
                {
                    message = info.message;
                    throw 0;
                });
            try
            {
                (void)sc::make_stack_vec_filled<2>(1, std::numeric_limits<sc::isize>::max());
                CHECK(false); // should not reach here
            }
            catch (int) // NOLINT(bugprone-empty-catch)
            {
            }
        }
        CHECK(message == "extend failed: capacity too low (is 2, required 9223372036854775807)");
    }
}
