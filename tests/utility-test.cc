#include <stack-core/impl/inline_storage.hh>
#include <stack-core/impl/object_lifetime_util.hh>
#include <stack-core/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <utility>
#include <vector>

static_assert(std::is_same_v<decltype(sc::move(std::declval<int&>())), int&&>);
static_assert(std::is_same_v<decltype(sc::forward<int&>(std::declval<int&>())), int&>);
static_assert(std::is_trivially_destructible_v<sc::storage_for<int>>);
static_assert(sizeof(sc::impl::inline_storage<std::string, 3>) == 3 * sizeof(std::string));
static_assert(alignof(sc::impl::inline_storage<double, 2>) == alignof(double));

TEST("utility - exchange, min, max")
{
    auto len = sc::isize(5);
    auto const old = sc::exchange(len, 0);
    CHECK(old == 5);
    CHECK(len == 0);

    auto p = std::make_unique<int>(1);
    auto q = sc::exchange(p, nullptr);
    CHECK(p == nullptr);
    CHECK(*q == 1);

    CHECK(sc::min(3, 4) == 3);
    CHECK(sc::max(3, 4) == 4);

    int a = 1;
    int b = 1;
    CHECK(&sc::min(a, b) == &a);
    CHECK(&sc::max(a, b) == &b);
}

TEST("utility - memcpy and memmove accept empty ranges")
{
    sc::memcpy(nullptr, nullptr, 0);
    sc::memmove(nullptr, nullptr, 0);

    int src[] = {1, 2, 3, 4};
    int dst[4] = {};
    sc::memcpy(dst, src, sizeof(src));
    CHECK(dst[3] == 4);

    sc::memmove(src + 1, src, 3 * sizeof(int));
    CHECK(src[0] == 1);
    CHECK(src[1] == 1);
    CHECK(src[2] == 2);
    CHECK(src[3] == 3);
}

TEST("utility - object lifetime helpers")
{
    SECTION("relocate ends the source lifetimes")
    {
        sc::impl::inline_storage<std::string, 3> src;
        sc::impl::inline_storage<std::string, 3> dst;
        new (sc::placement_new, src.slot(0)) std::string("a");
        new (sc::placement_new, src.slot(1)) std::string("b");

        auto dst_end = dst.ptr();
        sc::impl::relocate_objects_to(dst_end, src.slot(0), src.slot(2));
        CHECK(dst_end == dst.slot(2));
        CHECK(*dst.slot(0) == "a");
        CHECK(*dst.slot(1) == "b");

        sc::impl::destroy_objects(dst.ptr(), dst_end);
    }

    SECTION("shift back by one and compact")
    {
        sc::impl::inline_storage<std::string, 4> s;
        new (sc::placement_new, s.slot(0)) std::string("x");
        new (sc::placement_new, s.slot(1)) std::string("y");
        new (sc::placement_new, s.slot(2)) std::string("z");

        sc::impl::shift_objects_back_by_one(s.slot(0), s.slot(3));
        *s.slot(0) = "w";
        CHECK(*s.slot(0) == "w");
        CHECK(*s.slot(1) == "x");
        CHECK(*s.slot(2) == "y");
        CHECK(*s.slot(3) == "z");

        sc::impl::compact_move_objects_backward(s.slot(1), s.slot(2), s.slot(4));
        CHECK(*s.slot(1) == "y");
        CHECK(*s.slot(2) == "z");

        sc::impl::destroy_objects(s.ptr(), s.slot(4));
    }

    SECTION("trivially copyable types")
    {
        sc::impl::inline_storage<int, 5> s;
        auto p = s.ptr();
        p[0] = 1;
        p[1] = 2;
        p[2] = 3;

        sc::impl::shift_objects_back_by_one(p, p + 3);
        p[0] = 0;
        CHECK(p[1] == 1);
        CHECK(p[3] == 3);

        sc::impl::compact_move_objects_backward(p, p + 1, p + 4);
        CHECK(p[0] == 1);
        CHECK(p[2] == 3);
    }

    SECTION("destroy runs in index order")
    {
        std::vector<int> order;
        struct recorder
        {
            int id;
            std::vector<int>* order;
            ~recorder() { order->push_back(id); }
        };

        sc::impl::inline_storage<recorder, 3> s;
        for (auto i = 0; i < 3; ++i)
            new (sc::placement_new, s.slot(i)) recorder{i, &order};

        sc::impl::destroy_objects(s.ptr(), s.slot(3));
        REQUIRE(order.size() == 3);
        CHECK(order[0] == 0);
        CHECK(order[2] == 2);
    }

    SECTION("zero capacity storage")
    {
        sc::impl::inline_storage<int, 0> s;
        CHECK(s.ptr() == nullptr);
        sc::impl::destroy_objects(s.ptr(), s.slot(0));
    }
}
