#include <micro-map/fixed_vector.hh>

#include "test-util.hh"

#include <nexus/test.hh>

#include <string>
#include <type_traits>
#include <vector>

// trivial element types keep the whole container trivial
static_assert(std::is_trivially_copyable_v<mm::fixed_vector<int, 4>>);
static_assert(std::is_trivially_destructible_v<mm::fixed_vector<int, 4>>);
static_assert(!std::is_trivially_copyable_v<mm::fixed_vector<std::string, 4>>);
static_assert(!std::is_copy_constructible_v<mm::fixed_vector<mm::test::MoveOnly, 4>>);
static_assert(std::is_move_constructible_v<mm::fixed_vector<mm::test::MoveOnly, 4>>);

namespace
{
struct pinned
{
    pinned() = default;
    ~pinned() {}
    pinned(pinned const&) = delete;
    pinned(pinned&&) = delete;
    pinned& operator=(pinned const&) = delete;
    pinned& operator=(pinned&&) = delete;
};
} // namespace

// neither copyable nor movable elements make the container pinned as well
static_assert(!std::is_copy_constructible_v<mm::fixed_vector<pinned, 4>>);
static_assert(!std::is_move_constructible_v<mm::fixed_vector<pinned, 4>>);
static_assert(!std::is_move_assignable_v<mm::fixed_vector<pinned, 4>>);

// storage is inline: no pointer, just N slots and the size
static_assert(sizeof(mm::fixed_vector<mm::i64, 8>) == sizeof(mm::i64) * 8 + sizeof(mm::isize));
static_assert(mm::fixed_vector<int, 7>::capacity() == 7);

using mm::test::Tracked;

TEST("fixed_vector - default construction invariants")
{
    SECTION("empty state")
    {
        mm::fixed_vector<int, 4> v;
        CHECK(v.size() == 0);
        CHECK(v.empty());
        CHECK(!v.is_full());
        CHECK(v.begin() == v.end());
        CHECK(v.capacity() == 4);
        CHECK(v.capacity_remaining() == 4);
    }

    SECTION("no element is constructed up front")
    {
        Tracked::reset_counters();
        {
            mm::fixed_vector<Tracked, 8> v;
            CHECK(v.empty());
        }
        CHECK(Tracked::default_ctor_count == 0);
        CHECK(Tracked::dtor_count == 0);
    }

    SECTION("zero capacity")
    {
        mm::fixed_vector<int, 0> v;
        CHECK(v.empty());
        CHECK(v.is_full());
        MM_CHECK_ASSERTS(v.push_back(1));
    }
}

TEST("fixed_vector - appends")
{
    SECTION("push_back and emplace_back")
    {
        mm::fixed_vector<std::string, 3> v;
        v.push_back("a");
        v.emplace_back(2, 'b');
        auto& last = v.emplace_back("c");

        CHECK(v.size() == 3);
        CHECK(v.is_full());
        CHECK(v[0] == "a");
        CHECK(v[1] == "bb");
        CHECK(&last == &v.back());
        CHECK(v.front() == "a");
        CHECK(v.back() == "c");
    }

    SECTION("references stay valid while appending")
    {
        mm::fixed_vector<int, 8> v;
        auto& first = v.push_back(10);
        for (auto i = 0; i < 7; ++i)
            v.push_back(i);
        CHECK(&first == v.data());
        CHECK(first == 10);
    }

    SECTION("initializer list")
    {
        mm::fixed_vector<int, 5> v = {1, 2, 3};
        CHECK(v.size() == 3);
        CHECK(v[2] == 3);
    }

    SECTION("exceeding the capacity asserts and leaves the vector untouched")
    {
        mm::fixed_vector<int, 2> v = {1, 2};
        MM_CHECK_ASSERTS(v.push_back(3));
        CHECK(v.size() == 2);
        CHECK(v[0] == 1);
        CHECK(v[1] == 2);
    }
}

TEST("fixed_vector - removals")
{
    SECTION("pop_back and remove_back")
    {
        mm::fixed_vector<int, 4> v = {1, 2, 3};
        CHECK(v.pop_back() == 3);
        v.remove_back();
        CHECK(v.size() == 1);
        CHECK(v[0] == 1);
    }

    SECTION("pop_at keeps order")
    {
        mm::fixed_vector<int, 8> v = {1, 2, 3, 4, 5};
        CHECK(v.pop_at(1) == 2);
        REQUIRE(v.size() == 4);
        CHECK(v[0] == 1);
        CHECK(v[1] == 3);
        CHECK(v[2] == 4);
        CHECK(v[3] == 5);

        v.remove_at(3);
        REQUIRE(v.size() == 3);
        CHECK(v[2] == 4);
    }

    SECTION("pop_at_unordered fills the gap with the last element")
    {
        mm::fixed_vector<int, 8> v = {1, 2, 3, 4, 5};
        CHECK(v.pop_at_unordered(1) == 2);
        REQUIRE(v.size() == 4);
        CHECK(v[0] == 1);
        CHECK(v[1] == 5);
        CHECK(v[2] == 3);
        CHECK(v[3] == 4);

        v.remove_at_unordered(3);
        CHECK(v.size() == 3);
        CHECK(v[2] == 3);
    }

    SECTION("remove_all_where is stable")
    {
        mm::fixed_vector<int, 8> v = {1, 2, 3, 4, 5, 6};
        auto const removed = v.remove_all_where([](int x) { return x % 2 == 0; });
        CHECK(removed == 3);
        REQUIRE(v.size() == 3);
        CHECK(v[0] == 1);
        CHECK(v[1] == 3);
        CHECK(v[2] == 5);
    }

    SECTION("preconditions")
    {
        mm::fixed_vector<int, 4> v;
        MM_CHECK_ASSERTS(v.pop_back());
        MM_CHECK_ASSERTS(v.remove_back());
        MM_CHECK_ASSERTS(v.front());
        v.push_back(1);
        MM_CHECK_ASSERTS(v[1]);
        MM_CHECK_ASSERTS(v[-1]);
        MM_CHECK_ASSERTS(v.pop_at(1));
    }
}

TEST("fixed_vector - object lifetimes")
{
    SECTION("removal destroys exactly one object")
    {
        Tracked::reset_counters();
        {
            mm::fixed_vector<Tracked, 4> v;
            v.emplace_back(1);
            v.emplace_back(2);
            v.emplace_back(3);
            CHECK(Tracked::live_count() == 3);

            v.remove_at(0);
            CHECK(Tracked::live_count() == 2);
            CHECK(v[0].value == 2);
            CHECK(v[1].value == 3);

            v.remove_at_unordered(0);
            CHECK(Tracked::live_count() == 1);
            CHECK(v[0].value == 3);
        }
        CHECK(Tracked::live_count() == 0);
    }

    SECTION("destruction order is reverse")
    {
        std::vector<int> order;
        Tracked::reset_counters();
        {
            mm::fixed_vector<Tracked, 4> v;
            v.emplace_back(1);
            v.emplace_back(2);
            v.emplace_back(3);
            Tracked::destruction_order = &order;
        }
        Tracked::destruction_order = nullptr;
        REQUIRE(order.size() == 3);
        CHECK(order[0] == 3);
        CHECK(order[1] == 2);
        CHECK(order[2] == 1);
    }

    SECTION("clear")
    {
        Tracked::reset_counters();
        mm::fixed_vector<Tracked, 4> v;
        v.emplace_back(1);
        v.emplace_back(2);
        v.clear();
        CHECK(v.empty());
        CHECK(Tracked::live_count() == 0);
        v.emplace_back(3);
        CHECK(v.size() == 1);
        CHECK(v[0].value == 3);
    }
}

TEST("fixed_vector - copy and move")
{
    SECTION("copy is independent")
    {
        mm::fixed_vector<std::string, 4> a = {"x", "y"};
        auto b = a;
        b[0] = "changed";
        b.push_back("z");
        CHECK(a.size() == 2);
        CHECK(a[0] == "x");
        CHECK(b.size() == 3);
        CHECK(b[0] == "changed");
    }

    SECTION("copy assignment replaces the content")
    {
        Tracked::reset_counters();
        {
            mm::fixed_vector<Tracked, 4> a;
            a.emplace_back(1);
            mm::fixed_vector<Tracked, 4> b;
            b.emplace_back(7);
            b.emplace_back(8);
            b = a;
            REQUIRE(b.size() == 1);
            CHECK(b[0].value == 1);
            CHECK(Tracked::live_count() == 2);
        }
        CHECK(Tracked::live_count() == 0);
    }

    SECTION("move leaves the source empty")
    {
        mm::fixed_vector<mm::test::MoveOnly, 4> a;
        a.emplace_back(5);
        a.emplace_back(6);
        auto b = mm::move(a);
        CHECK(a.empty());
        REQUIRE(b.size() == 2);
        CHECK(b[1].value == 6);

        mm::fixed_vector<mm::test::MoveOnly, 4> c;
        c.emplace_back(1);
        c = mm::move(b);
        CHECK(b.empty());
        REQUIRE(c.size() == 2);
        CHECK(c[0].value == 5);
    }

    SECTION("positional equality")
    {
        mm::fixed_vector<int, 4> a = {1, 2};
        mm::fixed_vector<int, 4> b = {1, 2};
        mm::fixed_vector<int, 4> c = {2, 1};
        CHECK((a == b));
        CHECK((a != c));
    }
}

TEST("fixed_vector - throwing element copies")
{
    using mm::test::copy_failure;
    using mm::test::ThrowOnCopy;

    SECTION("copy construction destroys the partial copy")
    {
        ThrowOnCopy::reset_counters();
        {
            mm::fixed_vector<ThrowOnCopy, 4> a;
            a.emplace_back(1);
            a.emplace_back(2);
            a.emplace_back(3);

            ThrowOnCopy::copies_until_throw = 1;
            auto threw = false;
            try
            {
                auto b = a;
                (void)b;
            }
            catch (copy_failure const&)
            {
                threw = true;
            }
            CHECK(threw);
            CHECK(a.size() == 3);
            CHECK(ThrowOnCopy::live == 3);
        }
        CHECK(ThrowOnCopy::live == 0);
    }

    SECTION("initializer list construction destroys the partial copy")
    {
        ThrowOnCopy::reset_counters();
        ThrowOnCopy::copies_until_throw = 2;
        auto threw = false;
        try
        {
            mm::fixed_vector<ThrowOnCopy, 4> v = {ThrowOnCopy(1), ThrowOnCopy(2), ThrowOnCopy(3)};
            (void)v;
        }
        catch (copy_failure const&)
        {
            threw = true;
        }
        CHECK(threw);
        CHECK(ThrowOnCopy::live == 0);
    }

    SECTION("copy assignment keeps ownership of the copied prefix")
    {
        ThrowOnCopy::reset_counters();
        {
            mm::fixed_vector<ThrowOnCopy, 4> a;
            a.emplace_back(1);
            a.emplace_back(2);
            a.emplace_back(3);
            mm::fixed_vector<ThrowOnCopy, 4> b;
            b.emplace_back(7);

            ThrowOnCopy::copies_until_throw = 1;
            auto threw = false;
            try
            {
                b = a;
            }
            catch (copy_failure const&)
            {
                threw = true;
            }
            CHECK(threw);
            REQUIRE(b.size() == 1);
            CHECK(b[0].value == 1);
            CHECK(ThrowOnCopy::live == 4);
        }
        CHECK(ThrowOnCopy::live == 0);
    }
}
