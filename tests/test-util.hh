#pragma once

#include <micro-map/assert-handler.hh>

#include <nexus/test.hh>

#include <vector>

namespace mm::test
{
struct assertion_triggered
{
};

/// Runs f with a throwing assertion handler installed.
/// Returns true if an MM_ASSERT / MM_ASSERT_ALWAYS inside f failed.
template <class F>
bool triggers_assertion(F&& f)
{
    auto handler = mm::impl::scoped_assertion_handler([](mm::impl::assertion_info const&)
                                                      { throw assertion_triggered{}; });
    try
    {
        f();
    }
    catch (assertion_triggered const&)
    {
        return true;
    }
    return false;
}

/// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int default_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    static void reset_counters()
    {
        default_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
        destruction_order = nullptr;
    }

    static int live_count() { return default_ctor_count + copy_ctor_count + move_ctor_count - dtor_count; }

    Tracked() { ++default_ctor_count; }

    explicit Tracked(int v) : value(v) { ++default_ctor_count; }

    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }

    Tracked(Tracked&& rhs) noexcept : value(rhs.value)
    {
        ++move_ctor_count;
        rhs.value = -1;
    }

    Tracked& operator=(Tracked const& rhs)
    {
        value = rhs.value;
        return *this;
    }

    Tracked& operator=(Tracked&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }

    ~Tracked()
    {
        ++dtor_count;
        if (destruction_order)
            destruction_order->push_back(value);
    }

    friend bool operator==(Tracked const& a, Tracked const& b) { return a.value == b.value; }
};

/// Move-only type; the moved-from value is -1
struct MoveOnly
{
    int value = 0;

    MoveOnly() = default;
    explicit MoveOnly(int v) : value(v) {}
    MoveOnly(MoveOnly&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    MoveOnly& operator=(MoveOnly&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
    MoveOnly(MoveOnly const&) = delete;
    MoveOnly& operator=(MoveOnly const&) = delete;
};
struct copy_failure
{
};

/// Counts live instances; its copy constructor throws copy_failure once copies_until_throw reaches 0.
/// A negative copies_until_throw never throws.
struct ThrowOnCopy
{
    int value = 0;
    static inline int live = 0;
    static inline int copies_until_throw = -1;

    static void reset_counters()
    {
        live = 0;
        copies_until_throw = -1;
    }

    explicit ThrowOnCopy(int v) : value(v) { ++live; }

    ThrowOnCopy(ThrowOnCopy const& rhs) : value(rhs.value)
    {
        if (copies_until_throw == 0)
            throw copy_failure{};
        if (copies_until_throw > 0)
            --copies_until_throw;
        ++live;
    }

    ThrowOnCopy(ThrowOnCopy&& rhs) noexcept : value(rhs.value) { ++live; }

    ThrowOnCopy& operator=(ThrowOnCopy const& rhs) = default;
    ThrowOnCopy& operator=(ThrowOnCopy&& rhs) noexcept = default;

    ~ThrowOnCopy() { --live; }

    friend bool operator==(ThrowOnCopy const& a, ThrowOnCopy const& b) { return a.value == b.value; }
};
} // namespace mm::test

// CHECK that evaluating expr fails an assertion
#define MM_CHECK_ASSERTS(expr) CHECK(::mm::test::triggers_assertion([&] { (void)(expr); }))
