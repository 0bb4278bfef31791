#pragma once

#include <micro-map/fwd.hh>
#include <micro-map/utility.hh>

#include <cstring>

// Low-level helpers for containers that manage object lifetimes inside raw storage themselves.
// All ranges are half-open [start, end). Empty ranges are valid and result in a no-op.
// The "create" functions construct into UNINITIALIZED memory, the "assign" functions write over LIVE objects.

namespace mm::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) into uninitialized memory starting at dest_end.
/// dest_end is incremented after each successful construction, so if a copy throws,
/// [original dest_end, dest_end) is exactly the range the caller has to clean up.
/// Trivially copyable types are copied with memcpy.
template <class T>
void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            std::memcpy(dest_end, src_start, count * sizeof(T));
            dest_end += count;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (mm::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) into uninitialized memory starting at dest_end.
/// Same dest_end protocol as copy_create_objects_to.
/// The source objects stay alive (moved-from) and must still be destroyed by their owner.
template <class T>
void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            std::memcpy(dest_end, src_start, count * sizeof(T));
            dest_end += count;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (mm::placement_new, dest_end) T(mm::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Shifts the live objects [src_start, src_end) down to start at dest via move assignment.
/// Precondition: dest < src_start, and [dest, src_end) are all live objects.
/// Afterwards [dest, dest + (src_end - src_start)) holds the shifted values in their original order
/// and the trailing (src_start - dest) objects are moved-from but still alive.
/// Returns the new end of the compacted range.
/// Used for order-preserving removal.
template <class T>
constexpr T* compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");
    MM_ASSERT(dest <= src_start, "can only compact towards the front");

    while (src_start != src_end)
    {
        *dest = mm::move(*src_start);
        ++dest;
        ++src_start;
    }
    return dest;
}

/// Stable in-place filter over the live objects [start, end).
/// Objects for which keep(obj) returns false are overwritten by later survivors (move assignment),
/// relative order of survivors is preserved.
/// Returns the new end; objects in [new_end, end) are moved-from or rejected but still alive.
template <class T, class KeepF>
constexpr T* compact_move_objects_if(T* start, T* end, KeepF&& keep)
{
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    auto write = start;
    for (auto read = start; read != end; ++read)
    {
        if (!keep(static_cast<T const&>(*read)))
            continue;

        if (write != read)
            *write = mm::move(*read);
        ++write;
    }
    return write;
}
} // namespace mm::impl
