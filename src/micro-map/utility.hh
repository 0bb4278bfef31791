#pragma once

#include <micro-map/assert.hh>
#include <micro-map/fwd.hh>

#include <cstddef>
#include <type_traits>

// =========================================================================================================
// Utility functions and types shared by the containers
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Object storage:
//   placement_new               - tag for constructing objects into existing storage without <new>
//   storage_for<T>              - uninitialized, correctly aligned storage for exactly one T
//   slot_storage<T, N>          - uninitialized, correctly aligned storage for N objects of T
//


namespace mm
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   map.insert(mm::move(key), mm::move(value));
template <class T>
[[nodiscard]] MM_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] MM_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] MM_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Object storage
// =========================================================================================================

/// Tag type selecting our placement operator new (see bottom of this file)
/// Usage:
///   new (mm::placement_new, ptr) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Uninitialized storage for a single T
/// The member is only a live object when the owner says so (e.g. optional's _has_value flag).
/// Trivially destructible if T is, so owners can keep their triviality.
template <class T, bool = std::is_trivially_destructible_v<T>>
union storage_for
{
    constexpr storage_for() {}

    T value;
};

template <class T>
union storage_for<T, false>
{
    constexpr storage_for() {}
    constexpr ~storage_for() {}

    T value;
};

/// Uninitialized, aligned byte storage for N objects of T
/// Objects are created and destroyed by the owner (fixed_vector tracks the live prefix).
/// N == 0 still reserves one slot because zero-sized arrays are not valid C++,
/// but the slot is never used: all capacity checks are against N.
template <class T, isize N>
struct slot_storage
{
    static_assert(N >= 0, "slot_storage size must be non-negative");

    static constexpr isize slot_count = N > 0 ? N : 1;

    alignas(T) mm::byte bytes[sizeof(T) * slot_count];

    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    [[nodiscard]] T* ptr() { return reinterpret_cast<T*>(bytes); }
    [[nodiscard]] T const* ptr() const { return reinterpret_cast<T const*>(bytes); }
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
};

} // namespace mm

// =========================================================================================================
// Implementation
// =========================================================================================================

// placement new without including <new>
[[nodiscard]] MM_FORCE_INLINE void* operator new(std::size_t, mm::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

// matching placement delete, only called if a constructor throws during placement new
MM_FORCE_INLINE void operator delete(void*, mm::placement_new_t, void*) noexcept {}
