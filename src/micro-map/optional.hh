#pragma once

#include <micro-map/assert.hh>
#include <micro-map/fwd.hh>
#include <micro-map/utility.hh>

#include <type_traits>

/// Sentinel type for the "no value" state of optional.
/// Deliberately lacks a default constructor so that optional<T> = {} stays unambiguous.
struct mm::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace mm
{
/// The canonical empty value: return mm::nullopt; or if (opt == mm::nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace mm

/// Either a value of type T or nothing.
/// fixed_map::insert returns the replaced value this way and fixed_map::remove the removed one:
/// a miss is an ordinary outcome, not an error.
///
/// Subset of std::optional: no operator* / operator->, access goes through value() which asserts engagement.
/// Trivially copyable when T is trivially copyable.
template <class T>
struct mm::optional
{
    // construction
public:
    optional() = default;

    /// Constructs an engaged optional; explicit if U does not implicitly convert to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (mm::placement_new, &_storage.value) T(mm::forward<U>(value));
    }

    constexpr optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Leaves rhs empty: the moved-from value is destroyed right away.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (mm::placement_new, &_storage.value) T(mm::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (mm::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value (like std::optional).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = mm::move(rhs._storage.value);
            else
                new (mm::placement_new, &_storage.value) T(mm::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (mm::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    [[nodiscard]] constexpr T& value() &
    {
        MM_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        MM_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        MM_ASSERT(_has_value, "attempted to access value of empty optional");
        return mm::move(_storage.value);
    }

    /// Returns the held value or the fallback if empty.
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(mm::forward<U>(fallback));
    }

    // comparison
public:
    /// Both empty, or both engaged with equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Engaged with a value equal to rhs.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Prevents optional<int> == true from compiling through implicit conversions.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    mm::storage_for<T> _storage;
    bool _has_value = false;
};
