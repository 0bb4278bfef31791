#pragma once

#include <micro-map/assert.hh>
#include <micro-map/fwd.hh>
#include <micro-map/impl/object_lifetime_util.hh>
#include <micro-map/utility.hh>

#include <initializer_list>
#include <type_traits>


/// Fixed-capacity vector of up to N elements of type T.
/// Similar to a vector but with compile-time maximum capacity.
/// Does not perform dynamic allocation - all storage is inline.
/// Supports runtime variable size up to the fixed capacity N.
///
/// Layout: raw aligned storage for N elements plus the live count.
/// Exactly the prefix [0, size()) holds live objects; the remaining slots are raw memory
/// that is never read, copied or destroyed.
///
/// Exceeding the capacity is a programmer error and checked in every build mode (MM_ASSERT_ALWAYS).
/// The check happens before any element is touched, so a throwing assertion handler leaves the
/// vector unchanged.
///
/// Removal comes in two flavors:
///   pop_at / remove_at                     - shift-left, keeps the relative order, O(size - idx)
///   pop_at_unordered / remove_at_unordered - swap with last, O(1), breaks order
///
/// Trivially copyable and trivially destructible when T is.
template <class T, mm::isize N>
struct mm::fixed_vector
{
    static_assert(N >= 0, "fixed_vector capacity must be non-negative");

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        MM_ASSERT(0 <= i && i < _size, "index out of bounds");
        return data()[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        MM_ASSERT(0 <= i && i < _size, "index out of bounds");
        return data()[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] T& front()
    {
        MM_ASSERT(_size > 0, "front() called on empty fixed_vector");
        return data()[0];
    }
    [[nodiscard]] T const& front() const
    {
        MM_ASSERT(_size > 0, "front() called on empty fixed_vector");
        return data()[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] T& back()
    {
        MM_ASSERT(_size > 0, "back() called on empty fixed_vector");
        return data()[_size - 1];
    }
    [[nodiscard]] T const& back() const
    {
        MM_ASSERT(_size > 0, "back() called on empty fixed_vector");
        return data()[_size - 1];
    }

    /// Pointer to the first slot; never nullptr, even when empty.
    [[nodiscard]] T* data() { return _storage.ptr(); }
    [[nodiscard]] T const* data() const { return _storage.ptr(); }

    // iterators
public:
    [[nodiscard]] T* begin() { return data(); }
    [[nodiscard]] T* end() { return data() + _size; }
    [[nodiscard]] T const* begin() const { return data(); }
    [[nodiscard]] T const* end() const { return data() + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }
    [[nodiscard]] constexpr bool is_full() const { return _size == N; }

    /// The compile-time capacity N.
    [[nodiscard]] static constexpr isize capacity() { return N; }

    /// Number of elements that can still be added.
    [[nodiscard]] constexpr isize capacity_remaining() const { return N - _size; }

    // appends
public:
    /// Constructs a new element at the back.
    /// Precondition (always checked): !is_full().
    /// Strong exception safety: if T(...) throws, size() is unchanged.
    /// References to existing elements stay valid (storage never moves).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(mm::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");
        MM_ASSERT_ALWAYS(_size < N, "fixed_vector capacity exceeded");
        auto const p = new (mm::placement_new, data() + _size) T(mm::forward<Args>(args)...);
        ++_size; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(mm::move(value)); }

    // removals
public:
    /// Removes and returns the last element.
    /// Precondition: !empty().
    [[nodiscard("use remove_back() if you don't need the return value")]] T pop_back()
    {
        MM_ASSERT(_size > 0, "cannot pop from empty container");
        auto const p_last = data() + _size - 1;
        auto value = mm::move(*p_last);
        p_last->~T();
        --_size;
        return value;
    }

    /// Removes the last element.
    /// Precondition: !empty().
    void remove_back()
    {
        MM_ASSERT(_size > 0, "cannot remove from empty container");
        --_size;
        (data() + _size)->~T();
    }

    /// Removes and returns the element at idx, shifting all later elements one slot to the front.
    /// Keeps the relative order of the remaining elements.
    /// Precondition: 0 <= idx < size().
    [[nodiscard("use remove_at() if you don't need the return value")]] T pop_at(isize idx)
    {
        MM_ASSERT(0 <= idx && idx < _size, "index out of bounds");
        auto const p_obj = data() + idx;

        auto value = mm::move(*p_obj);
        impl::compact_move_objects_backward(p_obj, p_obj + 1, data() + _size);

        // the last slot now holds a moved-from object
        --_size;
        (data() + _size)->~T();

        return value;
    }

    /// Removes the element at idx, shifting all later elements one slot to the front.
    /// Precondition: 0 <= idx < size().
    void remove_at(isize idx)
    {
        MM_ASSERT(0 <= idx && idx < _size, "index out of bounds");
        auto const p_obj = data() + idx;

        impl::compact_move_objects_backward(p_obj, p_obj + 1, data() + _size);

        --_size;
        (data() + _size)->~T();
    }

    /// Removes and returns the element at idx by moving the last element into its slot.
    /// Does not preserve order. O(1).
    /// Precondition: 0 <= idx < size().
    [[nodiscard("use remove_at_unordered() if you don't need the return value")]] T pop_at_unordered(isize idx)
    {
        MM_ASSERT(0 <= idx && idx < _size, "index out of bounds");
        auto const p_obj = data() + idx;

        auto value = mm::move(*p_obj);

        --_size;
        auto const p_last = data() + _size;
        if (p_obj != p_last)
            *p_obj = mm::move(*p_last);
        p_last->~T();

        return value;
    }

    /// Removes the element at idx by moving the last element into its slot.
    /// Precondition: 0 <= idx < size().
    void remove_at_unordered(isize idx)
    {
        MM_ASSERT(0 <= idx && idx < _size, "index out of bounds");
        auto const p_obj = data() + idx;

        --_size;
        auto const p_last = data() + _size;
        if (p_obj != p_last)
            *p_obj = mm::move(*p_last);
        p_last->~T();
    }

    /// Removes all elements for which pred(element) returns true.
    /// Survivors keep their relative order.
    /// Returns the number of removed elements.
    template <class Pred>
    isize remove_all_where(Pred&& pred)
    {
        auto const p_end = data() + _size;
        auto const p_new_end
            = impl::compact_move_objects_if(data(), p_end, [&](T const& v) -> bool { return !bool(pred(v)); });

        impl::destroy_objects_in_reverse(p_new_end, p_end);
        auto const removed = isize(p_end - p_new_end);
        _size -= removed;
        return removed;
    }

    /// Destroys all elements, size() becomes 0.
    void clear()
    {
        impl::destroy_objects_in_reverse(data(), data() + _size);
        _size = 0;
    }

    // ctors / assignment
public:
    fixed_vector() = default;

    /// Precondition (always checked): values.size() <= N.
    fixed_vector(std::initializer_list<T> values)
    {
        MM_ASSERT_ALWAYS(isize(values.size()) <= N, "fixed_vector capacity exceeded");
        copy_construct_from(values.begin(), values.end());
    }

    // trivially copyable T: copy the whole storage block, which keeps fixed_vector trivial
    fixed_vector(fixed_vector const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    fixed_vector(fixed_vector&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    fixed_vector& operator=(fixed_vector const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    fixed_vector& operator=(fixed_vector&&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~fixed_vector()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial T: only the live prefix is copied / moved / destroyed

    fixed_vector(fixed_vector const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        copy_construct_from(rhs.data(), rhs.data() + rhs._size);
    }

    /// Moves every element over; rhs is empty afterwards.
    fixed_vector(fixed_vector&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> && std::is_move_constructible_v<T>)
    {
        auto p_end = data();
        impl::move_create_objects_to(p_end, rhs.data(), rhs.data() + rhs._size);
        _size = rhs._size;
        rhs.clear();
    }

    fixed_vector& operator=(fixed_vector const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (this != &rhs)
        {
            clear();

            // if a copy throws, the already copied prefix stays owned by this vector
            auto p_end = data();
            try
            {
                impl::copy_create_objects_to(p_end, rhs.data(), rhs.data() + rhs._size);
            }
            catch (...)
            {
                _size = p_end - data();
                throw;
            }
            _size = rhs._size;
        }
        return *this;
    }

    /// Moves every element over; rhs is empty afterwards.
    fixed_vector& operator=(fixed_vector&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T> && std::is_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            clear();
            auto p_end = data();
            impl::move_create_objects_to(p_end, rhs.data(), rhs.data() + rhs._size);
            _size = rhs._size;
            rhs.clear();
        }
        return *this;
    }

    ~fixed_vector()
        requires(!std::is_trivially_destructible_v<T>)
    {
        impl::destroy_objects_in_reverse(data(), data() + _size);
    }

    // comparison
public:
    /// Element-wise comparison of the live prefixes (sizes must match).
    [[nodiscard]] friend bool operator==(fixed_vector const& lhs, fixed_vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._size != rhs._size)
            return false;
        for (isize i = 0; i < lhs._size; ++i)
            if (!(lhs.data()[i] == rhs.data()[i]))
                return false;
        return true;
    }

    // helper
private:
    // only for constructors: the destructor does not run if a copy throws,
    // so the already copied prefix is destroyed here before rethrowing
    void copy_construct_from(T const* src_start, T const* src_end)
    {
        auto p_end = data();
        try
        {
            impl::copy_create_objects_to(p_end, src_start, src_end);
        }
        catch (...)
        {
            impl::destroy_objects_in_reverse(data(), p_end);
            throw;
        }
        _size = p_end - data();
    }

    // members
private:
    mm::slot_storage<T, N> _storage;
    isize _size = 0;
};
