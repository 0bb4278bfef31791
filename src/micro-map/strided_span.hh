#pragma once

#include <micro-map/assert.hh>
#include <micro-map/fwd.hh>

#include <type_traits>

/// Forward iterator over elements of type T that are a constant number of bytes apart.
///
/// fixed_map uses it to walk a single member (key or value) of consecutive entries:
/// the stride is sizeof(entry), the start is the member of the first entry.
template <class T>
struct mm::strided_iterator
{
    using difference_type = isize;
    using value_type = std::remove_cv_t<T>;
    using byte_ptr = std::conditional_t<std::is_const_v<T>, mm::byte const*, mm::byte*>;

    constexpr strided_iterator() = default;
    constexpr strided_iterator(byte_ptr ptr, isize stride) : _ptr(ptr), _stride_bytes(stride) {}

    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    [[nodiscard]] T& operator*() const { return *reinterpret_cast<T*>(_ptr); }
    [[nodiscard]] T* operator->() const { return reinterpret_cast<T*>(_ptr); }
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

    constexpr strided_iterator& operator++()
    {
        _ptr += _stride_bytes;
        return *this;
    }
    constexpr strided_iterator operator++(int)
    {
        auto const tmp = *this;
        ++(*this);
        return tmp;
    }

    [[nodiscard]] friend constexpr bool operator==(strided_iterator const& lhs, strided_iterator const& rhs)
    {
        return lhs._ptr == rhs._ptr;
    }

private:
    byte_ptr _ptr = nullptr;
    isize _stride_bytes = 0;
};

/// Non-owning view over size() elements of type T with a constant byte stride between them.
///
/// Typical use is a projection of one member out of an array of structs:
///
///     struct entry { int key; float value; };
///     entry entries[8];
///     auto keys = mm::strided_span<int>::create_from_member(entries, 8, &entry::key);
///
/// The viewed objects must outlive the span. Trivially copyable.
template <class T>
struct mm::strided_span
{
    // types
public:
    using byte_ptr = std::conditional_t<std::is_const_v<T>, mm::byte const*, mm::byte*>;
    using iterator = mm::strided_iterator<T>;

private:
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    [[nodiscard]] MM_FORCE_INLINE static byte_ptr to_byte_ptr(T* ptr) { return reinterpret_cast<byte_ptr>(ptr); }
    [[nodiscard]] MM_FORCE_INLINE static T* from_byte_ptr(byte_ptr ptr) { return reinterpret_cast<T*>(ptr); }
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

    // construction
public:
    /// Empty view: size() == 0.
    constexpr strided_span() = default;

    /// Views size elements starting at ptr, stride_bytes apart.
    /// Precondition: size >= 0.
    explicit strided_span(T* ptr, isize size, isize stride_bytes) // NOLINT(bugprone-easily-swappable-parameters)
      : _start(strided_span::to_byte_ptr(ptr)), _size(size), _stride_bytes(stride_bytes)
    {
        MM_ASSERT(size >= 0, "strided_span size must be non-negative");
    }

    /// Views the member `member` of each of the count objects starting at first.
    /// The stride is sizeof(S). count == 0 yields an empty view without touching first.
    template <class S, class C, class M>
        requires std::is_same_v<std::remove_const_t<S>, C> && std::is_same_v<std::remove_const_t<T>, M>
    [[nodiscard]] static strided_span create_from_member(S* first, isize count, M C::* member)
    {
        MM_ASSERT(count >= 0, "count must be non-negative");
        if (count == 0)
            return strided_span();
        return strided_span(&(first->*member), count, isize(sizeof(S)));
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i) const
    {
        MM_ASSERT(0 <= i && i < _size, "index out of bounds");
        return *strided_span::from_byte_ptr(_start + i * _stride_bytes);
    }

    /// Precondition: !empty().
    [[nodiscard]] T& front() const
    {
        MM_ASSERT(_size > 0, "front() called on empty strided_span");
        return *strided_span::from_byte_ptr(_start);
    }

    /// Precondition: !empty().
    [[nodiscard]] T& back() const
    {
        MM_ASSERT(_size > 0, "back() called on empty strided_span");
        return *strided_span::from_byte_ptr(_start + (_size - 1) * _stride_bytes);
    }

    // iterators
public:
    [[nodiscard]] constexpr iterator begin() const { return iterator(_start, _stride_bytes); }
    [[nodiscard]] constexpr iterator end() const { return iterator(_start + _size * _stride_bytes, _stride_bytes); }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }
    [[nodiscard]] constexpr isize stride_bytes() const { return _stride_bytes; }

    // members
private:
    byte_ptr _start = nullptr;
    isize _size = 0;
    isize _stride_bytes = 0;
};
