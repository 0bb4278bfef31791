#pragma once

#include <micro-map/assert.hh>
#include <micro-map/fixed_vector.hh>
#include <micro-map/fwd.hh>
#include <micro-map/optional.hh>
#include <micro-map/strided_span.hh>
#include <micro-map/utility.hh>

#include <initializer_list>
#include <type_traits>


/// Associative container mapping keys of type K to values of type V, for at most N entries.
///
/// Built for very small maps (roughly up to 20 entries), where it beats hash maps:
/// - all entries live inline in the map object, there is no heap allocation ever
/// - lookup is a linear scan with K's operator==, there is no hashing
/// - K only needs to be equality comparable (no hash, no ordering)
/// Past a few dozen entries the linear scan dominates and a hash map is the better choice.
///
/// Layout: a fixed_vector of { key, value } entries.
/// The live entries always form the prefix [0, size()) of the storage, keys are unique within it.
///
/// Ordering:
/// - inserting a new key appends it, so iteration follows insertion order
/// - overwriting an existing key keeps its position
/// - remove() shifts all later entries one slot to the front, so the remaining entries keep
///   their relative order (O(size) moves, but no reordering surprises)
///
/// Capacity:
/// Inserting a NEW key into a full map is a programmer error. It is checked in every build mode
/// via MM_ASSERT_ALWAYS and aborts unless a custom assertion handler unwinds; the map is unchanged
/// in that case. Use is_full() to check beforehand. Overwriting an existing key never fails.
///
/// Lookup functions accept any type Q that compares with K via operator==,
/// e.g. a fixed_map<std::string, int, 8> can be queried with a std::string_view or a string literal.
///
/// Iteration yields `entry const&` (keys are never mutable in place).
/// keys() and values() give strided views of just the keys or values; values() of a mutable map allows
/// modifying values during iteration. Any insert of a new key, remove, retain or clear invalidates iterators.
///
/// Not thread-safe: concurrent readers are fine, writers need external synchronization.
///
/// Usage:
///   mm::fixed_map<int, float, 8> m;
///   m.insert(1, 0.5f);
///   if (auto const p = m.get(1))
///       use(*p);
///   auto const old = m.remove(1); // optional<float>
template <class K, class V, mm::isize N>
struct mm::fixed_map
{
    static_assert(N >= 0, "fixed_map capacity must be non-negative");
    static_assert(requires(K const& k) { bool(k == k); }, "fixed_map keys must be equality comparable");

    // types
public:
    /// A single key/value pair as stored in the map.
    /// Supports structured bindings: for (auto const& [k, v] : map)
    struct entry
    {
        K key;
        V value;

        [[nodiscard]] friend bool operator==(entry const&, entry const&) = default;
    };

    using key_t = K;
    using value_t = V;

    // lookup
public:
    /// Returns a pointer to the value stored for key, or nullptr if the key is not present.
    /// O(size()) key comparisons.
    template <class Q>
        requires requires(K const& k, Q const& q) { bool(k == q); }
    [[nodiscard]] V* get(Q const& key)
    {
        auto const idx = find_index(key);
        return idx < 0 ? nullptr : &_entries[idx].value;
    }
    template <class Q>
        requires requires(K const& k, Q const& q) { bool(k == q); }
    [[nodiscard]] V const* get(Q const& key) const
    {
        auto const idx = find_index(key);
        return idx < 0 ? nullptr : &_entries[idx].value;
    }

    /// Returns the value stored for key.
    /// Precondition: contains_key(key).
    template <class Q>
        requires requires(K const& k, Q const& q) { bool(k == q); }
    [[nodiscard]] V& at(Q const& key)
    {
        auto const idx = find_index(key);
        MM_ASSERT(idx >= 0, "key not found in fixed_map");
        return _entries[idx].value;
    }
    template <class Q>
        requires requires(K const& k, Q const& q) { bool(k == q); }
    [[nodiscard]] V const& at(Q const& key) const
    {
        auto const idx = find_index(key);
        MM_ASSERT(idx >= 0, "key not found in fixed_map");
        return _entries[idx].value;
    }

    template <class Q>
        requires requires(K const& k, Q const& q) { bool(k == q); }
    [[nodiscard]] bool contains_key(Q const& key) const
    {
        return find_index(key) >= 0;
    }

    // modifiers
public:
    /// Associates value with key.
    /// If key is already present, its value is replaced in place and the previous value is returned;
    /// size() and entry order are unchanged.
    /// Otherwise the entry is appended and nullopt is returned.
    /// Precondition (always checked) for new keys: !is_full().
    mm::optional<V> insert(K key, V value)
    {
        auto const idx = find_index(key);
        if (idx >= 0)
        {
            auto& slot = _entries[idx].value;
            auto previous = mm::move(slot);
            slot = mm::move(value);
            return mm::move(previous);
        }

        MM_ASSERT_ALWAYS(!_entries.is_full(), "fixed_map capacity exceeded: cannot insert a new key into a full map");
        _entries.emplace_back(entry{mm::move(key), mm::move(value)});
        return mm::nullopt;
    }

    /// Removes the entry for key and returns its value, or nullopt if the key is not present.
    /// Later entries move one slot to the front, keeping their relative order.
    template <class Q>
        requires requires(K const& k, Q const& q) { bool(k == q); }
    mm::optional<V> remove(Q const& key)
    {
        auto const idx = find_index(key);
        if (idx < 0)
            return mm::nullopt;

        auto removed = _entries.pop_at(idx);
        return mm::move(removed.value);
    }

    /// Keeps only the entries for which keep(key, value) returns true.
    /// Survivors keep their relative order.
    /// Returns the number of removed entries.
    template <class KeepF>
        requires requires(KeepF&& f, K const& k, V const& v) { bool(f(k, v)); }
    isize retain(KeepF&& keep)
    {
        return _entries.remove_all_where([&](entry const& e) -> bool { return !bool(keep(e.key, e.value)); });
    }

    /// Destroys all entries; the capacity stays available.
    void clear() { _entries.clear(); }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _entries.size(); }
    [[nodiscard]] constexpr bool empty() const { return _entries.empty(); }
    [[nodiscard]] constexpr bool is_full() const { return _entries.is_full(); }

    /// The compile-time capacity N.
    [[nodiscard]] static constexpr isize capacity() { return N; }

    // iteration
public:
    [[nodiscard]] entry const* begin() const { return _entries.begin(); }
    [[nodiscard]] entry const* end() const { return _entries.end(); }

    /// View over all keys in iteration order.
    [[nodiscard]] mm::strided_span<K const> keys() const
    {
        return mm::strided_span<K const>::create_from_member(_entries.data(), _entries.size(), &entry::key);
    }

    /// View over all values in iteration order, values can be modified through it.
    [[nodiscard]] mm::strided_span<V> values()
    {
        return mm::strided_span<V>::create_from_member(_entries.data(), _entries.size(), &entry::value);
    }
    [[nodiscard]] mm::strided_span<V const> values() const
    {
        return mm::strided_span<V const>::create_from_member(_entries.data(), _entries.size(), &entry::value);
    }

    // ctors
public:
    fixed_map() = default;

    /// Inserts the given pairs in order with insert() semantics:
    /// a repeated key keeps its first position and ends up with the last value.
    /// Precondition (always checked): at most N distinct keys.
    fixed_map(std::initializer_list<entry> entries)
    {
        for (auto const& e : entries)
            insert(e.key, e.value);
    }

    // value semantics: copies duplicate every entry, moves leave the source empty
    // (all handled by fixed_vector)

    // comparison
public:
    /// Two maps are equal if they hold the same key/value pairs, regardless of entry order.
    /// Maps of different capacities can be compared.
    template <isize M>
    [[nodiscard]] bool operator==(fixed_map<K, V, M> const& rhs) const
        requires requires(V const& v) { bool(v == v); }
    {
        if (size() != rhs.size())
            return false;

        // keys are unique on both sides, so equal sizes + every lhs entry found in rhs is enough
        for (auto const& e : _entries)
        {
            auto const p = rhs.get(e.key);
            if (p == nullptr || !(*p == e.value))
                return false;
        }
        return true;
    }

private:
    // index of the entry with the given key, -1 if absent
    template <class Q>
    [[nodiscard]] isize find_index(Q const& key) const
    {
        auto const p = _entries.data();
        auto const n = _entries.size();
        for (isize i = 0; i < n; ++i)
            if (p[i].key == key)
                return i;
        return -1;
    }

    // members
private:
    mm::fixed_vector<entry, N> _entries;
};
