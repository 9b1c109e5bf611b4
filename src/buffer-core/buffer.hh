#pragma once

#include <buffer-core/assert.hh>
#include <buffer-core/buffer_view.hh>
#include <buffer-core/fwd.hh>
#include <buffer-core/growth.hh>
#include <buffer-core/impl/object_lifetime_util.hh>
#include <buffer-core/source.hh>
#include <buffer-core/storage.hh>
#include <buffer-core/utility.hh>

#include <functional>
#include <initializer_list>
#include <iterator>
#include <type_traits>

/// Growable, contiguous, randomly-indexable sequence of T.
///
/// Owns one bc::storage_block<T> and a logical length:
///   slots [0, size())           hold live elements
///   slots [size(), capacity())  hold no objects
///
/// Growth goes through bc::growth (doubling, starting at 16 for a default-constructed buffer).
/// Capacity never shrinks on its own; removals only shorten the live range and destroy what left it.
///
/// Every index/range argument is validated BEFORE anything is mutated.
/// Violations are reported as bc::violation::index_out_of_range, requests that do not fit the
/// index space as bc::violation::capacity_exceeded (see <buffer-core/assert-handler.hh>).
///
/// === Exception & reference guarantees ===
///
/// Element construction failures (copy ctors, emplace args) leave size and contents unchanged.
/// Move constructors are assumed not to throw: shifting and growth relocate elements by move.
/// Any growth invalidates pointers, references, views and cursors.
/// Insertions and removals invalidate everything at or behind the affected position.
///
/// Arguments that alias the buffer are fine: push_back(b[0]), insert_at(0, b[3]),
/// b.push_back_range(b), b.push_back_range(b.iterate()) and b.insert_range_at(i, b.view()) behave as if the
/// argument was copied first.
/// Other sources (e.g. a foreign span over b's slots) must not alias the buffer.
template <class T>
struct bc::buffer
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "buffer elements must be non-const object types");

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Raises index_out_of_range unless 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        BC_CHECK_INDEX(0 <= i && i < _length, "buffer index out of range");
        return _storage.slots[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        BC_CHECK_INDEX(0 <= i && i < _length, "buffer index out of range");
        return _storage.slots[i];
    }

    /// Overwrites the element at index i.
    /// Raises index_out_of_range unless 0 <= i < size().
    constexpr void update(isize i, T const& value) { (*this)[i] = value; }
    constexpr void update(isize i, T&& value) { (*this)[i] = bc::move(value); }

    [[nodiscard]] constexpr T& front()
    {
        BC_CHECK_INDEX(_length > 0, "front() called on empty buffer");
        return _storage.slots[0];
    }
    [[nodiscard]] constexpr T const& front() const
    {
        BC_CHECK_INDEX(_length > 0, "front() called on empty buffer");
        return _storage.slots[0];
    }

    [[nodiscard]] constexpr T& back()
    {
        BC_CHECK_INDEX(_length > 0, "back() called on empty buffer");
        return _storage.slots[_length - 1];
    }
    [[nodiscard]] constexpr T const& back() const
    {
        BC_CHECK_INDEX(_length > 0, "back() called on empty buffer");
        return _storage.slots[_length - 1];
    }

    /// Returns a pointer to the first slot.
    /// nullptr only for buffers without any capacity (moved-from or created with capacity 0).
    [[nodiscard]] constexpr T* data() { return _storage.slots; }
    [[nodiscard]] constexpr T const* data() const { return _storage.slots; }

    // iteration
public:
    [[nodiscard]] constexpr T* begin() { return _storage.slots; }
    [[nodiscard]] constexpr T* end() { return _storage.slots + _length; }
    [[nodiscard]] constexpr T const* begin() const { return _storage.slots; }
    [[nodiscard]] constexpr T const* end() const { return _storage.slots + _length; }

    /// Read-only snapshot window over the current live range.
    /// See bc::buffer_view for the aliasing rules.
    [[nodiscard]] constexpr bc::buffer_view<T> view() const { return bc::buffer_view<T>(_storage.slots, _length); }

    /// Fresh forward cursor over view(); every call starts from the first element.
    [[nodiscard]] constexpr bc::buffer_cursor<T> iterate() const
    {
        return bc::buffer_cursor<T>(_storage.slots, _length);
    }

    // queries
public:
    /// Logical length: number of live elements.
    [[nodiscard]] constexpr isize size() const { return _length; }
    [[nodiscard]] constexpr bool empty() const { return _length == 0; }

    /// Number of slots available without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return _storage.capacity; }

    /// Memory resource the slots come from, nullptr for the default resource.
    [[nodiscard]] constexpr bc::memory_resource const* custom_resource() const { return _storage.custom_resource; }

    /// Ensures capacity() >= min_capacity using the regular growth policy.
    /// Raises index_out_of_range for negative requests, capacity_exceeded for unsatisfiable ones.
    constexpr void reserve(isize min_capacity)
    {
        BC_CHECK_INDEX(min_capacity >= 0, "reserve with negative capacity");
        growth::ensure_capacity(_storage, _length, min_capacity);
    }

    // appends
public:
    /// Constructs a new element at the back, growing if necessary.
    /// Amortized O(1).
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(bc::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        if (_length < _storage.capacity) [[likely]]
        {
            auto const p = new (bc::placement_new, _storage.slots + _length) T(bc::forward<Args>(args)...);
            ++_length; // _after_ so exceptions in T(...) leave the state valid
            return *p;
        }

        return this->emplace_back_grow(bc::forward<Args>(args)...);
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(bc::move(value)); }

    /// Appends all elements of `source` in iteration order.
    ///
    /// Fast path: a bc::buffer<T>, bc::buffer_view<T> or bc::buffer_cursor<T> is appended with one block copy.
    /// Sized sources reserve once, then append at most size() elements.
    /// Unsized sources (e.g. one-shot input ranges) append element by element.
    template <class Source>
        requires bc::element_source<Source, T>
    constexpr void push_back_range(Source&& source)
    {
        if constexpr (bc::is_same_kind_source<Source, T>)
        {
            auto const count = source.size();
            if (count == 0)
                return;

            BC_CHECK_CAPACITY(count <= growth::max_capacity<T>() - _length, "appended range exceeds the index space");

            // source may be this buffer or a view/cursor into it: its slots move along if we grow
            auto src = source.data();
            auto const src_offset = this->aliases_storage(src) ? src - _storage.slots : isize(-1);
            if (growth::ensure_capacity(_storage, _length, _length + count) && src_offset >= 0)
                src = _storage.slots + src_offset;

            // [src, src + count) lies inside [0, _length) or outside the block, never in the tail
            this->fill_raw_tail(
                count, [&](T*& dest) { impl::copy_create_objects_to(dest, src, src + count); });
        }
        else if constexpr (bc::sized_element_source<Source, T>)
        {
            auto const count = isize(source.size());
            if (count == 0)
                return;

            BC_CHECK_CAPACITY(count <= growth::max_capacity<T>() - _length, "appended range exceeds the index space");
            growth::ensure_capacity(_storage, _length, _length + count);

            this->fill_raw_tail(count,
                                [&](T*& dest)
                                {
                                    auto it = std::begin(source);
                                    auto const end = std::end(source);
                                    for (isize i = 0; i < count && it != end; ++i, ++it)
                                    {
                                        new (bc::placement_new, dest) T(*it);
                                        ++dest;
                                    }
                                });
        }
        else
        {
            // one-shot sources cannot be re-read: roll back what was already appended
            auto const old_length = _length;
            try
            {
                for (auto&& elem : source)
                    this->emplace_back(bc::forward<decltype(elem)>(elem));
            }
            catch (...)
            {
                this->truncate(old_length);
                throw;
            }
        }
    }

    constexpr void push_back_range(std::initializer_list<T> values)
    {
        push_back_range<std::initializer_list<T>&>(values);
    }

    // insertions
public:
    /// Constructs a new element at position idx, shifting [idx, size()) one slot to the right.
    /// Raises index_out_of_range unless 0 <= idx <= size().
    /// O(size() - idx).
    template <class... Args>
    constexpr T& emplace_at(isize idx, Args&&... args)
    {
        static_assert(
            requires { T(bc::forward<Args>(args)...); }, "emplace_at: T is not constructible from "
                                                         "the provided argument types");
        BC_CHECK_INDEX(0 <= idx && idx <= _length, "insert position out of range");

        // construct first: args may reference elements that are about to move
        T value(bc::forward<Args>(args)...);

        growth::ensure_capacity(_storage, _length, _length + 1);

        auto const p = _storage.slots + idx;
        impl::open_gap(p, _storage.slots + _length, 1);
        new (bc::placement_new, p) T(bc::move(value));
        ++_length;
        return *p;
    }

    constexpr T& insert_at(isize idx, T const& value) { return emplace_at(idx, value); }
    constexpr T& insert_at(isize idx, T&& value) { return emplace_at(idx, bc::move(value)); }

    /// Inserts all elements of `source` at position idx, in iteration order.
    /// [idx, size()) is shifted right once by the full source size.
    /// Raises index_out_of_range unless 0 <= idx <= size().
    ///
    /// Fast path: a bc::buffer<T>, bc::buffer_view<T> or bc::buffer_cursor<T> is copied into the gap with one
    /// block copy.
    /// Sized sources are written element by element.
    /// Unsized sources are first collected into a temporary buffer.
    template <class Source>
        requires bc::element_source<Source, T>
    constexpr void insert_range_at(isize idx, Source&& source)
    {
        BC_CHECK_INDEX(0 <= idx && idx <= _length, "insert position out of range");

        if constexpr (bc::is_same_kind_source<Source, T>)
        {
            auto const count = source.size();
            if (count == 0)
                return;

            // the gap would move the source's own elements under it
            if (this->aliases_storage(source.data()))
            {
                auto copy = buffer::create_from(source, _storage.custom_resource);
                this->insert_range_at(idx, copy);
                return;
            }

            BC_CHECK_CAPACITY(count <= growth::max_capacity<T>() - _length, "inserted range exceeds the index space");
            growth::ensure_capacity(_storage, _length, _length + count);

            auto const src = source.data();
            this->fill_gap(idx, count, [&](T*& dest) { impl::copy_create_objects_to(dest, src, src + count); });
        }
        else if constexpr (bc::sized_element_source<Source, T>)
        {
            auto const count = isize(source.size());
            if (count == 0)
                return;

            BC_CHECK_CAPACITY(count <= growth::max_capacity<T>() - _length, "inserted range exceeds the index space");
            growth::ensure_capacity(_storage, _length, _length + count);

            this->fill_gap(idx, count,
                           [&](T*& dest)
                           {
                               auto it = std::begin(source);
                               auto const end = std::end(source);
                               for (isize i = 0; i < count && it != end; ++i, ++it)
                               {
                                   new (bc::placement_new, dest) T(*it);
                                   ++dest;
                               }
                           });
        }
        else
        {
            buffer collected(_storage.custom_resource);
            collected.push_back_range(bc::forward<Source>(source));
            this->insert_range_at(idx, collected);
        }
    }

    constexpr void insert_range_at(isize idx, std::initializer_list<T> values)
    {
        insert_range_at<std::initializer_list<T>&>(idx, values);
    }

    // removals
public:
    /// Removes and returns the element at idx, shifting [idx + 1, size()) one slot to the left.
    /// Raises index_out_of_range unless 0 <= idx < size().
    /// NOTE: Prefer remove_at() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_at() if you don't need the return value")]] constexpr T pop_at(isize idx)
    {
        BC_CHECK_INDEX(0 <= idx && idx < _length, "remove position out of range");

        T value = bc::move(_storage.slots[idx]);
        this->erase_slots(idx, 1);
        return value;
    }

    /// Removes the element at idx, shifting [idx + 1, size()) one slot to the left.
    /// Raises index_out_of_range unless 0 <= idx < size().
    constexpr void remove_at(isize idx)
    {
        BC_CHECK_INDEX(0 <= idx && idx < _length, "remove position out of range");
        this->erase_slots(idx, 1);
    }

    /// Removes `count` elements starting at `from`.
    /// count <= 0 is a no-op (and performs no bounds check).
    /// Otherwise raises index_out_of_range unless 0 <= from and from + count <= size().
    constexpr void remove_range(isize from, isize count)
    {
        if (count <= 0)
            return;

        BC_CHECK_INDEX(0 <= from && from <= _length && count <= _length - from, "remove range out of range");
        this->erase_slots(from, count);
    }

    /// Removes and returns the last element.
    /// Raises index_out_of_range on an empty buffer.
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        BC_CHECK_INDEX(_length > 0, "cannot pop from empty buffer");
        T value = bc::move(_storage.slots[_length - 1]);
        this->truncate(_length - 1);
        return value;
    }

    /// Removes the last element.
    /// Raises index_out_of_range on an empty buffer.
    constexpr void remove_back()
    {
        BC_CHECK_INDEX(_length > 0, "cannot remove from empty buffer");
        this->truncate(_length - 1);
    }

    /// Shortens the buffer to new_length elements, destroying the rest.
    /// Raises index_out_of_range unless 0 <= new_length <= size().
    constexpr void truncate(isize new_length)
    {
        BC_CHECK_INDEX(0 <= new_length && new_length <= _length, "truncate length out of range");
        growth::clear_range(_storage, new_length, _length);
        _length = new_length;
    }

    /// Destroys all elements. Capacity is retained.
    constexpr void clear()
    {
        growth::clear_range(_storage, 0, _length);
        _length = 0;
    }

    // factories
public:
    /// Empty buffer with exactly `capacity` slots (no rounding, capacity 0 allocates nothing).
    [[nodiscard]] static buffer create_with_capacity(isize capacity, bc::memory_resource const* resource = nullptr)
    {
        BC_CHECK_INDEX(capacity >= 0, "capacity must be non-negative");
        BC_CHECK_CAPACITY(capacity <= growth::max_capacity<T>(), "requested capacity exceeds the index space");
        return buffer(bc::storage_block<T>::create_empty(capacity, resource), 0);
    }

    /// Buffer holding a copy of all elements of `source`.
    /// Sources that know their size get a block of exactly that size (no over-allocation).
    /// Other sources start from a default buffer and grow as usual.
    template <class Source>
        requires bc::element_source<Source, T>
    [[nodiscard]] static buffer create_from(Source&& source, bc::memory_resource const* resource = nullptr)
    {
        if constexpr (bc::sized_element_source<Source, T>)
        {
            auto result = buffer::create_with_capacity(isize(source.size()), resource);
            result.push_back_range(bc::forward<Source>(source));
            return result;
        }
        else
        {
            buffer result(resource);
            result.push_back_range(bc::forward<Source>(source));
            return result;
        }
    }

    [[nodiscard]] static buffer create_from(std::initializer_list<T> values, bc::memory_resource const* resource = nullptr)
    {
        return buffer::create_from<std::initializer_list<T>&>(values, resource);
    }

    // lifecycle
public:
    /// Empty buffer with growth::initial_capacity slots from the default memory resource.
    buffer() : buffer(nullptr) {}

    /// Empty buffer with growth::initial_capacity slots from `resource` (nullptr means default).
    explicit buffer(bc::memory_resource const* resource)
      : _storage(bc::storage_block<T>::create_empty(growth::initial_capacity, resource))
    {
    }

    // deep copy, exactly sized
    buffer(buffer const& rhs)
      : _storage(buffer::create_copied_storage(rhs.data(), rhs._length, rhs._storage.custom_resource)),
        _length(rhs._length)
    {
    }
    buffer& operator=(buffer const& rhs)
    {
        if (this != &rhs)
        {
            // keep lhs resource
            auto copied = buffer::create_copied_storage(rhs.data(), rhs._length, _storage.custom_resource);
            this->clear();
            _storage = bc::move(copied);
            _length = rhs._length;
        }
        return *this;
    }

    // moved-from buffers are empty with capacity 0
    buffer(buffer&& rhs) noexcept : _storage(bc::move(rhs._storage)), _length(bc::exchange(rhs._length, 0)) {}
    buffer& operator=(buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            this->clear();
            _storage = bc::move(rhs._storage);
            _length = bc::exchange(rhs._length, 0);
        }
        return *this;
    }

    ~buffer() { growth::clear_range(_storage, 0, _length); }

    // helpers
private:
    buffer(bc::storage_block<T> storage, isize length) : _storage(bc::move(storage)), _length(length) {}

    /// True iff p points into our slot block.
    /// std::less gives a total order even for pointers into unrelated allocations.
    [[nodiscard]] constexpr bool aliases_storage(T const* p) const
    {
        return !std::less<T const*>()(p, _storage.slots) && std::less<T const*>()(p, _storage.slots + _storage.capacity);
    }

    template <class... Args>
    BC_COLD_FUNC constexpr T& emplace_back_grow(Args&&... args)
    {
        // construct first: args may reference elements that growth is about to relocate
        T value(bc::forward<Args>(args)...);

        growth::ensure_capacity(_storage, _length, _length + 1);

        auto const p = new (bc::placement_new, _storage.slots + _length) T(bc::move(value));
        ++_length;
        return *p;
    }

    /// Constructs `count` elements into the raw tail [size(), size() + count) via fill(dest_end).
    /// Capacity must already be sufficient. If fill throws, the constructed part is destroyed.
    template <class FillF>
    constexpr void fill_raw_tail(isize count, FillF&& fill)
    {
        BC_ASSERT(count <= _storage.capacity - _length, "tail too small");

        auto const start = _storage.slots + _length;
        auto dest = start;
        try
        {
            fill(dest);
        }
        catch (...)
        {
            impl::destroy_objects_in_reverse(start, dest);
            throw;
        }
        _length += dest - start;
    }

    /// Opens a gap of `count` raw slots at idx and constructs into it via fill(dest_end).
    /// Capacity must already be sufficient.
    /// If fill produces fewer than `count` elements (or throws), the unused part of the gap is closed again.
    template <class FillF>
    constexpr void fill_gap(isize idx, isize count, FillF&& fill)
    {
        BC_ASSERT(count <= _storage.capacity - _length, "not enough capacity for gap");

        auto const gap = _storage.slots + idx;
        auto const shifted_end = _storage.slots + _length + count;
        impl::open_gap(gap, _storage.slots + _length, count);

        auto dest = gap;
        try
        {
            fill(dest);
        }
        catch (...)
        {
            impl::destroy_objects_in_reverse(gap, dest);
            impl::close_gap(gap, shifted_end, count);
            throw;
        }

        auto const produced = dest - gap;
        if (produced < count) [[unlikely]]
            impl::close_gap(dest, shifted_end, count - produced);

        _length += produced;
    }

    /// Destroys [from, from + count) and moves the tail left over the hole.
    constexpr void erase_slots(isize from, isize count)
    {
        growth::clear_range(_storage, from, from + count);
        impl::close_gap(_storage.slots + from, _storage.slots + _length, count);
        _length -= count;
    }

    [[nodiscard]] static bc::storage_block<T> create_copied_storage(T const* src,
                                                                   isize count,
                                                                   bc::memory_resource const* resource)
    {
        auto storage = bc::storage_block<T>::create_empty(count, resource);
        auto dest = storage.slots;
        try
        {
            impl::copy_create_objects_to(dest, src, src + count);
        }
        catch (...)
        {
            impl::destroy_objects_in_reverse(storage.slots, dest);
            throw;
        }
        return storage;
    }

    // members
private:
    bc::storage_block<T> _storage;
    isize _length = 0;
};
