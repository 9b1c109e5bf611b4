#pragma once

#include <buffer-core/assert.hh>
#include <buffer-core/fwd.hh>
#include <buffer-core/utility.hh>

/// Forward-only cursor over a fixed (data, size) window.
/// Produced by buffer<T>::iterate() and buffer_view<T>::iterate(); every call yields a fresh cursor
/// starting at index 0, so iteration is restartable even though a single cursor is consumed.
///
/// Usage:
///   auto c = buf.iterate();
///   while (c.has_next())
///       use(c.next());
///
///   for (auto const& v : buf.iterate()) // range-for works as well
///       use(v);
///
/// Borrowed: the cursor reads the buffer's slots directly and must not outlive them.
template <class T>
struct bc::buffer_cursor
{
public:
    constexpr buffer_cursor() = default;
    constexpr explicit buffer_cursor(T const* data, isize size) : _pos(data), _end(data + size)
    {
        BC_ASSERT(size >= 0, "cursor size must be non-negative");
    }

    [[nodiscard]] constexpr bool has_next() const { return _pos != _end; }
    [[nodiscard]] constexpr isize remaining() const { return _end - _pos; }

    /// The not-yet-consumed window [data(), data() + size()).
    /// Lets bulk operations copy what is left in one go.
    [[nodiscard]] constexpr T const* data() const { return _pos; }
    [[nodiscard]] constexpr isize size() const { return _end - _pos; }

    /// Returns the current element and advances.
    /// Raises index_out_of_range if the cursor is exhausted.
    constexpr T const& next()
    {
        BC_CHECK_INDEX(_pos != _end, "cursor advanced past the end");
        return *_pos++;
    }

    // range-for support
    // the cursor is its own iterator, compared against bc::sentinel
public:
    [[nodiscard]] constexpr buffer_cursor begin() const { return *this; }
    [[nodiscard]] constexpr bc::sentinel end() const { return {}; }

    [[nodiscard]] constexpr T const& operator*() const { return *_pos; }
    constexpr buffer_cursor& operator++()
    {
        ++_pos;
        return *this;
    }
    constexpr bool operator!=(bc::sentinel) const { return _pos != _end; }
    constexpr bool operator==(bc::sentinel) const { return _pos == _end; }

private:
    T const* _pos = nullptr;
    T const* _end = nullptr;
};

/// Read-only, length-bounded window over the live slots of a bc::buffer<T>.
///
/// A view is a point-in-time snapshot of (data pointer, size): later appends to the buffer are not
/// visible through it. It does not own anything and it does not keep the slots alive.
///
/// IMPORTANT: a view taken before a mutation is only safe to read if that mutation did not reallocate
///            and did not touch the viewed slots. Reallocation (growth) leaves the view dangling, and
///            in-place writes (operator[], insert, remove) show through. Do not mutate a buffer while
///            a view or cursor over it is still in use.
///
/// Trivially copyable.
template <class T>
struct bc::buffer_view
{
    // construction
public:
    /// Default view is empty: data() == nullptr, size() == 0.
    constexpr buffer_view() = default;

    /// Creates a view over [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit buffer_view(T const* ptr, isize size) : _data(ptr), _size(size)
    {
        BC_ASSERT(size >= 0, "view size must be non-negative");
    }

    // element access
public:
    /// Returns the element at index i.
    /// Raises index_out_of_range unless 0 <= i < size().
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        BC_CHECK_INDEX(0 <= i && i < _size, "view index out of range");
        return _data[i];
    }

    /// Returns a pointer to the first viewed slot.
    /// May be nullptr if the view is default-constructed.
    [[nodiscard]] constexpr T const* data() const { return _data; }

    // iteration
public:
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + _size; }

    /// Returns a fresh forward cursor over the viewed elements.
    [[nodiscard]] constexpr bc::buffer_cursor<T> iterate() const { return bc::buffer_cursor<T>(_data, _size); }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T const* _data = nullptr;
    isize _size = 0;
};
