#pragma once

#include <buffer-core/fwd.hh>
#include <buffer-core/utility.hh>

#include <cstring>
#include <type_traits>

// Slot-level object lifetime helpers for bc::buffer<T> and bc::growth.
//
// Terminology:
// - a "live" slot holds a constructed T
// - a "raw" slot holds no object (never constructed or already destroyed)
// - "relocating" an object means move-constructing it into a raw slot and destroying the source,
//   which turns the source into a raw slot
//
// Trivially copyable types are moved with memcpy/memmove. For those, relocation and copying are the
// same operation and "destroying" is a no-op.

namespace bc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
void destroy_objects_in_reverse(T* start, T* end)
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

/// Copy-constructs objects from [src_start, src_end) into the raw slots starting at dest_end.
/// dest_end is incremented for each successfully constructed object, so if a copy throws,
/// [original dest_end, dest_end) is exactly the range that needs cleanup.
/// Trivially copyable types are copied with a single memcpy (the source must not overlap the destination).
template <class T>
void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (bc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Relocates [src_start, src_end) into the raw slots starting at dest (non-overlapping ranges).
/// Afterwards the source range is raw.
/// Used when growth moves the live range into a fresh block.
template <class T>
void relocate_objects_to(T* dest, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
            std::memcpy(static_cast<void*>(dest), src_start, size * sizeof(T));
    }
    else
    {
        while (src_start != src_end)
        {
            new (bc::placement_new, dest) T(bc::move(*src_start));
            src_start->~T();
            ++dest;
            ++src_start;
        }
    }
}

/// Opens a gap of `count` raw slots at `first` by shifting the live range [first, last) right by `count`.
/// PRECONDITION: [last, last + count) are raw slots inside the same block.
/// Afterwards [first, first + count) are raw and [first + count, last + count) are live.
///
/// Source and destination overlap, so we walk high-to-low: every destination slot is either beyond the
/// old live range or was just vacated by the previous step, and no unread element is overwritten.
template <class T>
void open_gap(T* first, T* last, isize count)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
    BC_ASSERT(first <= last && count >= 0, "invalid gap");

    if (count == 0 || first == last)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memmove(static_cast<void*>(first + count), first, (last - first) * sizeof(T));
    }
    else
    {
        auto src = last;
        while (src != first)
        {
            --src;
            new (bc::placement_new, src + count) T(bc::move(*src));
            src->~T();
        }
    }
}

/// Closes a gap of `count` raw slots at `first` by shifting the live range [first + count, last) left.
/// PRECONDITION: [first, first + count) are raw slots.
/// Afterwards [first, last - count) are live and [last - count, last) are raw.
///
/// Mirror image of open_gap: we walk low-to-high so no unread element is overwritten.
template <class T>
void close_gap(T* first, T* last, isize count)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
    BC_ASSERT(count >= 0 && first + count <= last, "invalid gap");

    if (count == 0 || first + count == last)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        std::memmove(static_cast<void*>(first), first + count, (last - first - count) * sizeof(T));
    }
    else
    {
        for (auto src = first + count; src != last; ++src)
        {
            new (bc::placement_new, src - count) T(bc::move(*src));
            src->~T();
        }
    }
}
} // namespace bc::impl
