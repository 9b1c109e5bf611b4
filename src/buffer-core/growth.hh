#pragma once

#include <buffer-core/assert.hh>
#include <buffer-core/fwd.hh>
#include <buffer-core/impl/object_lifetime_util.hh>
#include <buffer-core/storage.hh>

#include <limits>

// =========================================================================================================
// Growth policy for bc::buffer<T>
// =========================================================================================================
//
// Stateless free functions, kept apart from the buffer so the arithmetic can be tested on its own:
//
//   next_capacity(current, min_required, max)  - pure capacity arithmetic (doubling + clamping)
//   ensure_capacity(storage, length, min)      - grow a storage block so it holds at least min slots
//   clear_range(storage, from, to)             - end the lifetime of the elements in [from, to)
//
// Growth doubles the current capacity until the request fits, so a buffer that starts at
// initial_capacity only ever holds initial_capacity * 2^k slots (until the clamp kicks in).

namespace bc::growth
{
/// Capacity of a default-constructed buffer.
/// Also the doubling seed for blocks of capacity 0, which would never grow by doubling.
inline constexpr isize initial_capacity = 16;

/// Largest slot count for T whose byte size is still representable as isize.
template <class T>
[[nodiscard]] constexpr isize max_capacity()
{
    return std::numeric_limits<isize>::max() / isize(sizeof(T));
}

/// Returns the capacity a block of `current_capacity` slots must grow to so it holds `min_required`.
/// Returns `current_capacity` unchanged if it is already sufficient.
/// Otherwise doubles (starting at initial_capacity for empty blocks) until the request fits,
/// then clamps to `capacity_limit` (usually max_capacity<T>()).
/// Raises capacity_exceeded if `min_required > capacity_limit`.
[[nodiscard]] constexpr isize next_capacity(isize current_capacity, isize min_required, isize capacity_limit)
{
    BC_ASSERT(0 <= current_capacity && current_capacity <= capacity_limit, "invalid current capacity");

    if (min_required <= current_capacity)
        return current_capacity;

    BC_CHECK_CAPACITY(min_required <= capacity_limit, "requested capacity exceeds the index space");

    // u64 so the last doubling below max_capacity cannot overflow:
    // the loop only doubles values < min_required <= INT64_MAX, which stays below 2^64
    auto new_capacity = u64(current_capacity > 0 ? current_capacity : initial_capacity);
    while (new_capacity < u64(min_required))
        new_capacity *= 2;

    if (new_capacity > u64(capacity_limit))
        new_capacity = u64(capacity_limit);

    return isize(new_capacity);
}

/// Ensures `storage` has at least `min_required` slots.
/// If it already does, nothing happens and false is returned.
/// Otherwise a new block of next_capacity(...) slots is allocated from the same memory resource,
/// the `length` live elements are relocated into it (same indices, same order),
/// the old block is released and true is returned.
/// Raises capacity_exceeded before any allocation if the request cannot be satisfied.
template <class T>
bool ensure_capacity(bc::storage_block<T>& storage,
                     isize length,
                     isize min_required,
                     isize capacity_limit = growth::max_capacity<T>())
{
    BC_ASSERT(0 <= length && length <= storage.capacity, "live length must fit the block");

    if (min_required <= storage.capacity)
        return false;

    auto const new_capacity = growth::next_capacity(storage.capacity, min_required, capacity_limit);

    auto grown = bc::storage_block<T>::create_empty(new_capacity, storage.custom_resource);
    impl::relocate_objects_to(grown.slots, storage.slots, storage.slots + length);

    // old slots are all raw now, releasing the block is safe
    storage = bc::move(grown);
    return true;
}

/// Ends the lifetime of the elements in slots [from, to).
/// No-op if from >= to.
template <class T>
void clear_range(bc::storage_block<T>& storage, isize from, isize to)
{
    if (from >= to)
        return;

    BC_ASSERT(0 <= from && to <= storage.capacity, "slot range outside the block");
    impl::destroy_objects_in_reverse(storage.slots + from, storage.slots + to);
}
} // namespace bc::growth
