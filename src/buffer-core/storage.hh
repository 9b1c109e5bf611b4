#pragma once

#include <buffer-core/fwd.hh>
#include <buffer-core/utility.hh>

// bc::storage_block<T> is the owning slot block underneath bc::buffer<T>.
//
// It owns exactly one thing: a contiguous range of `capacity` raw slots, each large and aligned enough
// for one T, obtained from a bc::memory_resource. It does NOT know which slots hold live objects.
// Liveness is the owner's business (bc::buffer<T> tracks it as its length), which keeps the block
// usable as the "old block" and "new block" of a growth step without any object bookkeeping.
//
// Memory is obtained from a polymorphic bc::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the block*, not as a template argument. A null resource means
// "use bc::default_memory_resource". Replacement blocks created during growth inherit the resource.
//
// Core invariants:
// - slots == nullptr iff capacity == 0
// - slots is aligned to alignof(T)
// - custom_resource == nullptr implies use of bc::default_memory_resource
//
// IMPORTANT: destroying or overwriting a block releases the bytes WITHOUT running destructors.
//            The owner must end the lifetime of all live objects first.

namespace bc
{
/// Default memory resource used when storage_block::custom_resource == nullptr.
/// A system allocator stored in the data segment, valid even during static initialization.
extern bc::memory_resource const* const default_memory_resource;
} // namespace bc

/// Polymorphic memory resource interface powering bc::storage_block<T>.
/// A POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct bc::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment.
    /// bytes == 0 always returns nullptr.
    /// bytes > 0 always returns non-null; failure is fatal (assert/terminate) or throws.
    bc::function_ptr<bc::byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `p` may be nullptr (then bytes is 0 and this is a no-op for well-behaved resources).
    bc::function_ptr<void(bc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

template <class T>
struct bc::storage_block
{
    /// First slot; nullptr for the empty block.
    T* slots = nullptr;

    /// Number of slots.
    isize capacity = 0;

    /// Memory resource that owns the bytes, or nullptr for the global default.
    bc::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    [[nodiscard]] bc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// Number of allocated bytes
    [[nodiscard]] isize size_bytes() const { return capacity * isize(sizeof(T)); }

    // factories
public:
    /// Creates a block of exactly `capacity` uninitialized slots.
    /// capacity == 0 results in the empty block without calling the resource.
    /// The caller guarantees capacity * sizeof(T) fits into isize (see bc::growth::max_capacity).
    [[nodiscard]] static storage_block create_empty(isize capacity, bc::memory_resource const* resource)
    {
        BC_ASSERT(capacity >= 0, "capacity must be non-negative");

        storage_block result;
        result.custom_resource = resource;

        if (capacity == 0)
            return result;

        auto const& res = resource ? *resource : *default_memory_resource;
        result.slots = reinterpret_cast<T*>(res.allocate_bytes(capacity * isize(sizeof(T)), alignof(T), res.userdata));
        result.capacity = capacity;
        return result;
    }

    // lifecycle
public:
    storage_block() = default;

    // no implicit copies
    // copying a block would need to know which slots are alive
    storage_block(storage_block const&) = delete;
    storage_block& operator=(storage_block const&) = delete;

    storage_block(storage_block&& rhs) noexcept
      : slots(bc::exchange(rhs.slots, nullptr)),
        capacity(bc::exchange(rhs.capacity, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    storage_block& operator=(storage_block&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            slots = bc::exchange(rhs.slots, nullptr);
            capacity = bc::exchange(rhs.capacity, 0);
            custom_resource = rhs.custom_resource; // rhs resource stays
        }
        return *this;
    }

    ~storage_block() { release(); }

private:
    void release()
    {
        if (slots == nullptr)
            return;

        auto const& res = resource();
        res.deallocate_bytes(reinterpret_cast<bc::byte*>(slots), size_bytes(), alignof(T), res.userdata);
        slots = nullptr;
        capacity = 0;
    }
};
