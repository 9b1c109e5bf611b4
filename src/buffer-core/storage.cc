#include "storage.hh"

#include <buffer-core/assert.hh>
#include <buffer-core/macros.hh>
#include <buffer-core/utility.hh>

#include <cstdlib>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

bc::byte* system_allocate_bytes(bc::isize bytes, bc::isize alignment, void* userdata)
{
    BC_UNUSED(userdata);

    BC_ASSERT(bytes >= 0, "byte count must be non-negative");
    BC_ASSERT(alignment > 0 && bc::is_power_of_two(alignment), "alignment must be a power of 2");

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return nullptr;

    bc::byte* p = nullptr;

#ifdef BC_OS_WINDOWS
    p = static_cast<bc::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign does not require bytes % alignment == 0 (unlike std::aligned_alloc)
    // but it requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    bc::isize const effective_alignment = alignment < bc::isize(sizeof(void*)) ? bc::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    p = result == 0 ? static_cast<bc::byte*>(raw_ptr) : nullptr;
#endif

    BC_ASSERT_ALWAYS(p != nullptr, "system allocation failed");
    return p;
}

void system_deallocate_bytes(bc::byte* p, bc::isize bytes, bc::isize alignment, void* userdata)
{
    BC_UNUSED(bytes);
    BC_UNUSED(alignment);
    BC_UNUSED(userdata);

    // Must use the free function matching the platform's allocator:
    // - Windows: _aligned_malloc requires _aligned_free (not free())
    // - POSIX: posix_memalign uses std::free
#ifdef BC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

/// System memory resource instance stored in the data segment.
/// This is the fallback when bc::storage_block<T>::custom_resource is nullptr.
constinit bc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit bc::memory_resource const* const bc::default_memory_resource = &system_memory_resource;
