#pragma once

#include <buffer-core/assert.hh>
#include <buffer-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//
// Object construction:
//   new (bc::placement_new, p) T(...)  - placement new without pulling in <new>
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace bc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   buf.push_back(bc::move(obj));  // transfer obj into the buffer
template <class T>
[[nodiscard]] BC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] BC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] BC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto p = bc::exchange(rhs._slots, nullptr);  // take ownership of the slots, leave rhs empty
template <class T, class U = T>
[[nodiscard]] BC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = bc::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Check if value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    BC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

// =========================================================================================================
// Object construction
// =========================================================================================================

/// Tag for our own placement new overload
/// Usage:
///   new (bc::placement_new, slot) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

// =========================================================================================================
// Template metaprogramming
// =========================================================================================================

/// Always false, usable in static_assert inside templates
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   bc::function_ptr<bc::byte*(bc::isize, bc::isize, void*)>  -> bc::byte* (*)(bc::isize, bc::isize, void*)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Used as a lightweight alternative to a full iterator for range end
/// Usage:
///   for (auto const& v : buf.iterate()) { ... }  // cursor compares against bc::sentinel
struct sentinel
{
};

} // namespace bc

// placement new with a tag so we don't depend on <new> everywhere
// the matching delete is only called by the compiler if a constructor throws
inline void* operator new(std::size_t, bc::placement_new_t, void* p) noexcept
{
    return p;
}
inline void operator delete(void*, bc::placement_new_t, void*) noexcept {}
