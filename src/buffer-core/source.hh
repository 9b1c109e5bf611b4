#pragma once

#include <buffer-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <iterator>
#include <type_traits>

// =========================================================================================================
// Element sources
// =========================================================================================================
//
// What bulk operations (push_back_range, insert_range_at, create_from) accept as input.
//
//   element_source<S, T>        - anything range-for can traverse whose elements construct a T
//                                 (containers, views, initializer lists, one-shot input ranges)
//   sized_element_source<S, T>  - an element_source that also knows its size up front
//   is_same_kind_source<S, T>   - bc::buffer<T> / bc::buffer_view<T> / bc::buffer_cursor<T>: contiguous
//                                 live slots of the same element type, eligible for a single block copy
//
// Dispatch between fast and generic paths is done with `if constexpr` on these traits,
// never by inspecting the source at runtime.

namespace bc
{
template <class S, class T>
concept element_source = requires(S& s) {
    { std::begin(s) != std::end(s) } -> std::convertible_to<bool>;
    requires std::constructible_from<T, decltype(*std::begin(s))>;
};

template <class S, class T>
concept sized_element_source = element_source<S, T> && requires(S& s) {
    { s.size() } -> std::convertible_to<isize>;
};

namespace impl
{
template <class S, class T>
struct is_same_kind_source_t : std::false_type
{
};
template <class T>
struct is_same_kind_source_t<bc::buffer<T>, T> : std::true_type
{
};
template <class T>
struct is_same_kind_source_t<bc::buffer_view<T>, T> : std::true_type
{
};
template <class T>
struct is_same_kind_source_t<bc::buffer_cursor<T>, T> : std::true_type
{
};
} // namespace impl

template <class S, class T>
constexpr bool is_same_kind_source = impl::is_same_kind_source_t<std::remove_cvref_t<S>, T>::value;
} // namespace bc
