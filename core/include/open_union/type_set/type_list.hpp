// open_union/type_set/type_list.hpp - Compile-time candidate type lists
//
// A candidate list is a nested Cons<Head, Tail> chain terminated by End.
// It has no runtime footprint; every query below is a constant expression.
//
// Usage:
//   using L = make_list_t<int, std::string>;   // Cons<int, Cons<std::string, End>>
//   static_assert(list_size_v<L> == 2);
//   using U = apply_list_t<L, Union>;          // Union<int, std::string>
//
#pragma once

#include <cstddef>
#include <type_traits>

namespace open_union
{

/// Terminator of a candidate list
struct End
{
};

/// One slot of a candidate list
template <typename Head, typename Tail>
struct Cons
{
  using head = Head;
  using tail = Tail;
};

/// Largest supported candidate list; compose unions hierarchically beyond this
inline constexpr std::size_t k_max_candidates = 9;

// ============================================================================
// Construction
// ============================================================================

template <typename... Ts>
struct MakeList
{
  using type = End;
};

template <typename Head, typename... Rest>
struct MakeList<Head, Rest...>
{
  using type = Cons<Head, typename MakeList<Rest...>::type>;
};

template <typename... Ts>
using make_list_t = typename MakeList<Ts...>::type;

/// Turn a list back into Target<Ts...> (the "tuple form" of the list)
template <typename List, template <typename...> class Target, typename... Acc>
struct ApplyList;

template <template <typename...> class Target, typename... Acc>
struct ApplyList<End, Target, Acc...>
{
  using type = Target<Acc...>;
};

template <typename Head, typename Tail, template <typename...> class Target, typename... Acc>
struct ApplyList<Cons<Head, Tail>, Target, Acc...>
{
  using type = typename ApplyList<Tail, Target, Acc..., Head>::type;
};

template <typename List, template <typename...> class Target>
using apply_list_t = typename ApplyList<List, Target>::type;

// ============================================================================
// Queries
// ============================================================================

template <typename List>
struct ListSize;

template <>
struct ListSize<End> : std::integral_constant<std::size_t, 0>
{
};

template <typename Head, typename Tail>
struct ListSize<Cons<Head, Tail>> : std::integral_constant<std::size_t, 1 + ListSize<Tail>::value>
{
};

template <typename List>
inline constexpr std::size_t list_size_v = ListSize<List>::value;

/// Number of slots in List holding exactly T
template <typename List, typename T>
struct CountOf;

template <typename T>
struct CountOf<End, T> : std::integral_constant<std::size_t, 0>
{
};

template <typename Head, typename Tail, typename T>
struct CountOf<Cons<Head, Tail>, T>
: std::integral_constant<
    std::size_t, (std::is_same_v<Head, T> ? 1 : 0) + CountOf<Tail, T>::value>
{
};

template <typename List, typename T>
inline constexpr std::size_t count_of_v = CountOf<List, T>::value;

/// Position of T in List; list_size_v<List> when absent
template <typename List, typename T>
struct IndexOf;

template <typename T>
struct IndexOf<End, T> : std::integral_constant<std::size_t, 0>
{
};

template <typename Head, typename Tail, typename T>
struct IndexOf<Cons<Head, Tail>, T>
: std::integral_constant<
    std::size_t, std::is_same_v<Head, T> ? 0 : 1 + IndexOf<Tail, T>::value>
{
};

template <typename List, typename T>
inline constexpr std::size_t index_of_v = IndexOf<List, T>::value;

/// Type stored at position I
template <typename List, std::size_t I>
struct AtIndex;

template <typename Head, typename Tail>
struct AtIndex<Cons<Head, Tail>, 0>
{
  using type = Head;
};

template <typename Head, typename Tail, std::size_t I>
struct AtIndex<Cons<Head, Tail>, I>
{
  using type = typename AtIndex<Tail, I - 1>::type;
};

template <typename List, std::size_t I>
using at_index_t = typename AtIndex<List, I>::type;

/// true if no type occurs twice
template <typename List>
struct AllDistinct;

template <>
struct AllDistinct<End> : std::true_type
{
};

template <typename Head, typename Tail>
struct AllDistinct<Cons<Head, Tail>>
: std::bool_constant<CountOf<Tail, Head>::value == 0 && AllDistinct<Tail>::value>
{
};

template <typename List>
inline constexpr bool all_distinct_v = AllDistinct<List>::value;

}  // namespace open_union
