// open_union/type_set/algebra.hpp - Set relationships between candidate lists
//
// Each relationship is a compile-time proof. A relationship that does not
// hold still instantiates cleanly with `value == false`, so the operation
// consuming it can reject the call with a readable static_assert instead of
// a substitution failure deep inside the library.
//
//   Contains<List, T>            T occurs exactly once in List
//   Narrow<List, Target>         Target occurs in List; Remainder drops that slot
//   SupersetOf<Big, Small>       every entry of Small matches a distinct slot of
//                                Big; Remainder is Big minus the matched slots
//
// All remainders preserve the order of the original list.
//
#pragma once

#include <type_traits>

#include "open_union/type_set/type_list.hpp"

namespace open_union
{

// ============================================================================
// Contains
// ============================================================================

template <typename List, typename T>
struct Contains : std::bool_constant<count_of_v<List, T> == 1>
{
};

template <typename List, typename T>
inline constexpr bool contains_v = Contains<List, T>::value;

// ============================================================================
// Narrow
// ============================================================================

template <typename List, typename Target>
struct Narrow;

/// Target not found: the relationship fails
template <typename Target>
struct Narrow<End, Target> : std::false_type
{
  using Remainder = End;
};

template <typename Head, typename Tail, typename Target>
struct Narrow<Cons<Head, Tail>, Target>
{
private:
  using Rest = Narrow<Tail, Target>;

public:
  static constexpr bool value = std::is_same_v<Head, Target> || Rest::value;

  using Remainder = std::conditional_t<
    std::is_same_v<Head, Target>, Tail, Cons<Head, typename Rest::Remainder>>;
};

template <typename List, typename Target>
inline constexpr bool narrow_v = Narrow<List, Target>::value;

template <typename List, typename Target>
using narrow_remainder_t = typename Narrow<List, Target>::Remainder;

// ============================================================================
// SupersetOf
// ============================================================================

template <typename Big, typename Small>
struct SupersetOf;

/// Everything matched: what is left of Big is the remainder
template <typename Big>
struct SupersetOf<Big, End> : std::true_type
{
  using Remainder = Big;
};

/// Match Small's head against Big, then thread the remainder into the tail
/// so no slot of Big is used twice
template <typename Big, typename SmallHead, typename SmallTail>
struct SupersetOf<Big, Cons<SmallHead, SmallTail>>
{
private:
  using Step = Narrow<Big, SmallHead>;
  using Rest = SupersetOf<typename Step::Remainder, SmallTail>;

public:
  static constexpr bool value = Step::value && Rest::value;

  using Remainder = typename Rest::Remainder;
};

template <typename Big, typename Small>
inline constexpr bool superset_of_v = SupersetOf<Big, Small>::value;

template <typename Big, typename Small>
using superset_remainder_t = typename SupersetOf<Big, Small>::Remainder;

}  // namespace open_union
