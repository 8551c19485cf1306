// open_union/union/union.hpp - Open error union
//
// Union<Ts...> holds exactly one payload whose type is one of Ts, together
// with an ordered context trace and the backtrace captured at creation. The
// candidate list is part of the type: widening, narrowing and subsetting
// rewrite the list at compile time and move the same payload into a
// differently labelled union at run time.
//
// Usage:
//   using IoError = Union<std::string, std::uint32_t>;
//   IoError err(std::uint32_t{5});
//
//   auto narrowed = std::move(err).narrow<std::string>();
//   if (!narrowed) {
//     Union<std::uint32_t> rest = std::move(narrowed.error());
//     std::uint32_t code = std::move(rest).take();
//   }
//
#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "open_union/basic/casting.hpp"
#include "open_union/basic/context_message.hpp"
#include "open_union/basic/erased_box.hpp"
#include "open_union/basic/panic.hpp"
#include "open_union/basic/result.hpp"
#include "open_union/dispatch/error_chain.hpp"
#include "open_union/dispatch/trait_fold.hpp"
#include "open_union/report/error_report.hpp"
#include "open_union/trace/context_trace.hpp"
#include "open_union/trace/trace_config.hpp"
#include "open_union/type_set/algebra.hpp"
#include "open_union/type_set/type_list.hpp"
#include "open_union/union/enum_bridge.hpp"

namespace open_union
{

template <typename... Ts>
class Union;

/// Union labelled with the candidates of a type list
template <typename List>
using union_of_t = apply_list_t<List, Union>;

template <typename... Ts>
class Union
{
  static_assert(
    sizeof...(Ts) <= k_max_candidates,
    "a union holds at most 9 candidates; nest unions to compose larger sets");
  static_assert(
    all_distinct_v<make_list_t<Ts...>>, "union candidates must be pairwise distinct types");
  static_assert(
    (... && (std::is_object_v<Ts> && !std::is_const_v<Ts> && !std::is_volatile_v<Ts>)),
    "union candidates must be unqualified object types");

public:
  using Variants = make_list_t<Ts...>;

  static constexpr std::size_t arity = sizeof...(Ts);

  /// Wrap a payload of one of the candidate types
  template <
    typename T, typename V = std::decay_t<T>,
    std::enable_if_t<!std::is_same_v<V, Union> && contains_v<Variants, V>, int> = 0>
  explicit Union(T && value)
  : box_(std::make_unique<Boxed<V>>(std::in_place, std::forward<T>(value))),
    trace_(ContextTrace::capture())
  {
  }

  /// Construct the payload in place
  template <typename T, typename... Args>
  [[nodiscard]] static Union make(Args &&... args)
  {
    static_assert(contains_v<Variants, T>, "make<T>() requires T to be a candidate");
    return Union(
      std::make_unique<Boxed<T>>(std::in_place, std::forward<Args>(args)...),
      ContextTrace::capture());
  }

  Union(const Union &) = delete;
  Union & operator=(const Union &) = delete;
  Union(Union &&) noexcept = default;
  Union & operator=(Union &&) noexcept = default;
  ~Union() = default;

  // ==========================================================================
  // Type-set changes
  // ==========================================================================

  /**
   * Try to extract the payload as Target.
   *
   * Succeeds with the payload when it is a Target. Otherwise the same payload
   * and context come back in a union over the remaining candidates. Rejected
   * at compile time when Target is not a candidate.
   */
  template <typename Target>
  [[nodiscard]] Result<Target, union_of_t<narrow_remainder_t<Variants, Target>>> narrow() &&
  {
    static_assert(narrow_v<Variants, Target>, "narrow<T>() requires T to be a candidate");
    using Remainder = union_of_t<narrow_remainder_t<Variants, Target>>;

    if (auto * held = dyn_cast<Boxed<Target>>(&checked_box())) {
      Target value = held->release();
      box_.reset();
      return Result<Target, Remainder>(tl::in_place, std::move(value));
    }
    return make_unexpected(std::move(*this).template relabel<Remainder>());
  }

  /// Relabel into a union whose candidates include all of this union's
  template <typename... Others>
  [[nodiscard]] Union<Others...> widen() &&
  {
    static_assert(
      superset_of_v<make_list_t<Others...>, Variants>,
      "widen<...>() target must contain every candidate of the source union");
    return std::move(*this).template relabel<Union<Others...>>();
  }

  /**
   * Split by membership in Targets.
   *
   * The payload lands in Union<Targets...> when its type is one of Targets,
   * otherwise in the union of the remaining candidates.
   */
  template <typename... Targets>
  [[nodiscard]] Result<
    Union<Targets...>, union_of_t<superset_remainder_t<Variants, make_list_t<Targets...>>>>
  subset() &&
  {
    using TargetList = make_list_t<Targets...>;
    static_assert(
      superset_of_v<Variants, TargetList>,
      "subset<...>() requires every target to be a candidate of the source union");
    using Subset = Union<Targets...>;
    using Remainder = union_of_t<superset_remainder_t<Variants, TargetList>>;

    if (is_fold<TargetList>(checked_box())) {
      return Result<Subset, Remainder>(
        tl::in_place, std::move(*this).template relabel<Subset>());
    }
    return make_unexpected(std::move(*this).template relabel<Remainder>());
  }

  /// Move the payload out of a single-candidate union (context is dropped)
  [[nodiscard]] auto take() &&
  {
    static_assert(arity == 1, "take() requires exactly one candidate; narrow first");
    return std::move(*this).template take_payload<at_index_t<Variants, 0>>();
  }

  [[nodiscard]] auto into_inner() && { return std::move(*this).take(); }

  // ==========================================================================
  // Single-candidate access
  // ==========================================================================

  [[nodiscard]] const auto & inner() const
  {
    static_assert(arity == 1, "inner() requires exactly one candidate");
    return cast<Boxed<at_index_t<Variants, 0>>>(&checked_box())->get();
  }

  [[nodiscard]] auto & inner()
  {
    static_assert(arity == 1, "inner() requires exactly one candidate");
    return cast<Boxed<at_index_t<Variants, 0>>>(&checked_box())->get();
  }

  [[nodiscard]] const auto & operator*() const { return inner(); }
  [[nodiscard]] auto & operator*() { return inner(); }
  [[nodiscard]] const auto * operator->() const { return &inner(); }
  [[nodiscard]] auto * operator->() { return &inner(); }

  /// Transform the single payload, keeping context and backtrace
  template <typename F>
  [[nodiscard]] auto map(F && f) &&
  {
    static_assert(arity == 1, "map() requires exactly one candidate");
    using Only = at_index_t<Variants, 0>;
    using Mapped = std::decay_t<std::invoke_result_t<F, Only &&>>;

    Only value = std::move(*this).template take_payload<Only>();
    auto box = std::make_unique<Boxed<Mapped>>(
      std::in_place, std::invoke(std::forward<F>(f), std::move(value)));
    return Union<Mapped>(std::move(box), std::move(trace_));
  }

  // ==========================================================================
  // Queries
  // ==========================================================================

  template <typename T>
  [[nodiscard]] bool holds() const noexcept
  {
    static_assert(contains_v<Variants, T>, "holds<T>() requires T to be a candidate");
    return box_ && isa<Boxed<T>>(box_.get());
  }

  template <typename T>
  [[nodiscard]] const T * get_if() const noexcept
  {
    static_assert(contains_v<Variants, T>, "get_if<T>() requires T to be a candidate");
    const auto * held = box_ ? dyn_cast<Boxed<T>>(box_.get()) : nullptr;
    return held ? &held->get() : nullptr;
  }

  template <typename T>
  [[nodiscard]] T * get_if() noexcept
  {
    static_assert(contains_v<Variants, T>, "get_if<T>() requires T to be a candidate");
    auto * held = box_ ? dyn_cast<Boxed<T>>(box_.get()) : nullptr;
    return held ? &held->get() : nullptr;
  }

  /// Position of the payload's type in the candidate list
  [[nodiscard]] std::size_t index() const { return index_fold<Variants>(checked_box()); }

  /// false once the payload has been moved out
  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(box_); }

  // ==========================================================================
  // Closed mirrors
  // ==========================================================================

  [[nodiscard]] auto to_enum() &&
  {
    using Owned = std::variant<Ts...>;
    Owned out = detail::EnumFold<Owned, Variants>::take(checked_box());
    box_.reset();
    return out;
  }

  [[nodiscard]] auto as_enum_ref() const
  {
    return detail::EnumFold<std::variant<const Ts *...>, Variants>::ref(checked_box());
  }

  [[nodiscard]] auto as_enum_mut()
  {
    return detail::EnumFold<std::variant<Ts *...>, Variants>::mut(checked_box());
  }

  // ==========================================================================
  // Context
  // ==========================================================================

  Union & push_context(ContextMessage message) &
  {
    trace_.push(std::move(message));
    return *this;
  }

  [[nodiscard]] Union context(ContextMessage message) &&
  {
    trace_.push(std::move(message));
    return std::move(*this);
  }

  /// Like context(), with the message produced by make_message
  template <typename F>
  [[nodiscard]] Union with_context(F && make_message) &&
  {
    trace_.push(ContextMessage(std::invoke(std::forward<F>(make_message))));
    return std::move(*this);
  }

  [[nodiscard]] const ContextTrace & trace() const noexcept { return trace_; }
  [[nodiscard]] const Backtrace & backtrace() const noexcept { return trace_.backtrace(); }

  // ==========================================================================
  // Rendering
  // ==========================================================================

  /// Payload text; the context block follows when TraceConfig::display_context is set
  [[nodiscard]] std::string display() const
  {
    fmt::memory_buffer out;
    display_fold<Variants>(checked_box(), out);
    if (current_trace_config().display_context) {
      trace_.render_context(out);
    }
    return fmt::to_string(out);
  }

  /// Payload text followed by the context block, regardless of configuration
  [[nodiscard]] std::string display_with_context() const
  {
    fmt::memory_buffer out;
    display_fold<Variants>(checked_box(), out);
    trace_.render_context(out);
    return fmt::to_string(out);
  }

  /// Payload debug text, context block, then backtrace when one was captured
  [[nodiscard]] std::string debug() const
  {
    fmt::memory_buffer out;
    debug_fold<Variants>(checked_box(), out);
    trace_.render_context(out);
    trace_.render_backtrace(out);
    return fmt::to_string(out);
  }

  /// The payload's underlying cause, if it has one
  [[nodiscard]] std::exception_ptr source() const { return source_fold<Variants>(checked_box()); }

  [[nodiscard]] ErrorReport report() const
  {
    ErrorReport report;

    fmt::memory_buffer message;
    display_fold<Variants>(checked_box(), message);
    report.message = fmt::to_string(message);

    fmt::memory_buffer detail;
    debug_fold<Variants>(checked_box(), detail);
    report.detail = fmt::to_string(detail);

    report.candidate_index = index();
    report.candidate_count = arity;
    report.context = trace_.message_strings();
    report.causes = describe_chain(source());

    report.backtrace_status = trace_.backtrace().status();
    for (const auto & frame : trace_.backtrace().frames()) {
      report.backtrace.push_back(frame.symbol);
    }
    return report;
  }

private:
  template <typename...>
  friend class Union;

  Union(std::unique_ptr<ErasedBox> box, ContextTrace trace) noexcept
  : box_(std::move(box)), trace_(std::move(trace))
  {
  }

  [[nodiscard]] ErasedBox & checked_box()
  {
    if (!box_) {
      OPEN_UNION_PANIC("use of a moved-from union");
    }
    return *box_;
  }

  [[nodiscard]] const ErasedBox & checked_box() const
  {
    if (!box_) {
      OPEN_UNION_PANIC("use of a moved-from union");
    }
    return *box_;
  }

  template <typename T>
  T take_payload() &&
  {
    T value = cast<Boxed<T>>(&checked_box())->release();
    box_.reset();
    return value;
  }

  /// Hand the payload and trace to another labelling of the same value.
  /// An empty target list can never hold a payload.
  template <typename Target>
  Target relabel() &&
  {
    if constexpr (Target::arity == 0) {
      OPEN_UNION_PANIC(
        "payload '{}' escaped every candidate of its union", checked_box().type().name());
    } else {
      (void)checked_box();
      return Target(std::move(box_), std::move(trace_));
    }
  }

  std::unique_ptr<ErasedBox> box_;
  ContextTrace trace_;
};

// ============================================================================
// Stream and fmt integration
// ============================================================================

/// Writes the Display rendering
template <typename... Ts>
std::ostream & operator<<(std::ostream & os, const Union<Ts...> & value)
{
  return os << value.display();
}

}  // namespace open_union

/// "{}" renders Display, "{:?}" renders Debug
template <typename... Ts>
struct fmt::formatter<open_union::Union<Ts...>>
{
  bool debug = false;

  constexpr auto parse(fmt::format_parse_context & ctx) -> decltype(ctx.begin())
  {
    auto it = ctx.begin();
    if (it != ctx.end() && *it == '?') {
      debug = true;
      ++it;
    }
    if (it != ctx.end() && *it != '}') {
      throw fmt::format_error("invalid format specifier for open_union::Union");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const open_union::Union<Ts...> & value, FormatContext & ctx) const
    -> decltype(ctx.out())
  {
    const std::string text = debug ? value.debug() : value.display();
    return std::copy(text.begin(), text.end(), ctx.out());
  }
};
