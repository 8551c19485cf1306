// open_union/basic/erased_box.hpp - Type-erased payload storage
//
// A Union keeps its payload behind an ErasedBox so that narrowing, widening
// and subsetting only relabel the owner and never touch the heap allocation.
// Boxed<T> implements the classof() pattern used by casting.hpp.
//
#pragma once

#include <type_traits>
#include <typeinfo>
#include <utility>

namespace open_union
{

/**
 * Owner-agnostic handle to exactly one heap-allocated payload.
 *
 * The only runtime information an ErasedBox exposes is the identity of the
 * payload type; everything else is recovered by casting to Boxed<T>.
 */
class ErasedBox
{
public:
  ErasedBox(const ErasedBox &) = delete;
  ErasedBox & operator=(const ErasedBox &) = delete;

  virtual ~ErasedBox() = default;

  /// Runtime identity of the stored payload
  [[nodiscard]] virtual const std::type_info & type() const noexcept = 0;

protected:
  ErasedBox() = default;
};

template <typename T>
class Boxed final : public ErasedBox
{
  static_assert(!std::is_reference_v<T>, "Boxed payload cannot be a reference");
  static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "Boxed payload must be unqualified");

public:
  template <typename... Args>
  explicit Boxed(std::in_place_t, Args &&... args) : value_(std::forward<Args>(args)...)
  {
  }

  [[nodiscard]] const std::type_info & type() const noexcept override { return typeid(T); }

  [[nodiscard]] T & get() noexcept { return value_; }
  [[nodiscard]] const T & get() const noexcept { return value_; }

  /// Move the payload out, leaving a moved-from T behind
  [[nodiscard]] T release() noexcept(std::is_nothrow_move_constructible_v<T>)
  {
    return std::move(value_);
  }

  static bool classof(const ErasedBox * box) noexcept { return box->type() == typeid(T); }

private:
  T value_;
};

}  // namespace open_union
