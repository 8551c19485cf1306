// open_union/basic/result.hpp - Two-armed success/failure return channel
//
// Exposes tl::expected in the open_union namespace. Narrow and subset report
// their "miss" through the failure arm, never through an exception.
//
// Usage:
//   open_union::Result<T, E> result = some_operation();
//   if (result) {
//     process(*result);
//   } else {
//     handle(result.error());
//   }
//
#pragma once

#include <tl/expected.hpp>

namespace open_union
{

template <typename T, typename E>
using Result = tl::expected<T, E>;

using tl::make_unexpected;
using tl::unexpected;

}  // namespace open_union
