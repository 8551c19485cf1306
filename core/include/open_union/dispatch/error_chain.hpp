// open_union/dispatch/error_chain.hpp - Walk std::nested_exception causes
//
#pragma once

#include <exception>
#include <string>
#include <vector>

namespace open_union
{

/**
 * Describe every link of a cause chain, outermost first.
 *
 * Each link is rethrown and inspected; std::exception links contribute
 * what(), and their std::nested_exception cause (if any) is followed.
 * A link that is not a std::exception is reported as "unknown exception"
 * and ends the walk.
 *
 * @param cause First cause (may be null, yielding an empty chain)
 */
[[nodiscard]] std::vector<std::string> describe_chain(std::exception_ptr cause);

}  // namespace open_union
