// open_union/dispatch/error_chain.cpp
//
#include "open_union/dispatch/error_chain.hpp"

#include <utility>

namespace open_union
{

std::vector<std::string> describe_chain(std::exception_ptr cause)
{
  std::vector<std::string> chain;

  while (cause) {
    std::exception_ptr next;
    try {
      std::rethrow_exception(cause);
    } catch (const std::exception & e) {
      chain.emplace_back(e.what());
      if (const auto * nested = dynamic_cast<const std::nested_exception *>(&e)) {
        next = nested->nested_ptr();
      }
    } catch (...) {
      chain.emplace_back("unknown exception");
    }
    cause = std::move(next);
  }

  return chain;
}

}  // namespace open_union
