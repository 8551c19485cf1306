// open_union/dispatch/any_error.cpp
//
#include "open_union/dispatch/any_error.hpp"

namespace open_union
{

AnyError::AnyError(std::string message) : message_(std::move(message)) {}

AnyError::AnyError(std::exception_ptr error) : error_(std::move(error))
{
  if (!error_) {
    message_ = "unknown exception";
    return;
  }
  try {
    std::rethrow_exception(error_);
  } catch (const std::exception & e) {
    message_ = e.what();
    if (const auto * nested = dynamic_cast<const std::nested_exception *>(&e)) {
      cause_ = nested->nested_ptr();
    }
  } catch (...) {
    message_ = "unknown exception";
  }
}

}  // namespace open_union
