// open_union/basic/context_message.cpp
//
#include "open_union/basic/context_message.hpp"

namespace open_union
{

std::string_view ContextMessage::view() const noexcept
{
  if (const auto * literal = std::get_if<std::string_view>(&text_)) {
    return *literal;
  }
  return std::get<std::string>(text_);
}

bool ContextMessage::is_static() const noexcept
{
  return std::holds_alternative<std::string_view>(text_);
}

}  // namespace open_union
