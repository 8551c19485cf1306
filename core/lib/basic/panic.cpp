// open_union/basic/panic.cpp - Panic banner
//
#include "open_union/basic/panic.hpp"

#include <fmt/ostream.h>

#include <cstdlib>
#include <iostream>
#include <rang.hpp>

namespace open_union::detail
{

void internal_panic(const char * file, int line, std::string_view message)
{
  std::cerr << "\n[" << file << ":" << line << " - " << rang::style::bold << rang::fg::red
            << "PANIC!" << rang::fg::reset << rang::style::reset << "] " << rang::style::bold
            << rang::fg::red << message << rang::fg::reset << rang::style::reset << "\n\n";
  fmt::print(
    std::cerr,
    "A panic indicates that an internal invariant of open_union was violated.\n"
    "The union was built or reshaped unsoundly somewhere upstream of this call.\n");
  std::cerr.flush();
  std::abort();
}

}  // namespace open_union::detail
