#pragma once

#include <fmt/core.h>
#include <stdexcept>

// Internal consistency checks. A failure here is a bug in the decoder, not
// bad input, so it is reported as std::logic_error.
#define COFF_THROW_IF(cond)                                                    \
  do {                                                                         \
    if (cond)                                                                  \
      throw std::logic_error(fmt::format("Assertion \"{}\" failed at {}:{}",   \
                                         #cond, __FILE__, __LINE__));          \
  } while (0)

