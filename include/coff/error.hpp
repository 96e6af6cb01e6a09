#pragma once

#include <stdexcept>
#include <string>

namespace coff {

enum struct errc {
  unknown_machine,
  invalid_virtual_size,
  truncated_input,
  unknown_storage_class,
  invalid_long_name,
};

inline auto format_as(errc e) noexcept {
  switch (e) {
  case errc::unknown_machine:
    return "unknown machine";
  case errc::invalid_virtual_size:
    return "invalid virtual size";
  case errc::truncated_input:
    return "truncated input";
  case errc::unknown_storage_class:
    return "unknown storage class";
  case errc::invalid_long_name:
    return "invalid long name";
  }
  return "???";
}

// Thrown when the input does not decode as a relocatable COFF object. Any
// error aborts the parse that raised it.
class error : public std::runtime_error {
public:
  error(errc code, std::string const &what)
      : std::runtime_error(what), _code(code) {}
  errc code() const noexcept { return _code; }

private:
  errc _code;
};

} // namespace coff
