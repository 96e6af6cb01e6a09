#include "binary_parsing.hpp"
#include "coff/coff.hpp"
#include "coff/error.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <ctre.hpp>
#include <fmt/format.h>
#include <limits>
#include <scope_guard.hpp>

namespace {

std::string_view until_nul(std::span<const char> raw) noexcept {
  auto nul = std::ranges::find(raw, '\0');
  return std::string_view(raw.data(), nul - raw.begin());
}

// Offsets too large for 7 decimal digits are written as "//" followed by up
// to 6 base64 digits
std::optional<coff::u32> decode_base64(std::string_view str) noexcept {
  uint64_t value = 0;
  for (char c : str) {
    unsigned digit;
    if (c >= 'A' && c <= 'Z')
      digit = c - 'A';
    else if (c >= 'a' && c <= 'z')
      digit = c - 'a' + 26;
    else if (c >= '0' && c <= '9')
      digit = c - '0' + 52;
    else if (c == '+')
      digit = 62;
    else if (c == '/')
      digit = 63;
    else
      return std::nullopt;
    value = value * 64 + digit;
  }
  if (value > std::numeric_limits<coff::u32>::max())
    return std::nullopt;
  return static_cast<coff::u32>(value);
}

} // namespace

std::string_view coff::string_table::lookup(u32 offset) const noexcept {
  if (offset >= _data.size())
    return {};
  auto begin = reinterpret_cast<const char *>(_data.data()) + offset;
  auto len = std::find(begin, begin + (_data.size() - offset), '\0') - begin;
  return std::string_view(begin, len);
}

coff::string_table coff::read_string_table(Reader &r, header const &h) {
  // objects without a symbol table carry no string table either
  if (h.pointer_to_symbol_table == 0)
    return {};

  uint64_t offset = uint64_t(h.pointer_to_symbol_table) +
                    uint64_t(h.number_of_symbols) * symbol_record_size;

  auto guard = sg::make_scope_guard([&r, pos = r.tell()]() noexcept {
    r.begin = r.base + pos;
  });
  r.seek(offset);
  auto total_size = r.consume<u32>();
  if (total_size <= sizeof(u32))
    return string_table(static_cast<u32>(offset), {});
  return string_table(static_cast<u32>(offset),
                      r.consume_vec<uint8_t>(total_size - sizeof(u32)));
}

std::string_view coff::resolve_name(std::span<const char, 8> raw,
                                    string_table const &strtab) {
  auto name = until_nul(raw);
  if (name.empty() || name.front() != '/')
    return name;

  if (auto base64 = ctre::match<"//([A-Za-z0-9+/]{1,6})">(name)) {
    if (auto offset = decode_base64(base64.get<1>().to_view()))
      return strtab.lookup(*offset);
  } else if (auto decimal = ctre::match<"/([0-9]{1,7})">(name)) {
    auto digits = decimal.get<1>().to_view();
    u32 offset = 0;
    auto [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), offset);
    if (ec == std::errc{} && end == digits.data() + digits.size())
      return strtab.lookup(offset);
  }
  throw coff::error(errc::invalid_long_name,
                    fmt::format("section name \"{}\" is not a valid string "
                                "table reference",
                                name));
}
