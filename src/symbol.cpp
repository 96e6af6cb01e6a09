#include "binary_parsing.hpp"
#include "coff/coff.hpp"
#include "coff/error.hpp"
#include "coff/parse.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace coffp = coff::parse;

std::string_view coff::symbol::name(string_table const &strtab) const {
  // a name starting with four zero bytes is an offset into the string table
  u32 zeroes;
  std::memcpy(&zeroes, raw_name.data(), sizeof(zeroes));
  if (zeroes == 0) {
    u32 offset;
    std::memcpy(&offset, raw_name.data() + sizeof(zeroes), sizeof(offset));
    return strtab.lookup(offset);
  }
  auto nul = std::find(raw_name.begin(), raw_name.end(), '\0');
  return std::string_view(raw_name.data(), nul - raw_name.begin());
}

std::vector<coff::symbol> coff::read_symbols(Reader &r, header const &h) {
  std::vector<symbol> symbols;
  if (h.number_of_symbols == 0)
    return symbols;

  r.seek(h.pointer_to_symbol_table);
  auto raw = r.consume_vec<coffp::symbol>(h.number_of_symbols);
  symbols.reserve(raw.size());

  // aux records share the table with the symbols they extend, so they are
  // kept as placeholders to keep relocation symbol indices valid
  unsigned aux_left = 0;
  for (u32 index = 0; index < raw.size(); ++index) {
    auto const &rec = raw[index];
    if (aux_left > 0) {
      --aux_left;
      symbol aux{};
      aux.raw_name = rec.name;
      aux.auxiliary = true;
      symbols.push_back(aux);
      continue;
    }

    u8 storage_byte = rec.storage_class;
    auto storage = sym::to_storage_class(storage_byte);
    if (!storage)
      throw coff::error(
          errc::unknown_storage_class,
          fmt::format("symbol {} has unknown storage class {:#04x}", index,
                      storage_byte));

    symbols.push_back(symbol{.raw_name = rec.name,
                             .value = rec.value,
                             .section_number = rec.section_number,
                             .type = rec.type,
                             .storage_class = *storage,
                             .number_of_aux_symbols =
                                 rec.number_of_aux_symbols});
    aux_left = rec.number_of_aux_symbols;
  }
  return symbols;
}
