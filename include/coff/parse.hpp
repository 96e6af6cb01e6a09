#pragma once

#include "coff/types.hpp"
#include <array>

// On-disk record layouts. Every field is little-endian.
namespace coff {
namespace parse {

struct header {
  u16 machine;
  u16 number_of_sections;
  u32 timedate_stamp;
  u32 pointer_to_symbol_table;
  u32 number_of_symbols;
  u16 size_of_optional_header;
  u16 characteristics;
};
static_assert(sizeof(header) == 20);

struct section_header {
  std::array<char, 8> name;
  u32 virtual_size;
  u32 virtual_address;
  u32 size_of_raw_data;
  u32 pointer_to_raw_data;
  u32 pointer_to_relocations;
  u32 pointer_to_linenumbers;
  u16 number_of_relocations;
  u16 number_of_linenumbers;
  u32 characteristics;
};
static_assert(sizeof(section_header) == 40);

struct relocation {
  u32 virtual_address;
  u32 symbol_table_index;
  u16 type;
} __attribute__((packed));
static_assert(sizeof(relocation) == 10);

struct symbol {
  std::array<char, 8> name;
  u32 value;
  i16 section_number;
  u16 type;
  u8 storage_class;
  u8 number_of_aux_symbols;
} __attribute__((packed));
static_assert(sizeof(symbol) == symbol_record_size);

} // namespace parse
} // namespace coff
