#pragma once

#include "binary_parsing.hpp"
#include "coff/log.hpp"
#include "coff/types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace coff {

struct header {
  machine_type machine;
  u16 number_of_sections;
  u32 timedate_stamp;
  u32 pointer_to_symbol_table;
  u32 number_of_symbols;
  u16 size_of_optional_header;
  u16 characteristics;

  bool has_flag(fh::flags f) const noexcept { return characteristics & f; }
};

// Names that don't fit in 8 bytes. The buffer is kept raw; lookups return
// views into it.
class string_table {
public:
  string_table() = default;
  string_table(u32 file_offset, std::vector<uint8_t> data)
      : _file_offset(file_offset), _data(std::move(data)) {}

  // The NUL terminated string starting at `offset`. Offsets past the end of
  // the table give an empty string.
  std::string_view lookup(u32 offset) const noexcept;

  u32 file_offset() const noexcept { return _file_offset; }
  // bytes after the size field
  size_t size() const noexcept { return _data.size(); }
  bool empty() const noexcept { return _data.empty(); }

private:
  u32 _file_offset = 0;
  std::vector<uint8_t> _data;
};

struct section_header {
  std::string name;
  std::array<char, 8> raw_name;
  // Physical address or virtual size, depending on the file kind. Objects
  // must leave it 0, which the parser enforces; the raw data size is then
  // size_of_raw_data.
  u32 virtual_size;
  u32 virtual_address;
  u32 size_of_raw_data;
  u32 pointer_to_raw_data;
  u32 pointer_to_relocations;
  u32 pointer_to_linenumbers;
  u16 number_of_relocations;
  u16 number_of_linenumbers;
  u32 characteristics;

  bool has_flag(sh::flags f) const noexcept { return characteristics & f; }
  // no file backing, e.g. .bss
  bool is_virtual() const noexcept { return pointer_to_raw_data == 0; }

  // false for a zero or reserved (0xf) alignment field
  bool has_alignment() const noexcept {
    auto field = (characteristics & sh::align_mask) >> sh::align_shift;
    return field >= 1 && field <= sh::align_values.size();
  }
  // Required alignment in bytes. Throws std::logic_error unless
  // has_alignment().
  u32 alignment() const;

  // grouped sections such as ".text$mn" are merged into ".text" and ordered
  // by the suffix
  bool is_grouped() const noexcept {
    return name.find('$') != std::string::npos;
  }
  std::string_view group_name() const noexcept;
  std::string_view group_suffix() const noexcept;
};

struct section {
  std::vector<uint8_t> data;
};

struct relocation {
  u32 virtual_address;
  u32 symbol_table_index;
  u16 type;
  bool operator==(relocation const &o) const noexcept = default;
};

struct symbol {
  std::array<char, 8> raw_name;
  u32 value;
  i16 section_number;
  u16 type;
  sym::storage_class storage_class;
  u8 number_of_aux_symbols;
  // record belongs to the aux records of an earlier symbol. None of the
  // other fields are meaningful then.
  bool auxiliary = false;

  std::string_view name(string_table const &strtab) const;

  u8 base_type() const noexcept { return type >> 8; }
  sym::complex_type complex_type() const noexcept {
    return sym::complex_type((type >> 4) & 0xf);
  }
  bool is_function() const noexcept {
    return complex_type() == sym::dt_function;
  }
  bool is_undefined() const noexcept {
    return section_number == sym::undefined_section;
  }
  bool is_absolute() const noexcept {
    return section_number == sym::absolute_section;
  }
  bool is_debug() const noexcept {
    return section_number == sym::debug_section;
  }
  bool is_auxiliary() const noexcept { return auxiliary; }
};

// Resolves an 8 byte section name field. "/123" and "//Base64" refer to the
// string table, anything else is the name itself up to the first NUL. Inline
// names are returned as a view into `raw`.
std::string_view resolve_name(std::span<const char, 8> raw,
                              string_table const &strtab);

using relocation_map = std::unordered_map<u32, std::vector<relocation>>;

// A relocatable COFF object. The byte source is borrowed and must outlive
// parse(); everything decoded from it is owned here.
class object_file {
public:
  object_file(std::span<const uint8_t> stream, std::string name,
              logger log = {});

  // Decodes the whole file. Throws coff::error on malformed input, leaving
  // the object unparsed.
  void parse();
  bool parsed() const noexcept { return _parsed; }

  std::string_view name() const noexcept { return _name; }
  header const &get_header() const;
  string_table const &strtab() const;
  std::span<const section_header> section_headers() const;
  std::span<const section> sections() const;
  relocation_map const &relocations() const;
  std::span<const symbol> symbols() const;

  // empty when the section has no relocations
  std::span<const relocation> relocations_for(u32 section_index) const;
  std::optional<u32> find_section(std::string_view name) const;
  std::string_view symbol_name(symbol const &s) const {
    return s.name(strtab());
  }
  // Name of the symbol a relocation refers to, or a placeholder when the
  // index is out of range or lands on an aux record.
  std::string_view relocation_target_name(relocation const &rel) const;

private:
  Reader _stream;
  std::string _name;
  logger _log;
  bool _parsed = false;

  header _header{};
  string_table _strtab;
  std::vector<section_header> _section_headers;
  std::vector<section> _sections;
  relocation_map _relocations;
  std::vector<symbol> _symbols;
};

// parse steps, in the order object_file::parse runs them
header read_header(Reader &r, std::string_view file_name, logger const &log);
string_table read_string_table(Reader &r, header const &h);
std::vector<section_header> read_section_headers(Reader &r, header const &h,
                                                 string_table const &strtab);
std::vector<section> read_section_data(Reader &r,
                                       std::span<const section_header> headers,
                                       logger const &log);
relocation_map read_relocations(Reader &r,
                                std::span<const section_header> headers);
std::vector<symbol> read_symbols(Reader &r, header const &h);

} // namespace coff
