#include "binary_parsing.hpp"
#include "coff/coff.hpp"
#include "coff/error.hpp"
#include "coff/macros.hpp"
#include "coff/parse.hpp"

#include <fmt/format.h>
#include <stdexcept>
#include <utility>

namespace coffp = coff::parse;

coff::header coff::read_header(Reader &r, std::string_view file_name,
                               logger const &log) {
  auto raw = r.consume<coffp::header>();
  auto machine = to_machine_type(raw.machine);
  if (!machine) {
    log.error("Given file {} is not a coff file or contains an unknown machine",
              file_name);
    throw coff::error(errc::unknown_machine,
                      fmt::format("{}: unknown machine type {:#06x}", file_name,
                                  raw.machine));
  }
  return {.machine = *machine,
          .number_of_sections = raw.number_of_sections,
          .timedate_stamp = raw.timedate_stamp,
          .pointer_to_symbol_table = raw.pointer_to_symbol_table,
          .number_of_symbols = raw.number_of_symbols,
          .size_of_optional_header = raw.size_of_optional_header,
          .characteristics = raw.characteristics};
}

coff::object_file::object_file(std::span<const uint8_t> stream,
                               std::string name, logger log)
    : _stream(stream), _name(std::move(name)), _log(std::move(log)) {}

namespace {
// runs one parse step, reporting a short read as truncated input
template <typename F> auto stage(std::string_view file, const char *what, F &&f) {
  try {
    return f();
  } catch (std::out_of_range const &e) {
    throw coff::error(coff::errc::truncated_input,
                      fmt::format("{}: truncated input while reading {}: {}",
                                  file, what, e.what()));
  }
}
} // namespace

void coff::object_file::parse() {
  _parsed = false;
  _stream.seek(0);

  auto h = stage(_name, "file header",
                 [&] { return read_header(_stream, _name, _log); });
  _log.debug("{}: machine {}, {} sections, {} symbols", _name,
             format_as(h.machine), h.number_of_sections, h.number_of_symbols);

  stage(_name, "optional header",
        [&] { _stream.increment(h.size_of_optional_header); });

  auto strtab = stage(_name, "string table",
                      [&] { return read_string_table(_stream, h); });
  _log.debug("{}: string table at {:#x}, {} bytes", _name,
             strtab.file_offset(), strtab.size());

  auto headers = stage(_name, "section headers", [&] {
    return read_section_headers(_stream, h, strtab);
  });
  COFF_THROW_IF(headers.size() != h.number_of_sections);

  auto sections = stage(_name, "section data", [&] {
    return read_section_data(_stream, headers, _log);
  });
  _log.debug("{}: loaded {} sections", _name, sections.size());

  auto relocations = stage(_name, "relocations",
                           [&] { return read_relocations(_stream, headers); });
  _log.debug("{}: {} sections with relocations", _name, relocations.size());

  auto symbols =
      stage(_name, "symbol table", [&] { return read_symbols(_stream, h); });
  COFF_THROW_IF(symbols.size() != h.number_of_symbols);
  _log.debug("{}: {} symbol table records", _name, symbols.size());

  _header = h;
  _strtab = std::move(strtab);
  _section_headers = std::move(headers);
  _sections = std::move(sections);
  _relocations = std::move(relocations);
  _symbols = std::move(symbols);
  _parsed = true;
}

coff::header const &coff::object_file::get_header() const {
  COFF_THROW_IF(!_parsed);
  return _header;
}

coff::string_table const &coff::object_file::strtab() const {
  COFF_THROW_IF(!_parsed);
  return _strtab;
}

std::span<const coff::section_header>
coff::object_file::section_headers() const {
  COFF_THROW_IF(!_parsed);
  return _section_headers;
}

std::span<const coff::section> coff::object_file::sections() const {
  COFF_THROW_IF(!_parsed);
  return _sections;
}

coff::relocation_map const &coff::object_file::relocations() const {
  COFF_THROW_IF(!_parsed);
  return _relocations;
}

std::span<const coff::symbol> coff::object_file::symbols() const {
  COFF_THROW_IF(!_parsed);
  return _symbols;
}

std::span<const coff::relocation>
coff::object_file::relocations_for(u32 section_index) const {
  COFF_THROW_IF(!_parsed);
  auto it = _relocations.find(section_index);
  if (it == _relocations.end())
    return {};
  return it->second;
}

std::optional<coff::u32>
coff::object_file::find_section(std::string_view name) const {
  COFF_THROW_IF(!_parsed);
  for (u32 i = 0; i < _section_headers.size(); ++i) {
    if (_section_headers[i].name == name)
      return i;
  }
  return std::nullopt;
}

std::string_view
coff::object_file::relocation_target_name(relocation const &rel) const {
  COFF_THROW_IF(!_parsed);
  if (rel.symbol_table_index >= _symbols.size())
    return "<invalid index>";
  auto &s = _symbols[rel.symbol_table_index];
  if (s.is_auxiliary())
    return "<aux record>";
  return s.name(_strtab);
}
