#include "binary_parsing.hpp"
#include "coff/coff.hpp"
#include "coff/error.hpp"
#include "coff/macros.hpp"
#include "coff/parse.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <ranges>
#include <stdexcept>

namespace coffp = coff::parse;

coff::u32 coff::section_header::alignment() const {
  u32 bytes = 1;
  for (auto value : sh::align_values) {
    if ((characteristics & sh::align_mask) == value)
      return bytes;
    bytes <<= 1;
  }
  throw std::logic_error(
      fmt::format("section {} has no alignment (characteristics {:#x})", name,
                  characteristics));
}

std::string_view coff::section_header::group_name() const noexcept {
  return std::string_view(name).substr(0, name.find('$'));
}

std::string_view coff::section_header::group_suffix() const noexcept {
  auto pos = name.find('$');
  if (pos == std::string::npos)
    return {};
  return std::string_view(name).substr(pos + 1);
}

std::vector<coff::section_header>
coff::read_section_headers(Reader &r, header const &h,
                           string_table const &strtab) {
  auto read_header = std::views::transform([&](coffp::section_header sh) {
    return section_header{
        .name = std::string(resolve_name(sh.name, strtab)),
        .raw_name = sh.name,
        .virtual_size = sh.virtual_size,
        .virtual_address = sh.virtual_address,
        .size_of_raw_data = sh.size_of_raw_data,
        .pointer_to_raw_data = sh.pointer_to_raw_data,
        .pointer_to_relocations = sh.pointer_to_relocations,
        .pointer_to_linenumbers = sh.pointer_to_linenumbers,
        .number_of_relocations = sh.number_of_relocations,
        .number_of_linenumbers = sh.number_of_linenumbers,
        .characteristics = sh.characteristics};
  });

  auto raw = r.consume_vec<coffp::section_header>(h.number_of_sections);
  std::vector<section_header> headers;
  headers.reserve(raw.size());
  std::ranges::copy(raw | read_header, std::back_inserter(headers));

  for (size_t i = 0; i < headers.size(); ++i) {
    if (headers[i].virtual_size != 0)
      throw coff::error(
          errc::invalid_virtual_size,
          fmt::format("section {} ({}) has virtual size {:#x}, object files "
                      "must leave it 0",
                      i, headers[i].name, headers[i].virtual_size));
  }
  return headers;
}

std::vector<coff::section>
coff::read_section_data(Reader &r, std::span<const section_header> headers,
                        logger const &log) {
  std::vector<section> sections;
  if (headers.empty())
    return sections;

  sections.reserve(headers.size());
  for (auto &sh : headers) {
    if (sh.size_of_raw_data == 0) {
      sections.push_back({});
      continue;
    }
    if (sh.is_virtual()) {
      log.debug("section {} has {} bytes of uninitialized data", sh.name,
                sh.size_of_raw_data);
      sections.push_back({});
      continue;
    }
    r.seek(sh.pointer_to_raw_data);
    sections.push_back({r.consume_vec<uint8_t>(sh.size_of_raw_data)});
  }
  return sections;
}

coff::relocation_map
coff::read_relocations(Reader &r, std::span<const section_header> headers) {
  relocation_map result;
  for (u32 index = 0; index < headers.size(); ++index) {
    auto &sh = headers[index];
    if (sh.number_of_relocations == 0)
      continue;

    r.seek(sh.pointer_to_relocations);
    auto raw = r.consume_vec<coffp::relocation>(sh.number_of_relocations);
    std::vector<relocation> relocs;
    relocs.reserve(raw.size());
    std::ranges::copy(raw | std::views::transform([](coffp::relocation rel) {
                        return relocation{
                            .virtual_address = rel.virtual_address,
                            .symbol_table_index = rel.symbol_table_index,
                            .type = rel.type};
                      }),
                      std::back_inserter(relocs));

    auto [_, inserted] = result.emplace(index, std::move(relocs));
    COFF_THROW_IF(!inserted);
  }
  return result;
}
