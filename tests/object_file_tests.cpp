#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>

namespace {
coff_builder single_text_section() {
  coff_builder b;
  std::vector<uint8_t> code(16);
  std::iota(code.begin(), code.end(), uint8_t{0xa0});
  b.sections.push_back({.name = ".text", .data = code});
  b.symbols.push_back({.name = "main",
                       .value = 0,
                       .section_number = 1,
                       .storage_class = coff::sym::external,
                       .aux = 0});
  return b;
}
} // namespace

TEST(ObjectFileTests, ParsesSingleSectionAndSymbol) {
  auto b = single_text_section();
  auto buffer = b.build();

  auto o = coff::object_file(buffer, "a.obj");
  o.parse();
  ASSERT_TRUE(o.parsed());

  auto &h = o.get_header();
  EXPECT_EQ(h.machine, coff::amd64);
  ASSERT_EQ(o.section_headers().size(), 1u);
  ASSERT_EQ(o.sections().size(), 1u);
  EXPECT_EQ(o.section_headers()[0].name, ".text");
  EXPECT_EQ(o.section_headers()[0].size_of_raw_data, 16u);
  EXPECT_EQ(o.sections()[0].data, b.sections[0].data);
  EXPECT_TRUE(o.relocations().empty());

  ASSERT_EQ(o.symbols().size(), 1u);
  auto &main = o.symbols()[0];
  EXPECT_EQ(o.symbol_name(main), "main");
  EXPECT_EQ(main.value, 0u);
  EXPECT_EQ(main.section_number, 1);
  EXPECT_EQ(main.storage_class, coff::sym::external);
  EXPECT_EQ(main.number_of_aux_symbols, 0);
}

TEST(ObjectFileTests, UnknownMachineStopsBeforeAnythingElse) {
  auto b = single_text_section();
  b.machine = 0xffff;
  auto buffer = b.build();
  // only the header is present, so reading further would fail differently
  buffer.resize(20);

  auto o = coff::object_file(buffer, "b.obj");
  expect_parse_error(o, coff::errc::unknown_machine);
  EXPECT_THROW((void)o.sections(), std::logic_error);
  EXPECT_THROW((void)o.symbols(), std::logic_error);
}

TEST(ObjectFileTests, SymbolNameFromStringTable) {
  coff_builder b;
  b.add_string("foo");
  b.symbols.push_back({.name = "placeholder"});
  auto buffer = b.build();

  // point the symbol at offset 0 of the table
  auto symbol_offset = buffer.size() - coff::symbol_record_size - 4 -
                       b.strtab.size();
  std::fill_n(buffer.begin() + symbol_offset, 8, 0);

  auto o = coff::object_file(buffer, "c.obj");
  o.parse();
  ASSERT_EQ(o.symbols().size(), 1u);
  EXPECT_EQ(o.symbol_name(o.symbols()[0]), "foo");
  EXPECT_EQ(o.symbols()[0].name(o.strtab()), "foo");
}

TEST(ObjectFileTests, InvalidVirtualSizeAbortsParse) {
  auto b = single_text_section();
  b.sections.push_back({.name = ".data", .data = {1}, .virtual_size = 0x100});

  std::vector<std::string> messages;
  coff::logger log([&](coff::log_level, std::string_view msg) {
    messages.emplace_back(msg);
  });
  auto buffer = b.build();
  auto o = coff::object_file(buffer, "d.obj", log);
  expect_parse_error(o, coff::errc::invalid_virtual_size);

  // nothing past the section headers was reached
  for (auto &msg : messages) {
    EXPECT_EQ(msg.find("loaded"), std::string::npos) << msg;
    EXPECT_EQ(msg.find("symbol table records"), std::string::npos) << msg;
  }
}

TEST(ObjectFileTests, CountsMatchHeader) {
  coff_builder b;
  for (int i = 0; i < 5; ++i) {
    b.sections.push_back(
        {.name = ".text$" + std::to_string(i), .data = {uint8_t(i)}});
    b.symbols.push_back({.name = "sym" + std::to_string(i),
                         .section_number = coff::i16(i + 1),
                         .storage_class = coff::sym::static_,
                         .aux = coff::u8(i % 2)});
  }
  auto buffer = b.build();

  auto o = coff::object_file(buffer, "e.obj");
  o.parse();
  EXPECT_EQ(o.section_headers().size(), o.get_header().number_of_sections);
  EXPECT_EQ(o.sections().size(), o.get_header().number_of_sections);
  EXPECT_EQ(o.symbols().size(), o.get_header().number_of_symbols);
  EXPECT_EQ(o.symbols().size(), b.symbol_count());
}

TEST(ObjectFileTests, OptionalHeaderIsSkipped) {
  auto b = single_text_section();
  b.optional_header_size = 28;
  auto buffer = b.build();

  auto o = coff::object_file(buffer, "f.obj");
  o.parse();
  EXPECT_EQ(o.get_header().size_of_optional_header, 28);
  EXPECT_EQ(o.section_headers()[0].name, ".text");
  EXPECT_EQ(o.sections()[0].data, b.sections[0].data);
}

TEST(ObjectFileTests, TruncatedFileIsReported) {
  auto b = single_text_section();
  auto full = b.build();

  // cut inside the file header, the section headers, the section data and the
  // string table size field
  for (size_t size : {size_t{10}, size_t{40}, size_t{65}, full.size() - 2}) {
    auto buffer = std::vector<uint8_t>(full.begin(), full.begin() + size);
    auto o = coff::object_file(buffer, "g.obj");
    expect_parse_error(o, coff::errc::truncated_input);
  }
}

TEST(ObjectFileTests, EmptyObject) {
  coff_builder b;
  auto buffer = b.build();

  auto o = coff::object_file(buffer, "empty.obj");
  o.parse();
  EXPECT_TRUE(o.section_headers().empty());
  EXPECT_TRUE(o.sections().empty());
  EXPECT_TRUE(o.symbols().empty());
  EXPECT_TRUE(o.relocations().empty());
  EXPECT_TRUE(o.strtab().empty());
}

TEST(ObjectFileTests, FindSection) {
  coff_builder b;
  b.sections.push_back({.name = ".text", .data = {0}});
  b.sections.push_back({.name = ".debug_line", .data = {0}});
  b.symbols.push_back({.name = "x"});
  auto buffer = b.build();

  auto o = coff::object_file(buffer, "h.obj");
  o.parse();
  EXPECT_EQ(o.find_section(".text"), 0u);
  EXPECT_EQ(o.find_section(".debug_line"), 1u);
  EXPECT_FALSE(o.find_section(".data").has_value());
}

TEST(ObjectFileTests, AccessBeforeParseIsLogicError) {
  std::vector<uint8_t> buffer;
  auto o = coff::object_file(buffer, "unparsed.obj");
  EXPECT_FALSE(o.parsed());
  EXPECT_EQ(o.name(), "unparsed.obj");
  EXPECT_THROW((void)o.get_header(), std::logic_error);
  EXPECT_THROW((void)o.section_headers(), std::logic_error);
  EXPECT_THROW((void)o.relocations_for(0), std::logic_error);
}

TEST(ObjectFileTests, ParseLogsEachStage) {
  auto b = single_text_section();
  auto buffer = b.build();

  std::vector<std::string> messages;
  coff::logger log([&](coff::log_level level, std::string_view msg) {
    EXPECT_EQ(level, coff::log_level::debug);
    messages.emplace_back(msg);
  });
  auto o = coff::object_file(buffer, "log.obj", log);
  o.parse();

  ASSERT_EQ(messages.size(), 5u);
  EXPECT_NE(messages[0].find("x86-64"), std::string::npos);
  EXPECT_NE(messages[4].find("1 symbol table records"), std::string::npos);
}

TEST(ObjectFileTests, ParseCanBeRepeated) {
  auto b = single_text_section();
  auto buffer = b.build();

  auto o = coff::object_file(buffer, "twice.obj");
  o.parse();
  o.parse();
  EXPECT_EQ(o.symbols().size(), 1u);
  EXPECT_EQ(o.sections()[0].data.size(), 16u);
}
