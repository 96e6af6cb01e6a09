#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

TEST(HeaderTests, DecodesAllFields) {
  coff_builder b;
  b.machine = coff::x86;
  b.timedate_stamp = 0x12345678;
  b.characteristics = coff::fh::machine_32bit | coff::fh::line_nums_stripped;
  b.sections.push_back({.name = ".text", .data = {0xc3}});
  b.symbols.push_back({.name = "_main", .section_number = 1});
  auto buffer = b.build();

  Reader r(buffer);
  auto h = coff::read_header(r, "test.obj", {});
  EXPECT_EQ(h.machine, coff::x86);
  EXPECT_EQ(h.number_of_sections, 1);
  EXPECT_EQ(h.timedate_stamp, 0x12345678u);
  EXPECT_EQ(h.number_of_symbols, 1u);
  EXPECT_EQ(h.pointer_to_symbol_table, 20u + 40u + 1u);
  EXPECT_EQ(h.size_of_optional_header, 0);
  EXPECT_TRUE(h.has_flag(coff::fh::machine_32bit));
  EXPECT_TRUE(h.has_flag(coff::fh::line_nums_stripped));
  EXPECT_FALSE(h.has_flag(coff::fh::dll));
  EXPECT_EQ(r.tell(), 20u);
}

TEST(HeaderTests, AcceptsKnownMachines) {
  for (coff::u16 machine : {0x0, 0x14c, 0x8664, 0xaa64, 0x1c4, 0x200}) {
    coff_builder b;
    b.machine = machine;
    auto buffer = b.build();
    Reader r(buffer);
    EXPECT_EQ(coff::read_header(r, "m.obj", {}).machine, machine);
  }
}

TEST(HeaderTests, UnknownMachineThrows) {
  coff_builder b;
  b.machine = 0xffff;
  auto buffer = b.build();

  std::vector<std::string> messages;
  coff::logger log([&](coff::log_level level, std::string_view msg) {
    EXPECT_EQ(level, coff::log_level::error);
    messages.emplace_back(msg);
  });

  Reader r(buffer);
  try {
    (void)coff::read_header(r, "bogus.obj", log);
    FAIL() << "expected unknown_machine";
  } catch (coff::error const &e) {
    EXPECT_EQ(e.code(), coff::errc::unknown_machine);
  }
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_NE(messages[0].find("bogus.obj"), std::string::npos);
}

TEST(HeaderTests, ShortHeaderIsOutOfRange) {
  std::vector<uint8_t> buffer = {0x64, 0x86, 0x01, 0x00};
  Reader r(buffer);
  EXPECT_THROW(coff::read_header(r, "short.obj", {}), std::out_of_range);
}

TEST(HeaderTests, FlagNames) {
  EXPECT_EQ(format_as(coff::fh::flags(0)), "0");
  EXPECT_EQ(format_as(coff::fh::flags(coff::fh::relocs_stripped |
                                      coff::fh::large_address_aware)),
            "relocs_stripped | large_address_aware");
  EXPECT_STREQ(format_as(coff::amd64), "x86-64");
  EXPECT_STREQ(format_as(coff::x86), "i386");
}
