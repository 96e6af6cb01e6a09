#pragma once

#include "coff/types.hpp"
#include <cstdint>
#include <string_view>

namespace coff {

namespace amd64_reloc {
enum type : u16 {
  absolute = 0x0000,
  addr64 = 0x0001,
  addr32 = 0x0002,
  addr32nb = 0x0003,
  rel32 = 0x0004,
  rel32_1 = 0x0005,
  rel32_2 = 0x0006,
  rel32_3 = 0x0007,
  rel32_4 = 0x0008,
  rel32_5 = 0x0009,
  section = 0x000a,
  secrel = 0x000b,
  secrel7 = 0x000c,
  token = 0x000d,
  srel32 = 0x000e,
  pair = 0x000f,
  sspan32 = 0x0010,
};
} // namespace amd64_reloc

namespace i386_reloc {
enum type : u16 {
  absolute = 0x0000,
  dir16 = 0x0001,
  rel16 = 0x0002,
  dir32 = 0x0006,
  dir32nb = 0x0007,
  seg12 = 0x0009,
  section = 0x000a,
  secrel = 0x000b,
  token = 0x000c,
  secrel7 = 0x000d,
  rel32 = 0x0014,
};
} // namespace i386_reloc

namespace arm64_reloc {
enum type : u16 {
  absolute = 0x0000,
  addr32 = 0x0001,
  addr32nb = 0x0002,
  branch26 = 0x0003,
  pagebase_rel21 = 0x0004,
  rel21 = 0x0005,
  pageoffset_12a = 0x0006,
  pageoffset_12l = 0x0007,
  secrel = 0x0008,
  secrel_low12a = 0x0009,
  secrel_high12a = 0x000a,
  secrel_low12l = 0x000b,
  token = 0x000c,
  section = 0x000d,
  addr64 = 0x000e,
  branch19 = 0x000f,
  branch14 = 0x0010,
  rel32 = 0x0011,
};
} // namespace arm64_reloc

#define STRINGTIZE(TOK) #TOK
constexpr std::string_view to_string(amd64_reloc::type t) noexcept {
  switch (t) {
  case amd64_reloc::absolute:
    return STRINGTIZE(IMAGE_REL_AMD64_ABSOLUTE);
  case amd64_reloc::addr64:
    return STRINGTIZE(IMAGE_REL_AMD64_ADDR64);
  case amd64_reloc::addr32:
    return STRINGTIZE(IMAGE_REL_AMD64_ADDR32);
  case amd64_reloc::addr32nb:
    return STRINGTIZE(IMAGE_REL_AMD64_ADDR32NB);
  case amd64_reloc::rel32:
    return STRINGTIZE(IMAGE_REL_AMD64_REL32);
  case amd64_reloc::rel32_1:
    return STRINGTIZE(IMAGE_REL_AMD64_REL32_1);
  case amd64_reloc::rel32_2:
    return STRINGTIZE(IMAGE_REL_AMD64_REL32_2);
  case amd64_reloc::rel32_3:
    return STRINGTIZE(IMAGE_REL_AMD64_REL32_3);
  case amd64_reloc::rel32_4:
    return STRINGTIZE(IMAGE_REL_AMD64_REL32_4);
  case amd64_reloc::rel32_5:
    return STRINGTIZE(IMAGE_REL_AMD64_REL32_5);
  case amd64_reloc::section:
    return STRINGTIZE(IMAGE_REL_AMD64_SECTION);
  case amd64_reloc::secrel:
    return STRINGTIZE(IMAGE_REL_AMD64_SECREL);
  case amd64_reloc::secrel7:
    return STRINGTIZE(IMAGE_REL_AMD64_SECREL7);
  case amd64_reloc::token:
    return STRINGTIZE(IMAGE_REL_AMD64_TOKEN);
  case amd64_reloc::srel32:
    return STRINGTIZE(IMAGE_REL_AMD64_SREL32);
  case amd64_reloc::pair:
    return STRINGTIZE(IMAGE_REL_AMD64_PAIR);
  case amd64_reloc::sspan32:
    return STRINGTIZE(IMAGE_REL_AMD64_SSPAN32);
  }
  return "unknown amd64 relocation";
}

constexpr std::string_view to_string(i386_reloc::type t) noexcept {
  switch (t) {
  case i386_reloc::absolute:
    return STRINGTIZE(IMAGE_REL_I386_ABSOLUTE);
  case i386_reloc::dir16:
    return STRINGTIZE(IMAGE_REL_I386_DIR16);
  case i386_reloc::rel16:
    return STRINGTIZE(IMAGE_REL_I386_REL16);
  case i386_reloc::dir32:
    return STRINGTIZE(IMAGE_REL_I386_DIR32);
  case i386_reloc::dir32nb:
    return STRINGTIZE(IMAGE_REL_I386_DIR32NB);
  case i386_reloc::seg12:
    return STRINGTIZE(IMAGE_REL_I386_SEG12);
  case i386_reloc::section:
    return STRINGTIZE(IMAGE_REL_I386_SECTION);
  case i386_reloc::secrel:
    return STRINGTIZE(IMAGE_REL_I386_SECREL);
  case i386_reloc::token:
    return STRINGTIZE(IMAGE_REL_I386_TOKEN);
  case i386_reloc::secrel7:
    return STRINGTIZE(IMAGE_REL_I386_SECREL7);
  case i386_reloc::rel32:
    return STRINGTIZE(IMAGE_REL_I386_REL32);
  }
  return "unknown i386 relocation";
}

constexpr std::string_view to_string(arm64_reloc::type t) noexcept {
  switch (t) {
  case arm64_reloc::absolute:
    return STRINGTIZE(IMAGE_REL_ARM64_ABSOLUTE);
  case arm64_reloc::addr32:
    return STRINGTIZE(IMAGE_REL_ARM64_ADDR32);
  case arm64_reloc::addr32nb:
    return STRINGTIZE(IMAGE_REL_ARM64_ADDR32NB);
  case arm64_reloc::branch26:
    return STRINGTIZE(IMAGE_REL_ARM64_BRANCH26);
  case arm64_reloc::pagebase_rel21:
    return STRINGTIZE(IMAGE_REL_ARM64_PAGEBASE_REL21);
  case arm64_reloc::rel21:
    return STRINGTIZE(IMAGE_REL_ARM64_REL21);
  case arm64_reloc::pageoffset_12a:
    return STRINGTIZE(IMAGE_REL_ARM64_PAGEOFFSET_12A);
  case arm64_reloc::pageoffset_12l:
    return STRINGTIZE(IMAGE_REL_ARM64_PAGEOFFSET_12L);
  case arm64_reloc::secrel:
    return STRINGTIZE(IMAGE_REL_ARM64_SECREL);
  case arm64_reloc::secrel_low12a:
    return STRINGTIZE(IMAGE_REL_ARM64_SECREL_LOW12A);
  case arm64_reloc::secrel_high12a:
    return STRINGTIZE(IMAGE_REL_ARM64_SECREL_HIGH12A);
  case arm64_reloc::secrel_low12l:
    return STRINGTIZE(IMAGE_REL_ARM64_SECREL_LOW12L);
  case arm64_reloc::token:
    return STRINGTIZE(IMAGE_REL_ARM64_TOKEN);
  case arm64_reloc::section:
    return STRINGTIZE(IMAGE_REL_ARM64_SECTION);
  case arm64_reloc::addr64:
    return STRINGTIZE(IMAGE_REL_ARM64_ADDR64);
  case arm64_reloc::branch19:
    return STRINGTIZE(IMAGE_REL_ARM64_BRANCH19);
  case arm64_reloc::branch14:
    return STRINGTIZE(IMAGE_REL_ARM64_BRANCH14);
  case arm64_reloc::rel32:
    return STRINGTIZE(IMAGE_REL_ARM64_REL32);
  }
  return "unknown arm64 relocation";
}
#undef STRINGTIZE

// name of a relocation type tag, which is only meaningful per machine
constexpr std::string_view reloc_name(machine_type machine, u16 type) noexcept {
  switch (machine) {
  case amd64:
    return to_string(amd64_reloc::type(type));
  case x86:
    return to_string(i386_reloc::type(type));
  case arm64:
    return to_string(arm64_reloc::type(type));
  default:
    return "unknown";
  }
}

} // namespace coff
