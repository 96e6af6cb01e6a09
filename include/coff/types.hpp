#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace coff {

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using i16 = int16_t;

// size of one record in the symbol table, aux records included
constexpr u32 symbol_record_size = 18;

enum machine_type : u16 {
  unknown = 0x0,
  am33 = 0x1d3,
  amd64 = 0x8664,
  arm = 0x1c0,
  arm64 = 0xaa64,
  armnt = 0x1c4,
  ebc = 0xebc,
  x86 = 0x14c,
  ia64 = 0x200,
  loongarch32 = 0x6232,
  loongarch64 = 0x6264,
  m32r = 0x9041,
  mips16 = 0x266,
  mipsfpu = 0x366,
  mipsfpu16 = 0x466,
  powerpc = 0x1f0,
  powerpcfp = 0x1f1,
  r4000 = 0x166,
  riscv32 = 0x5032,
  riscv64 = 0x5064,
  riscv128 = 0x5128,
  sh3 = 0x1a2,
  sh3dsp = 0x1a3,
  sh4 = 0x1a6,
  sh5 = 0x1a8,
  thumb = 0x1c2,
  wcemipsv2 = 0x169,
};

// nullopt when the value is not a machine this decoder knows about
constexpr std::optional<machine_type> to_machine_type(u16 value) noexcept {
  switch (value) {
  case unknown:
  case am33:
  case amd64:
  case arm:
  case arm64:
  case armnt:
  case ebc:
  case x86:
  case ia64:
  case loongarch32:
  case loongarch64:
  case m32r:
  case mips16:
  case mipsfpu:
  case mipsfpu16:
  case powerpc:
  case powerpcfp:
  case r4000:
  case riscv32:
  case riscv64:
  case riscv128:
  case sh3:
  case sh3dsp:
  case sh4:
  case sh5:
  case thumb:
  case wcemipsv2:
    return static_cast<machine_type>(value);
  }
  return std::nullopt;
}

inline auto format_as(machine_type e) noexcept {
  switch (e) {
  case unknown:
    return "unknown";
  case am33:
    return "AM33";
  case amd64:
    return "x86-64";
  case arm:
    return "ARM";
  case arm64:
    return "ARM64";
  case armnt:
    return "ARM Thumb-2";
  case ebc:
    return "EFI byte code";
  case x86:
    return "i386";
  case ia64:
    return "IA64";
  case loongarch32:
    return "LoongArch32";
  case loongarch64:
    return "LoongArch64";
  case m32r:
    return "M32R";
  case mips16:
    return "MIPS16";
  case mipsfpu:
    return "MIPS with FPU";
  case mipsfpu16:
    return "MIPS16 with FPU";
  case powerpc:
    return "PowerPC";
  case powerpcfp:
    return "PowerPC with FPU";
  case r4000:
    return "MIPS R4000";
  case riscv32:
    return "RISC-V 32";
  case riscv64:
    return "RISC-V 64";
  case riscv128:
    return "RISC-V 128";
  case sh3:
    return "SH3";
  case sh3dsp:
    return "SH3 DSP";
  case sh4:
    return "SH4";
  case sh5:
    return "SH5";
  case thumb:
    return "Thumb";
  case wcemipsv2:
    return "MIPS WCE v2";
  default:
    return "???";
  }
}

namespace fh {
// file header characteristics
enum flags : u16 {
  relocs_stripped = 0x0001,
  executable_image = 0x0002,
  line_nums_stripped = 0x0004,
  local_syms_stripped = 0x0008,
  aggressive_ws_trim = 0x0010,
  large_address_aware = 0x0020,
  bytes_reversed_lo = 0x0080,
  machine_32bit = 0x0100,
  debug_stripped = 0x0200,
  removable_run_from_swap = 0x0400,
  net_run_from_swap = 0x0800,
  system = 0x1000,
  dll = 0x2000,
  up_system_only = 0x4000,
  bytes_reversed_hi = 0x8000,
};

inline std::string format_as(flags e) {
  std::string result;
  constexpr auto all_flags = std::to_array<std::pair<flags, const char *>>(
      {{relocs_stripped, "relocs_stripped"},
       {executable_image, "executable_image"},
       {line_nums_stripped, "line_nums_stripped"},
       {local_syms_stripped, "local_syms_stripped"},
       {aggressive_ws_trim, "aggressive_ws_trim"},
       {large_address_aware, "large_address_aware"},
       {bytes_reversed_lo, "bytes_reversed_lo"},
       {machine_32bit, "32bit_machine"},
       {debug_stripped, "debug_stripped"},
       {removable_run_from_swap, "removable_run_from_swap"},
       {net_run_from_swap, "net_run_from_swap"},
       {system, "system"},
       {dll, "dll"},
       {up_system_only, "up_system_only"},
       {bytes_reversed_hi, "bytes_reversed_hi"}});
  bool first = true;
  for (auto &&[val, name] : all_flags) {
    if (bool(e & val)) {
      if (!first)
        result += " | ";
      else
        first = false;
      result += name;
    }
  }
  if (result.empty())
    return "0";
  return result;
}
} // namespace fh

namespace sh {

enum flags : u32 {
  type_no_pad = 0x00000008,
  cnt_code = 0x00000020,
  cnt_initialized_data = 0x00000040,
  cnt_uninitialized_data = 0x00000080,
  lnk_other = 0x00000100,
  lnk_info = 0x00000200,
  lnk_remove = 0x00000800,
  lnk_comdat = 0x00001000,
  gprel = 0x00008000,
  mem_purgeable = 0x00020000,
  mem_locked = 0x00040000,
  mem_preload = 0x00080000,
  lnk_nreloc_ovfl = 0x01000000,
  mem_discardable = 0x02000000,
  mem_not_cached = 0x04000000,
  mem_not_paged = 0x08000000,
  mem_shared = 0x10000000,
  mem_execute = 0x20000000,
  mem_read = 0x40000000,
  mem_write = 0x80000000,
};

// The alignment is a 4 bit field, not a set of independent bits. Values
// 1 to 14 select 2^(value - 1) bytes.
constexpr u32 align_mask = 0x00f00000;
constexpr u32 align_shift = 20;
constexpr std::array<u32, 14> align_values = {
    0x00100000, 0x00200000, 0x00300000, 0x00400000, 0x00500000,
    0x00600000, 0x00700000, 0x00800000, 0x00900000, 0x00a00000,
    0x00b00000, 0x00c00000, 0x00d00000, 0x00e00000};

constexpr u32 align_flag(u32 bytes) noexcept {
  u32 value = 1;
  while (bytes > 1) {
    bytes >>= 1;
    ++value;
  }
  return value << align_shift;
}

inline std::string format_as(flags e) {
  std::string result;
  constexpr auto all_flags = std::to_array<std::pair<flags, const char *>>(
      {{type_no_pad, "no_pad"},
       {cnt_code, "code"},
       {cnt_initialized_data, "initialized_data"},
       {cnt_uninitialized_data, "uninitialized_data"},
       {lnk_other, "lnk_other"},
       {lnk_info, "lnk_info"},
       {lnk_remove, "lnk_remove"},
       {lnk_comdat, "comdat"},
       {gprel, "gprel"},
       {mem_purgeable, "purgeable"},
       {mem_locked, "locked"},
       {mem_preload, "preload"},
       {lnk_nreloc_ovfl, "nreloc_ovfl"},
       {mem_discardable, "discardable"},
       {mem_not_cached, "not_cached"},
       {mem_not_paged, "not_paged"},
       {mem_shared, "shared"},
       {mem_execute, "execute"},
       {mem_read, "read"},
       {mem_write, "write"}});
  bool first = true;
  for (auto &&[val, name] : all_flags) {
    if (bool(e & val)) {
      if (!first)
        result += " | ";
      else
        first = false;
      result += name;
    }
  }
  if (result.empty())
    return "0";
  return result;
}
} // namespace sh

namespace sym {

// section_number values with special meaning
constexpr i16 undefined_section = 0;
constexpr i16 absolute_section = -1;
constexpr i16 debug_section = -2;

enum storage_class : u8 {
  end_of_function = 0xff,
  null = 0,
  automatic = 1,
  external = 2,
  static_ = 3,
  register_ = 4,
  external_def = 5,
  label = 6,
  undefined_label = 7,
  member_of_struct = 8,
  argument = 9,
  struct_tag = 10,
  member_of_union = 11,
  union_tag = 12,
  type_definition = 13,
  undefined_static = 14,
  enum_tag = 15,
  member_of_enum = 16,
  register_param = 17,
  bit_field = 18,
  block = 100,
  function = 101,
  end_of_struct = 102,
  file = 103,
  section = 104,
  weak_external = 105,
  clr_token = 107,
};

constexpr std::optional<storage_class> to_storage_class(u8 value) noexcept {
  switch (value) {
  case end_of_function:
  case null:
  case automatic:
  case external:
  case static_:
  case register_:
  case external_def:
  case label:
  case undefined_label:
  case member_of_struct:
  case argument:
  case struct_tag:
  case member_of_union:
  case union_tag:
  case type_definition:
  case undefined_static:
  case enum_tag:
  case member_of_enum:
  case register_param:
  case bit_field:
  case block:
  case function:
  case end_of_struct:
  case file:
  case section:
  case weak_external:
  case clr_token:
    return static_cast<storage_class>(value);
  }
  return std::nullopt;
}

inline auto format_as(storage_class e) noexcept {
  switch (e) {
  case end_of_function:
    return "end_of_function";
  case null:
    return "null";
  case automatic:
    return "automatic";
  case external:
    return "external";
  case static_:
    return "static";
  case register_:
    return "register";
  case external_def:
    return "external_def";
  case label:
    return "label";
  case undefined_label:
    return "undefined_label";
  case member_of_struct:
    return "member_of_struct";
  case argument:
    return "argument";
  case struct_tag:
    return "struct_tag";
  case member_of_union:
    return "member_of_union";
  case union_tag:
    return "union_tag";
  case type_definition:
    return "type_definition";
  case undefined_static:
    return "undefined_static";
  case enum_tag:
    return "enum_tag";
  case member_of_enum:
    return "member_of_enum";
  case register_param:
    return "register_param";
  case bit_field:
    return "bit_field";
  case block:
    return "block";
  case function:
    return "function";
  case end_of_struct:
    return "end_of_struct";
  case file:
    return "file";
  case section:
    return "section";
  case weak_external:
    return "weak_external";
  case clr_token:
    return "clr_token";
  default:
    return "???";
  }
}

enum complex_type : u8 { dt_null = 0, dt_pointer = 1, dt_function = 2, dt_array = 3 };

inline auto format_as(complex_type e) noexcept {
  switch (e) {
  case dt_null:
    return "null";
  case dt_pointer:
    return "pointer";
  case dt_function:
    return "function";
  case dt_array:
    return "array";
  default:
    return "???";
  }
}
} // namespace sym
} // namespace coff
