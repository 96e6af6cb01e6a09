#include "coff/coff.hpp"
#include "coff/error.hpp"
#include "coff/reloc.hpp"
#include "io.hpp"

#include <cstdio>
#include <cstdlib>
#include <fmt/core.h>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {
using namespace std::string_view_literals;

constexpr auto usage = R"(Usage: coffdump [options] [files...]

Options:
-H, --help                         Print this help and exit
-h, --headers                      Print the section headers of the object file
-t, --syms                         Print the symbol table
-r, --relocs                       Print the relocations of each section
-v, --verbose                      Log parsing progress to stderr
)";

struct options {
  bool headers = false;
  bool syms = false;
  bool relocs = false;
  bool verbose = false;
  std::vector<std::string> paths;
};

[[noreturn]] void print_help_and_exit() {
  fmt::print("{}", usage);
  std::exit(0);
}

template <typename... Args>
[[noreturn]] void print_error_and_exit(fmt::format_string<Args...> format,
                                       Args &&...args) {
  fmt::print(stderr, format, std::forward<Args>(args)...);
  fmt::print(stderr, "\n");
  std::exit(1);
}

options parse_args(int argc, char **argv) {
  options result;
  if (argc < 2)
    print_help_and_exit();
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-H"sv || arg == "--help"sv) {
      print_help_and_exit();
    } else if (arg == "-h"sv || arg == "--headers"sv) {
      result.headers = true;
    } else if (arg == "-t"sv || arg == "--syms"sv) {
      result.syms = true;
    } else if (arg == "-r"sv || arg == "--relocs"sv) {
      result.relocs = true;
    } else if (arg == "-v"sv || arg == "--verbose"sv) {
      result.verbose = true;
    } else if (arg.starts_with("--")) {
      print_error_and_exit("Unknown argument '{}'", arg);
    } else {
      result.paths.emplace_back(arg);
    }
  }
  if (result.paths.empty())
    print_error_and_exit("Expected one or more object files, none were given");
  return result;
}

void print_details(coff::object_file const &o) {
  auto &h = o.get_header();
  fmt::print("\nFile content for '{}':\n", o.name());
  fmt::print("machine: {}, sections: {}, symbols: {}, flags: {}\n",
             format_as(h.machine), h.number_of_sections, h.number_of_symbols,
             format_as(coff::fh::flags(h.characteristics)));
}

void print_headers(coff::object_file const &o) {
  fmt::print("\nSections:\n");
  fmt::print("{} {:<13} {:<8} {:<8} {:>5} {}\n", "Idx", "Name", "Size",
             "FileOff", "Align", "Flags");
  int i = 0;
  for (auto &sh : o.section_headers()) {
    auto align =
        sh.has_alignment() ? fmt::format("{}", sh.alignment()) : std::string{};
    fmt::print("{:>3} {:<13} {:08x} {:08x} {:>5} {}\n", i++, sh.name,
               sh.size_of_raw_data, sh.pointer_to_raw_data, align,
               format_as(coff::sh::flags(sh.characteristics)));
  }
}

void print_symtable(coff::object_file const &o) {
  fmt::print("\nSymbol table:\n");
  int i = 0;
  for (auto &s : o.symbols()) {
    int index = i++;
    if (s.is_auxiliary())
      continue;
    fmt::print("[{:>3}](sec {})(ty {:>4x})(scl {:>3}) 0x{:016x} {}\n", index,
               s.section_number, s.type, uint8_t(s.storage_class), s.value,
               o.symbol_name(s));
  }
}

void print_relocs(coff::object_file const &o) {
  auto machine = o.get_header().machine;
  auto headers = o.section_headers();
  for (coff::u32 i = 0; i < headers.size(); ++i) {
    auto relocs = o.relocations_for(i);
    if (relocs.empty())
      continue;
    fmt::print("\nRelocations for section {} ({}):\n", i, headers[i].name);
    fmt::print("{:<8} {:<30} {}\n", "Offset", "Type", "Symbol");
    for (auto &rel : relocs) {
      fmt::print("{:08x} {:<30} {}\n", rel.virtual_address,
                 coff::reloc_name(machine, rel.type),
                 o.relocation_target_name(rel));
    }
  }
}

} // namespace

int main(int argc, char **argv) {
  auto opts = parse_args(argc, argv);

  coff::logger log;
  if (opts.verbose) {
    log = coff::logger([](coff::log_level level, std::string_view msg) {
      fmt::print(stderr, "[{}] {}\n", format_as(level), msg);
    });
  }

  int status = 0;
  for (auto &path : opts.paths) {
    try {
      auto buffer = read_file(path);
      auto o = coff::object_file(buffer, path, log);
      o.parse();

      print_details(o);
      if (opts.headers)
        print_headers(o);
      if (opts.syms)
        print_symtable(o);
      if (opts.relocs)
        print_relocs(o);
    } catch (coff::error const &e) {
      fmt::print(stderr, "{}: {}: {}\n", path, format_as(e.code()), e.what());
      status = 1;
    } catch (std::runtime_error const &e) {
      fmt::print(stderr, "{}: {}\n", path, e.what());
      status = 1;
    } catch (std::logic_error const &e) {
      fmt::print(stderr, "{}: internal error: {}\n", path, e.what());
      status = 1;
    }
  }
  return status;
}
