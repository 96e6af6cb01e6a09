#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fmt/core.h>
#include <scope_guard.hpp>
#include <stdexcept>
#include <string>
#include <vector>

inline std::vector<uint8_t> read_file(std::string const &path) {
  auto f = fopen(path.c_str(), "rb");
  if (!f)
    throw std::runtime_error(
        fmt::format("failed to open {}: {}", path, std::strerror(errno)));
  auto guard = sg::make_scope_guard([&]() noexcept { fclose(f); });

  if (int err = fseek(f, 0, SEEK_END)) {
    throw std::runtime_error(fmt::format("failed to fseek: {}", err));
  }
  long size = ftell(f);
  if (size < 0)
    throw std::runtime_error(
        fmt::format("failed to ftell {}: {}", path, std::strerror(errno)));

  std::vector<uint8_t> result;
  result.resize(size);
  if (int err = fseek(f, 0, SEEK_SET)) {
    throw std::runtime_error(fmt::format("failed to fseek: {}", err));
  }
  if (fread(result.data(), 1, result.size(), f) != result.size())
    throw std::runtime_error(fmt::format("short read from {}", path));
  return result;
}
