#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <fmt/core.h>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

// records are copied straight out of the buffer, which is only correct for
// little-endian hosts
static_assert(std::endian::native == std::endian::little);

template <typename T>
concept trivially_copyable = std::is_trivially_copyable_v<T>;

// Seekable cursor over a borrowed byte buffer. The buffer must outlive the
// reader.
struct Reader {
  const uint8_t *base{}, *begin{}, *end{};
  Reader(std::span<const uint8_t> buffer_view, size_t pos = 0)
      : base(buffer_view.data()), begin(buffer_view.data()),
        end(buffer_view.data() + buffer_view.size()) {
    seek(pos);
  }

  template <trivially_copyable T> T consume() {
    T result = view<T>();
    increment(sizeof(T));
    return result;
  }

  template <trivially_copyable T> T view() const {
    if (sizeof(T) > remaining())
      throw std::out_of_range(
          fmt::format("read of {} bytes at offset {} passes end of input",
                      sizeof(T), tell()));
    T result;
    std::memcpy(&result, begin, sizeof(T));
    return result;
  }

  template <trivially_copyable T> std::vector<T> consume_vec(uint64_t size) {
    if (size > remaining() / sizeof(T))
      throw std::out_of_range(
          fmt::format("read of {} records at offset {} passes end of input",
                      size, tell()));
    std::vector<T> result;
    result.resize(size);
    if (size != 0)
      std::memcpy(result.data(), begin, size * sizeof(T));
    increment(size * sizeof(T));
    return result;
  }

  void increment(uint64_t len) {
    if (len > remaining())
      throw std::out_of_range("incremented out of range");
    begin += len;
  }

  void seek(uint64_t pos) {
    if (pos > size())
      throw std::out_of_range(
          fmt::format("seek to {} passes end of input ({} bytes)", pos,
                      size()));
    begin = base + pos;
  }

  size_t tell() const noexcept { return begin - base; }
  size_t size() const noexcept { return end - base; }
  size_t remaining() const noexcept { return end - begin; }
  bool empty() const noexcept { return begin >= end; }
};

template <std::invocable<const void *, size_t> Callback> struct Writer {
  Callback callback;
  size_t bytes_written = 0;
  Writer(Callback c) : callback(std::move(c)) {}
  template <trivially_copyable T, size_t extent>
  void write(std::span<T, extent> data) {
    callback(data.data(), data.size_bytes());
    bytes_written += data.size_bytes();
  }
  template <trivially_copyable T> void write(T const &data) {
    callback(&data, sizeof(T));
    bytes_written += sizeof(T);
  }
};

inline auto write_vector(std::vector<uint8_t> &vec) {
  return Writer([&vec](const void *data, size_t size) {
    auto bytes = static_cast<const uint8_t *>(data);
    vec.insert(vec.end(), bytes, bytes + size);
  });
}
