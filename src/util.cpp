#include "util.h"

#include <array>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace hijack {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

std::string util_random_suffix() {
  thread_local std::mt19937_64 rng{ std::random_device{}() };
  std::uint64_t const value{ rng() };
  return util_bytes_to_hex(&value, sizeof value);
}

std::filesystem::path util_unique_path(std::filesystem::path const &parent,
                                       std::string_view prefix) {
  return parent / (std::string{ prefix } + util_random_suffix());
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_read_prefix(std::filesystem::path const &path,
                                            std::size_t count) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_read_prefix: failed to open file: " + path.string());
  }

  std::vector<unsigned char> buffer(count);
  size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
  if (bytes_read < count && std::ferror(file.get())) {
    throw std::runtime_error("util_read_prefix: failed to read file: " + path.string());
  }

  buffer.resize(bytes_read);
  return buffer;
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

std::filesystem::path scoped_path_cleanup::release() { return std::exchange(path_, {}); }

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;  // best effort: the path may never have been created
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace hijack
