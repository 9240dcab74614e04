#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hijack {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// 16 lowercase hex characters from a per-thread random engine. Used to build
// collision-free temporary names; not suitable for anything security related.
std::string util_random_suffix();

// Returns `parent / (prefix + random suffix)`. Nothing is created on disk.
std::filesystem::path util_unique_path(std::filesystem::path const &parent,
                                       std::string_view prefix);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Read up to `count` leading bytes of a file. Short files return fewer bytes.
// Throws std::runtime_error if the file cannot be opened or read.
std::vector<unsigned char> util_read_prefix(std::filesystem::path const &path,
                                            std::size_t count);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// Removes `path` (file or directory tree) on destruction unless released.
class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  std::filesystem::path release();
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace hijack
