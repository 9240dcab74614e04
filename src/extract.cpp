#include "extract.h"

#include "hijack_error.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace hijack {
namespace {

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_tar(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct signature {
  std::size_t offset;
  std::string_view magic;
};

using namespace std::string_view_literals;

constexpr std::array kArchiveSignatures{
  signature{ 0, "\x1f\x8b"sv },                  // gzip
  signature{ 0, "\xfd\x37\x7a\x58\x5a\x00"sv },  // xz
  signature{ 0, "BZh"sv },                       // bzip2
  signature{ 0, "\x28\xb5\x2f\xfd"sv },          // zstd
  signature{ 257, "ustar"sv },                   // tar
};

constexpr std::size_t kSignatureProbeBytes{ 262 };

bool has_signature(std::vector<unsigned char> const &prefix, signature const &sig) {
  if (prefix.size() < sig.offset + sig.magic.size()) { return false; }
  return std::equal(sig.magic.begin(),
                    sig.magic.end(),
                    prefix.begin() + static_cast<std::ptrdiff_t>(sig.offset),
                    [](char a, unsigned char b) { return static_cast<unsigned char>(a) == b; });
}

[[noreturn]] void throw_corrupt(std::filesystem::path const &archive_path,
                                std::string const &what,
                                archive *handle) {
  std::string msg{ "Corrupt archive " + archive_path.string() + ": " + what };
  if (handle) {
    if (char const *detail{ archive_error_string(handle) }) { msg += ": " + std::string{ detail }; }
  }
  throw hijack_error(error_kind::corrupt_archive, msg);
}

// Last path component of an archive entry, or nullopt for names that cannot be
// flattened ("", ".", "..").
std::optional<std::string> entry_file_name(char const *entry_path) {
  if (!entry_path) { return std::nullopt; }
  std::string name{ std::filesystem::path{ entry_path }.filename().string() };
  if (name.empty() || name == "." || name == "..") { return std::nullopt; }
  return name;
}

void copy_entry_data(archive *reader,
                     archive *writer,
                     std::filesystem::path const &archive_path) {
  std::vector<char> buffer(1024 * 1024);

  la_ssize_t bytes_read{ 0 };
  while ((bytes_read = archive_read_data(reader, buffer.data(), buffer.size())) > 0) {
    if (archive_write_data(writer, buffer.data(), static_cast<size_t>(bytes_read)) < 0) {
      throw hijack_error(error_kind::filesystem_error,
                         std::string("Failed to write entry data: ") +
                             archive_error_string(writer));
    }
  }

  if (bytes_read < 0) { throw_corrupt(archive_path, "failed to read entry data", reader); }
}

}  // namespace

std::string_view resource_kind_name(resource_kind kind) {
  switch (kind) {
    case resource_kind::raw: return "raw";
    case resource_kind::archive: return "archive";
  }
  return "unknown";
}

resource_kind extract_detect_kind(std::filesystem::path const &path) {
  std::vector<unsigned char> prefix;
  try {
    prefix = util_read_prefix(path, kSignatureProbeBytes);
  } catch (std::runtime_error const &e) {
    throw hijack_error(error_kind::filesystem_error, e.what());
  }

  bool const is_archive{ std::ranges::any_of(
      kArchiveSignatures,
      [&](signature const &sig) { return has_signature(prefix, sig); }) };
  return is_archive ? resource_kind::archive : resource_kind::raw;
}

extract_result extract_artifacts(std::filesystem::path const &resource,
                                 resource_kind kind,
                                 std::filesystem::path const &staging_dir,
                                 std::string_view primary_name) {
  if (kind == resource_kind::raw) { return raw_artifact{ .path = resource }; }

  std::error_code ec;
  std::filesystem::create_directories(staging_dir, ec);
  if (ec) {
    throw hijack_error(error_kind::filesystem_error,
                       "Failed to create staging directory " + staging_dir.string() +
                           ": " + ec.message());
  }

  archive_reader reader;
  archive_writer writer;

  if (archive_read_open_filename(reader.handle, resource.string().c_str(), 10240) !=
      ARCHIVE_OK) {
    throw_corrupt(resource, "failed to open", reader.handle);
  }

  std::optional<std::filesystem::path> primary;
  std::vector<auxiliary_artifact> auxiliaries;
  std::unordered_set<std::string> seen;

  archive_entry *entry{ nullptr };
  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r == ARCHIVE_WARN) {
      tui::warn("%s: %s", resource.string().c_str(), archive_error_string(reader.handle));
    } else if (r != ARCHIVE_OK) {
      throw_corrupt(resource, "failed to read header", reader.handle);
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    auto const filetype{ archive_entry_filetype(entry) };

    if (filetype == AE_IFDIR) { continue; }

    if (filetype == AE_IFLNK || archive_entry_hardlink(entry)) {
      tui::warn("Skipping link entry '%s' in %s",
                entry_path ? entry_path : "",
                resource.string().c_str());
      continue;
    }

    if (filetype != AE_IFREG) {
      tui::debug("Skipping special entry '%s' in %s",
                 entry_path ? entry_path : "",
                 resource.string().c_str());
      continue;
    }

    auto const file_name{ entry_file_name(entry_path) };
    if (!file_name) {
      throw_corrupt(resource,
                    "entry '" + std::string{ entry_path ? entry_path : "" } +
                        "' has no usable file name",
                    nullptr);
    }

    bool const is_primary{ *file_name == primary_name };
    if (is_primary && primary) {
      throw hijack_error(error_kind::ambiguous_primary_artifact,
                         "Archive " + resource.string() + " contains more than one '" +
                             std::string{ primary_name } + "'");
    }
    if (!seen.insert(*file_name).second) {
      throw_corrupt(resource, "duplicate entry name '" + *file_name + "'", nullptr);
    }

    std::filesystem::path const out_path{ staging_dir / *file_name };
    {
      std::string const out_path_str{ out_path.string() };
      archive_entry_copy_pathname(entry, out_path_str.c_str());
    }

    if (int const write_header_result{ archive_write_header(writer.handle, entry) };
        write_header_result != ARCHIVE_OK && write_header_result != ARCHIVE_WARN) {
      throw hijack_error(error_kind::filesystem_error,
                         std::string("Failed to write entry header: ") +
                             archive_error_string(writer.handle));
    }

    if (archive_entry_size(entry) > 0) {
      copy_entry_data(reader.handle, writer.handle, resource);
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw hijack_error(error_kind::filesystem_error,
                         std::string("Failed to finish entry: ") +
                             archive_error_string(writer.handle));
    }

    if (is_primary) {
      primary = out_path;
    } else {
      auxiliaries.push_back(auxiliary_artifact{ .file_name = *file_name, .path = out_path });
    }
  }

  if (!primary) {
    throw hijack_error(error_kind::missing_primary_artifact,
                       "Archive " + resource.string() + " does not contain '" +
                           std::string{ primary_name } + "'");
  }

  tui::debug("extract_artifacts: %s -> primary + %zu auxiliary file(s)",
             resource.string().c_str(),
             auxiliaries.size());

  return archive_manifest{ .primary = std::move(*primary),
                           .auxiliaries = std::move(auxiliaries) };
}

}  // namespace hijack
