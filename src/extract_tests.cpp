#include "extract.h"

#include "hijack_error.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <variant>

namespace {

constexpr char kArMagic[]{ "!<arch>\n" };

}  // namespace

TEST_CASE("extract_detect_kind sniffs compression signatures") {
  hijack::test::temp_dir const tmp;
  std::vector<hijack::test::tar_entry> const entries{ { .path = "export.rlib",
                                                        .content = "primary" } };

  SUBCASE("gzip") {
    hijack::test::write_tar(tmp / "a.bin", entries, hijack::test::tar_compression::gzip);
    CHECK(hijack::extract_detect_kind(tmp / "a.bin") == hijack::resource_kind::archive);
  }
  SUBCASE("xz") {
    hijack::test::write_tar(tmp / "a.bin", entries, hijack::test::tar_compression::xz);
    CHECK(hijack::extract_detect_kind(tmp / "a.bin") == hijack::resource_kind::archive);
  }
  SUBCASE("bzip2") {
    hijack::test::write_tar(tmp / "a.bin", entries, hijack::test::tar_compression::bzip2);
    CHECK(hijack::extract_detect_kind(tmp / "a.bin") == hijack::resource_kind::archive);
  }
  SUBCASE("uncompressed tar") {
    hijack::test::write_tar(tmp / "a.bin", entries, hijack::test::tar_compression::none);
    CHECK(hijack::extract_detect_kind(tmp / "a.bin") == hijack::resource_kind::archive);
  }
}

TEST_CASE("extract_detect_kind treats ar rlibs and short files as raw") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_file(tmp / "libdemo.rlib", std::string{ kArMagic } + "payload");
  hijack::test::write_file(tmp / "empty.rlib", "");
  hijack::test::write_file(tmp / "one.bin", "\x1f");

  CHECK(hijack::extract_detect_kind(tmp / "libdemo.rlib") == hijack::resource_kind::raw);
  CHECK(hijack::extract_detect_kind(tmp / "empty.rlib") == hijack::resource_kind::raw);
  CHECK(hijack::extract_detect_kind(tmp / "one.bin") == hijack::resource_kind::raw);
  CHECK(hijack::resource_kind_name(hijack::resource_kind::raw) == "raw");
}

TEST_CASE("extract_artifacts passes raw resources through") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_file(tmp / "libdemo.rlib", kArMagic);

  auto const result{ hijack::extract_artifacts(tmp / "libdemo.rlib",
                                               hijack::resource_kind::raw,
                                               tmp / "staging",
                                               "export.rlib") };
  auto const *raw{ std::get_if<hijack::raw_artifact>(&result) };
  REQUIRE(raw);
  CHECK(raw->path == tmp / "libdemo.rlib");
  CHECK_FALSE(std::filesystem::exists(tmp / "staging"));
}

TEST_CASE("extract_artifacts splits primary and auxiliary entries") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_tar(tmp / "pkg.tgz",
                          { { .path = "bundle/", .type = hijack::test::tar_entry::kind::directory },
                            { .path = "bundle/libdep_b-1111.rlib", .content = "dep b" },
                            { .path = "bundle/export.rlib", .content = "primary" },
                            { .path = "bundle/nested/libdep_a-2222.rlib", .content = "dep a" } });

  auto const result{ hijack::extract_artifacts(tmp / "pkg.tgz",
                                               hijack::resource_kind::archive,
                                               tmp / "staging",
                                               "export.rlib") };
  auto const *manifest{ std::get_if<hijack::archive_manifest>(&result) };
  REQUIRE(manifest);

  CHECK(manifest->primary == tmp / "staging" / "export.rlib");
  CHECK(hijack::test::read_file(manifest->primary) == "primary");

  REQUIRE(manifest->auxiliaries.size() == 2);
  CHECK(manifest->auxiliaries[0].file_name == "libdep_b-1111.rlib");
  CHECK(manifest->auxiliaries[1].file_name == "libdep_a-2222.rlib");
  CHECK(hijack::test::read_file(manifest->auxiliaries[1].path) == "dep a");
}

TEST_CASE("extract_artifacts honors a custom primary name") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_tar(tmp / "pkg.tar.xz",
                          { { .path = "libdemo.rlib", .content = "custom" },
                            { .path = "export.rlib", .content = "aux now" } },
                          hijack::test::tar_compression::xz);

  auto const result{ hijack::extract_artifacts(tmp / "pkg.tar.xz",
                                               hijack::resource_kind::archive,
                                               tmp / "staging",
                                               "libdemo.rlib") };
  auto const &manifest{ std::get<hijack::archive_manifest>(result) };
  CHECK(hijack::test::read_file(manifest.primary) == "custom");
  REQUIRE(manifest.auxiliaries.size() == 1);
  CHECK(manifest.auxiliaries[0].file_name == "export.rlib");
}

TEST_CASE("extract_artifacts skips link entries") {
  hijack::test::temp_dir const tmp;
  hijack::test::write_tar(
      tmp / "pkg.tgz",
      { { .path = "export.rlib", .content = "primary" },
        { .path = "alias.rlib",
          .type = hijack::test::tar_entry::kind::symlink,
          .link_target = "export.rlib" },
        { .path = "hard.rlib",
          .type = hijack::test::tar_entry::kind::hardlink,
          .link_target = "export.rlib" } });

  auto const result{ hijack::extract_artifacts(tmp / "pkg.tgz",
                                               hijack::resource_kind::archive,
                                               tmp / "staging",
                                               "export.rlib") };
  auto const &manifest{ std::get<hijack::archive_manifest>(result) };
  CHECK(manifest.auxiliaries.empty());
  CHECK_FALSE(std::filesystem::exists(tmp / "staging" / "alias.rlib"));
  CHECK_FALSE(std::filesystem::exists(tmp / "staging" / "hard.rlib"));
}

TEST_CASE("extract_artifacts reports primary problems") {
  hijack::test::temp_dir const tmp;

  SUBCASE("missing primary") {
    hijack::test::write_tar(tmp / "pkg.tgz", { { .path = "libother-1.rlib", .content = "x" } });
    CHECK(hijack::test::error_kind_of([&] {
            hijack::extract_artifacts(tmp / "pkg.tgz",
                                      hijack::resource_kind::archive,
                                      tmp / "staging",
                                      "export.rlib");
          }) == hijack::error_kind::missing_primary_artifact);
  }

  SUBCASE("ambiguous primary") {
    hijack::test::write_tar(tmp / "pkg.tgz",
                            { { .path = "a/export.rlib", .content = "one" },
                              { .path = "b/export.rlib", .content = "two" } });
    CHECK(hijack::test::error_kind_of([&] {
            hijack::extract_artifacts(tmp / "pkg.tgz",
                                      hijack::resource_kind::archive,
                                      tmp / "staging",
                                      "export.rlib");
          }) == hijack::error_kind::ambiguous_primary_artifact);
  }

  SUBCASE("duplicate auxiliary names") {
    hijack::test::write_tar(tmp / "pkg.tgz",
                            { { .path = "export.rlib", .content = "p" },
                              { .path = "a/libx-1.rlib", .content = "one" },
                              { .path = "b/libx-1.rlib", .content = "two" } });
    CHECK(hijack::test::error_kind_of([&] {
            hijack::extract_artifacts(tmp / "pkg.tgz",
                                      hijack::resource_kind::archive,
                                      tmp / "staging",
                                      "export.rlib");
          }) == hijack::error_kind::corrupt_archive);
  }
}

TEST_CASE("extract_artifacts rejects corrupt archives") {
  hijack::test::temp_dir const tmp;
  // gzip magic followed by garbage
  hijack::test::write_file(tmp / "bad.tgz", std::string{ "\x1f\x8b\x08\x00" } + "not really gzip");

  CHECK(hijack::extract_detect_kind(tmp / "bad.tgz") == hijack::resource_kind::archive);
  CHECK(hijack::test::error_kind_of([&] {
          hijack::extract_artifacts(tmp / "bad.tgz",
                                    hijack::resource_kind::archive,
                                    tmp / "staging",
                                    "export.rlib");
        }) == hijack::error_kind::corrupt_archive);
}
