#include "libcurl_util.h"

#include "hijack_error.h"
#include "util.h"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#ifndef HIJACK_VERSION_STR
#error "HIJACK_VERSION_STR must be defined by the build system"
#endif

namespace hijack {

namespace {

constexpr char kDefaultUserAgent[]{ "hijack/" HIJACK_VERSION_STR };
constexpr long kMaxRedirects{ 5 };
constexpr long kConnectTimeoutSeconds{ 30 };
constexpr long kLowSpeedLimitBytes{ 1 };
constexpr long kLowSpeedTimeSeconds{ 60 };

struct write_state {
  std::ofstream *stream;
  std::uint64_t bytes;
};

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *state{ static_cast<write_state *>(userdata) };
  size_t const total{ size * nmemb };
  state->stream->write(ptr, static_cast<std::streamsize>(total));
  if (!*state->stream) { return 0; }
  state->bytes += total;
  return total;
}

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw hijack_error(error_kind::transport_error,
                         std::string("curl_global_init failed: ") +
                             curl_easy_strerror(code));
    }
  });
}

}  // namespace

libcurl_download_result libcurl_download(std::string_view url,
                                         std::filesystem::path const &destination) {
  libcurl_ensure_initialized();

  std::string const url_copy{ url };

  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  std::error_code ec;
  if (auto const parent{ destination.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw hijack_error(error_kind::filesystem_error,
                         "libcurl_download: failed to create parent directory: " +
                             parent.string() + ": " + ec.message());
    }
  }

  scoped_path_cleanup partial{ destination };

  std::ofstream output{ destination, std::ios::binary | std::ios::trunc };
  if (!output.is_open()) {
    throw hijack_error(error_kind::filesystem_error,
                       "libcurl_download: failed to open destination: " +
                           destination.string());
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw hijack_error(error_kind::transport_error, "curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw hijack_error(error_kind::transport_error,
                         std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
    }
  };

  char error_buffer[CURL_ERROR_SIZE]{};
  write_state state{ .stream = &output, .bytes = 0 };

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_MAXREDIRS, kMaxRedirects);
  setopt(CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
  setopt(CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimitBytes);
  setopt(CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeSeconds);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_ERRORBUFFER, error_buffer);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_file);
  setopt(CURLOPT_WRITEDATA, &state);
  setopt(CURLOPT_NOPROGRESS, 1L);

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    std::string detail{ error_buffer[0] != '\0' ? error_buffer
                                                : curl_easy_strerror(perform_result) };
    throw hijack_error(error_kind::transport_error,
                       "Failed to download '" + url_copy + "': " + detail);
  }

  long response_code{ 0 };
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response_code);
  if (response_code < 200 || response_code >= 300) {
    throw hijack_error(error_kind::unexpected_status,
                       "Failed to download '" + url_copy + "': HTTP status " +
                           std::to_string(response_code));
  }

  output.flush();
  if (!output) {
    throw hijack_error(error_kind::filesystem_error,
                       "libcurl_download: failed to flush destination file " +
                           destination.string());
  }
  output.close();

  partial.release();
  return libcurl_download_result{ .response_code = response_code, .bytes = state.bytes };
}

}  // namespace hijack
