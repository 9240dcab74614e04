#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace hijack {

struct libcurl_download_result {
  long response_code{ 0 };
  std::uint64_t bytes{ 0 };
};

// Blocking GET of `url` streamed into `destination` (truncated first). Follows at most
// five redirects. On any failure the destination is removed and hijack_error is thrown:
// transport_error for connection/protocol failures, unexpected_status for non-2xx.
libcurl_download_result libcurl_download(std::string_view url,
                                         std::filesystem::path const &destination);

}  // namespace hijack
