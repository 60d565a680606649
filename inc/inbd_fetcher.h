/******************************************************************************
 * OpenHD
 *
 * Licensed under the GNU General Public License (GPL) Version 3.
 *
 * This software is provided "as-is," without warranty of any kind, express or
 * implied, including but not limited to the warranties of merchantability,
 * fitness for a particular purpose, and non-infringement. For details, see the
 * full license in the LICENSE file provided with this source code.
 *
 * Non-Military Use Only:
 * This software and its associated components are explicitly intended for
 * civilian and non-military purposes. Use in any military or defense
 * applications is strictly prohibited unless explicitly and individually
 * licensed otherwise by the OpenHD Team.
 *
 * Contributors:
 * A full list of contributors can be found at the OpenHD GitHub repository:
 * https://github.com/OpenHD
 *
 * © OpenHD, All Rights Reserved.
 ******************************************************************************/

#ifndef INBD_FETCHER_H
#define INBD_FETCHER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "inbd_http.h"

namespace inbd {

// Sizes and downloads update artifacts over authenticated HTTPS.
class ArtifactFetcher {
 public:
  explicit ArtifactFetcher(HttpTransport& transport);

  // Reads the artifact size with HEAD, then a one-byte range GET. On 401 a
  // last-resort sequence of alternate credential shapes is tried for servers
  // that reject plain bearer tokens. This is for compatibility only and adds
  // no security.
  std::optional<std::int64_t> size(const std::string& url,
                                    const std::string& token,
                                    std::string& error);

  // Downloads into dest_dir, naming the file after the last URL segment.
  // Tries the bearer token first and then anonymous access.
  std::optional<std::string> download(const std::string& url,
                                      const std::string& dest_dir,
                                      const std::string& token,
                                      std::string& error);

 private:
  std::optional<std::int64_t> size_with_fallback_auth(const std::string& url,
                                                      const std::string& token,
                                                      std::string& error);

  HttpTransport& transport_;
};

// Builds a request carrying the bearer token when one is set.
HttpRequest make_http_request(HttpMethod method, const std::string& url,
                              const std::string& token);

// HEAD requests tried after a 401, in order.
std::vector<HttpRequest> fallback_auth_requests(const std::string& url,
                                                const std::string& token);

// Last path segment of url, without query or fragment.
std::string artifact_file_name(const std::string& url);

// Total from a "bytes a-b/total" Content-Range value.
std::optional<std::int64_t> parse_content_range_total(const std::string& value);

}  // namespace inbd

#endif  // INBD_FETCHER_H
