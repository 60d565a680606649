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

#include "inbd_source.h"

#include <memory>

#include <curl/curl.h>

#include "utils/string_utils.h"

namespace inbd {
namespace {

struct UrlDeleter {
  void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

struct CurlStringDeleter {
  void operator()(char* value) const { curl_free(value); }
};

std::string url_part(CURLU* url, CURLUPart part) {
  char* raw = nullptr;
  if (curl_url_get(url, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
    return {};
  }
  std::unique_ptr<char, CurlStringDeleter> owned(raw);
  return std::string(owned.get());
}

}  // namespace

bool validate_url(const std::string& url, std::string& error) {
  if (url.empty()) {
    error = "URL is empty";
    return false;
  }
  std::unique_ptr<CURLU, UrlDeleter> handle(curl_url());
  if (!handle) {
    error = "URL is not valid: out of memory";
    return false;
  }
  const CURLUcode code =
      curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
  if (code != CURLUE_OK) {
    error = std::string("URL is not valid: ") + curl_url_strerror(code);
    return false;
  }
  if (toLower(url_part(handle.get(), CURLUPART_SCHEME)) != "https") {
    error = "URL must use https scheme";
    return false;
  }
  if (url_part(handle.get(), CURLUPART_HOST).empty()) {
    error = "URL must have a host";
    return false;
  }
  return true;
}

std::string strip_query_and_fragment(const std::string& url) {
  const auto cut = url.find_first_of("?#");
  return cut == std::string::npos ? url : url.substr(0, cut);
}

bool is_trusted(const std::string& url,
                const std::vector<std::string>& trusted_repositories) {
  const auto base = strip_query_and_fragment(trim(url));
  if (base.empty()) {
    return false;
  }
  for (const auto& repository : trusted_repositories) {
    const auto prefix = trim(repository);
    if (!prefix.empty() && startsWith(base, prefix)) {
      return true;
    }
  }
  return false;
}

}  // namespace inbd
