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

#include "inbd_fetcher.h"

#include <fcntl.h>

#include <iostream>
#include <memory>

#include <curl/curl.h>

#include "inbd_safe_fs.h"
#include "inbd_token.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

constexpr mode_t kArtifactMode = 0640;

constexpr const char* kBasicAuthUsernames[] = {
    "api", "", "token", "_token", "admin", "bearer", "artifactory",
};

constexpr const char* kJwtUsernameClaims[] = {
    "sub", "username", "preferred_username", "email", "client_id",
};

struct UrlDeleter {
  void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

std::optional<std::int64_t> parse_size(const std::string& value) {
  const auto text = trim(value);
  if (text.empty()) {
    return std::nullopt;
  }
  std::int64_t result = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    result = result * 10 + (c - '0');
  }
  return result;
}

std::optional<std::int64_t> content_length(const HttpResponse& response) {
  const auto value = response.header("Content-Length");
  if (!value) {
    return std::nullopt;
  }
  return parse_size(*value);
}

}  // namespace

HttpRequest make_http_request(HttpMethod method, const std::string& url,
                              const std::string& token) {
  HttpRequest request;
  request.method = method;
  request.url = url;
  // Anonymous fetches may skip verification; authenticated ones never do.
  request.verify_tls = !token.empty();
  if (!token.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + token);
  }
  return request;
}

std::vector<HttpRequest> fallback_auth_requests(const std::string& url,
                                                const std::string& token) {
  std::vector<HttpRequest> requests;

  auto with_bearer = [&](std::vector<std::pair<std::string, std::string>> extra) {
    auto request = make_http_request(HttpMethod::Head, url, token);
    for (auto& header : extra) {
      request.headers.push_back(std::move(header));
    }
    requests.push_back(std::move(request));
  };
  with_bearer({{"X-JFrog-Art-Api", token}});
  with_bearer({{"X-API-Key", token}});
  with_bearer({{"X-Azure-Token", token}, {"X-MS-TOKEN-AAD-ACCESS-TOKEN", token}});

  for (const char* scheme : {"Token ", "JWT ", "ApiKey ", ""}) {
    auto request = make_http_request(HttpMethod::Head, url, "");
    request.verify_tls = true;
    request.headers.emplace_back("Authorization", scheme + token);
    requests.push_back(std::move(request));
  }

  auto with_basic = [&](const std::string& user, const std::string& password) {
    auto request = make_http_request(HttpMethod::Head, url, "");
    request.verify_tls = true;
    request.basic_auth = std::make_pair(user, password);
    requests.push_back(std::move(request));
  };
  for (const auto* user : kBasicAuthUsernames) {
    with_basic(user, token);
  }
  with_basic(token, token);

  if (const auto claims = decode_jwt_claims(token)) {
    for (const auto* claim : kJwtUsernameClaims) {
      const auto it = claims->strings.find(claim);
      if (it != claims->strings.end() && !it->second.empty()) {
        with_basic(it->second, token);
      }
    }
  }
  return requests;
}

std::string artifact_file_name(const std::string& url) {
  std::unique_ptr<CURLU, UrlDeleter> handle(curl_url());
  if (!handle ||
      curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
    return {};
  }
  char* raw_path = nullptr;
  if (curl_url_get(handle.get(), CURLUPART_PATH, &raw_path, CURLU_URLDECODE) !=
      CURLUE_OK) {
    return {};
  }
  const std::string path(raw_path);
  curl_free(raw_path);

  const auto slash = path.find_last_of('/');
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  if (name == "." || name == "..") {
    return {};
  }
  return name;
}

std::optional<std::int64_t> parse_content_range_total(const std::string& value) {
  const auto slash = value.rfind('/');
  if (slash == std::string::npos) {
    return std::nullopt;
  }
  return parse_size(value.substr(slash + 1));
}

ArtifactFetcher::ArtifactFetcher(HttpTransport& transport)
    : transport_(transport) {}

std::optional<std::int64_t> ArtifactFetcher::size(const std::string& url,
                                                  const std::string& token,
                                                  std::string& error) {
  bool unauthorized = false;

  const auto head =
      transport_.perform(make_http_request(HttpMethod::Head, url, token));
  if (!head.error.empty()) {
    error = "HEAD request failed: " + head.error;
    return std::nullopt;
  }
  if (head.status == 200) {
    if (const auto length = content_length(head)) {
      return length;
    }
  }
  unauthorized = head.status == 401;

  auto ranged_request = make_http_request(HttpMethod::Get, url, token);
  ranged_request.headers.emplace_back("Range", "bytes=0-0");
  // A server that ignores Range answers 200 with the whole artifact.
  ranged_request.headers_only = true;
  const auto ranged = transport_.perform(ranged_request);
  if (!ranged.error.empty()) {
    error = "range request failed: " + ranged.error;
    return std::nullopt;
  }
  if (ranged.status == 206 || ranged.status == 200) {
    if (const auto range = ranged.header("Content-Range")) {
      if (const auto total = parse_content_range_total(*range)) {
        return total;
      }
    }
    if (const auto length = content_length(ranged)) {
      return length;
    }
    error = "Content-Length header is missing in response";
    return std::nullopt;
  }
  unauthorized = unauthorized || ranged.status == 401;

  if (unauthorized && !token.empty()) {
    std::cout << "Bearer token rejected for " << url
              << ", trying alternate authentication" << std::endl;
    return size_with_fallback_auth(url, token, error);
  }
  error = "size request failed with status code: " +
          std::to_string(ranged.status);
  return std::nullopt;
}

std::optional<std::int64_t> ArtifactFetcher::size_with_fallback_auth(
    const std::string& url, const std::string& token, std::string& error) {
  long last_status = 401;
  for (const auto& request : fallback_auth_requests(url, token)) {
    const auto response = transport_.perform(request);
    if (!response.error.empty()) {
      error = "HEAD request failed: " + response.error;
      return std::nullopt;
    }
    last_status = response.status;
    if (response.status == 200) {
      if (const auto length = content_length(response)) {
        return length;
      }
      error = "Content-Length header is missing in HEAD response";
      return std::nullopt;
    }
  }
  error = "basic Auth HEAD request failed with status code: " +
          std::to_string(last_status);
  return std::nullopt;
}

std::optional<std::string> ArtifactFetcher::download(const std::string& url,
                                                     const std::string& dest_dir,
                                                     const std::string& token,
                                                     std::string& error) {
  const auto name = artifact_file_name(url);
  if (name.empty()) {
    error = "cannot derive a file name from " + url;
    return std::nullopt;
  }
  if (!mkdir_all(dest_dir, 0755, error)) {
    return std::nullopt;
  }
  const std::string dest = dest_dir + "/" + name;

  std::vector<std::string> credentials;
  if (!token.empty()) {
    credentials.push_back(token);
  }
  credentials.emplace_back();

  for (const auto& credential : credentials) {
    auto handle = open_file(dest, O_WRONLY | O_CREAT | O_TRUNC, kArtifactMode, error);
    if (!handle.valid()) {
      return std::nullopt;
    }
    auto request = make_http_request(HttpMethod::Get, url, credential);
    request.output_fd = handle.get();
    const auto response = transport_.perform(request);
    handle.reset();

    if (response.error.empty() && response.status == 200) {
      std::cout << "Downloaded " << url << " to " << dest << std::endl;
      return dest;
    }

    std::string cleanup_error;
    if (!remove_file(dest, cleanup_error)) {
      std::cerr << "Failed to remove partial download: " << cleanup_error
                << std::endl;
    }
    if (!response.error.empty()) {
      error = "download failed: " + response.error;
      return std::nullopt;
    }
    const bool auth_failure = response.status == 401 || response.status == 403;
    if (auth_failure && !credential.empty()) {
      std::cout << "Download with bearer token failed (" << response.status
                << "), retrying without authentication" << std::endl;
      continue;
    }
    error = auth_failure
                ? "authentication failed downloading " + url +
                      ": status code " + std::to_string(response.status)
                : "download failed with status code: " +
                      std::to_string(response.status);
    return std::nullopt;
  }
  error = "download failed: no credentials left to try";
  return std::nullopt;
}

}  // namespace inbd
