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

#include "inbd_http.h"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include <curl/curl.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "utils/string_utils.h"

namespace inbd {
namespace {

constexpr long kConnectTimeoutSeconds = 30;
constexpr long kMaxRedirects = 5;

struct CurlDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct TransferState {
  HttpResponse* response = nullptr;
  int output_fd = -1;
  bool headers_only = false;
  bool write_failed = false;
  bool stopped = false;
};

size_t on_header(char* buffer, size_t size, size_t count, void* user) {
  auto* state = static_cast<TransferState*>(user);
  const std::string line(buffer, size * count);
  // A new status line starts a new response (redirects, 100-continue).
  if (startsWith(line, "HTTP/")) {
    state->response->headers.clear();
    return size * count;
  }
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    state->response->headers[toLower(trim(line.substr(0, colon)))] =
        trim(line.substr(colon + 1));
  }
  return size * count;
}

size_t on_body(char* buffer, size_t size, size_t count, void* user) {
  auto* state = static_cast<TransferState*>(user);
  const size_t total = size * count;
  if (state->headers_only) {
    state->stopped = true;
    return 0;
  }
  if (state->output_fd < 0) {
    return total;
  }
  size_t offset = 0;
  while (offset < total) {
    const ssize_t written =
        ::write(state->output_fd, buffer + offset, total - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      state->write_failed = true;
      return 0;
    }
    offset += static_cast<size_t>(written);
  }
  return total;
}

// Adds the custom CA bundle to the store libcurl already loaded.
CURLcode on_ssl_context(CURL*, void* ssl_ctx, void* user) {
  const auto* ca_file = static_cast<const std::string*>(user);
  X509_STORE* store = SSL_CTX_get_cert_store(static_cast<SSL_CTX*>(ssl_ctx));
  if (store == nullptr ||
      X509_STORE_load_locations(store, ca_file->c_str(), nullptr) != 1) {
    std::cerr << "Failed to load custom CA file " << *ca_file << std::endl;
    return CURLE_SSL_CACERT_BADFILE;
  }
  return CURLE_OK;
}

bool is_certificate_error(CURLcode code) {
  return code == CURLE_PEER_FAILED_VERIFICATION ||
         code == CURLE_SSL_CACERT_BADFILE || code == CURLE_SSL_CERTPROBLEM ||
         code == CURLE_SSL_ISSUER_ERROR || code == CURLE_SSL_PINNEDPUBKEYNOTMATCH;
}

}  // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  const auto it = headers.find(toLower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

CurlTransport::CurlTransport(std::string custom_ca_file)
    : custom_ca_file_(std::move(custom_ca_file)) {}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
  HttpResponse response;
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "failed to create HTTP client";
    return response;
  }

  TransferState state;
  state.response = &response;
  state.output_fd = request.output_fd;
  state.headers_only = request.headers_only;

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
    if (appended == nullptr) {
      response.error = "failed to build request headers";
      return response;
    }
    headers.release();
    headers.reset(appended);
  }

  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "https");
  curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS_STR, "https");
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_MAXREDIRS, kMaxRedirects);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2);
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);
  if (request.verify_tls && !custom_ca_file_.empty()) {
    curl_easy_setopt(handle, CURLOPT_SSL_CTX_FUNCTION, on_ssl_context);
    curl_easy_setopt(handle, CURLOPT_SSL_CTX_DATA, &custom_ca_file_);
  }
  if (request.method == HttpMethod::Head) {
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
  } else {
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
  }
  if (headers) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  }
  if (request.basic_auth) {
    curl_easy_setopt(handle, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(handle, CURLOPT_USERNAME, request.basic_auth->first.c_str());
    curl_easy_setopt(handle, CURLOPT_PASSWORD, request.basic_auth->second.c_str());
  }
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, on_header);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, on_body);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);

  const CURLcode code = curl_easy_perform(handle);
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
  if (code == CURLE_WRITE_ERROR && state.stopped) {
    return response;
  }
  if (code != CURLE_OK) {
    response.certificate_error = is_certificate_error(code);
    response.error = state.write_failed ? std::string("failed to write response body")
                                        : std::string(curl_easy_strerror(code));
  }
  return response;
}

std::string custom_ca_file_from_env() {
  const char* value = std::getenv(kCustomCaFileEnv);
  return value != nullptr ? std::string(value) : std::string();
}

void init_http() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace inbd
