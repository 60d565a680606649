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

#ifndef INBD_HTTP_H
#define INBD_HTTP_H

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace inbd {

// Names the optional CA bundle added to the system trust store.
constexpr const char* kCustomCaFileEnv = "INBM_CUSTOM_CA_FILE";

enum class HttpMethod {
  Head,
  Get,
};

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  // Basic credentials (user, password).
  std::optional<std::pair<std::string, std::string>> basic_auth;
  // Peer and host verification. Only anonymous requests may turn it off.
  bool verify_tls = true;
  // Body sink for downloads; the body is discarded when negative.
  int output_fd = -1;
  // Ends the transfer once the headers are in.
  bool headers_only = false;
};

struct HttpResponse {
  long status = 0;
  // Header names are lower case.
  std::map<std::string, std::string> headers;
  // Transport failure (DNS, TLS, I/O). Empty when a response arrived.
  std::string error;
  bool certificate_error = false;

  std::optional<std::string> header(const std::string& name) const;
};

// Performs one HTTP exchange. Implementations build a fresh client per call.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// libcurl transport enforcing TLS 1.2 or newer.
class CurlTransport : public HttpTransport {
 public:
  // custom_ca_file is appended to the default trust store when non-empty.
  explicit CurlTransport(std::string custom_ca_file = {});

  HttpResponse perform(const HttpRequest& request) override;

 private:
  std::string custom_ca_file_;
};

// Reads the custom CA path from the environment.
std::string custom_ca_file_from_env();

// Initialises libcurl once per process.
void init_http();

}  // namespace inbd

#endif  // INBD_HTTP_H
