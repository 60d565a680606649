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

#include "inbd_token.h"

#include <algorithm>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include "inbd_safe_fs.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

constexpr const char* kAnonymousToken = "anonymous";

// base64url without padding to raw bytes.
std::optional<std::string> base64url_decode(std::string input) {
  std::replace(input.begin(), input.end(), '-', '+');
  std::replace(input.begin(), input.end(), '_', '/');
  std::size_t padding = 0;
  while (input.size() % 4 != 0) {
    input += '=';
    ++padding;
  }
  if (padding == 3) {
    return std::nullopt;
  }
  std::vector<unsigned char> out(input.size() / 4 * 3 + 1);
  const int len = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(input.data()),
      static_cast<int>(input.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding bytes as output.
  std::size_t actual = static_cast<std::size_t>(len);
  std::size_t pad_chars = 0;
  for (auto it = input.rbegin(); it != input.rend() && *it == '='; ++it) {
    ++pad_chars;
  }
  actual -= std::min(actual, pad_chars);
  return std::string(reinterpret_cast<const char*>(out.data()), actual);
}

}  // namespace

std::optional<JwtClaims> decode_jwt_claims(const std::string& token) {
  const auto parts = split(token, '.');
  if (parts.size() != 3 || parts[1].empty()) {
    return std::nullopt;
  }
  const auto payload = base64url_decode(parts[1]);
  if (!payload) {
    return std::nullopt;
  }
  const auto doc = nlohmann::json::parse(*payload, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return std::nullopt;
  }

  JwtClaims claims;
  for (const auto& [key, value] : doc.items()) {
    if (value.is_string()) {
      claims.strings[key] = value.get<std::string>();
    }
  }
  const auto exp = doc.find("exp");
  if (exp != doc.end() && exp->is_number()) {
    claims.expires_at = exp->get<std::int64_t>();
  }
  return claims;
}

bool read_access_token(const std::string& path, std::int64_t now,
                       std::string& token, std::string& error) {
  token.clear();
  if (!file_exists(path)) {
    return true;
  }
  auto content = read_file(path, error);
  if (!content) {
    return false;
  }
  const auto value = trim(*content);
  if (value.empty() || value == kAnonymousToken) {
    return true;
  }

  const auto claims = decode_jwt_claims(value);
  if (claims && claims->expires_at && *claims->expires_at < now) {
    error = "access token has expired";
    return false;
  }
  token = value;
  return true;
}

}  // namespace inbd
