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

#ifndef INBD_TOKEN_H
#define INBD_TOKEN_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace inbd {

struct JwtClaims {
  // String-valued claims only.
  std::map<std::string, std::string> strings;
  std::optional<std::int64_t> expires_at;
};

// Decodes a JWT payload without verifying the signature. Returns nullopt when
// the token is not a JWT.
std::optional<JwtClaims> decode_jwt_claims(const std::string& token);

// Reads the release-service token. A missing or empty file, or the literal
// "anonymous", yields an empty token. A JWT whose exp claim lies before now
// is rejected.
bool read_access_token(const std::string& path, std::int64_t now,
                       std::string& token, std::string& error);

}  // namespace inbd

#endif  // INBD_TOKEN_H
