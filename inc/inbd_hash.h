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

#ifndef INBD_HASH_H
#define INBD_HASH_H

#include <optional>
#include <string>

namespace inbd {

enum class HashAlgorithm {
  Sha256,
  Sha384,
  Sha512,
};

const char* hash_algorithm_name(HashAlgorithm algorithm);
// Accepts sha256/sha384/sha512 in any case.
std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name);

// Hex digest of a file read through the safe filesystem.
std::optional<std::string> file_digest_hex(const std::string& path,
                                           HashAlgorithm algorithm,
                                           std::string& error);

// Compares the file digest with expected_hex (case-insensitive). Returns
// false with error set on mismatch or read failure.
bool verify_file_hash(const std::string& path, HashAlgorithm algorithm,
                      const std::string& expected_hex, std::string& error);

}  // namespace inbd

#endif  // INBD_HASH_H
