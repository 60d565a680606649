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

#include "inbd_hash.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <memory>

#include <openssl/evp.h>

#include "inbd_safe_fs.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

const EVP_MD* digest_for(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::Sha256:
      return EVP_sha256();
    case HashAlgorithm::Sha384:
      return EVP_sha384();
    case HashAlgorithm::Sha512:
      return EVP_sha512();
  }
  return EVP_sha384();
}

std::string to_hex(const unsigned char* data, unsigned int size) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out += kDigits[data[i] >> 4];
    out += kDigits[data[i] & 0x0F];
  }
  return out;
}

}  // namespace

const char* hash_algorithm_name(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::Sha256:
      return "sha256";
    case HashAlgorithm::Sha384:
      return "sha384";
    case HashAlgorithm::Sha512:
      return "sha512";
  }
  return "sha384";
}

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name) {
  const auto lower = toLower(trim(name));
  if (lower == "sha256") {
    return HashAlgorithm::Sha256;
  }
  if (lower == "sha384") {
    return HashAlgorithm::Sha384;
  }
  if (lower == "sha512") {
    return HashAlgorithm::Sha512;
  }
  return std::nullopt;
}

std::optional<std::string> file_digest_hex(const std::string& path,
                                           HashAlgorithm algorithm,
                                           std::string& error) {
  auto handle = open_file(path, O_RDONLY, 0, error);
  if (!handle.valid()) {
    return std::nullopt;
  }

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), digest_for(algorithm), nullptr) != 1) {
    error = "failed to initialise digest";
    return std::nullopt;
  }

  unsigned char buffer[65536];
  while (true) {
    const ssize_t count = ::read(handle.get(), buffer, sizeof(buffer));
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "failed to read " + path;
      return std::nullopt;
    }
    if (count == 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(count)) != 1) {
      error = "failed to update digest";
      return std::nullopt;
    }
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int size = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &size) != 1) {
    error = "failed to finalise digest";
    return std::nullopt;
  }
  return to_hex(digest, size);
}

bool verify_file_hash(const std::string& path, HashAlgorithm algorithm,
                      const std::string& expected_hex, std::string& error) {
  const auto actual = file_digest_hex(path, algorithm, error);
  if (!actual) {
    return false;
  }
  if (*actual != toLower(trim(expected_hex))) {
    error = std::string(hash_algorithm_name(algorithm)) +
            " checksum mismatch for " + path;
    return false;
  }
  return true;
}

}  // namespace inbd
