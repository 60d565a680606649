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

#include "inbd_disk.h"

#include <sys/statfs.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace inbd {

std::uint64_t required_space(std::uint64_t artifact_bytes) {
  const std::uint64_t scaled = (artifact_bytes * 6 + 4) / 5;
  return std::max(scaled, artifact_bytes + kDiskHeadroomBytes);
}

bool has_enough_space(std::uint64_t free_bytes, std::uint64_t artifact_bytes) {
  return free_bytes >= required_space(artifact_bytes);
}

std::optional<std::uint64_t> available_space(const std::string& mount,
                                             std::string& error) {
  struct statfs info {};
  if (::statfs(mount.c_str(), &info) != 0) {
    error = "statfs " + mount + ": " + std::strerror(errno);
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(info.f_bavail) *
         static_cast<std::uint64_t>(info.f_bsize);
}

}  // namespace inbd
