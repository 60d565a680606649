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

#ifndef INBD_DISK_H
#define INBD_DISK_H

#include <cstdint>
#include <optional>
#include <string>

namespace inbd {

// Fixed headroom added on top of the artifact size.
constexpr std::uint64_t kDiskHeadroomBytes = 100ULL * 1024 * 1024;

// max(ceil(1.2 * size), size + 100 MiB).
std::uint64_t required_space(std::uint64_t artifact_bytes);

// Free space exactly equal to the requirement is enough.
bool has_enough_space(std::uint64_t free_bytes, std::uint64_t artifact_bytes);

// f_bavail * f_bsize of the filesystem holding mount.
std::optional<std::uint64_t> available_space(const std::string& mount,
                                             std::string& error);

}  // namespace inbd

#endif  // INBD_DISK_H
