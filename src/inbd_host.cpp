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

#include "inbd_host.h"

#include <thread>

#include "inbd_disk.h"
#include "inbd_safe_fs.h"

namespace inbd {

std::optional<std::uint64_t> LinuxHost::free_space(const std::string& mount,
                                                   std::string& error) {
  return available_space(mount, error);
}

bool LinuxHost::is_btrfs(const std::string& path) {
  return inbd::is_btrfs(path);
}

void LinuxHost::sleep_for(std::chrono::seconds duration) {
  std::this_thread::sleep_for(duration);
}

std::int64_t LinuxHost::now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace inbd
