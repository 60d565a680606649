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

#ifndef INBD_HOST_H
#define INBD_HOST_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace inbd {

// Host facilities the pipeline queries. Tests substitute a fake.
class HostSystem {
 public:
  virtual ~HostSystem() = default;
  virtual std::optional<std::uint64_t> free_space(const std::string& mount,
                                                  std::string& error) = 0;
  virtual bool is_btrfs(const std::string& path) = 0;
  virtual void sleep_for(std::chrono::seconds duration) = 0;
  // Seconds since the epoch.
  virtual std::int64_t now() = 0;
};

class LinuxHost : public HostSystem {
 public:
  std::optional<std::uint64_t> free_space(const std::string& mount,
                                          std::string& error) override;
  bool is_btrfs(const std::string& path) override;
  void sleep_for(std::chrono::seconds duration) override;
  std::int64_t now() override;
};

}  // namespace inbd

#endif  // INBD_HOST_H
