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

#ifndef INBD_REBOOT_H
#define INBD_REBOOT_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "inbd_command.h"
#include "inbd_host.h"

namespace inbd {

// Delay before the reboot command so pending log writes reach disk.
constexpr std::chrono::seconds kRebootDelay{2};

// What the pipeline did, as seen by the reboot gate.
struct RebootFacts {
  bool do_not_reboot = false;
  bool package_family = false;
  // A system-wide update was applied (image activated or apt ran).
  bool system_changed = false;
  // Requested packages were already installed.
  bool packages_installed = false;
  bool kernel_args_changed = false;
};

bool should_reboot(const RebootFacts& facts);

enum class PowerAction {
  Cycle,
  Off,
};

std::optional<PowerAction> parse_power_action(const std::string& name);

// Issues reboot and shutdown after the fixed delay.
class Rebooter {
 public:
  Rebooter(CommandExecutor& executor, HostSystem& host);

  bool reboot(std::string& error);
  bool shutdown(std::string& error);
  bool perform(PowerAction action, std::string& error);

 private:
  bool run(const std::vector<std::string>& argv, std::string& error);

  CommandExecutor& executor_;
  HostSystem& host_;
};

}  // namespace inbd

#endif  // INBD_REBOOT_H
