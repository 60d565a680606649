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

#include "inbd_reboot.h"

#include <iostream>

#include "utils/string_utils.h"

namespace inbd {

bool should_reboot(const RebootFacts& facts) {
  if (facts.do_not_reboot) {
    return false;
  }
  if (facts.package_family && !facts.system_changed &&
      facts.packages_installed && !facts.kernel_args_changed) {
    return false;
  }
  if (facts.kernel_args_changed) {
    return true;
  }
  return facts.system_changed;
}

std::optional<PowerAction> parse_power_action(const std::string& name) {
  const auto lower = toLower(trim(name));
  if (lower == "cycle" || lower == "reboot") {
    return PowerAction::Cycle;
  }
  if (lower == "off" || lower == "shutdown") {
    return PowerAction::Off;
  }
  return std::nullopt;
}

Rebooter::Rebooter(CommandExecutor& executor, HostSystem& host)
    : executor_(executor), host_(host) {}

bool Rebooter::run(const std::vector<std::string>& argv, std::string& error) {
  std::cout << "Power: " << describe_command(argv) << " in "
            << kRebootDelay.count() << "s" << std::endl;
  host_.sleep_for(kRebootDelay);
  const auto result = executor_.execute(argv);
  if (!result.ok()) {
    error = "failed to execute " + describe_command(argv) + ": " +
            result.error;
    std::cerr << "Power: " << error << std::endl;
    return false;
  }
  return true;
}

bool Rebooter::reboot(std::string& error) {
  return run({kRebootCmd}, error);
}

bool Rebooter::shutdown(std::string& error) {
  return run({kShutdownCmd, "now"}, error);
}

bool Rebooter::perform(PowerAction action, std::string& error) {
  return action == PowerAction::Cycle ? reboot(error) : shutdown(error);
}

}  // namespace inbd
