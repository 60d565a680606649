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

#include "inbd_command.h"

#include <iostream>

#include "utils/process.h"

namespace inbd {
namespace {

constexpr const char* kAllowedCommands[] = {
    kRebootCmd,     kShutdownCmd,   kAptGetCmd,    kDpkgCmd,
    kTruncateCmd,   kIpCmd,         kLsbReleaseCmd, kUpdateGrubCmd,
    kImageToolCmd,  kSnapperCmd,    kGpgCmd,       kTarCmd,
};

}  // namespace

bool is_allowed_command(const std::string& path) {
  for (const auto* allowed : kAllowedCommands) {
    if (path == allowed) {
      return true;
    }
  }
  return false;
}

std::string describe_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

CommandResult SystemCommandExecutor::execute(
    const std::vector<std::string>& argv, const Environment& environment) {
  CommandResult result;
  if (argv.empty()) {
    result.error = "empty command";
    return result;
  }
  if (!is_allowed_command(argv[0])) {
    result.error = "command not allowed: " + argv[0];
    std::cerr << result.error << std::endl;
    return result;
  }

  auto process = runProcess(argv, environment);
  result.stdout_text = std::move(process.output);
  result.stderr_text = std::move(process.errorOutput);
  result.exit_code = process.exitCode;
  if (!process.error.empty()) {
    result.error = process.error;
  } else if (!process.success) {
    result.error = argv[0] + " exited with status " +
                   std::to_string(process.exitCode);
  }
  return result;
}

}  // namespace inbd
