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

#ifndef INBD_COMMAND_H
#define INBD_COMMAND_H

#include <map>
#include <string>
#include <vector>

namespace inbd {

// Tools the daemon is allowed to launch.
constexpr const char* kRebootCmd = "/usr/sbin/reboot";
constexpr const char* kShutdownCmd = "/usr/sbin/shutdown";
constexpr const char* kAptGetCmd = "/usr/bin/apt-get";
constexpr const char* kDpkgCmd = "/usr/bin/dpkg";
constexpr const char* kTruncateCmd = "/usr/bin/truncate";
constexpr const char* kIpCmd = "/usr/bin/ip";
constexpr const char* kLsbReleaseCmd = "/usr/bin/lsb_release";
constexpr const char* kUpdateGrubCmd = "/usr/sbin/update-grub";
constexpr const char* kImageToolCmd = "/usr/bin/os-update-tool.sh";
constexpr const char* kSnapperCmd = "/usr/bin/snapper";
constexpr const char* kGpgCmd = "/usr/bin/gpg";
constexpr const char* kTarCmd = "/usr/bin/tar";

using Environment = std::map<std::string, std::string>;

struct CommandResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  // Set when the command was refused, failed to start or exited nonzero.
  std::string error;

  bool ok() const { return error.empty() && exit_code == 0; }
};

// Single choke point for child processes. argv[0] must be an absolute path
// from the allowlist; no shell is involved.
class CommandExecutor {
 public:
  virtual ~CommandExecutor() = default;
  virtual CommandResult execute(const std::vector<std::string>& argv,
                                const Environment& environment) = 0;

  CommandResult execute(const std::vector<std::string>& argv) {
    return execute(argv, Environment{});
  }
};

// Returns true when path is one of the allowlisted tools.
bool is_allowed_command(const std::string& path);

// Launches allowlisted tools with fork/execve.
class SystemCommandExecutor : public CommandExecutor {
 public:
  using CommandExecutor::execute;
  CommandResult execute(const std::vector<std::string>& argv,
                        const Environment& environment) override;
};

// Joins argv for log output.
std::string describe_command(const std::vector<std::string>& argv);

}  // namespace inbd

#endif  // INBD_COMMAND_H
