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

#ifndef INBD_PACKAGE_UPDATER_H
#define INBD_PACKAGE_UPDATER_H

#include <cstdint>
#include <string>
#include <vector>

#include "inbd_command.h"
#include "inbd_request.h"

namespace inbd {

enum class DryRunOutcome {
  UpdateAvailable,
  NoUpdate,
  // apt could not resolve a requested package.
  InvalidPackages,
  Failed,
};

struct DryRunResult {
  DryRunOutcome outcome = DryRunOutcome::Failed;
  // Additional disk space apt will use; 0 when the update frees space.
  std::uint64_t size_bytes = 0;
  std::string error;
};

// Converts an apt size ("1,234.5" with unit B/kB/MB/GB, 1024 based).
std::uint64_t apt_size_to_bytes(const std::string& number,
                                const std::string& unit);

// Interprets the output of an --assume-no dry run.
DryRunResult parse_dry_run_output(const std::string& stdout_text,
                                  const std::string& stderr_text);

// apt-get --assume-no invocation that sizes the operation.
std::vector<std::string> dry_run_command(
    const std::vector<std::string>& packages);

// Commands run for mode, in order.
std::vector<std::vector<std::string>> apt_command_sequence(
    UpdateMode mode, const std::vector<std::string>& packages);

// Non-interactive apt environment. PATH is the daemon's PATH with
// /usr/bin:/bin appended.
Environment apt_environment();

// Drives apt-get and dpkg for package distributions.
class PackageUpdater {
 public:
  explicit PackageUpdater(CommandExecutor& executor);

  DryRunResult estimate(const std::vector<std::string>& packages);

  // Runs the mode's command sequence. Any nonzero exit or stderr output is
  // a failure.
  bool run(UpdateMode mode, const std::vector<std::string>& packages,
           std::string& error);

  // Requires an "ii  <pkg>" line from dpkg -l for every package.
  bool verify_installed(const std::vector<std::string>& packages,
                        std::string& error);

 private:
  CommandExecutor& executor_;
  Environment environment_;
};

}  // namespace inbd

#endif  // INBD_PACKAGE_UPDATER_H
