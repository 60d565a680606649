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

#ifndef INBD_KERNEL_ARGS_H
#define INBD_KERNEL_ARGS_H

#include <optional>
#include <string>

#include "inbd_command.h"
#include "inbd_paths.h"

namespace inbd {

constexpr const char* kBootEntryTitle =
    "Edge Microvisor Toolkit Kernel Parameters";

// GRUB_CMDLINE_LINUX_DEFAULT="<kernel_command>" without a trailing newline.
std::string grub_fragment_contents(const std::string& kernel_command);

// Writes the grub.d fragment used on package distributions.
bool write_grub_fragment(const std::string& path,
                         const std::string& kernel_command, std::string& error);

// Regenerates grub.cfg with update-grub.
bool refresh_grub(CommandExecutor& executor, std::string& error);

// First linux-*.efi kernel image in dir, by name.
std::optional<std::string> find_efi_kernel(const std::string& dir,
                                           std::string& error);

// Boot entry for a first kernel-args update. The last line keeps the
// running command line so later updates start from it.
std::string new_boot_entry(const std::string& efi_file,
                           const std::string& current_cmdline,
                           const std::string& kernel_command);

// Rewrites the options line of an existing entry from its preserved command
// line. Fails when the entry has fewer than four lines.
std::optional<std::string> update_boot_entry(const std::string& existing,
                                             const std::string& kernel_command,
                                             std::string& error);

// Creates or updates the systemd-boot entry and loader default on image
// distributions.
bool write_boot_entry(const Paths& paths, const std::string& kernel_command,
                      std::string& error);

}  // namespace inbd

#endif  // INBD_KERNEL_ARGS_H
