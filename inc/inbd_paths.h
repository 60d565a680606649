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

#ifndef INBD_PATHS_H
#define INBD_PATHS_H

#include <string>

namespace inbd {

// Every on-disk location the daemon touches. Defaults are the production
// paths; tests and the CLI override individual fields.
struct Paths {
  // Durable record of an in-flight update.
  std::string state_file = "/var/intel-manageability/inbd_state";
  // Device configuration and its schema.
  std::string config_file = "/etc/intel_manageability.conf";
  std::string schema_file = "/usr/share/inbd_schema.json";
  // Update status and granular logs.
  std::string status_log = "/var/log/inbm-update-status.log";
  std::string granular_log = "/var/log/inbm-update-log.log";
  // Download cache for image artifacts.
  std::string artifact_dir = "/var/cache/manageability/repository-tool/sota";
  // Release service token.
  std::string access_token =
      "/etc/intel_edge_node/tokens/release-service/access_token";
  // Version sources.
  std::string image_id = "/etc/image-id";
  std::string os_release = "/etc/os-release";
  // Kernel-args targets.
  std::string grub_fragment = "/etc/default/grub.d/90-inbd.cfg";
  std::string proc_cmdline = "/proc/cmdline";
  std::string efi_linux_dir = "/boot/efi/EFI/Linux";
  std::string boot_entry =
      "/boot/efi/loader/entries/inbd_user_kernel_param.conf";
  std::string loader_conf = "/boot/efi/loader/loader.conf";
  // apt sources and the keyrings they reference.
  std::string apt_sources_list = "/etc/apt/sources.list";
  std::string apt_sources_dir = "/etc/apt/sources.list.d";
  std::string keyring_dir = "/usr/share/keyrings";
  // Mount checked for package updates and snapshots.
  std::string root_mount = "/";
};

}  // namespace inbd

#endif  // INBD_PATHS_H
