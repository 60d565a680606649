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

#ifndef INBD_SNAPSHOT_H
#define INBD_SNAPSHOT_H

#include <optional>
#include <string>

#include "inbd_command.h"

namespace inbd {

// snapper config covering the root filesystem.
constexpr const char* kSnapperConfig = "rootConfig";

// Filesystem snapshots of / through snapper. Snapshot id 0 means no snapshot
// and makes undo/delete no-ops.
class SnapperTool {
 public:
  explicit SnapperTool(CommandExecutor& executor);

  bool is_installed(std::string& error);
  // Creates the rootConfig configuration when list-configs lacks it.
  bool ensure_config(std::string& error);
  // Returns the id printed by snapper create.
  std::optional<int> create(std::string& error);
  bool undo_change(int snapshot_id, std::string& error);
  bool delete_snapshot(int snapshot_id, std::string& error);

 private:
  CommandExecutor& executor_;
};

}  // namespace inbd

#endif  // INBD_SNAPSHOT_H
