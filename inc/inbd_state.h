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

#ifndef INBD_STATE_H
#define INBD_STATE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "inbd_command.h"

namespace inbd {

// Restart reasons recorded in the state file.
constexpr const char* kRestartReasonSota = "sota";
constexpr const char* kRestartReasonPackages = "package_installation";
constexpr const char* kRestartReasonKernelArgs = "kernel_args";
constexpr const char* kRestartReasonNone = "none";

// Progress marker of an update that spans reboots.
enum class UpdatePhase {
  Idle,
  Downloaded,
  Snapshotted,
  Applied,
  Rebooting,
  Verifying,
};

const char* phase_name(UpdatePhase phase);
std::optional<UpdatePhase> parse_phase(const std::string& name);

struct PersistentState {
  std::string restart_reason = kRestartReasonNone;
  // Rollback snapshot id, 0 when none was taken.
  int snapshot_id = 0;
  // Image version running before the update.
  std::string previous_version;
  std::vector<std::string> package_list;
  // Kernel command line written by the kernel-args applier.
  std::string kernel_args;
  UpdatePhase phase = UpdatePhase::Idle;
  std::int64_t start_time = 0;
  std::int64_t deadline = 0;

  bool operator==(const PersistentState& other) const;
  bool operator!=(const PersistentState& other) const {
    return !(*this == other);
  }
};

// Result of attempting to load the state file.
enum class StateLoadResult {
  NotFound,
  Loaded,
  Error,
};

std::string serialize_state(const PersistentState& state);
bool parse_state(const std::string& text, PersistentState& state,
                 std::string& error);

// Durable record of the in-flight update at a single well-known path.
class StateStore {
 public:
  StateStore(CommandExecutor& executor, std::string path);

  // A missing or size-zero file is NotFound.
  StateLoadResult load(PersistentState& state, std::string& error) const;
  // Atomically replaces the state file.
  bool store(const PersistentState& state, std::string& error);
  // Empties the file with the truncate tool, keeping the inode.
  bool truncate_to_zero(std::string& error);
  bool remove(std::string& error);

  const std::string& path() const { return path_; }

 private:
  CommandExecutor& executor_;
  std::string path_;
};

}  // namespace inbd

#endif  // INBD_STATE_H
