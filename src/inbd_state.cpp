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

#include "inbd_state.h"

#include <sys/stat.h>

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "inbd_safe_fs.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

using json = nlohmann::json;

constexpr mode_t kStateFileMode = 0640;

constexpr const char* kKeyRestartReason = "restart_reason";
constexpr const char* kKeySnapshot = "snapshot_number";
constexpr const char* kKeyVersion = "tiber-version";
constexpr const char* kKeyPackages = "package_list";
constexpr const char* kKeyKernelArgs = "kernel_args";
constexpr const char* kKeyPhase = "phase";
constexpr const char* kKeyStart = "start_time";
constexpr const char* kKeyDeadline = "deadline";

bool is_known_restart_reason(const std::string& reason) {
  return reason == kRestartReasonSota || reason == kRestartReasonPackages ||
         reason == kRestartReasonKernelArgs || reason == kRestartReasonNone;
}

std::vector<std::string> split_package_list(const std::string& joined) {
  std::vector<std::string> packages;
  for (auto& item : split(joined, ',')) {
    item = trim(item);
    if (!item.empty()) {
      packages.push_back(item);
    }
  }
  return packages;
}

}  // namespace

const char* phase_name(UpdatePhase phase) {
  switch (phase) {
    case UpdatePhase::Idle:
      return "idle";
    case UpdatePhase::Downloaded:
      return "downloaded";
    case UpdatePhase::Snapshotted:
      return "snapshotted";
    case UpdatePhase::Applied:
      return "applied";
    case UpdatePhase::Rebooting:
      return "rebooting";
    case UpdatePhase::Verifying:
      return "verifying";
  }
  return "idle";
}

std::optional<UpdatePhase> parse_phase(const std::string& name) {
  for (auto phase : {UpdatePhase::Idle, UpdatePhase::Downloaded,
                     UpdatePhase::Snapshotted, UpdatePhase::Applied,
                     UpdatePhase::Rebooting, UpdatePhase::Verifying}) {
    if (name == phase_name(phase)) {
      return phase;
    }
  }
  return std::nullopt;
}

bool PersistentState::operator==(const PersistentState& other) const {
  return restart_reason == other.restart_reason &&
         snapshot_id == other.snapshot_id &&
         previous_version == other.previous_version &&
         package_list == other.package_list &&
         kernel_args == other.kernel_args && phase == other.phase &&
         start_time == other.start_time && deadline == other.deadline;
}

std::string serialize_state(const PersistentState& state) {
  json doc;
  doc[kKeyRestartReason] = state.restart_reason;
  doc[kKeySnapshot] = state.snapshot_id;
  doc[kKeyVersion] = state.previous_version;
  if (!state.package_list.empty()) {
    doc[kKeyPackages] = join(state.package_list, ",");
  }
  if (!state.kernel_args.empty()) {
    doc[kKeyKernelArgs] = state.kernel_args;
  }
  doc[kKeyPhase] = phase_name(state.phase);
  doc[kKeyStart] = state.start_time;
  doc[kKeyDeadline] = state.deadline;
  return doc.dump();
}

bool parse_state(const std::string& text, PersistentState& state,
                 std::string& error) {
  const json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = "state file is not a JSON object";
    return false;
  }

  PersistentState parsed;
  // Older writers omit the phase; their state always described an applied
  // update.
  parsed.phase = UpdatePhase::Applied;
  try {
    parsed.restart_reason =
        doc.value(kKeyRestartReason, std::string(kRestartReasonNone));
    parsed.snapshot_id = doc.value(kKeySnapshot, 0);
    parsed.previous_version = doc.value(kKeyVersion, std::string());
    parsed.package_list =
        split_package_list(doc.value(kKeyPackages, std::string()));
    parsed.kernel_args = doc.value(kKeyKernelArgs, std::string());
    parsed.start_time = doc.value(kKeyStart, std::int64_t{0});
    parsed.deadline = doc.value(kKeyDeadline, std::int64_t{0});
    if (doc.contains(kKeyPhase)) {
      const auto phase = parse_phase(doc.at(kKeyPhase).get<std::string>());
      if (!phase) {
        error = "unknown phase in state file";
        return false;
      }
      parsed.phase = *phase;
    }
  } catch (const json::exception& e) {
    error = std::string("malformed state file: ") + e.what();
    return false;
  }

  if (!is_known_restart_reason(parsed.restart_reason)) {
    error = "unknown restart reason in state file: " + parsed.restart_reason;
    return false;
  }
  if (parsed.snapshot_id < 0) {
    error = "negative snapshot number in state file";
    return false;
  }
  state = std::move(parsed);
  return true;
}

StateStore::StateStore(CommandExecutor& executor, std::string path)
    : executor_(executor), path_(std::move(path)) {}

StateLoadResult StateStore::load(PersistentState& state,
                                 std::string& error) const {
  if (!file_exists(path_)) {
    return StateLoadResult::NotFound;
  }
  auto content = read_file(path_, error);
  if (!content) {
    return StateLoadResult::Error;
  }
  if (trim(*content).empty()) {
    return StateLoadResult::NotFound;
  }
  if (!parse_state(*content, state, error)) {
    return StateLoadResult::Error;
  }
  return StateLoadResult::Loaded;
}

bool StateStore::store(const PersistentState& state, std::string& error) {
  const auto dir = std::filesystem::path(path_).parent_path().string();
  if (!mkdir_all(dir, 0755, error)) {
    return false;
  }
  if (!write_file(path_, serialize_state(state), kStateFileMode, error)) {
    return false;
  }
  std::cout << "State: " << phase_name(state.phase) << " ("
            << state.restart_reason << ")" << std::endl;
  return true;
}

bool StateStore::truncate_to_zero(std::string& error) {
  if (!file_exists(path_)) {
    return true;
  }
  const auto result = executor_.execute({kTruncateCmd, "-s", "0", path_});
  if (!result.ok()) {
    error = "failed to truncate state file: " + result.error;
    return false;
  }
  return true;
}

bool StateStore::remove(std::string& error) {
  return remove_file(path_, error);
}

}  // namespace inbd
