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

#include "inbd_snapshot.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include "utils/string_utils.h"

namespace inbd {
namespace {

std::string failure_detail(const CommandResult& result) {
  std::string detail = result.error;
  if (!result.stderr_text.empty()) {
    detail += ", stderr: " + trim(result.stderr_text);
  }
  return detail;
}

void warn_stderr(const char* step, const CommandResult& result) {
  if (!trim(result.stderr_text).empty()) {
    std::cerr << "Snapper: " << step
              << " produced stderr: " << trim(result.stderr_text) << std::endl;
  }
}

}  // namespace

SnapperTool::SnapperTool(CommandExecutor& executor) : executor_(executor) {}

bool SnapperTool::is_installed(std::string& error) {
  const auto result = executor_.execute({kSnapperCmd, "--version"});
  if (!result.ok() || trim(result.stdout_text).empty()) {
    error = "snapper is not installed";
    return false;
  }
  return true;
}

bool SnapperTool::ensure_config(std::string& error) {
  const auto listed =
      executor_.execute({kSnapperCmd, "-c", kSnapperConfig, "list-configs"});
  if (!listed.ok()) {
    error = "failed to check snapper config: " + failure_detail(listed);
    return false;
  }
  if (listed.stdout_text.find(kSnapperConfig) != std::string::npos) {
    return true;
  }
  std::cout << "Snapper: creating config " << kSnapperConfig << std::endl;
  const auto created = executor_.execute(
      {kSnapperCmd, "-c", kSnapperConfig, "create-config", "/"});
  if (!created.ok()) {
    error = "failed to create snapper config: " + failure_detail(created);
    return false;
  }
  return true;
}

std::optional<int> SnapperTool::create(std::string& error) {
  const auto result =
      executor_.execute({kSnapperCmd, "-c", kSnapperConfig, "create", "-p",
                         "--description", "sota_update"});
  if (!result.ok()) {
    error = "failed to create snapshot: " + failure_detail(result);
    return std::nullopt;
  }
  warn_stderr("create", result);

  const auto text = trim(result.stdout_text);
  if (text.empty()) {
    error = "snapshot ID is blank";
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const long id = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || id < 0 || id > INT32_MAX) {
    error = "snapshot ID is not a valid integer: " + text;
    return std::nullopt;
  }
  std::cout << "Snapper: created snapshot " << id << std::endl;
  return static_cast<int>(id);
}

bool SnapperTool::undo_change(int snapshot_id, std::string& error) {
  if (snapshot_id == 0) {
    std::cout << "Snapper: rollback skipped, no snapshot" << std::endl;
    return true;
  }
  const auto range = std::to_string(snapshot_id) + "..0";
  const auto result = executor_.execute(
      {kSnapperCmd, "-c", kSnapperConfig, "undochange", range});
  if (!result.ok()) {
    error = "failed to undo changes: " + failure_detail(result);
    return false;
  }
  warn_stderr("undochange", result);
  std::cout << "Snapper: reverted changes since snapshot " << snapshot_id
            << std::endl;
  return true;
}

bool SnapperTool::delete_snapshot(int snapshot_id, std::string& error) {
  if (snapshot_id == 0) {
    return true;
  }
  const auto result =
      executor_.execute({kSnapperCmd, "-c", kSnapperConfig, "delete",
                         std::to_string(snapshot_id)});
  if (!result.ok()) {
    error = "failed to delete snapshot: " + failure_detail(result);
    return false;
  }
  warn_stderr("delete", result);
  std::cout << "Snapper: deleted snapshot " << snapshot_id << std::endl;
  return true;
}

}  // namespace inbd
