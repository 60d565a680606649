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

#include <iostream>

#include "inbd_disk.h"
#include "inbd_family.h"
#include "inbd_kernel_args.h"
#include "inbd_package_updater.h"
#include "inbd_snapshot.h"
#include "inbd_source.h"
#include "utils/string_utils.h"

namespace inbd {

PackageFamily::PackageFamily(AgentContext& agent) : agent_(agent) {}

bool PackageFamily::validate(const UpdateRequest& request,
                             std::string& error) const {
  return request.url.empty() || validate_url(request.url, error);
}

PhaseResult PackageFamily::update_kernel_args(UpdateContext& ctx) {
  std::string error;
  if (!write_grub_fragment(agent_.paths.grub_fragment,
                           ctx.request.kernel_command, error) ||
      !refresh_grub(agent_.executor, error)) {
    return PhaseResult::failure(FailureReason::Bootloader, error);
  }
  return PhaseResult::success();
}

PhaseResult PackageFamily::prepare(UpdateContext& ctx) {
  PackageUpdater updater(agent_.executor);
  const auto estimate = updater.estimate(ctx.request.package_list);
  switch (estimate.outcome) {
    case DryRunOutcome::InvalidPackages:
      return PhaseResult::failure(FailureReason::Download, estimate.error);
    case DryRunOutcome::Failed:
      return PhaseResult::failure(FailureReason::UpdateTool, estimate.error);
    case DryRunOutcome::NoUpdate:
      ctx.no_update = true;
      ctx.packages_installed = !ctx.request.package_list.empty();
      return PhaseResult::success();
    case DryRunOutcome::UpdateAvailable:
      break;
  }

  std::string error;
  const auto free = agent_.host.free_space(agent_.paths.root_mount, error);
  if (!free) {
    return PhaseResult::failure(FailureReason::Inbm, error);
  }
  if (!has_enough_space(*free, estimate.size_bytes)) {
    return PhaseResult::failure(
        FailureReason::InsufficientStorage,
        "insufficient disk space: free " + std::to_string(*free) +
            " bytes, required " +
            std::to_string(required_space(estimate.size_bytes)) + " bytes");
  }
  return PhaseResult::success();
}

bool PackageFamily::needs_snapshot(const UpdateContext& ctx) const {
  // Additive installs and downloads are not rolled back.
  return ctx.request.mode != UpdateMode::DownloadOnly &&
         ctx.request.package_list.empty() && !ctx.no_update;
}

PhaseResult PackageFamily::take_snapshot(UpdateContext& ctx) {
  if (!agent_.host.is_btrfs(agent_.paths.root_mount)) {
    std::cout << "Packages: no snapshot taken, root is not btrfs" << std::endl;
    ctx.state.snapshot_id = 0;
    return PhaseResult::success();
  }
  SnapperTool snapper(agent_.executor);
  std::string error;
  if (!snapper.is_installed(error) ||
      !agent_.state_store.truncate_to_zero(error) ||
      !snapper.ensure_config(error)) {
    return PhaseResult::failure(FailureReason::Inbm, error);
  }
  const auto id = snapper.create(error);
  if (!id) {
    return PhaseResult::failure(FailureReason::Inbm, error);
  }
  ctx.state.snapshot_id = *id;
  return PhaseResult::success();
}

PhaseResult PackageFamily::snapshot(UpdateContext& ctx) {
  auto result = take_snapshot(ctx);
  if (result.ok) {
    return result;
  }
  if (agent_.config.proceed_without_rollback()) {
    std::cerr << "Packages: snapshot failed, continuing without rollback: "
              << result.error << std::endl;
    ctx.state.snapshot_id = 0;
    return PhaseResult::success();
  }
  result.error =
      "proceedWithoutRollback configuration flag is false; can not proceed "
      "as snapshot failed: " +
      result.error;
  return result;
}

PhaseResult PackageFamily::apply(UpdateContext& ctx) {
  const auto& request = ctx.request;
  if (request.mode == UpdateMode::DownloadOnly) {
    if (ctx.no_update) {
      return PhaseResult::success();
    }
    std::string error;
    PackageUpdater updater(agent_.executor);
    if (!updater.run(request.mode, request.package_list, error)) {
      return PhaseResult::failure(FailureReason::UpdateTool, error);
    }
    return PhaseResult::success();
  }

  // Only preinstalled package sets are confirmed after the reboot.
  if (request.mode == UpdateMode::NoDownload &&
      !request.package_list.empty()) {
    ctx.state.restart_reason = kRestartReasonPackages;
    ctx.state.package_list = request.package_list;
  }
  if (ctx.no_update) {
    return PhaseResult::success();
  }

  std::string error;
  PackageUpdater updater(agent_.executor);
  if (!updater.run(request.mode, request.package_list, error)) {
    return PhaseResult::failure(FailureReason::UpdateTool, error);
  }
  ctx.system_changed = true;
  if (request.package_list.empty()) {
    ctx.state.restart_reason = kRestartReasonSota;
  }
  return PhaseResult::success();
}

std::optional<std::string> PackageFamily::current_version(
    std::string& error) const {
  return read_os_version(agent_.paths.os_release, error);
}

bool PackageFamily::has_default_route() {
  const auto result = agent_.executor.execute({kIpCmd, "route", "show", "default"});
  if (!result.ok()) {
    std::cerr << "Packages: route check failed: " << result.error << std::endl;
    return false;
  }
  return !trim(result.stdout_text).empty();
}

bool PackageFamily::commit(const PersistentState& state, std::string& error) {
  SnapperTool snapper(agent_.executor);
  return snapper.delete_snapshot(state.snapshot_id, error);
}

bool PackageFamily::roll_back(const PersistentState& state,
                              std::string& error) {
  SnapperTool snapper(agent_.executor);
  if (!snapper.undo_change(state.snapshot_id, error)) {
    return false;
  }
  std::string delete_error;
  if (!snapper.delete_snapshot(state.snapshot_id, delete_error)) {
    std::cerr << "Packages: " << delete_error << std::endl;
  }
  return true;
}

VerifyResult PackageFamily::verify(const PersistentState& state) {
  VerifyResult result;
  std::string error;
  if (auto version = current_version(error)) {
    result.version = *version;
  } else {
    std::cerr << "Packages: " << error << std::endl;
  }

  if (!state.package_list.empty()) {
    PackageUpdater updater(agent_.executor);
    if (!updater.verify_installed(state.package_list, error)) {
      result.status = UpdateStatus::Fail;
      result.reason = FailureReason::UpdateTool;
      result.message = error;
      result.keep_state = true;
      return result;
    }
  }

  if (state.snapshot_id == 0) {
    if (state.package_list.empty() && !state.kernel_args.empty()) {
      result.message = kKernelArgsSuccessMessage;
    }
    return result;
  }

  if (!has_default_route()) {
    std::cerr << "Packages: no network route, reverting to snapshot "
              << state.snapshot_id << std::endl;
    result.status = UpdateStatus::Fail;
    if (!roll_back(state, error)) {
      result.reason = FailureReason::Inbm;
      result.message = "network check failed; rollback failed: " + error;
      return result;
    }
    result.reason = FailureReason::CriticalServices;
    result.message = "network check failed";
    result.reboot = true;
    return result;
  }

  if (!commit(state, error)) {
    std::cerr << "Packages: " << error << std::endl;
  }
  return result;
}

}  // namespace inbd
