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

#include "inbd_pipeline.h"

#include <iostream>
#include <mutex>

#include "inbd_reboot.h"
#include "inbd_safe_fs.h"

namespace inbd {
namespace {

// Held for the whole of a pipeline run.
std::mutex g_pipeline_mutex;

}  // namespace

bool clean_artifact_dir(const std::string& dir, std::string& error) {
  if (!file_exists(dir)) {
    return true;
  }
  const auto entries = list_directory(dir, error);
  if (!entries) {
    return false;
  }
  bool ok = true;
  for (const auto& name : *entries) {
    std::string remove_error;
    if (!remove_file(dir + "/" + name, remove_error)) {
      error = remove_error;
      ok = false;
    }
  }
  return ok;
}

UpdatePipeline::UpdatePipeline(AgentContext& agent) : agent_(agent) {}

UpdateResponse UpdatePipeline::run(const UpdateRequest& request) {
  std::unique_lock<std::mutex> lock(g_pipeline_mutex, std::try_to_lock);
  if (!lock.owns_lock()) {
    std::cerr << "Pipeline: " << kUpdateInProgressError << std::endl;
    return UpdateResponse{kStatusFailed, kUpdateInProgressError};
  }
  return run_locked(request);
}

UpdateResponse UpdatePipeline::run_locked(const UpdateRequest& request) {
  std::string error;
  const auto os = detect_os_family(agent_.executor, error);
  if (!os) {
    std::cerr << "Pipeline: " << error << std::endl;
    return UpdateResponse{kStatusUnsupportedOs, error};
  }
  auto family = make_update_family(*os, agent_);
  if (!family->validate(request, error)) {
    return UpdateResponse{kStatusBadRequest, error};
  }

  UpdateContext ctx;
  ctx.request = request;
  ctx.state.phase = UpdatePhase::Idle;
  ctx.state.start_time = agent_.host.now();
  if (request.duration_seconds > 0) {
    ctx.state.deadline = ctx.state.start_time + request.duration_seconds;
  }

  std::cout << "Pipeline: accepted " << update_mode_name(request.mode)
            << " update on " << os_family_name(*os) << " system"
            << std::endl;
  if (!agent_.logger.reset_granular(error) ||
      !agent_.logger.write_status(UpdateStatus::Pending,
                                  request_metadata(request), "", error)) {
    std::cerr << "Pipeline: " << error << std::endl;
  }
  if (!agent_.state_store.store(ctx.state, error)) {
    return fail(ctx, PhaseResult::failure(FailureReason::Inbm, error));
  }
  return execute(*family, ctx);
}

bool UpdatePipeline::deadline_passed(const UpdateContext& ctx) const {
  const auto duration = ctx.request.duration_seconds;
  return duration > 0 && agent_.host.now() - ctx.state.start_time >= duration;
}

bool UpdatePipeline::record_phase(UpdateContext& ctx, UpdatePhase phase,
                                  PhaseResult& result) {
  ctx.state.phase = phase;
  std::string error;
  if (!agent_.state_store.store(ctx.state, error)) {
    result = PhaseResult::failure(FailureReason::Inbm, error);
    return false;
  }
  return true;
}

UpdateResponse UpdatePipeline::execute(UpdateFamily& family,
                                       UpdateContext& ctx) {
  const auto timed_out =
      PhaseResult::failure(FailureReason::Inbm, kTimedOutError);
  const auto& request = ctx.request;
  PhaseResult result;

  if (!request.kernel_command.empty()) {
    if (deadline_passed(ctx)) {
      return fail(ctx, timed_out);
    }
    result = family.update_kernel_args(ctx);
    if (!result.ok) {
      return fail(ctx, result);
    }
    ctx.kernel_args_changed = true;
    ctx.state.kernel_args = request.kernel_command;
    if (ctx.state.restart_reason == kRestartReasonNone) {
      ctx.state.restart_reason = kRestartReasonSota;
    }
  }

  if (deadline_passed(ctx)) {
    return fail(ctx, timed_out);
  }
  result = family.prepare(ctx);
  if (!result.ok) {
    return fail(ctx, result);
  }
  if (ctx.no_update && !ctx.packages_installed && !ctx.kernel_args_changed) {
    return succeed(family, ctx, UpdateStatus::NoUpdateAvailable);
  }
  if (!ctx.artifact_path.empty() &&
      !record_phase(ctx, UpdatePhase::Downloaded, result)) {
    return fail(ctx, result);
  }

  if (family.needs_snapshot(ctx)) {
    if (deadline_passed(ctx)) {
      return fail(ctx, timed_out);
    }
    result = family.snapshot(ctx);
    if (!result.ok) {
      return fail(ctx, result);
    }
    // From here on the next boot has something to verify.
    if (ctx.state.restart_reason == kRestartReasonNone) {
      ctx.state.restart_reason = kRestartReasonSota;
    }
    if (!record_phase(ctx, UpdatePhase::Snapshotted, result)) {
      return fail(ctx, result);
    }
  }

  if (deadline_passed(ctx)) {
    return fail_after_snapshot(family, ctx, timed_out);
  }
  result = family.apply(ctx);
  if (!result.ok) {
    return fail_after_snapshot(family, ctx, result);
  }
  if (ctx.state.restart_reason != kRestartReasonNone &&
      !record_phase(ctx, UpdatePhase::Applied, result)) {
    return fail(ctx, result);
  }

  if (deadline_passed(ctx)) {
    return fail(ctx, timed_out);
  }
  return succeed(family, ctx, UpdateStatus::Success);
}

UpdateResponse UpdatePipeline::fail(const UpdateContext& ctx,
                                    const PhaseResult& result) {
  std::cerr << "Pipeline: failed (" << failure_reason_name(result.reason)
            << "): " << result.error << std::endl;
  std::string error;
  if (!agent_.logger.write_status(UpdateStatus::Fail,
                                  request_metadata(ctx.request), result.error,
                                  error) ||
      !agent_.logger.log_failure(result.reason, error)) {
    std::cerr << "Pipeline: " << error << std::endl;
  }
  cleanup_artifacts();
  if (!agent_.state_store.remove(error)) {
    std::cerr << "Pipeline: failed to clear state: " << error << std::endl;
  }
  return UpdateResponse{kStatusFailed, result.error};
}

UpdateResponse UpdatePipeline::fail_after_snapshot(UpdateFamily& family,
                                                   const UpdateContext& ctx,
                                                   const PhaseResult& result) {
  if (ctx.state.snapshot_id != 0) {
    std::cerr << "Pipeline: reverting to snapshot " << ctx.state.snapshot_id
              << std::endl;
    std::string error;
    if (!family.roll_back(ctx.state, error)) {
      auto failed = result;
      failed.error += "; rollback to snapshot " +
                      std::to_string(ctx.state.snapshot_id) +
                      " failed: " + error;
      return fail(ctx, failed);
    }
  }
  return fail(ctx, result);
}

UpdateResponse UpdatePipeline::succeed(UpdateFamily& family,
                                       UpdateContext& ctx,
                                       UpdateStatus status) {
  cleanup_artifacts();
  std::string error;
  const bool keep_state = status == UpdateStatus::Success &&
                          ctx.state.restart_reason != kRestartReasonNone;
  if (!keep_state && !agent_.state_store.remove(error)) {
    std::cerr << "Pipeline: failed to clear state: " << error << std::endl;
  }

  RebootFacts facts;
  facts.do_not_reboot = ctx.request.do_not_reboot;
  facts.package_family = family.kind() == OsFamily::Package;
  facts.system_changed = ctx.system_changed;
  facts.packages_installed = ctx.packages_installed;
  facts.kernel_args_changed = ctx.kernel_args_changed;
  const bool reboot = status == UpdateStatus::Success && should_reboot(facts);

  if (reboot && keep_state) {
    PhaseResult result;
    if (!record_phase(ctx, UpdatePhase::Rebooting, result)) {
      return fail(ctx, result);
    }
  }

  if (!agent_.logger.write_status(status, request_metadata(ctx.request), "",
                                  error)) {
    std::cerr << "Pipeline: " << error << std::endl;
  }
  if (status == UpdateStatus::Success) {
    std::string version_error;
    auto version = family.current_version(version_error);
    if (!version) {
      std::cerr << "Pipeline: " << version_error << std::endl;
    }
    if (!agent_.logger.log_success(version.value_or(""), error)) {
      std::cerr << "Pipeline: " << error << std::endl;
    }
  }
  if (!reboot) {
    return UpdateResponse{};
  }

  Rebooter rebooter(agent_.executor, agent_.host);
  if (!rebooter.reboot(error)) {
    return fail(ctx, PhaseResult::failure(FailureReason::Inbm, error));
  }
  return UpdateResponse{};
}

void UpdatePipeline::cleanup_artifacts() {
  std::string error;
  if (!clean_artifact_dir(agent_.paths.artifact_dir, error)) {
    std::cerr << "Pipeline: failed to clean artifacts: " << error << std::endl;
  }
}

}  // namespace inbd
