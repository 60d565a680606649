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

#include <sys/stat.h>

#include <iostream>

#include "inbd_disk.h"
#include "inbd_family.h"
#include "inbd_fetcher.h"
#include "inbd_image_tool.h"
#include "inbd_kernel_args.h"
#include "inbd_safe_fs.h"
#include "inbd_source.h"
#include "inbd_token.h"

namespace inbd {
namespace {

constexpr mode_t kArtifactDirMode = 0755;

bool downloads_artifact(UpdateMode mode) {
  return mode == UpdateMode::Full || mode == UpdateMode::DownloadOnly;
}

// A kernel command without an image leaves the running slot in place.
bool kernel_args_only(const UpdateRequest& request) {
  return !request.kernel_command.empty() && request.url.empty();
}

}  // namespace

ImageFamily::ImageFamily(AgentContext& agent) : agent_(agent) {}

bool ImageFamily::validate(const UpdateRequest& request,
                           std::string& error) const {
  if (downloads_artifact(request.mode) && request.url.empty() &&
      !kernel_args_only(request)) {
    error = "url is required for " + std::string(update_mode_name(request.mode)) +
            " on image-based systems";
    return false;
  }
  return request.url.empty() || validate_url(request.url, error);
}

PhaseResult ImageFamily::update_kernel_args(UpdateContext& ctx) {
  std::string error;
  if (!write_boot_entry(agent_.paths, ctx.request.kernel_command, error)) {
    return PhaseResult::failure(FailureReason::Bootloader, error);
  }
  return PhaseResult::success();
}

PhaseResult ImageFamily::check_trusted(const std::string& url) const {
  std::string error;
  const auto repositories = agent_.config.trusted_repositories(error);
  if (!error.empty()) {
    std::cerr << "Image: trusted repositories unavailable: " << error
              << std::endl;
  }
  if (!is_trusted(url, repositories)) {
    return PhaseResult::failure(
        FailureReason::RsAuthentication,
        "URL is not in the trusted repositories list: " + url);
  }
  return PhaseResult::success();
}

PhaseResult ImageFamily::download(UpdateContext& ctx) {
  const auto& request = ctx.request;
  std::string error;
  std::string token;
  if (!read_access_token(agent_.paths.access_token, agent_.host.now(), token,
                         error)) {
    return PhaseResult::failure(FailureReason::Download, error);
  }

  ArtifactFetcher fetcher(agent_.http);
  const auto size = fetcher.size(request.url, token, error);
  if (!size) {
    return PhaseResult::failure(FailureReason::Download, error);
  }
  std::cout << "Image: artifact size " << *size << " bytes" << std::endl;

  if (!mkdir_all(agent_.paths.artifact_dir, kArtifactDirMode, error)) {
    return PhaseResult::failure(FailureReason::Inbm, error);
  }
  const auto free = agent_.host.free_space(agent_.paths.artifact_dir, error);
  if (!free) {
    return PhaseResult::failure(FailureReason::Inbm, error);
  }
  const auto artifact_bytes = static_cast<std::uint64_t>(*size);
  if (!has_enough_space(*free, artifact_bytes)) {
    return PhaseResult::failure(
        FailureReason::InsufficientStorage,
        "insufficient disk space: free " + std::to_string(*free) +
            " bytes, required " +
            std::to_string(required_space(artifact_bytes)) + " bytes");
  }

  const auto path =
      fetcher.download(request.url, agent_.paths.artifact_dir, token, error);
  if (!path) {
    return PhaseResult::failure(FailureReason::Download, error);
  }
  ctx.artifact_path = *path;

  if (request.signature.empty()) {
    return PhaseResult::failure(FailureReason::SignatureCheck,
                                "signature is required to verify " + *path);
  }
  if (!verify_file_hash(*path, request.hash_algorithm, request.signature,
                        error)) {
    return PhaseResult::failure(FailureReason::SignatureCheck, error);
  }
  return PhaseResult::success();
}

PhaseResult ImageFamily::prepare(UpdateContext& ctx) {
  if (!ctx.request.url.empty()) {
    auto trusted = check_trusted(ctx.request.url);
    if (!trusted.ok) {
      return trusted;
    }
  }
  if (!downloads_artifact(ctx.request.mode) || kernel_args_only(ctx.request)) {
    return PhaseResult::success();
  }
  return download(ctx);
}

bool ImageFamily::needs_snapshot(const UpdateContext& ctx) const {
  return ctx.request.mode != UpdateMode::DownloadOnly &&
         !kernel_args_only(ctx.request);
}

PhaseResult ImageFamily::snapshot(UpdateContext& ctx) {
  // The inactive slot is the rollback point; only the running version is
  // recorded.
  std::string error;
  const auto version = read_image_build_date(agent_.paths.image_id, error);
  if (!version) {
    return PhaseResult::failure(FailureReason::Inbm,
                                "failed to read image version: " + error);
  }
  ctx.state.previous_version = *version;
  ctx.state.snapshot_id = 0;
  std::cout << "Image: running version " << *version << std::endl;
  return PhaseResult::success();
}

PhaseResult ImageFamily::apply(UpdateContext& ctx) {
  if (kernel_args_only(ctx.request)) {
    std::cout << "Image: kernel parameters only, keeping the running slot"
              << std::endl;
    return PhaseResult::success();
  }
  ImageUpdateTool tool(agent_.executor);
  std::string error;
  const auto mode = ctx.request.mode;
  if (downloads_artifact(mode)) {
    if (!tool.write(ctx.artifact_path, ctx.request.signature, error)) {
      return PhaseResult::failure(FailureReason::UtWrite, error);
    }
  }
  if (mode == UpdateMode::DownloadOnly) {
    return PhaseResult::success();
  }
  if (!tool.apply(error)) {
    return PhaseResult::failure(FailureReason::UtBootConfiguration, error);
  }
  ctx.system_changed = true;
  ctx.state.restart_reason = kRestartReasonSota;
  return PhaseResult::success();
}

std::optional<std::string> ImageFamily::current_version(
    std::string& error) const {
  return read_image_build_date(agent_.paths.image_id, error);
}

bool ImageFamily::commit(const PersistentState& state, std::string& error) {
  (void)state;
  ImageUpdateTool tool(agent_.executor);
  return tool.commit(error);
}

bool ImageFamily::roll_back(const PersistentState& state, std::string& error) {
  // The bootloader falls back to the previous slot on its own.
  (void)state;
  (void)error;
  return true;
}

VerifyResult ImageFamily::verify(const PersistentState& state) {
  VerifyResult result;
  std::string error;
  const auto current = current_version(error);
  if (!current) {
    result.status = UpdateStatus::Fail;
    result.reason = FailureReason::Inbm;
    result.message = "failed to read image version: " + error;
    return result;
  }
  result.version = *current;

  if (state.previous_version.empty()) {
    result.message = kKernelArgsSuccessMessage;
    return result;
  }
  if (*current == state.previous_version) {
    std::cerr << "Image: still running " << *current
              << ", falling back through the bootloader" << std::endl;
    result.status = UpdateStatus::Fail;
    result.reason = FailureReason::Bootloader;
    result.message = "image version unchanged after reboot: " + *current;
    result.reboot = true;
    return result;
  }

  std::cout << "Image: updated from " << state.previous_version << " to "
            << *current << ", committing" << std::endl;
  if (!commit(state, error)) {
    result.status = UpdateStatus::Fail;
    result.reason = FailureReason::OsCommit;
    result.message = error;
    result.reboot = true;
  }
  return result;
}

}  // namespace inbd
