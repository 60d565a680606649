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

#ifndef INBD_FAMILY_H
#define INBD_FAMILY_H

#include <memory>
#include <optional>
#include <string>

#include "inbd_command.h"
#include "inbd_config.h"
#include "inbd_host.h"
#include "inbd_http.h"
#include "inbd_os.h"
#include "inbd_paths.h"
#include "inbd_request.h"
#include "inbd_state.h"
#include "inbd_status_log.h"

namespace inbd {

// Collaborators shared by the pipeline, the verifier and the families.
struct AgentContext {
  Paths paths;
  CommandExecutor& executor;
  HostSystem& host;
  HttpTransport& http;
  StateStore& state_store;
  UpdateLogger& logger;
  DeviceConfig& config;
};

// Outcome of one pipeline phase with its classified failure reason.
struct PhaseResult {
  bool ok = true;
  FailureReason reason = FailureReason::Unspecified;
  std::string error;

  static PhaseResult success() { return PhaseResult{}; }
  static PhaseResult failure(FailureReason reason, std::string error);
};

// Working data of one pipeline run.
struct UpdateContext {
  UpdateRequest request;
  PersistentState state;
  // Downloaded artifact, empty when nothing was downloaded.
  std::string artifact_path;
  // The package manager reported nothing to do.
  bool no_update = false;
  // Requested packages were already installed.
  bool packages_installed = false;
  // A system-wide update was applied and needs a reboot.
  bool system_changed = false;
  bool kernel_args_changed = false;
};

// Post-boot verdict of a family.
struct VerifyResult {
  UpdateStatus status = UpdateStatus::Success;
  FailureReason reason = FailureReason::Unspecified;
  // Written to the status log's Error field.
  std::string message;
  // Version recorded with a successful outcome.
  std::string version;
  bool reboot = false;
  // Leave the state file for the next boot.
  bool keep_state = false;
};

constexpr const char* kKernelArgsSuccessMessage =
    "Kernel command line parameters updated successfully";

// Family-specific steps behind the common pipeline.
class UpdateFamily {
 public:
  virtual ~UpdateFamily() = default;

  virtual OsFamily kind() const = 0;
  // Request checks that are reported as input errors.
  virtual bool validate(const UpdateRequest& request,
                        std::string& error) const = 0;
  virtual PhaseResult update_kernel_args(UpdateContext& ctx) = 0;
  // Trust, size, space, download and hash checks.
  virtual PhaseResult prepare(UpdateContext& ctx) = 0;
  virtual bool needs_snapshot(const UpdateContext& ctx) const = 0;
  virtual PhaseResult snapshot(UpdateContext& ctx) = 0;
  virtual PhaseResult apply(UpdateContext& ctx) = 0;
  virtual std::optional<std::string> current_version(
      std::string& error) const = 0;

  // Checks the update after reboot. May commit or roll back.
  virtual VerifyResult verify(const PersistentState& state) = 0;
  // Makes the update permanent.
  virtual bool commit(const PersistentState& state, std::string& error) = 0;
  // Reverts to the rollback point recorded in state and releases it.
  virtual bool roll_back(const PersistentState& state, std::string& error) = 0;
};

std::unique_ptr<UpdateFamily> make_update_family(OsFamily family,
                                                 AgentContext& agent);

// Image family: A/B slot switch driven by the image-update tool.
class ImageFamily : public UpdateFamily {
 public:
  explicit ImageFamily(AgentContext& agent);

  OsFamily kind() const override { return OsFamily::Image; }
  bool validate(const UpdateRequest& request,
                std::string& error) const override;
  PhaseResult update_kernel_args(UpdateContext& ctx) override;
  PhaseResult prepare(UpdateContext& ctx) override;
  bool needs_snapshot(const UpdateContext& ctx) const override;
  PhaseResult snapshot(UpdateContext& ctx) override;
  PhaseResult apply(UpdateContext& ctx) override;
  std::optional<std::string> current_version(
      std::string& error) const override;
  VerifyResult verify(const PersistentState& state) override;
  bool commit(const PersistentState& state, std::string& error) override;
  bool roll_back(const PersistentState& state, std::string& error) override;

 private:
  PhaseResult check_trusted(const std::string& url) const;
  PhaseResult download(UpdateContext& ctx);

  AgentContext& agent_;
};

// Package family: snapper snapshot plus apt.
class PackageFamily : public UpdateFamily {
 public:
  explicit PackageFamily(AgentContext& agent);

  OsFamily kind() const override { return OsFamily::Package; }
  bool validate(const UpdateRequest& request,
                std::string& error) const override;
  PhaseResult update_kernel_args(UpdateContext& ctx) override;
  PhaseResult prepare(UpdateContext& ctx) override;
  bool needs_snapshot(const UpdateContext& ctx) const override;
  PhaseResult snapshot(UpdateContext& ctx) override;
  PhaseResult apply(UpdateContext& ctx) override;
  std::optional<std::string> current_version(
      std::string& error) const override;
  VerifyResult verify(const PersistentState& state) override;
  bool commit(const PersistentState& state, std::string& error) override;
  bool roll_back(const PersistentState& state, std::string& error) override;

 private:
  PhaseResult take_snapshot(UpdateContext& ctx);
  bool has_default_route();

  AgentContext& agent_;
};

}  // namespace inbd

#endif  // INBD_FAMILY_H
