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

#ifndef INBD_PIPELINE_H
#define INBD_PIPELINE_H

#include <string>

#include "inbd_family.h"

namespace inbd {

constexpr const char* kUpdateInProgressError = "update already in progress";
constexpr const char* kTimedOutError = "partial success - timed out";

// Removes the regular files in the artifact cache.
bool clean_artifact_dir(const std::string& dir, std::string& error);

// Sequences one SOTA run: accept, kernel args, prepare, snapshot, apply and
// the reboot gate. Only one run may be active in the process; a concurrent
// request is refused without side effects.
class UpdatePipeline {
 public:
  explicit UpdatePipeline(AgentContext& agent);

  UpdateResponse run(const UpdateRequest& request);

 private:
  UpdateResponse run_locked(const UpdateRequest& request);
  UpdateResponse execute(UpdateFamily& family, UpdateContext& ctx);
  bool deadline_passed(const UpdateContext& ctx) const;
  bool record_phase(UpdateContext& ctx, UpdatePhase phase, PhaseResult& result);
  UpdateResponse fail(const UpdateContext& ctx, const PhaseResult& result);
  UpdateResponse fail_after_snapshot(UpdateFamily& family,
                                     const UpdateContext& ctx,
                                     const PhaseResult& result);
  UpdateResponse succeed(UpdateFamily& family, UpdateContext& ctx,
                         UpdateStatus status);
  void cleanup_artifacts();

  AgentContext& agent_;
};

}  // namespace inbd

#endif  // INBD_PIPELINE_H
