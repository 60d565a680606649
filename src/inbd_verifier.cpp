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

#include "inbd_verifier.h"

#include <iostream>

#include "inbd_reboot.h"

namespace inbd {

PostBootVerifier::PostBootVerifier(AgentContext& agent) : agent_(agent) {}

void PostBootVerifier::clear_state() {
  std::string error;
  if (!agent_.state_store.remove(error)) {
    std::cerr << "Verifier: failed to remove state file: " << error
              << std::endl;
  }
}

VerifyOutcome PostBootVerifier::finish(const VerifyResult& result) {
  if (!result.keep_state) {
    clear_state();
  }

  std::string error;
  if (result.status == UpdateStatus::Success) {
    if (!agent_.logger.write_status(UpdateStatus::Success, "", result.message,
                                    error) ||
        !agent_.logger.log_success(result.version, error)) {
      std::cerr << "Verifier: " << error << std::endl;
    }
    return VerifyOutcome::Succeeded;
  }

  if (!agent_.logger.write_status(UpdateStatus::Fail, "", result.message,
                                  error) ||
      !agent_.logger.log_failure(result.reason, error)) {
    std::cerr << "Verifier: " << error << std::endl;
  }
  if (!result.reboot) {
    return VerifyOutcome::Failed;
  }
  Rebooter rebooter(agent_.executor, agent_.host);
  if (!rebooter.reboot(error)) {
    return VerifyOutcome::Failed;
  }
  return VerifyOutcome::RebootScheduled;
}

VerifyOutcome PostBootVerifier::run() {
  PersistentState state;
  std::string error;
  switch (agent_.state_store.load(state, error)) {
    case StateLoadResult::NotFound:
      return VerifyOutcome::NothingToDo;
    case StateLoadResult::Error: {
      std::cerr << "Verifier: " << error << std::endl;
      VerifyResult corrupt;
      corrupt.status = UpdateStatus::Fail;
      corrupt.reason = FailureReason::Inbm;
      corrupt.message = "invalid state file: " + error;
      return finish(corrupt);
    }
    case StateLoadResult::Loaded:
      break;
  }

  if (state.restart_reason == kRestartReasonNone) {
    clear_state();
    return VerifyOutcome::NothingToDo;
  }
  if (state.phase == UpdatePhase::Idle ||
      state.phase == UpdatePhase::Downloaded) {
    VerifyResult interrupted;
    interrupted.status = UpdateStatus::Fail;
    interrupted.reason = FailureReason::Inbm;
    interrupted.message = "update interrupted before apply";
    return finish(interrupted);
  }

  const auto os = detect_os_family(agent_.executor, error);
  if (!os) {
    std::cerr << "Verifier: " << error << std::endl;
    return VerifyOutcome::Failed;
  }
  std::cout << "Verifier: checking " << state.restart_reason
            << " update on " << os_family_name(*os) << " system" << std::endl;

  state.phase = UpdatePhase::Verifying;
  if (!agent_.state_store.store(state, error)) {
    std::cerr << "Verifier: " << error << std::endl;
  }

  auto family = make_update_family(*os, agent_);
  return finish(family->verify(state));
}

}  // namespace inbd
