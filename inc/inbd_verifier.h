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

#ifndef INBD_VERIFIER_H
#define INBD_VERIFIER_H

#include "inbd_family.h"

namespace inbd {

// What a post-boot verification run did.
enum class VerifyOutcome {
  // No pending update was recorded.
  NothingToDo,
  Succeeded,
  Failed,
  // Failed and a reboot was issued to fall back or roll back.
  RebootScheduled,
};

// Runs once per boot and finishes the update recorded in the state file.
class PostBootVerifier {
 public:
  explicit PostBootVerifier(AgentContext& agent);

  VerifyOutcome run();

 private:
  VerifyOutcome finish(const VerifyResult& result);
  void clear_state();

  AgentContext& agent_;
};

}  // namespace inbd

#endif  // INBD_VERIFIER_H
