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

#include "inbd_family.h"

#include <utility>

namespace inbd {

PhaseResult PhaseResult::failure(FailureReason reason, std::string error) {
  PhaseResult result;
  result.ok = false;
  result.reason = reason;
  result.error = std::move(error);
  return result;
}

std::unique_ptr<UpdateFamily> make_update_family(OsFamily family,
                                                 AgentContext& agent) {
  switch (family) {
    case OsFamily::Image:
      return std::make_unique<ImageFamily>(agent);
    case OsFamily::Package:
      return std::make_unique<PackageFamily>(agent);
  }
  return nullptr;
}

}  // namespace inbd
