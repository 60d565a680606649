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

#ifndef INBD_SCHEMA_H
#define INBD_SCHEMA_H

#include <string>

#include <nlohmann/json.hpp>

namespace inbd {

// Validates document against the JSON-schema subset used by the device
// configuration schema. On failure error names the offending location.
bool validate_against_schema(const nlohmann::json& schema,
                             const nlohmann::json& document,
                             std::string& error);

}  // namespace inbd

#endif  // INBD_SCHEMA_H
