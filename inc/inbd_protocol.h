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

#ifndef INBD_PROTOCOL_H
#define INBD_PROTOCOL_H

#include <optional>
#include <string>

#include "inbd_request.h"

namespace inbd {

// Message types of the newline-delimited JSON protocol.
constexpr const char* kUpdateRequestType = "inbd.update.request";
constexpr const char* kUpdateResponseType = "inbd.update.response";
constexpr const char* kPowerRequestType = "inbd.power.request";
constexpr const char* kPowerResponseType = "inbd.power.response";
constexpr const char* kConfigLoadType = "inbd.config.load";
constexpr const char* kConfigGetType = "inbd.config.get";
constexpr const char* kConfigSetType = "inbd.config.set";
constexpr const char* kConfigAppendType = "inbd.config.append";
constexpr const char* kConfigRemoveType = "inbd.config.remove";
constexpr const char* kConfigResponseType = "inbd.config.response";
constexpr const char* kOsSourceUpdateType = "inbd.source.os.update";
constexpr const char* kAppSourceAddType = "inbd.source.application.add";
constexpr const char* kAppSourceRemoveType = "inbd.source.application.remove";
constexpr const char* kSourceResponseType = "inbd.source.response";
constexpr const char* kErrorResponseType = "inbd.error";

struct ConfigResponse {
  int status_code = kStatusOk;
  std::string error;
  bool success = true;
  // Values returned by get.
  std::string value;
};

// Returns the "type" of a request line, or nullopt if it is not a JSON object
// with a string type.
std::optional<std::string> message_type(const std::string& line);

// Checks whether the line is an update request.
bool is_update_request(const std::string& line);
// Checks whether the line is a power request.
bool is_power_request(const std::string& line);
// Checks whether the line is one of the config requests.
bool is_config_request(const std::string& line);
// Checks whether the line is one of the apt source requests.
bool is_source_request(const std::string& line);

// Response lines, each terminated by a newline.
std::string build_update_response(const UpdateResponse& response);
std::string build_power_response(const UpdateResponse& response);
std::string build_config_response(const ConfigResponse& response);
std::string build_source_response(const UpdateResponse& response);
std::string build_error_response(const std::string& error);

}  // namespace inbd

#endif  // INBD_PROTOCOL_H
