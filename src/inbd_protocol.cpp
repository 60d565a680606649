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

#include "inbd_protocol.h"

#include <nlohmann/json.hpp>

#include "utils/string_utils.h"

namespace inbd {
namespace {

using json = nlohmann::json;

std::string to_line(const json& message) { return message.dump() + "\n"; }

json status_message(const char* type, const UpdateResponse& response) {
  json message;
  message["type"] = type;
  message["status_code"] = response.status_code;
  message["error"] = response.error;
  return message;
}

}  // namespace

std::optional<std::string> message_type(const std::string& line) {
  const auto message = json::parse(line, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return std::nullopt;
  }
  const auto it = message.find("type");
  if (it == message.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

bool is_update_request(const std::string& line) {
  auto type = message_type(line);
  return type.has_value() && *type == kUpdateRequestType;
}

bool is_power_request(const std::string& line) {
  auto type = message_type(line);
  return type.has_value() && *type == kPowerRequestType;
}

bool is_config_request(const std::string& line) {
  auto type = message_type(line);
  return type.has_value() && startsWith(*type, "inbd.config.") &&
         *type != kConfigResponseType;
}

bool is_source_request(const std::string& line) {
  auto type = message_type(line);
  return type.has_value() && startsWith(*type, "inbd.source.") &&
         *type != kSourceResponseType;
}

std::string build_update_response(const UpdateResponse& response) {
  return to_line(status_message(kUpdateResponseType, response));
}

std::string build_power_response(const UpdateResponse& response) {
  return to_line(status_message(kPowerResponseType, response));
}

std::string build_source_response(const UpdateResponse& response) {
  return to_line(status_message(kSourceResponseType, response));
}

std::string build_config_response(const ConfigResponse& response) {
  json message;
  message["type"] = kConfigResponseType;
  message["status_code"] = response.status_code;
  message["error"] = response.error;
  message["success"] = response.success;
  if (!response.value.empty()) {
    message["value"] = response.value;
  }
  return to_line(message);
}

std::string build_error_response(const std::string& error) {
  json message;
  message["type"] = kErrorResponseType;
  message["status_code"] = kStatusBadRequest;
  message["error"] = error;
  return to_line(message);
}

}  // namespace inbd
