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

#ifndef INBD_REQUEST_H
#define INBD_REQUEST_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inbd_hash.h"

namespace inbd {

// Response codes shared by every request handler.
constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusUnsupportedOs = 415;
constexpr int kStatusFailed = 500;

struct UpdateResponse {
  int status_code = kStatusOk;
  std::string error;
};

enum class UpdateMode {
  Full,
  DownloadOnly,
  NoDownload,
};

const char* update_mode_name(UpdateMode mode);
// Accepts FULL, DOWNLOAD_ONLY and NO_DOWNLOAD in any case, with '-' or '_'.
std::optional<UpdateMode> parse_update_mode(const std::string& name);

struct UpdateRequest {
  UpdateMode mode = UpdateMode::Full;
  std::string url;
  // Expected hex digest of the artifact.
  std::string signature;
  HashAlgorithm hash_algorithm = HashAlgorithm::Sha384;
  std::vector<std::string> package_list;
  std::string kernel_command;
  std::string release_date;
  bool do_not_reboot = false;
  // Whole-run deadline; 0 disables it.
  std::int64_t duration_seconds = 0;
};

// Reads an update request from a JSON object. Missing fields keep their
// defaults; an empty hash_algorithm means sha384.
bool parse_update_request(const nlohmann::json& body, UpdateRequest& request,
                          std::string& error);

// JSON echo of the request stored as status metadata.
std::string request_metadata(const UpdateRequest& request);

}  // namespace inbd

#endif  // INBD_REQUEST_H
