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

#include "inbd_request.h"

#include <algorithm>

#include "utils/string_utils.h"

namespace inbd {
namespace {

using json = nlohmann::json;

bool read_string(const json& body, const char* key, std::string& out,
                 std::string& error) {
  const auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_package_list(const json& body, std::vector<std::string>& packages,
                       std::string& error) {
  const auto it = body.find("package_list");
  if (it == body.end() || it->is_null()) {
    return true;
  }
  packages.clear();
  if (it->is_string()) {
    for (const auto& name : split(it->get<std::string>(), ',')) {
      if (!trim(name).empty()) {
        packages.push_back(trim(name));
      }
    }
    return true;
  }
  if (!it->is_array()) {
    error = "package_list must be an array of strings";
    return false;
  }
  for (const auto& entry : *it) {
    if (!entry.is_string()) {
      error = "package_list must be an array of strings";
      return false;
    }
    const auto name = trim(entry.get<std::string>());
    if (!name.empty()) {
      packages.push_back(name);
    }
  }
  return true;
}

}  // namespace

const char* update_mode_name(UpdateMode mode) {
  switch (mode) {
    case UpdateMode::Full:
      return "FULL";
    case UpdateMode::DownloadOnly:
      return "DOWNLOAD_ONLY";
    case UpdateMode::NoDownload:
      return "NO_DOWNLOAD";
  }
  return "FULL";
}

std::optional<UpdateMode> parse_update_mode(const std::string& name) {
  auto normalized = toLower(trim(name));
  std::replace(normalized.begin(), normalized.end(), '-', '_');
  if (normalized == "full") {
    return UpdateMode::Full;
  }
  if (normalized == "download_only") {
    return UpdateMode::DownloadOnly;
  }
  if (normalized == "no_download") {
    return UpdateMode::NoDownload;
  }
  return std::nullopt;
}

bool parse_update_request(const json& body, UpdateRequest& request,
                          std::string& error) {
  if (!body.is_object()) {
    error = "request must be a JSON object";
    return false;
  }

  std::string mode;
  if (!read_string(body, "mode", mode, error)) {
    return false;
  }
  if (!mode.empty()) {
    const auto parsed = parse_update_mode(mode);
    if (!parsed) {
      error = "invalid mode: " + mode;
      return false;
    }
    request.mode = *parsed;
  }

  std::string algorithm;
  if (!read_string(body, "url", request.url, error) ||
      !read_string(body, "signature", request.signature, error) ||
      !read_string(body, "hash_algorithm", algorithm, error) ||
      !read_string(body, "kernel_command", request.kernel_command, error) ||
      !read_string(body, "release_date", request.release_date, error) ||
      !read_package_list(body, request.package_list, error)) {
    return false;
  }
  request.url = trim(request.url);
  request.signature = trim(request.signature);
  request.kernel_command = trim(request.kernel_command);

  if (!trim(algorithm).empty()) {
    const auto parsed = parse_hash_algorithm(trim(algorithm));
    if (!parsed) {
      error = "invalid hash algorithm: " + algorithm +
              " (must be 'sha256', 'sha384', or 'sha512')";
      return false;
    }
    request.hash_algorithm = *parsed;
  }

  if (const auto it = body.find("do_not_reboot"); it != body.end()) {
    if (!it->is_boolean()) {
      error = "do_not_reboot must be a boolean";
      return false;
    }
    request.do_not_reboot = it->get<bool>();
  }
  if (const auto it = body.find("duration_seconds"); it != body.end()) {
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
      error = "duration_seconds must be a non-negative integer";
      return false;
    }
    request.duration_seconds = it->get<std::int64_t>();
  }
  return true;
}

std::string request_metadata(const UpdateRequest& request) {
  json echo;
  echo["mode"] = update_mode_name(request.mode);
  echo["url"] = request.url;
  echo["signature"] = request.signature;
  echo["hash_algorithm"] = hash_algorithm_name(request.hash_algorithm);
  echo["package_list"] = request.package_list;
  echo["kernel_command"] = request.kernel_command;
  echo["release_date"] = request.release_date;
  echo["do_not_reboot"] = request.do_not_reboot;
  echo["duration_seconds"] = request.duration_seconds;
  return echo.dump();
}

}  // namespace inbd
