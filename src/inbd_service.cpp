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

#include "inbd_service.h"

#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "inbd_pipeline.h"
#include "inbd_source.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

using json = nlohmann::json;

// Shared with detached request workers.
struct WorkerCount {
  std::mutex mutex;
  std::condition_variable idle;
  int active = 0;
};

ConfigResponse config_failure(int status_code, std::string error) {
  ConfigResponse response;
  response.status_code = status_code;
  response.error = std::move(error);
  response.success = false;
  return response;
}

ConfigResponse config_result(bool ok, const std::string& error) {
  if (!ok) {
    return config_failure(kStatusFailed, error);
  }
  return ConfigResponse{};
}

std::string string_field(const json& message, const char* key) {
  const auto it = message.find(key);
  if (it == message.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::vector<std::string> string_list(const json& message, const char* key) {
  std::vector<std::string> values;
  const auto it = message.find(key);
  if (it == message.end() || !it->is_array()) {
    return values;
  }
  for (const auto& item : *it) {
    if (item.is_string()) {
      values.push_back(item.get<std::string>());
    }
  }
  return values;
}

}  // namespace

RequestService::RequestService(AgentContext& agent) : agent_(agent) {}

UpdateResponse RequestService::update_system_software(
    const UpdateRequest& request) {
  UpdatePipeline pipeline(agent_);
  return pipeline.run(request);
}

UpdateResponse RequestService::set_power_state(PowerAction action) {
  Rebooter rebooter(agent_.executor, agent_.host);
  std::string error;
  if (!rebooter.perform(action, error)) {
    return UpdateResponse{kStatusFailed, error};
  }
  return UpdateResponse{};
}

bool RequestService::require_package_os(const char* operation,
                                        UpdateResponse& response) {
  std::string error;
  const auto os = detect_os_family(agent_.executor, error);
  if (!os) {
    response = UpdateResponse{kStatusUnsupportedOs, error};
    return false;
  }
  if (*os != OsFamily::Package) {
    response = UpdateResponse{
        kStatusUnsupportedOs,
        std::string("Unsupported OS. ") + operation + " is only for Ubuntu."};
    return false;
  }
  return true;
}

UpdateResponse RequestService::update_os_source(
    const std::vector<std::string>& sources) {
  UpdateResponse response;
  if (!require_package_os("Update OS Source", response)) {
    return response;
  }
  if (sources.empty()) {
    return UpdateResponse{kStatusBadRequest, "Source list is empty"};
  }
  std::string error;
  if (!inbd::update_os_source(agent_.paths, sources, error)) {
    return UpdateResponse{kStatusFailed, error};
  }
  return response;
}

UpdateResponse RequestService::add_application_source(
    const ApplicationSource& source) {
  UpdateResponse response;
  if (!require_package_os("Add Application Source", response)) {
    return response;
  }
  std::string error;
  if (!source.gpg_key_uri.empty() && !validate_url(source.gpg_key_uri, error)) {
    return UpdateResponse{kStatusBadRequest, error};
  }
  if (source.filename.empty()) {
    return UpdateResponse{kStatusBadRequest, "Filename is empty"};
  }
  if (!is_plain_file_name(source.filename) ||
      (!source.gpg_key_name.empty() &&
       !is_plain_file_name(source.gpg_key_name))) {
    return UpdateResponse{kStatusBadRequest, "invalid file name"};
  }
  if (source.sources.empty()) {
    return UpdateResponse{kStatusBadRequest, "Source list is empty"};
  }
  ApplicationSourceManager manager(agent_);
  if (!manager.add(source, error)) {
    return UpdateResponse{kStatusFailed, error};
  }
  return response;
}

UpdateResponse RequestService::remove_application_source(
    const std::string& filename, const std::string& gpg_key_name) {
  UpdateResponse response;
  if (!require_package_os("Remove Application Source", response)) {
    return response;
  }
  if (filename.empty()) {
    return UpdateResponse{kStatusBadRequest, "Filename is empty"};
  }
  if (!is_plain_file_name(filename) ||
      (!gpg_key_name.empty() && !is_plain_file_name(gpg_key_name))) {
    return UpdateResponse{kStatusBadRequest, "invalid file name"};
  }
  std::string error;
  ApplicationSourceManager manager(agent_);
  if (!manager.remove(filename, gpg_key_name, error)) {
    return UpdateResponse{kStatusFailed, error};
  }
  return response;
}

ConfigResponse RequestService::load_config(const std::string& uri,
                                           const std::string& signature,
                                           const std::string& hash_algorithm) {
  if (trim(uri).empty()) {
    return config_failure(kStatusBadRequest, "uri is required");
  }
  auto algorithm = HashAlgorithm::Sha384;
  if (!trim(hash_algorithm).empty()) {
    const auto parsed = parse_hash_algorithm(trim(hash_algorithm));
    if (!parsed) {
      return config_failure(kStatusBadRequest,
                            "invalid hash algorithm: " + hash_algorithm +
                                " (must be 'sha256', 'sha384', or 'sha512')");
    }
    algorithm = *parsed;
  }
  std::string error;
  const bool ok = agent_.config.load(agent_.executor, uri,
                                     trim(signature), algorithm, error);
  return config_result(ok, error);
}

ConfigResponse RequestService::get_config(const std::string& path) {
  if (trim(path).empty()) {
    return config_failure(kStatusBadRequest, "path is required");
  }
  ConfigResponse response;
  std::string error;
  if (!agent_.config.get(path, response.value, error)) {
    return config_failure(kStatusFailed, error);
  }
  // Partial failures are reported next to the values that were found.
  response.error = error;
  return response;
}

ConfigResponse RequestService::set_config(const std::string& path) {
  if (trim(path).empty()) {
    return config_failure(kStatusBadRequest, "path is required");
  }
  std::string error;
  const bool ok = agent_.config.set(path, error);
  return config_result(ok, error);
}

ConfigResponse RequestService::append_config(const std::string& path) {
  if (trim(path).empty()) {
    return config_failure(kStatusBadRequest, "path is required");
  }
  std::string error;
  const bool ok = agent_.config.append(path, error);
  return config_result(ok, error);
}

ConfigResponse RequestService::remove_config(const std::string& path) {
  if (trim(path).empty()) {
    return config_failure(kStatusBadRequest, "path is required");
  }
  std::string error;
  const bool ok = agent_.config.remove(path, error);
  return config_result(ok, error);
}

std::string RequestService::handle_update_request(const std::string& line) {
  const auto message = json::parse(line, nullptr, false);
  UpdateRequest request;
  std::string error;
  if (!parse_update_request(message, request, error)) {
    return build_update_response(UpdateResponse{kStatusBadRequest, error});
  }
  return build_update_response(update_system_software(request));
}

std::string RequestService::handle_power_request(const std::string& line) {
  const auto message = json::parse(line, nullptr, false);
  const auto action_name = string_field(message, "action");
  const auto action = parse_power_action(action_name);
  if (!action) {
    return build_power_response(
        UpdateResponse{kStatusBadRequest, "invalid power action: " + action_name});
  }
  return build_power_response(set_power_state(*action));
}

std::string RequestService::handle_config_request(const std::string& line) {
  const auto message = json::parse(line, nullptr, false);
  const auto type = string_field(message, "type");
  const auto path = string_field(message, "path");
  if (type == kConfigLoadType) {
    return build_config_response(load_config(string_field(message, "uri"),
                                             string_field(message, "signature"),
                                             string_field(message, "hash_algorithm")));
  }
  if (type == kConfigGetType) {
    return build_config_response(get_config(path));
  }
  if (type == kConfigSetType) {
    return build_config_response(set_config(path));
  }
  if (type == kConfigAppendType) {
    return build_config_response(append_config(path));
  }
  if (type == kConfigRemoveType) {
    return build_config_response(remove_config(path));
  }
  return build_config_response(
      config_failure(kStatusBadRequest, "unknown config request: " + type));
}

std::string RequestService::handle_source_request(const std::string& line) {
  const auto message = json::parse(line, nullptr, false);
  const auto type = string_field(message, "type");
  if (type == kOsSourceUpdateType) {
    return build_source_response(
        update_os_source(string_list(message, "sources")));
  }
  if (type == kAppSourceAddType) {
    ApplicationSource source;
    source.filename = string_field(message, "filename");
    source.sources = string_list(message, "sources");
    source.gpg_key_uri = string_field(message, "gpg_key_uri");
    source.gpg_key_name = string_field(message, "gpg_key_name");
    return build_source_response(add_application_source(source));
  }
  if (type == kAppSourceRemoveType) {
    return build_source_response(remove_application_source(
        string_field(message, "filename"), string_field(message, "gpg_key_name")));
  }
  return build_source_response(
      UpdateResponse{kStatusBadRequest, "unknown source request: " + type});
}

std::string RequestService::handle_line(const std::string& line) {
  if (is_update_request(line)) {
    return handle_update_request(line);
  }
  if (is_power_request(line)) {
    return handle_power_request(line);
  }
  if (is_config_request(line)) {
    return handle_config_request(line);
  }
  if (is_source_request(line)) {
    return handle_source_request(line);
  }
  std::cerr << "Service: unrecognized request" << std::endl;
  return build_error_response("unrecognized request");
}

void serve_stream(RequestService& service, std::istream& in,
                  std::ostream& out) {
  auto workers = std::make_shared<WorkerCount>();
  std::string line;
  while (std::getline(in, line)) {
    if (trim(line).empty()) {
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(workers->mutex);
      ++workers->active;
    }
    std::thread([&service, &out, workers, line]() {
      const auto response = service.handle_line(line);
      std::lock_guard<std::mutex> lock(workers->mutex);
      out << response << std::flush;
      --workers->active;
      workers->idle.notify_all();
    }).detach();
  }
  std::unique_lock<std::mutex> lock(workers->mutex);
  workers->idle.wait(lock, [&workers] { return workers->active == 0; });
}

}  // namespace inbd
