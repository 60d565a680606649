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

#include "inbd_config.h"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <utility>

#include "inbd_safe_fs.h"
#include "inbd_schema.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

using json = nlohmann::json;

constexpr mode_t kConfigMode = 0644;
constexpr const char* kFileScheme = "file://";

const json* find_path(const json& document, const std::string& path,
                      std::string& error) {
  const json* current = &document;
  for (const auto& part : split(path, '.')) {
    if (!current->is_object()) {
      error = "invalid path: " + path;
      return nullptr;
    }
    const auto it = current->find(part);
    if (it == current->end()) {
      error = "path not found: " + path;
      return nullptr;
    }
    current = &*it;
  }
  return current;
}

json* find_path(json& document, const std::string& path, std::string& error) {
  return const_cast<json*>(
      find_path(static_cast<const json&>(document), path, error));
}

bool set_path(json& document, const std::string& path, json value,
              std::string& error) {
  if (trim(path).empty()) {
    error = "invalid path: path is empty";
    return false;
  }
  const auto parts = split(path, '.');
  json* current = &document;
  for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
    if (!current->is_object()) {
      error = "invalid path: " + path;
      return false;
    }
    json& next = (*current)[parts[i]];
    if (next.is_null()) {
      next = json::object();
    }
    current = &next;
  }
  if (!current->is_object()) {
    error = "invalid path: " + path;
    return false;
  }
  (*current)[parts.back()] = std::move(value);
  return true;
}

// Splits "key:value" at the first colon.
bool split_key_value(const std::string& item, std::string& key,
                     std::string& value, std::string& error) {
  const auto colon = item.find(':');
  if (colon == std::string::npos) {
    error = "invalid format, expected key:value";
    return false;
  }
  key = trim(item.substr(0, colon));
  value = item.substr(colon + 1);
  return true;
}

std::string render_value(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

constexpr const char* kConfigMemberName = "intel_manageability.conf";

std::string command_detail(const CommandResult& result) {
  std::string detail = result.error;
  if (!result.stderr_text.empty()) {
    detail += ", stderr: " + trim(result.stderr_text);
  }
  return detail;
}

// Reads the first member named intel_manageability.conf, at any depth.
std::optional<std::string> read_config_archive(CommandExecutor& executor,
                                               const std::string& archive,
                                               std::string& error) {
  if (!file_exists(archive)) {
    error = "failed to open tar file: " + archive;
    return std::nullopt;
  }
  const auto listing = executor.execute({kTarCmd, "-tf", archive});
  if (!listing.ok()) {
    error = "failed to read tar file: " + command_detail(listing);
    return std::nullopt;
  }
  for (const auto& entry : split(listing.stdout_text, '\n')) {
    const auto slash = entry.find_last_of('/');
    const auto base =
        slash == std::string::npos ? entry : entry.substr(slash + 1);
    if (base != kConfigMemberName) {
      continue;
    }
    const auto member =
        executor.execute({kTarCmd, "-xOf", archive, "--", entry});
    if (!member.ok()) {
      error = "failed to read config from tar: " + command_detail(member);
      return std::nullopt;
    }
    return member.stdout_text;
  }
  error = std::string(kConfigMemberName) + " not found in tar archive";
  return std::nullopt;
}

std::string local_source_path(const std::string& uri) {
  if (startsWith(uri, kFileScheme)) {
    return uri.substr(std::char_traits<char>::length(kFileScheme));
  }
  return uri;
}

}  // namespace

bool is_append_remove_path_allowed(const std::string& path) {
  const auto parts = split(path, '.');
  if (parts.empty()) {
    return false;
  }
  const auto last = trim(parts.back());
  return last == "sotaSW" || last == "trustedRepositories";
}

json parse_config_value(const std::string& value) {
  if (!value.empty()) {
    errno = 0;
    char* end = nullptr;
    const long long number = std::strtoll(value.c_str(), &end, 10);
    if (errno == 0 && end != nullptr && *end == '\0' &&
        !std::isspace(static_cast<unsigned char>(value.front()))) {
      return number;
    }
  }
  const auto lower = toLower(value);
  if (lower == "true" || lower == "1" || lower == "t") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "f") {
    return false;
  }
  return value;
}

DeviceConfig::DeviceConfig(std::string config_path, std::string schema_path)
    : config_path_(std::move(config_path)),
      schema_path_(std::move(schema_path)) {}

bool DeviceConfig::read_document(json& document, std::string& error) const {
  const auto content = read_file(config_path_, error);
  if (!content) {
    error = "failed to read config: " + error;
    return false;
  }
  try {
    document = json::parse(*content);
  } catch (const json::parse_error& e) {
    error = std::string("invalid config JSON: ") + e.what();
    return false;
  }
  if (!document.is_object()) {
    error = "invalid config JSON: not an object";
    return false;
  }
  return true;
}

bool DeviceConfig::validate(const json& document, std::string& error) const {
  const auto schema_text = read_file(schema_path_, error);
  if (!schema_text) {
    error = "failed to read schema: " + error;
    return false;
  }
  json schema;
  try {
    schema = json::parse(*schema_text);
  } catch (const json::parse_error& e) {
    error = std::string("invalid schema JSON: ") + e.what();
    return false;
  }
  std::string detail;
  if (!validate_against_schema(schema, document, detail)) {
    error = "config validation failed: " + detail;
    return false;
  }
  return true;
}

bool DeviceConfig::write_document(const json& document, std::string& error) {
  if (!validate(document, error)) {
    return false;
  }
  if (!write_file(config_path_, document.dump(2) + "\n", kConfigMode, error)) {
    error = "failed to write config: " + error;
    return false;
  }
  return true;
}

bool DeviceConfig::load(CommandExecutor& executor, const std::string& uri,
                        const std::string& signature, HashAlgorithm algorithm,
                        std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto source = local_source_path(trim(uri));
  if (source.empty()) {
    error = "uri is required";
    return false;
  }
  if (!signature.empty()) {
    std::string detail;
    if (!verify_file_hash(source, algorithm, signature, detail)) {
      error = "signature verification failed: " + detail;
      return false;
    }
  }
  std::optional<std::string> content;
  if (endsWith(toLower(source), ".tar")) {
    content = read_config_archive(executor, source, error);
  } else {
    content = read_file(source, error);
    if (!content) {
      error = "failed to read new config: " + error;
    }
  }
  if (!content) {
    return false;
  }
  json document;
  try {
    document = json::parse(*content);
  } catch (const json::parse_error& e) {
    error = std::string("invalid config JSON: ") + e.what();
    return false;
  }
  if (!validate(document, error)) {
    return false;
  }
  // Keep the caller's bytes rather than a re-serialized copy.
  if (!write_file(config_path_, *content, kConfigMode, error)) {
    error = "failed to write config: " + error;
    return false;
  }
  std::cout << "Config: loaded " << source << std::endl;
  return true;
}

bool DeviceConfig::get(const std::string& paths, std::string& value,
                       std::string& error) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (trim(paths).empty()) {
    error = "path is required";
    return false;
  }
  json document;
  if (!read_document(document, error)) {
    return false;
  }

  const auto keys = split(paths, ';');
  std::vector<std::string> results;
  std::vector<std::string> failures;
  for (const auto& raw : keys) {
    const auto key = trim(raw);
    if (key.empty()) {
      results.emplace_back();
      continue;
    }
    std::string detail;
    const json* found = find_path(document, key, detail);
    if (found == nullptr) {
      failures.push_back(key + ": " + detail);
      results.emplace_back();
      continue;
    }
    results.push_back(render_value(*found));
  }
  error = join(failures, "; ");
  if (failures.size() == keys.size()) {
    value.clear();
    return false;
  }
  value = join(results, ";");
  return true;
}

bool DeviceConfig::set(const std::string& key_values, std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  json document;
  if (!read_document(document, error)) {
    return false;
  }
  for (const auto& raw : split(key_values, ';')) {
    const auto item = trim(raw);
    if (item.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    if (!split_key_value(item, key, value, error)) {
      return false;
    }
    if (!set_path(document, key, parse_config_value(value), error)) {
      return false;
    }
  }
  return write_document(document, error);
}

bool DeviceConfig::modify_list(const std::string& key_values, bool append,
                               std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  json document;
  if (!read_document(document, error)) {
    return false;
  }
  for (const auto& raw : split(key_values, ';')) {
    const auto item = trim(raw);
    if (item.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    if (!split_key_value(item, key, value, error)) {
      return false;
    }
    if (!is_append_remove_path_allowed(key)) {
      error = std::string(append ? "append" : "remove") +
              " not supported for this path";
      return false;
    }
    json* list = find_path(document, key, error);
    if (list == nullptr) {
      return false;
    }
    if (!list->is_array()) {
      error = "target is not a list";
      return false;
    }
    if (append) {
      list->push_back(value);
    } else {
      list->erase(std::remove(list->begin(), list->end(), json(value)),
                  list->end());
    }
  }
  return write_document(document, error);
}

bool DeviceConfig::append(const std::string& key_values, std::string& error) {
  return modify_list(key_values, true, error);
}

bool DeviceConfig::remove(const std::string& key_values, std::string& error) {
  return modify_list(key_values, false, error);
}

std::vector<std::string> DeviceConfig::trusted_repositories(
    std::string& error) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> repositories;
  json document;
  if (!read_document(document, error)) {
    return repositories;
  }
  const json* list = find_path(document, kTrustedRepositoriesKey, error);
  if (list == nullptr || !list->is_array()) {
    return repositories;
  }
  for (const auto& entry : *list) {
    if (entry.is_string()) {
      repositories.push_back(entry.get<std::string>());
    }
  }
  return repositories;
}

bool DeviceConfig::proceed_without_rollback() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::string error;
  json document;
  if (!read_document(document, error)) {
    std::cerr << "Config: " << error << std::endl;
    return false;
  }
  const json* flag = find_path(document, kProceedWithoutRollbackKey, error);
  return flag != nullptr && flag->is_boolean() && flag->get<bool>();
}

}  // namespace inbd
