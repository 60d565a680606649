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

#ifndef INBD_CONFIG_H
#define INBD_CONFIG_H

#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inbd_command.h"
#include "inbd_hash.h"

namespace inbd {

// Config keys read by the update pipeline.
constexpr const char* kTrustedRepositoriesKey = "os_updater.trustedRepositories";
constexpr const char* kProceedWithoutRollbackKey =
    "os_updater.proceedWithoutRollback";

// Returns true when the last dotted component of path may be appended to or
// removed from (sotaSW, trustedRepositories).
bool is_append_remove_path_allowed(const std::string& path);

// Parses a set value: integer, then boolean, otherwise string.
nlohmann::json parse_config_value(const std::string& value);

// JSON device configuration validated against a schema on every change.
// Readers share the lock, writers hold it exclusively.
class DeviceConfig {
 public:
  DeviceConfig(std::string config_path, std::string schema_path);

  // Replaces the config with the file at uri after an optional digest check
  // (signature empty skips it) and schema validation. A ".tar" uri is read
  // through tar and must hold an intel_manageability.conf member.
  bool load(CommandExecutor& executor, const std::string& uri,
            const std::string& signature, HashAlgorithm algorithm,
            std::string& error);

  // paths is a ';' separated list of dotted paths. Values are joined with ';'.
  // Returns false only when every path failed; error lists the failures.
  bool get(const std::string& paths, std::string& value,
           std::string& error) const;

  // "a.b:value;c:value" with values parsed by parse_config_value.
  bool set(const std::string& key_values, std::string& error);

  // "path:value" pairs on array leaves only.
  bool append(const std::string& key_values, std::string& error);
  bool remove(const std::string& key_values, std::string& error);

  // Trusted repository prefixes. Empty when the config cannot be read.
  std::vector<std::string> trusted_repositories(std::string& error) const;
  // Returns false when the flag is unset or the config cannot be read.
  bool proceed_without_rollback() const;

  const std::string& path() const { return config_path_; }

 private:
  bool read_document(nlohmann::json& document, std::string& error) const;
  bool validate(const nlohmann::json& document, std::string& error) const;
  bool write_document(const nlohmann::json& document, std::string& error);
  bool modify_list(const std::string& key_values, bool append,
                   std::string& error);

  std::string config_path_;
  std::string schema_path_;
  mutable std::shared_mutex mutex_;
};

}  // namespace inbd

#endif  // INBD_CONFIG_H
