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

#include "inbd_os.h"

#include "inbd_safe_fs.h"
#include "utils/string_utils.h"

namespace inbd {
namespace {

// Returns the value of KEY=value from a key/value file, quotes removed.
std::optional<std::string> find_key(const std::string& content,
                                    const std::string& key) {
  const std::string prefix = key + "=";
  for (const auto& raw : split(content, '\n')) {
    const auto line = trim(raw);
    if (!startsWith(line, prefix)) {
      continue;
    }
    auto value = trim(line.substr(prefix.size()));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    return value;
  }
  return std::nullopt;
}

}  // namespace

const char* os_family_name(OsFamily family) {
  switch (family) {
    case OsFamily::Image:
      return "image";
    case OsFamily::Package:
      return "package";
  }
  return "unknown";
}

std::optional<OsFamily> classify_lsb_release(const std::string& output) {
  if (output.find("Ubuntu") != std::string::npos) {
    return OsFamily::Package;
  }
  if (toLower(output).find("microvisor") != std::string::npos) {
    return OsFamily::Image;
  }
  return std::nullopt;
}

std::optional<OsFamily> detect_os_family(CommandExecutor& executor,
                                         std::string& error) {
  // lsb_release prints "No LSB modules are available." on stderr.
  const auto result = executor.execute({kLsbReleaseCmd, "-a"});
  if (!result.ok()) {
    error = "failed to detect OS: " +
            (result.error.empty() ? result.stderr_text : result.error);
    return std::nullopt;
  }
  const auto family = classify_lsb_release(result.stdout_text);
  if (!family) {
    error = "unsupported OS: " + trim(result.stdout_text);
  }
  return family;
}

std::optional<std::string> read_image_build_date(const std::string& path,
                                                 std::string& error) {
  const auto content = read_file(path, error);
  if (!content) {
    return std::nullopt;
  }
  auto value = find_key(*content, "IMAGE_BUILD_DATE");
  if (!value || value->empty()) {
    error = "IMAGE_BUILD_DATE not found in " + path;
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> read_os_version(const std::string& path,
                                           std::string& error) {
  const auto content = read_file(path, error);
  if (!content) {
    return std::nullopt;
  }
  if (auto id = find_key(*content, "VERSION_ID"); id && !id->empty()) {
    return id;
  }
  if (auto version = find_key(*content, "VERSION"); version && !version->empty()) {
    return version;
  }
  error = "VERSION_ID not found in " + path;
  return std::nullopt;
}

}  // namespace inbd
